//===-- patch.h - wharf patch types and functions -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of types and functions for creating and applying wharf
///    patches.
///
/// A patch describes how to build every file of the new container from the
///    files of the old container and literal data. Each file record uses
///    either the rsync algorithm (copies of old blocks interleaved with
///    literal data) or the bsdiff algorithm (byte-wise additions to an old
///    file, literal data and seeks in the old file).
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"
#include "signature.h"

#include <stdint.h>

//===-- Types -------------------------------------------------------------===//

/// Behavior of bsdiff add operations that read outside of the old file.
enum tek_wh_bsdiff_oob {
  /// Fail the operation with @ref TEK_WH_ERRC_add_oob.
  TEK_WH_BSDIFF_OOB_fail,
  /// Treat bytes outside of the old file as zeros.
  TEK_WH_BSDIFF_OOB_zero_pad
};
/// @copydoc tek_wh_bsdiff_oob
typedef enum tek_wh_bsdiff_oob tek_wh_bsdiff_oob;

/// Prototype of patch progress handler function.
///
/// @param [in, out] user_data
///    Opaque pointer that was provided along with the function.
/// @param current
///    Number of bytes of new files written so far.
/// @param total
///    Total size of all new files, in bytes.
typedef void tek_wh_progress_func(void *_Nullable user_data, int64_t current,
                                  int64_t total);

/// Arguments for @ref tek_wh_patch_apply.
typedef struct tek_wh_patch_apply_args tek_wh_patch_apply_args;
/// @copydoc tek_wh_patch_apply_args
struct tek_wh_patch_apply_args {
  /// Path to the root directory of the old tree, as a null-terminated UTF-8
  ///    string.
  const char *_Nonnull old_root;
  /// Path to the root directory of the new tree, as a null-terminated UTF-8
  ///    string. It may be the same as @ref old_root, in which case the patch
  ///    is applied in-place. The directory is created if it doesn't exist.
  const char *_Nonnull new_root;
  /// Stream to read the patch from.
  tek_wh_istream patch;
  /// Optional stream to read the signature of the new tree from. If
  ///    provided, the new tree is verified after patching.
  const tek_wh_istream *_Nullable new_sig;
  /// Number of worker threads applying file records, `0` to use the number
  ///    of available logical processors.
  int num_threads;
  /// Behavior of bsdiff add operations that read outside of the old file.
  tek_wh_bsdiff_oob bsdiff_oob;
  /// Optional pointer to a flag that cancels the operation when set to a
  ///    non-zero value. It is accessed atomically, and may be set from any
  ///    thread.
  uint32_t *_Nullable cancel;
  /// Optional pointer to the function that receives progress updates. Calls
  ///    are serialized but may come from different threads.
  tek_wh_progress_func *_Nullable progress;
  /// Opaque pointer passed to @ref progress.
  void *_Nullable progress_data;
};

/// Arguments for @ref tek_wh_diff.
typedef struct tek_wh_diff_args tek_wh_diff_args;
/// @copydoc tek_wh_diff_args
struct tek_wh_diff_args {
  /// Stream to read the signature of the old tree from.
  tek_wh_istream old_sig;
  /// Path to the root directory of the new tree, as a null-terminated UTF-8
  ///    string.
  const char *_Nonnull new_root;
  /// Compression settings for the patch body.
  tek_wh_comp_settings comp;
  /// Stream that receives the patch.
  tek_wh_ostream out;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Apply a patch to an old tree, producing the new tree.
///
/// @remark
/// Every new file is reconstructed into a staging directory inside the new
///    root and moved into place only after it's complete. If the operation
///    fails or is cancelled, staged data is discarded, but files committed
///    before that remain in place.
///
/// @param [in] args
///    Pointer to the arguments structure.
/// @param [out] findings
///    Optional address of variable that receives post-patch verification
///    findings when `args->new_sig` is set. It must be freed with
///    @ref tek_wh_findings_free after use.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
tek_wh_err tek_wh_patch_apply(const tek_wh_patch_apply_args *_Nonnull args,
                              tek_wh_findings *_Nullable findings);

/// Create an rsync-algorithm patch from the signature of the old tree to the
///    contents of the new tree.
///
/// @param [in] args
///    Pointer to the arguments structure.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
tek_wh_err tek_wh_diff(const tek_wh_diff_args *_Nonnull args);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
