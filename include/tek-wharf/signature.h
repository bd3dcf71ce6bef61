//===-- signature.h - wharf signature types and functions -----------------===//
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
/// Declarations of types and functions for generating wharf signatures and
///    verifying directory trees against them.
///
/// A signature is a container followed by a weak rolling checksum and an MD5
///    hash of every @ref TEK_WH_BLOCK_SIZE block of every file, in file index
///    order.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "container.h"
#include "error.h"

#include <stdint.h>

//===-- Types -------------------------------------------------------------===//

/// Types of verification findings.
enum tek_wh_finding_type {
  /// The file is missing or is shorter than declared.
  TEK_WH_FINDING_TYPE_missing,
  /// Hashes of a block don't match the signature.
  TEK_WH_FINDING_TYPE_corrupted,
  /// The file is longer than declared. Its declared blocks are still checked.
  TEK_WH_FINDING_TYPE_oversized
};
/// @copydoc tek_wh_finding_type
typedef enum tek_wh_finding_type tek_wh_finding_type;

/// Single verification finding.
typedef struct tek_wh_finding tek_wh_finding;
/// @copydoc tek_wh_finding
struct tek_wh_finding {
  /// Type of the finding.
  tek_wh_finding_type type;
  /// Index of the affected file in the container.
  int file_index;
  /// For @ref TEK_WH_FINDING_TYPE_corrupted, index of the affected block in
  ///    the file, otherwise `-1`.
  int64_t block_index;
};

/// List of verification findings.
typedef struct tek_wh_findings tek_wh_findings;
/// @copydoc tek_wh_findings
struct tek_wh_findings {
  /// Pointer to the finding array, `nullptr` if there are none.
  tek_wh_finding *_Nullable items;
  /// Number of elements in @ref items.
  int num_items;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Write a signature of a directory tree.
///
/// @param [in] root
///    Path to the root directory of the tree, as a null-terminated UTF-8
///    string.
/// @param [in] ctr
///    Pointer to the container describing the tree, usually obtained via
///    @ref tek_wh_ctr_scan.
/// @param comp
///    Compression settings for the signature body.
/// @param [in] out
///    Pointer to the stream that receives the signature.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::TEK_WH_API, gnu::nonnull(1, 2, 4), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1), gnu::access(read_only, 2),
  gnu::access(read_only, 4)]]
tek_wh_err tek_wh_sig_write(const char *_Nonnull root,
                            const tek_wh_ctr *_Nonnull ctr,
                            tek_wh_comp_settings comp,
                            const tek_wh_ostream *_Nonnull out);

/// Verify a directory tree against a signature. Verification is exhaustive:
///    all files and blocks are checked regardless of earlier findings.
///
/// @param [in] root
///    Path to the root directory of the tree, as a null-terminated UTF-8
///    string.
/// @param [in] sig
///    Pointer to the stream to read the signature from.
/// @param [out] findings
///    Address of variable that receives the findings. It must be freed with
///    @ref tek_wh_findings_free after use. On failure, it's left empty.
/// @return A @ref tek_wh_err indicating the result of operation. Mismatches
///    are reported via @p findings, not as errors.
[[gnu::TEK_WH_API, gnu::nonnull(1, 2, 3), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1), gnu::access(read_only, 2),
  gnu::access(write_only, 3)]]
tek_wh_err tek_wh_sig_verify(const char *_Nonnull root,
                             const tek_wh_istream *_Nonnull sig,
                             tek_wh_findings *_Nonnull findings);

/// Free the memory allocated for a findings list.
///
/// @param [in, out] findings
///    Pointer to the findings list to free.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_wh_findings_free(tek_wh_findings *_Nonnull findings);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
