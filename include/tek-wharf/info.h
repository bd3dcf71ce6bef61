//===-- info.h - wharf binary identification and summary ------------------===//
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
/// Declarations of functions for identifying wharf binaries and reading their
///    headers and containers.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "container.h"
#include "error.h"

//===-- Types -------------------------------------------------------------===//

/// Kinds of wharf binaries.
enum tek_wh_bin_kind {
  /// Patch.
  TEK_WH_BIN_KIND_patch,
  /// Signature.
  TEK_WH_BIN_KIND_signature
};
/// @copydoc tek_wh_bin_kind
typedef enum tek_wh_bin_kind tek_wh_bin_kind;

/// Summary of a wharf binary.
typedef struct tek_wh_info tek_wh_info;
/// @copydoc tek_wh_info
struct tek_wh_info {
  /// Kind of the binary.
  tek_wh_bin_kind kind;
  /// Compression settings from the header.
  tek_wh_comp_settings comp;
  /// For patches, the old container; for signatures, the only container.
  tek_wh_ctr old_ctr;
  /// For patches, the new container; for signatures, it's empty.
  tek_wh_ctr new_ctr;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Identify a wharf binary by its magic number.
///
/// @param [in] in
///    Pointer to the stream to read the magic number from. Only 4 bytes are
///    read.
/// @param [out] kind
///    Address of variable that receives the kind of the binary.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::TEK_WH_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
tek_wh_err tek_wh_identify(const tek_wh_istream *_Nonnull in,
                           tek_wh_bin_kind *_Nonnull kind);

/// Read the header and containers of a wharf binary.
///
/// @param [in] in
///    Pointer to the stream to read the binary from. Reading stops after the
///    containers.
/// @param [out] info
///    Address of variable that receives the summary. It must be freed with
///    @ref tek_wh_info_free after use.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::TEK_WH_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
tek_wh_err tek_wh_info_read(const tek_wh_istream *_Nonnull in,
                            tek_wh_info *_Nonnull info);

/// Free the memory allocated for a wharf binary summary.
///
/// @param [in, out] info
///    Pointer to the summary to free.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_wh_info_free(tek_wh_info *_Nonnull info);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
