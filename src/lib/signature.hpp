//===-- signature.hpp - signature engine ----------------------------------===//
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
/// Declarations of signature generation and verification functions.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "msg_stream.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"
#include "tek-wharf/signature.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace tek::wharf {

/// Get the number of blocks in a file.
///
/// @param size
///    Size of the file, in bytes.
/// @param block_size
///    Size of a block, in bytes.
/// @return Number of blocks, at least 1.
constexpr std::int64_t num_blocks(std::int64_t size,
                                  std::size_t block_size) noexcept {
  const auto bs = static_cast<std::int64_t>(block_size);
  return size ? (size + bs - 1) / bs : 1;
}

/// Write the signature of a tree.
///
/// @param root_handle
///    Handle for the root directory of the tree.
/// @param [in] ctr
///    Container describing the tree.
/// @param [in] comp
///    Compression settings for the body.
/// @param [in, out] out
///    Sink that receives the signature. It's finished on success.
/// @param block_size
///    Size of a block, in bytes.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err sig_write(tek_wh_os_handle root_handle, const tek_wh_ctr &ctr,
                     const tek_wh_comp_settings &comp, sink &out,
                     std::size_t block_size = TEK_WH_BLOCK_SIZE);

/// Read the magic number, the header and the container of a signature,
///    leaving the reader positioned at the first block hash.
///
/// @param [in, out] reader
///    Reader to read the signature from.
/// @param [out] comp
///    Variable that receives compression settings from the header.
/// @param [out] ctr
///    Variable that receives the container. It must be freed with
///    @ref tek_wh_ctr_free after use.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err sig_read_head(msg_reader &reader, tek_wh_comp_settings &comp,
                         tek_wh_ctr &ctr);

/// Same as @ref sig_read_head, for a reader that has already consumed the
///    magic number.
[[gnu::visibility("internal")]]
tek_wh_err sig_read_header(msg_reader &reader, tek_wh_comp_settings &comp,
                           tek_wh_ctr &ctr);

/// Verify a tree against block hashes of its signature. Verification doesn't
///    stop on mismatches, all of them are collected.
///
/// @param root_handle
///    Handle for the root directory of the tree.
/// @param [in] ctr
///    Container from the signature.
/// @param [in, out] reader
///    Reader positioned at the first block hash.
/// @param [out] findings
///    Vector that receives discrepancies found.
/// @param block_size
///    Size of a block, in bytes.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err sig_verify_body(tek_wh_os_handle root_handle,
                           const tek_wh_ctr &ctr, msg_reader &reader,
                           std::vector<tek_wh_finding> &findings,
                           std::size_t block_size = TEK_WH_BLOCK_SIZE);

/// Copy findings into a caller-owned @ref tek_wh_findings.
///
/// @param [in] items
///    Findings to copy.
/// @param [out] findings
///    Variable that receives the copy. It must be freed with
///    @ref tek_wh_findings_free after use.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err findings_export(const std::vector<tek_wh_finding> &items,
                           tek_wh_findings &findings);

} // namespace tek::wharf
