//===-- patch.hpp - patch reading and application -------------------------===//
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
/// Declarations of internal patch functions, parameterized by block size.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "msg_stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/patch.h"
#include "tek-wharf/signature.h"

#include <cstddef>

namespace tek::wharf {

/// Read patch magic number, header and both containers.
///
/// @param [in, out] reader
///    Reader positioned at the start of the patch.
/// @param [out] comp
///    Variable that receives compression settings of the body.
/// @param [out] old_ctr
///    Variable that receives the old container.
/// @param [out] new_ctr
///    Variable that receives the new container.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err patch_read_head(msg_reader &reader, tek_wh_comp_settings &comp,
                           tek_wh_ctr &old_ctr, tek_wh_ctr &new_ctr);

/// Same as @ref patch_read_head, for a reader that has already consumed the
///    magic number.
[[gnu::visibility("internal")]]
tek_wh_err patch_read_header(msg_reader &reader, tek_wh_comp_settings &comp,
                             tek_wh_ctr &old_ctr, tek_wh_ctr &new_ctr);

/// Default maximum number of payload bytes buffered for a single file
///    record. A record that grows past it is applied on the decoding thread
///    as it is read.
inline constexpr std::size_t max_job_payload = 16 * 1024 * 1024;

/// Apply a patch. This is @ref tek_wh_patch_apply with configurable block
///    size and record buffering limit, returning errors with placeholder
///    primary codes.
[[gnu::visibility("internal")]]
tek_wh_err patch_apply(const tek_wh_patch_apply_args &args,
                       tek_wh_findings *_Nullable findings,
                       std::size_t block_size = TEK_WH_BLOCK_SIZE,
                       std::size_t payload_limit = max_job_payload);

/// Create a patch. This is @ref tek_wh_diff with configurable block size,
///    returning errors with placeholder primary codes.
[[gnu::visibility("internal")]]
tek_wh_err diff(const tek_wh_diff_args &args,
                std::size_t block_size = TEK_WH_BLOCK_SIZE);

} // namespace tek::wharf
