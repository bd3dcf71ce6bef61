//===-- codec.hpp - compression stream transforms -------------------------===//
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
/// Declarations of factory functions for decompressing sources and
///    compressing sinks used for wharf binary bodies.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"

#include <memory>

namespace tek::wharf {

/// Create a source that decompresses data read from another source.
///
/// @param comp
///    Compression algorithm of the data. Any integer value is accepted, values
///    not in @ref tek_wh_comp are reported as unknown.
/// @param [in, out] upstream
///    Source to read compressed data from. Must outlive the created source.
/// @param [out] out
///    Variable that receives the created source.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err make_decompressor(int comp, source &upstream,
                             std::unique_ptr<source> &out);

/// Create a sink that compresses data before writing it to another sink.
///
/// @param [in] settings
///    Compression algorithm and quality to use.
/// @param [in, out] downstream
///    Sink to write compressed data to. Must outlive the created sink.
///    Finishing the created sink doesn't finish @p downstream.
/// @param [out] out
///    Variable that receives the created sink.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err make_compressor(const tek_wh_comp_settings &settings,
                           sink &downstream, std::unique_ptr<sink> &out);

/// Get the message for a compression library error code.
///
/// @param comp
///    Compression algorithm whose library reported the error.
/// @param code
///    Library-specific error code.
/// @return Static null-terminated message string, or `nullptr` if there is
///    no message for @p code.
[[gnu::visibility("internal")]]
const char *_Nullable codec_err_msg(tek_wh_comp comp, int code) noexcept;

} // namespace tek::wharf
