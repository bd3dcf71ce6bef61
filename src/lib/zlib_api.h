//===-- zlib_api.h - zlib adapter API -------------------------------------===//
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
/// Type definitions and macros that are resolved to zlib or zlib-ng based on
///    the build option.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "config.h" // IWYU pragma: keep

#ifdef TEK_WHB_GZIP

#ifdef TEK_WHB_ZNG
#include <zlib-ng.h>

typedef zng_stream twhi_z_stream;
#define twhi_z_deflate zng_deflate
#define twhi_z_deflateEnd zng_deflateEnd
#define twhi_z_deflateInit2 zng_deflateInit2
#define twhi_z_inflate zng_inflate
#define twhi_z_inflateEnd zng_inflateEnd
#define twhi_z_inflateInit2 zng_inflateInit2
#define twhi_z_inflateReset zng_inflateReset
#define twhi_z_zError zng_zError

#else // def TEK_WHB_ZNG
#include <zlib.h>

typedef z_stream twhi_z_stream;
#define twhi_z_deflate deflate
#define twhi_z_deflateEnd deflateEnd
#define twhi_z_deflateInit2 deflateInit2
#define twhi_z_inflate inflate
#define twhi_z_inflateEnd inflateEnd
#define twhi_z_inflateInit2 inflateInit2
#define twhi_z_inflateReset inflateReset
#define twhi_z_zError zError

#endif // def TEK_WHB_ZNG else

/// @def TWHI_Z_GZIP_WBITS
/// Window bits value selecting the maximum window size and the gzip wrapper.
#define TWHI_Z_GZIP_WBITS (16 + 15)

#endif // def TEK_WHB_GZIP
