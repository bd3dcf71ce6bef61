//===-- error.h - error creation helpers ----------------------------------===//
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
/// Helper functions for creating @ref tek_wh_err objects.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-wharf/base.h"
#include "tek-wharf/error.h"

/// Create a basic @ref tek_wh_err for specified error code.
///
/// @param errc
///    Error code to create error object for.
/// @return A @ref tek_wh_err for specified error code.
[[gnu::nothrow, gnu::const]]
static inline tek_wh_err twh_err_basic(tek_wh_errc errc) {
  return
#ifdef __cplusplus
      {.type = TEK_WH_ERR_TYPE_basic,
       .primary = errc,
       .auxiliary = 0,
       .extra = 0,
       .uri = nullptr};
#else  // def __cplusplus
      (tek_wh_err){.type = TEK_WH_ERR_TYPE_basic, .primary = errc};
#endif // def __cplusplus else
}

/// Create a @ref tek_wh_err object indicating success.
/// @return A @ref tek_wh_err indicating success.
[[gnu::nothrow, gnu::const]]
static inline tek_wh_err twh_err_ok(void) {
  return twh_err_basic(TEK_WH_ERRC_ok);
}

/// Create a compound @ref tek_wh_err.
///
/// @param prim
///    Primary error code.
/// @param aux
///    Auxiliary error code.
/// @return A @ref tek_wh_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline tek_wh_err twh_err_sub(tek_wh_errc prim, tek_wh_errc aux) {
  return
#ifdef __cplusplus
      {.type = TEK_WH_ERR_TYPE_sub,
       .primary = prim,
       .auxiliary = aux,
       .extra = 0,
       .uri = nullptr};
#else  // def __cplusplus
      (tek_wh_err){
          .type = TEK_WH_ERR_TYPE_sub, .primary = prim, .auxiliary = aux};
#endif // def __cplusplus else
}

/// Create a compression library @ref tek_wh_err.
///
/// @param prim
///    Primary error code.
/// @param comp
///    Compression algorithm whose library reported the error.
/// @param code
///    Library-specific error code.
/// @return A @ref tek_wh_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline tek_wh_err twh_err_codec(tek_wh_errc prim, tek_wh_comp comp,
                                       int code) {
  return
#ifdef __cplusplus
      {.type = TEK_WH_ERR_TYPE_codec,
       .primary = prim,
       .auxiliary = code,
       .extra = static_cast<int>(comp),
       .uri = nullptr};
#else  // def __cplusplus
      (tek_wh_err){.type = TEK_WH_ERR_TYPE_codec,
                   .primary = prim,
                   .auxiliary = code,
                   .extra = (int)comp};
#endif // def __cplusplus else
}

/// Attribute an error returned by an internal routine to a top-level
///    operation.
///
/// @param prim
///    Error code of the top-level operation.
/// @param err
///    Error returned by the internal routine. Must not indicate success.
/// @return @p err with @p prim as its primary code. Basic errors become
///    compound ones with their original code as the auxiliary.
[[gnu::nothrow, gnu::const]]
static inline tek_wh_err twh_err_rebase(tek_wh_errc prim, tek_wh_err err) {
  if (err.type == TEK_WH_ERR_TYPE_basic) {
    return twh_err_sub(prim, err.primary);
  }
  err.primary = prim;
  return err;
}
