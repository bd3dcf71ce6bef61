//===-- base.h - basic tek-wharf declarations -----------------------------===//
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
/// Declarations of tek-wharf's basic macros, constants, types and functions.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <stddef.h>
#include <stdint.h>

//===-- Compiler macros ---------------------------------------------------===//

#ifndef __clang__
// Clang nullability attributes are replaced with mock macros for other
//    compilers.

#ifndef _Nullable
#define _Nullable
#endif // ndef _Nullable
#ifndef _Nonnull
#define _Nonnull
#endif // ndef _Nonnull
#ifndef _Null_unspecified
#define _Null_unspecified
#endif // ndef _Null_unspecified

#endif // ndef __clang__

// Public API attribute.
#if defined(_WIN32) && !defined(TEK_WH_STATIC)

// Use DLL exports/imports.
#ifdef TEK_WH_EXPORT
#define TEK_WH_API dllexport
#else // def TEK_WH_EXPORT
#define TEK_WH_API dllimport
#endif // def TEK_WH_EXPORT else

#else // defined(_WIN32) && !defined(TEK_WH_STATIC)
#define TEK_WH_API visibility("default")
#endif // defined(_WIN32) && !defined(TEK_WH_STATIC) else

//===-- Constants ---------------------------------------------------------===//

/// @def TEK_WH_BLOCK_SIZE
/// Size of the blocks that files are split into for hashing and rsync block
///    addressing, in bytes. It is not stored in wharf binaries, so all
///    producers and consumers must use the same value.
#define TEK_WH_BLOCK_SIZE 65536
/// @def TEK_WH_PATCH_MAGIC
/// Magic number at the beginning of wharf patch files.
#define TEK_WH_PATCH_MAGIC 0x0FEF5F00
/// @def TEK_WH_SIG_MAGIC
/// Magic number at the beginning of wharf signature files.
#define TEK_WH_SIG_MAGIC (TEK_WH_PATCH_MAGIC + 1)

//===-- Common types ------------------------------------------------------===//

/// Compression algorithms that may be used for wharf binary bodies. Values
///    match the ones used in the wire format.
enum tek_wh_comp {
  /// No compression.
  TEK_WH_COMP_none,
  /// Brotli.
  TEK_WH_COMP_brotli,
  /// GZip (DEFLATE with gzip wrapper).
  TEK_WH_COMP_gzip,
  /// Zstandard.
  TEK_WH_COMP_zstd
};
/// @copydoc tek_wh_comp
typedef enum tek_wh_comp tek_wh_comp;

/// Compression settings stored in wharf binary headers.
typedef struct tek_wh_comp_settings tek_wh_comp_settings;
/// @copydoc tek_wh_comp_settings
struct tek_wh_comp_settings {
  /// Compression algorithm used for the body.
  tek_wh_comp algorithm;
  /// Compression quality level. It is only used when writing, and is stored
  ///    as metadata in the header.
  int quality;
};

/// Prototype of function that reads data from a stream.
///
/// @param [in, out] user_data
///    Opaque pointer that was provided along with the function.
/// @param [out] buf
///    Pointer to the buffer that receives the read data.
/// @param size
///    Maximum number of bytes to read.
/// @return Number of bytes written to @p buf, `0` at the end of stream, or a
///    negative value if a read error occurs.
typedef ptrdiff_t tek_wh_read_func(void *_Nullable user_data,
                                   void *_Nonnull buf, size_t size);

/// Prototype of function that writes data to a stream.
///
/// @param [in, out] user_data
///    Opaque pointer that was provided along with the function.
/// @param [in] buf
///    Pointer to the buffer containing data to write.
/// @param size
///    Number of bytes to write.
/// @return Value indicating whether all data has been written successfully.
typedef bool tek_wh_write_func(void *_Nullable user_data,
                               const void *_Nonnull buf, size_t size);

/// Readable byte stream descriptor.
typedef struct tek_wh_istream tek_wh_istream;
/// @copydoc tek_wh_istream
struct tek_wh_istream {
  /// Pointer to the function that reads the data.
  tek_wh_read_func *_Nonnull read;
  /// Opaque pointer passed to @ref read.
  void *_Nullable user_data;
};

/// Writable byte stream descriptor.
typedef struct tek_wh_ostream tek_wh_ostream;
/// @copydoc tek_wh_ostream
struct tek_wh_ostream {
  /// Pointer to the function that writes the data.
  tek_wh_write_func *_Nonnull write;
  /// Opaque pointer passed to @ref write.
  void *_Nullable user_data;
};

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get the version of tek-wharf library.
///
/// @return Pointer to the statically allocated null-terminated version string.
[[gnu::TEK_WH_API,
  gnu::returns_nonnull]] const char *_Nonnull tek_wh_version(void);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
