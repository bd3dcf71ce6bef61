//===-- error.h - tek-wharf error type and function declarations ----------===//
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
/// Declarations of error-related types and functions used in tek-wharf.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"

//===-- Types -------------------------------------------------------------===//

/// tek-wharf error type values.
/// This type identifies the error domain and which fields in
///    @ref tek_wh_err are set, as well as their types. `primary` is set for all
///    error types.
enum tek_wh_err_type {
  /// Library internal error, only `primary` code is set.
  TEK_WH_ERR_TYPE_basic,
  /// Compound library internal error with a sub-operation defined by
  ///    `auxiliary` code, which has type @ref tek_wh_errc.
  TEK_WH_ERR_TYPE_sub,
  /// System call error, `auxiliary` code is an `errno` value. `extra` is set
  ///    to a non-zero @ref tek_wh_err_io_type and `uri` may be set to path to
  ///    the affected file.
  TEK_WH_ERR_TYPE_os,
  /// Compression library error, `auxiliary` is the library's own error code
  ///    (`BrotliDecoderErrorCode`, `ZSTD_ErrorCode` or zlib's `Z_*` value),
  ///    and `extra` is the @ref tek_wh_comp value identifying the library.
  TEK_WH_ERR_TYPE_codec
};
/// @copydoc tek_wh_err_type
typedef enum tek_wh_err_type tek_wh_err_type;

/// tek-wharf error codes.
enum tek_wh_errc {
  /// (0) Operation completed successfully.
  TEK_WH_ERRC_ok,
  /// (1) Bsdiff add operation reads outside of the old file.
  TEK_WH_ERRC_add_oob,
  /// (2) Rsync block range exceeds the old file's bounds.
  TEK_WH_ERRC_block_range,
  /// (3) Brotli compression or decompression error.
  TEK_WH_ERRC_brotli,
  /// (4) The operation has been cancelled.
  TEK_WH_ERRC_cancelled,
  /// (5) Failed to create a compression context.
  TEK_WH_ERRC_comp_init,
  /// (6) Failed to scan a directory into a container.
  TEK_WH_ERRC_ctr_scan,
  /// (7) Failed to create a patch.
  TEK_WH_ERRC_diff,
  /// (8) The patch contains more than one record for the same file.
  TEK_WH_ERRC_duplicate_file,
  /// (9) File index is out of container bounds.
  TEK_WH_ERRC_file_index,
  /// (10) GZip compression or decompression error.
  TEK_WH_ERRC_gzip,
  /// (11) Number of block hashes in the signature doesn't match its
  ///    container.
  TEK_WH_ERRC_hash_count,
  /// (12) Failed to identify a wharf binary.
  TEK_WH_ERRC_identify,
  /// (13) Failed to read wharf binary information.
  TEK_WH_ERRC_info,
  /// (14) Encountered an invalid varint.
  TEK_WH_ERRC_invalid_varint,
  /// (15) Magic number mismatch.
  TEK_WH_ERRC_magic_mismatch,
  /// (16) MD5 hashing error.
  TEK_WH_ERRC_md5,
  /// (17) Memory allocation error.
  TEK_WH_ERRC_mem_alloc,
  /// (18) Old file is shorter than declared by its container.
  TEK_WH_ERRC_old_file_short,
  /// (19) Failed to apply a patch.
  TEK_WH_ERRC_patch_apply,
  /// (20) Failed to deserialize a Protobuf message.
  TEK_WH_ERRC_protobuf_deserialize,
  /// (21) Failed to serialize a Protobuf message.
  TEK_WH_ERRC_protobuf_serialize,
  /// (22) Failed to verify files against a signature.
  TEK_WH_ERRC_sig_verify,
  /// (23) Failed to write a signature.
  TEK_WH_ERRC_sig_write,
  /// (24) Reconstructed file size doesn't match the declared one.
  TEK_WH_ERRC_size_mismatch,
  /// (25) Failed to read from the input stream.
  TEK_WH_ERRC_stream_read,
  /// (26) Failed to write to the output stream.
  TEK_WH_ERRC_stream_write,
  /// (27) Unexpected end of stream.
  TEK_WH_ERRC_truncated,
  /// (28) Encountered a message that is not valid at its position.
  TEK_WH_ERRC_unexpected_msg,
  /// (29) Unknown compression algorithm.
  TEK_WH_ERRC_unknown_comp,
  /// (30) Container path is absolute or escapes the container root.
  TEK_WH_ERRC_unsafe_path,
  /// (31) Compression algorithm support has been disabled at build time.
  TEK_WH_ERRC_unsupported_comp,
  /// (32) Failed to start a worker thread.
  TEK_WH_ERRC_wt_start,
  /// (33) Zstandard compression or decompression error.
  TEK_WH_ERRC_zstd
};
/// @copydoc tek_wh_errc
typedef enum tek_wh_errc tek_wh_errc;

/// Types of I/O operations that may fail.
enum tek_wh_err_io_type {
  /// Not an I/O operation.
  TEK_WH_ERR_IO_TYPE_none,
  /// Creating or opening a file or directory.
  TEK_WH_ERR_IO_TYPE_open,
  /// Getting file status.
  TEK_WH_ERR_IO_TYPE_stat,
  /// Reading data from a file.
  TEK_WH_ERR_IO_TYPE_read,
  /// Writing data to a file.
  TEK_WH_ERR_IO_TYPE_write,
  /// Creating a directory.
  TEK_WH_ERR_IO_TYPE_create_dir,
  /// Listing directory contents.
  TEK_WH_ERR_IO_TYPE_list_dir,
  /// Creating a symbolic link.
  TEK_WH_ERR_IO_TYPE_symlink,
  /// Reading a symbolic link target.
  TEK_WH_ERR_IO_TYPE_readlink,
  /// Moving a file.
  TEK_WH_ERR_IO_TYPE_move,
  /// Deleting a file or directory.
  TEK_WH_ERR_IO_TYPE_delete,
  /// Setting file permissions.
  TEK_WH_ERR_IO_TYPE_set_mode
};
/// @copydoc tek_wh_err_io_type
typedef enum tek_wh_err_io_type tek_wh_err_io_type;

/// Error classes that tek-wharf errors fall into.
enum tek_wh_err_class {
  /// Not an error.
  TEK_WH_ERR_CLASS_none,
  /// Malformed or unsupported wharf binary data.
  TEK_WH_ERR_CLASS_format,
  /// Addressing outside of file or container bounds.
  TEK_WH_ERR_CLASS_range,
  /// Reconstructed file length differs from the declared one.
  TEK_WH_ERR_CLASS_size,
  /// Underlying read or write failure.
  TEK_WH_ERR_CLASS_io,
  /// Operation cancelled by the caller.
  TEK_WH_ERR_CLASS_cancelled,
  /// Resource exhaustion or library failure.
  TEK_WH_ERR_CLASS_internal
};
/// @copydoc tek_wh_err_class
typedef enum tek_wh_err_class tek_wh_err_class;

/// tek-wharf error description structure.
typedef struct tek_wh_err tek_wh_err;
/// @copydoc tek_wh_err
struct tek_wh_err {
  // Type of the error. Defines which fields are set.
  tek_wh_err_type type;
  /// Primary error code. Defines the outermost operation that has failed.
  tek_wh_errc primary;
  /// Auxiliary error code, the value and type depend on @ref type.
  int auxiliary;
  /// Extra information value, the value and type depend on @ref type.
  int extra;
  /// May be set by certain errors to provide a file path, as a
  ///    null-terminated UTF-8 string.
  /// If set, must be freed with `free` after use.
  const char *_Nullable uri;
};

/// Human-readable messages for @ref tek_wh_err fields.
typedef struct tek_wh_err_msgs tek_wh_err_msgs;
/// @copydoc tek_wh_err_msgs
struct tek_wh_err_msgs {
  // Type of the error that the messages were produced for.
  tek_wh_err_type type;
  /// String representation of @ref type.
  const char *_Nonnull type_str;
  /// Message for the primary error code.
  const char *_Nonnull primary;
  /// Message for the auxiliary error code, if the error has one.
  const char *_Nullable auxiliary;
  /// Message for the extra error code, if the error has one.
  const char *_Nullable extra;
  /// Message identifying type of string that `uri` refers to.
  const char *_Nullable uri_type;
};

//===-- Functions ---------------------------------------------------------===//

/// Check whether specified error structure indicates success.
///
/// @param [in] err
///    Pointer to the error structure to examine.
/// @return Value indicating whether @p err indicates success.
[[gnu::nothrow, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline bool tek_wh_err_success(const tek_wh_err *_Nonnull err) {
  return err->primary == TEK_WH_ERRC_ok;
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get the class of specified error.
///
/// @param [in] err
///    Pointer to the error structure to classify.
/// @return The @ref tek_wh_err_class that the most specific error code in
///    @p err belongs to.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
tek_wh_err_class tek_wh_err_get_class(const tek_wh_err *_Nonnull err);

/// Get human-readable messages for specified error structure.
///
/// @param [in] err
///    Pointer to the error structure to get messages for.
/// @return A structure containing messages for the error structure fields. It
///    must be released with @ref tek_wh_err_release_msgs after use.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
tek_wh_err_msgs tek_wh_err_get_msgs(const tek_wh_err *_Nonnull err);

/// Release error messages.
///
/// @param [in, out] err_msgs
///    Pointer to the error messages structure to release.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_wh_err_release_msgs(tek_wh_err_msgs *_Nonnull err_msgs);

/// Free the resources held by an error structure.
///
/// @param [in, out] err
///    Pointer to the error structure to release.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_wh_err_release(tek_wh_err *_Nonnull err);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
