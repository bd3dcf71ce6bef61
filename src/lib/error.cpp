//===-- error.cpp - error messages and classification ---------------------===//
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
/// Implementation of tek-wharf error functions.
///
//===----------------------------------------------------------------------===//
#include "tek-wharf/error.h"

#include "codec.hpp"
#include "os.h"
#include "tek-wharf/base.h"

#include <array>
#include <cstdlib>

namespace tek::wharf {

namespace {

//===-- Private variables -------------------------------------------------===//

/// Messages for @ref tek_wh_errc values.
static constexpr std::array errc_msgs{
    "Operation completed successfully",
    "Bsdiff add operation reads outside of the old file",
    "Rsync block range exceeds the old file's bounds",
    "Brotli compression or decompression error",
    "The operation has been cancelled",
    "Failed to create a compression context",
    "Failed to scan a directory into a container",
    "Failed to create a patch",
    "The patch contains more than one record for the same file",
    "File index is out of container bounds",
    "GZip compression or decompression error",
    "Number of block hashes in the signature doesn't match its container",
    "Failed to identify a wharf binary",
    "Failed to read wharf binary information",
    "Encountered an invalid varint",
    "Magic number mismatch",
    "MD5 hashing error",
    "Memory allocation error",
    "Old file is shorter than declared by its container",
    "Failed to apply a patch",
    "Failed to deserialize a Protobuf message",
    "Failed to serialize a Protobuf message",
    "Failed to verify files against a signature",
    "Failed to write a signature",
    "Reconstructed file size doesn't match the declared one",
    "Failed to read from the input stream",
    "Failed to write to the output stream",
    "Unexpected end of stream",
    "Encountered a message that is not valid at its position",
    "Unknown compression algorithm",
    "Container path is absolute or escapes the container root",
    "Compression algorithm support has been disabled at build time",
    "Failed to start a worker thread",
    "Zstandard compression or decompression error"};
static_assert(errc_msgs.size() == TEK_WH_ERRC_zstd + 1);

/// Classes of @ref tek_wh_errc values. Operation codes are classified as
///    internal, as they only describe the outermost failed operation.
static constexpr std::array errc_classes{
    TEK_WH_ERR_CLASS_none,      // ok
    TEK_WH_ERR_CLASS_range,     // add_oob
    TEK_WH_ERR_CLASS_range,     // block_range
    TEK_WH_ERR_CLASS_format,    // brotli
    TEK_WH_ERR_CLASS_cancelled, // cancelled
    TEK_WH_ERR_CLASS_internal,  // comp_init
    TEK_WH_ERR_CLASS_internal,  // ctr_scan
    TEK_WH_ERR_CLASS_internal,  // diff
    TEK_WH_ERR_CLASS_format,    // duplicate_file
    TEK_WH_ERR_CLASS_range,     // file_index
    TEK_WH_ERR_CLASS_format,    // gzip
    TEK_WH_ERR_CLASS_format,    // hash_count
    TEK_WH_ERR_CLASS_internal,  // identify
    TEK_WH_ERR_CLASS_internal,  // info
    TEK_WH_ERR_CLASS_format,    // invalid_varint
    TEK_WH_ERR_CLASS_format,    // magic_mismatch
    TEK_WH_ERR_CLASS_internal,  // md5
    TEK_WH_ERR_CLASS_internal,  // mem_alloc
    TEK_WH_ERR_CLASS_range,     // old_file_short
    TEK_WH_ERR_CLASS_internal,  // patch_apply
    TEK_WH_ERR_CLASS_format,    // protobuf_deserialize
    TEK_WH_ERR_CLASS_internal,  // protobuf_serialize
    TEK_WH_ERR_CLASS_internal,  // sig_verify
    TEK_WH_ERR_CLASS_internal,  // sig_write
    TEK_WH_ERR_CLASS_size,      // size_mismatch
    TEK_WH_ERR_CLASS_io,        // stream_read
    TEK_WH_ERR_CLASS_io,        // stream_write
    TEK_WH_ERR_CLASS_format,    // truncated
    TEK_WH_ERR_CLASS_format,    // unexpected_msg
    TEK_WH_ERR_CLASS_format,    // unknown_comp
    TEK_WH_ERR_CLASS_format,    // unsafe_path
    TEK_WH_ERR_CLASS_format,    // unsupported_comp
    TEK_WH_ERR_CLASS_internal,  // wt_start
    TEK_WH_ERR_CLASS_format};   // zstd
static_assert(errc_classes.size() == errc_msgs.size());

/// Messages for @ref tek_wh_err_io_type values.
static constexpr std::array io_type_msgs{"Not an I/O operation",
                                         "Open",
                                         "Get status",
                                         "Read",
                                         "Write",
                                         "Create directory",
                                         "List directory",
                                         "Create symbolic link",
                                         "Read symbolic link",
                                         "Move",
                                         "Delete",
                                         "Set permissions"};
static_assert(io_type_msgs.size() == TEK_WH_ERR_IO_TYPE_set_mode + 1);

/// Names of @ref tek_wh_comp values.
static constexpr std::array comp_names{"None", "Brotli", "GZip", "Zstandard"};

//===-- Private functions -------------------------------------------------===//

/// Get the message for an error code, tolerating out-of-range values.
static constexpr const char *errc_msg(int errc) noexcept {
  return errc >= 0 && static_cast<unsigned>(errc) < errc_msgs.size()
             ? errc_msgs[errc]
             : "Unknown error code";
}

/// Get the class of an error code, tolerating out-of-range values.
static constexpr tek_wh_err_class errc_class(int errc) noexcept {
  return errc >= 0 && static_cast<unsigned>(errc) < errc_classes.size()
             ? errc_classes[errc]
             : TEK_WH_ERR_CLASS_internal;
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_wh_err_class tek_wh_err_get_class(const tek_wh_err *err) {
  switch (err->type) {
  case TEK_WH_ERR_TYPE_basic:
    return errc_class(err->primary);
  case TEK_WH_ERR_TYPE_sub:
    return errc_class(err->auxiliary);
  case TEK_WH_ERR_TYPE_os:
    return TEK_WH_ERR_CLASS_io;
  case TEK_WH_ERR_TYPE_codec:
    return TEK_WH_ERR_CLASS_format;
  default:
    return TEK_WH_ERR_CLASS_internal;
  }
}

tek_wh_err_msgs tek_wh_err_get_msgs(const tek_wh_err *err) {
  tek_wh_err_msgs msgs{.type = err->type,
                       .type_str = "",
                       .primary = errc_msg(err->primary),
                       .auxiliary = nullptr,
                       .extra = nullptr,
                       .uri_type = err->uri ? "Path" : nullptr};
  switch (err->type) {
  case TEK_WH_ERR_TYPE_basic:
    msgs.type_str = "Basic error";
    break;
  case TEK_WH_ERR_TYPE_sub:
    msgs.type_str = "Compound error";
    msgs.auxiliary = errc_msg(err->auxiliary);
    break;
  case TEK_WH_ERR_TYPE_os:
    msgs.type_str = "System error";
    msgs.auxiliary = twhi_os_get_err_msg(err->auxiliary);
    if (err->extra >= 0 &&
        static_cast<unsigned>(err->extra) < io_type_msgs.size()) {
      msgs.extra = io_type_msgs[err->extra];
    }
    break;
  case TEK_WH_ERR_TYPE_codec:
    msgs.type_str = "Compression library error";
    msgs.auxiliary =
        codec_err_msg(static_cast<tek_wh_comp>(err->extra), err->auxiliary);
    if (err->extra >= 0 &&
        static_cast<unsigned>(err->extra) < comp_names.size()) {
      msgs.extra = comp_names[err->extra];
    }
    break;
  default:
    msgs.type_str = "Unknown error type";
  }
  return msgs;
}

void tek_wh_err_release_msgs(tek_wh_err_msgs *err_msgs) {
  // Only OS error messages are allocated
  if (err_msgs->type == TEK_WH_ERR_TYPE_os && err_msgs->auxiliary) {
    std::free(const_cast<char *>(err_msgs->auxiliary));
  }
  err_msgs->auxiliary = nullptr;
}

void tek_wh_err_release(tek_wh_err *err) {
  if (err->uri) {
    std::free(const_cast<char *>(err->uri));
    err->uri = nullptr;
  }
}

} // extern "C"

} // namespace tek::wharf
