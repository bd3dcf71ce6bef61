//===-- msg_stream.hpp - framed message stream ----------------------------===//
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
/// Declarations of the wharf binary reader and writer.
///
/// Every wharf binary starts with a 4-byte little-endian magic number,
///    followed by an uncompressed header message. Remaining messages form the
///    body, which is compressed as a single stream with the algorithm named
///    in the header. Each message is prefixed by its size encoded as a
///    Protobuf varint.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"

#include <cstddef>
#include <cstdint>
#include <google/protobuf/message_lite.h>
#include <memory>
#include <vector>

namespace tek::wharf {

/// Sequential reader of wharf binaries.
class [[gnu::visibility("internal")]] msg_reader {
  /// Buffered reader over the raw input.
  byte_reader raw;
  /// Decompressing source over @ref raw, created by @ref begin_body.
  std::unique_ptr<source> decomp;
  /// Buffered reader over @ref decomp.
  std::unique_ptr<byte_reader> body;
  /// Buffer for message data.
  std::vector<unsigned char> msg_buf;

  /// Read a varint-prefixed message.
  ///
  /// @param [in, out] reader
  ///    Reader to read the message from.
  /// @param [out] msg
  ///    Message object that receives parsed data.
  /// @param [out] eos
  ///    Variable that receives the value indicating whether the stream ended
  ///    cleanly before the message started.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err read_msg(byte_reader &reader, google::protobuf::MessageLite &msg,
                      bool &eos);

public:
  /// Maximum number of bytes in a varint.
  static constexpr int max_varint_size = 10;
  /// Step by which the message buffer grows while reading message data.
  static constexpr std::size_t buf_grow_step = 4 * 1024 * 1024;

  explicit msg_reader(source &raw_src) : raw{raw_src} {}

  /// Read the magic number.
  ///
  /// @param [out] magic
  ///    Variable that receives the magic number.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err read_magic(std::uint32_t &magic);
  /// Read the uncompressed header message.
  ///
  /// @param [out] msg
  ///    Message object that receives parsed data.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err read_header(google::protobuf::MessageLite &msg);
  /// Switch to reading the compressed body.
  ///
  /// @param comp
  ///    Compression algorithm value from the header.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err begin_body(int comp);
  /// Read the next body message, which must be present.
  ///
  /// @param [out] msg
  ///    Message object that receives parsed data.
  /// @return A @ref tek_wh_err indicating the result of operation,
  ///    @ref TEK_WH_ERRC_truncated if the body has ended.
  tek_wh_err read(google::protobuf::MessageLite &msg);
  /// Read the next body message if there is one.
  ///
  /// @param [out] msg
  ///    Message object that receives parsed data.
  /// @param [out] eos
  ///    Variable that receives the value indicating whether the body has
  ///    ended instead. @p msg is left untouched in that case.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err next(google::protobuf::MessageLite &msg, bool &eos);
};

/// Sequential writer of wharf binaries.
class [[gnu::visibility("internal")]] msg_writer {
  /// Raw output sink.
  sink &raw;
  /// Compressing sink over @ref raw, created by @ref begin_body.
  std::unique_ptr<sink> comp;
  /// Buffer for serialized messages.
  std::vector<unsigned char> msg_buf;

  /// Write a varint-prefixed message.
  tek_wh_err write_msg(sink &out, const google::protobuf::MessageLite &msg);

public:
  explicit msg_writer(sink &raw) noexcept : raw{raw} {}

  /// Write the magic number.
  ///
  /// @param magic
  ///    Magic number to write.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err write_magic(std::uint32_t magic);
  /// Write the uncompressed header message.
  ///
  /// @param [in] msg
  ///    Header message to write.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err write_header(const google::protobuf::MessageLite &msg);
  /// Switch to writing the compressed body.
  ///
  /// @param [in] settings
  ///    Compression settings for the body.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err begin_body(const tek_wh_comp_settings &settings);
  /// Write a body message.
  ///
  /// @param [in] msg
  ///    Message to write.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err write(const google::protobuf::MessageLite &msg);
  /// Flush the compressed body and finish the raw sink.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err finish();
};

} // namespace tek::wharf
