//===-- msg_stream.cpp - framed message stream ----------------------------===//
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
/// Implementation of @ref tek::wharf::msg_reader and
///    @ref tek::wharf::msg_writer.
///
//===----------------------------------------------------------------------===//
#include "msg_stream.hpp"

#include "codec.hpp"
#include "common/error.h"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"

#include <algorithm>
#include <array>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/message_lite.h>
#include <memory>

namespace tek::wharf {

using google::protobuf::MessageLite;
using google::protobuf::io::CodedOutputStream;

//===-- msg_reader --------------------------------------------------------===//

tek_wh_err msg_reader::read_msg(byte_reader &reader, MessageLite &msg,
                                bool &eos) {
  eos = false;
  // Decode the size varint
  std::uint64_t size = 0;
  for (int i = 0;; ++i) {
    unsigned char byte;
    std::size_t num_read;
    if (const auto res = reader.read(&byte, 1, num_read);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (!num_read) {
      if (i) {
        return twh_err_basic(TEK_WH_ERRC_truncated);
      }
      eos = true;
      return twh_err_ok();
    }
    // The last byte may only hold the top bit of the value, with no
    //    continuation
    if (i == max_varint_size - 1 && byte > 1) {
      return twh_err_basic(TEK_WH_ERRC_invalid_varint);
    }
    size |= static_cast<std::uint64_t>(byte & 0x7F) << (i * 7);
    if (!(byte & 0x80)) {
      break;
    }
  }
  if (size > INT_MAX) {
    return twh_err_basic(TEK_WH_ERRC_invalid_varint);
  }
  // Read message data, growing the buffer only as data actually arrives so
  //    that a bogus size can't trigger a huge allocation
  std::size_t num_read = 0;
  while (num_read < size) {
    const auto chunk = std::min<std::size_t>(size - num_read, buf_grow_step);
    if (msg_buf.size() < num_read + chunk) {
      msg_buf.resize(num_read + chunk);
    }
    if (const auto res = reader.read_exact(&msg_buf[num_read], chunk);
        !tek_wh_err_success(&res)) {
      return res;
    }
    num_read += chunk;
  }
  if (!msg.ParseFromArray(msg_buf.data(), static_cast<int>(size))) {
    return twh_err_basic(TEK_WH_ERRC_protobuf_deserialize);
  }
  return twh_err_ok();
}

tek_wh_err msg_reader::read_magic(std::uint32_t &magic) {
  std::array<unsigned char, 4> bytes;
  if (const auto res = raw.read_exact(bytes.data(), bytes.size());
      !tek_wh_err_success(&res)) {
    return res;
  }
  magic = static_cast<std::uint32_t>(bytes[0]) |
          static_cast<std::uint32_t>(bytes[1]) << 8 |
          static_cast<std::uint32_t>(bytes[2]) << 16 |
          static_cast<std::uint32_t>(bytes[3]) << 24;
  return twh_err_ok();
}

tek_wh_err msg_reader::read_header(MessageLite &msg) {
  bool eos;
  if (const auto res = read_msg(raw, msg, eos); !tek_wh_err_success(&res)) {
    return res;
  }
  return eos ? twh_err_basic(TEK_WH_ERRC_truncated) : twh_err_ok();
}

tek_wh_err msg_reader::begin_body(int comp) {
  if (const auto res = make_decompressor(comp, raw, decomp);
      !tek_wh_err_success(&res)) {
    return res;
  }
  body = std::make_unique<byte_reader>(*decomp);
  return twh_err_ok();
}

tek_wh_err msg_reader::read(MessageLite &msg) {
  bool eos;
  if (const auto res = next(msg, eos); !tek_wh_err_success(&res)) {
    return res;
  }
  return eos ? twh_err_basic(TEK_WH_ERRC_truncated) : twh_err_ok();
}

tek_wh_err msg_reader::next(MessageLite &msg, bool &eos) {
  return read_msg(*body, msg, eos);
}

//===-- msg_writer --------------------------------------------------------===//

tek_wh_err msg_writer::write_msg(sink &out, const MessageLite &msg) {
  const auto size = msg.ByteSizeLong();
  if (size > INT_MAX) {
    return twh_err_basic(TEK_WH_ERRC_protobuf_serialize);
  }
  msg_buf.resize(CodedOutputStream::VarintSize64(size) + size);
  const auto data_start =
      CodedOutputStream::WriteVarint64ToArray(size, msg_buf.data());
  if (!msg.SerializeToArray(data_start, static_cast<int>(size))) {
    return twh_err_basic(TEK_WH_ERRC_protobuf_serialize);
  }
  return out.write(msg_buf.data(), msg_buf.size());
}

tek_wh_err msg_writer::write_magic(std::uint32_t magic) {
  const std::array<unsigned char, 4> bytes{
      static_cast<unsigned char>(magic),
      static_cast<unsigned char>(magic >> 8),
      static_cast<unsigned char>(magic >> 16),
      static_cast<unsigned char>(magic >> 24)};
  return raw.write(bytes.data(), bytes.size());
}

tek_wh_err msg_writer::write_header(const MessageLite &msg) {
  return write_msg(raw, msg);
}

tek_wh_err msg_writer::begin_body(const tek_wh_comp_settings &settings) {
  return make_compressor(settings, raw, comp);
}

tek_wh_err msg_writer::write(const MessageLite &msg) {
  return write_msg(*comp, msg);
}

tek_wh_err msg_writer::finish() {
  if (const auto res = comp->finish(); !tek_wh_err_success(&res)) {
    return res;
  }
  return raw.finish();
}

} // namespace tek::wharf
