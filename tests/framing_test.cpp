//===-- framing_test.cpp - wharf binary framing tests ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "msg_stream.hpp"

#include "codec.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "tek-wharf/patch.h"
#include "tek/wharf/pwr.pb.h"
#include "test_utils.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tek::wharf::test {

namespace {

/// Write a patch-like binary with specified body compression and messages.
std::string write_binary(tek_wh_comp comp, const std::vector<SyncOp> &ops) {
  mem_ostream out;
  callback_sink raw{out.stream()};
  msg_writer writer{raw};
  PatchHeader header;
  header.mutable_compression()->set_algorithm(
      static_cast<CompressionAlgorithm>(comp));
  header.mutable_compression()->set_quality(1);
  EXPECT_TRUE(succeeded(writer.write_magic(TEK_WH_PATCH_MAGIC)));
  EXPECT_TRUE(succeeded(writer.write_header(header)));
  EXPECT_TRUE(succeeded(writer.begin_body({.algorithm = comp, .quality = 1})));
  for (const auto &op : ops) {
    EXPECT_TRUE(succeeded(writer.write(op)));
  }
  EXPECT_TRUE(succeeded(writer.finish()));
  return std::move(out.data);
}

std::vector<SyncOp> sample_ops() {
  std::vector<SyncOp> ops(3);
  ops[0].set_type(SyncOp::BLOCK_RANGE);
  ops[0].set_fileindex(3);
  ops[0].set_blockindex(1);
  ops[0].set_blockspan(7);
  ops[1].set_type(SyncOp::DATA);
  ops[1].set_data(random_data(100000, 1));
  ops[2].set_type(SyncOp::HEY_YOU_DID_IT);
  return ops;
}

/// Check whether a compression algorithm has been enabled at build time.
bool supported(tek_wh_comp comp) {
  vector_sink downstream;
  std::unique_ptr<sink> comp_sink;
  return make_compressor({.algorithm = comp, .quality = 1}, downstream,
                         comp_sink)
             .primary != TEK_WH_ERRC_unsupported_comp;
}

/// Read the magic and header of a binary prepared by the test.
tek_wh_err read_head(msg_reader &reader, PatchHeader &header) {
  std::uint32_t magic;
  if (const auto res = reader.read_magic(magic); !tek_wh_err_success(&res)) {
    return res;
  }
  EXPECT_EQ(magic, TEK_WH_PATCH_MAGIC);
  return reader.read_header(header);
}

} // namespace

TEST(framing, writes_magic_little_endian) {
  const auto data = write_binary(TEK_WH_COMP_none, {});
  ASSERT_GE(data.size(), 4u);
  EXPECT_EQ(data.substr(0, 4), std::string("\x00\x5F\xEF\x0F", 4));
}

TEST(framing, reads_back_messages_in_small_pieces) {
  const auto ops = sample_ops();
  for (const auto comp : {TEK_WH_COMP_none, TEK_WH_COMP_zstd}) {
    if (!supported(comp)) {
      continue;
    }
    const auto data = write_binary(comp, ops);
    mem_istream in{data, 3};
    callback_source src{in.stream()};
    msg_reader reader{src};
    PatchHeader header;
    ASSERT_TRUE(succeeded(read_head(reader, header)));
    EXPECT_EQ(header.compression().algorithm(), static_cast<int>(comp));
    ASSERT_TRUE(succeeded(reader.begin_body(header.compression().algorithm())));
    for (const auto &expected : ops) {
      SyncOp op;
      ASSERT_TRUE(succeeded(reader.read(op)));
      EXPECT_EQ(op.type(), expected.type());
      EXPECT_EQ(op.fileindex(), expected.fileindex());
      EXPECT_EQ(op.blockindex(), expected.blockindex());
      EXPECT_EQ(op.blockspan(), expected.blockspan());
      EXPECT_EQ(op.data(), expected.data());
    }
    SyncOp extra;
    bool eos = false;
    ASSERT_TRUE(succeeded(reader.next(extra, eos)));
    EXPECT_TRUE(eos);
    EXPECT_EQ(reader.read(extra).primary, TEK_WH_ERRC_truncated);
  }
}

TEST(framing, rejects_overlong_varint) {
  const auto data =
      std::string("\x00\x5F\xEF\x0F", 4) + std::string(11, '\x80');
  mem_istream in{data};
  callback_source src{in.stream()};
  msg_reader reader{src};
  PatchHeader header;
  const auto res = read_head(reader, header);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_invalid_varint);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
}

TEST(framing, rejects_varint_overflowing_last_byte) {
  // The value would wrap around to 0 if the excess bits were dropped
  const auto data = std::string("\x00\x5F\xEF\x0F", 4) +
                    std::string(9, '\x80') + "\x02" + "payload";
  mem_istream in{data};
  callback_source src{in.stream()};
  msg_reader reader{src};
  PatchHeader header;
  const auto res = read_head(reader, header);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_invalid_varint);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
}

TEST(framing, rejects_oversized_message_length) {
  const auto data =
      std::string("\x00\x5F\xEF\x0F", 4) + std::string("\xFF\xFF\xFF\xFF\x0F");
  mem_istream in{data};
  callback_source src{in.stream()};
  msg_reader reader{src};
  PatchHeader header;
  EXPECT_EQ(read_head(reader, header).primary, TEK_WH_ERRC_invalid_varint);
}

TEST(framing, reports_truncated_message) {
  // Length says 10 bytes, only 3 follow
  const auto data = std::string("\x00\x5F\xEF\x0F", 4) + "\x0A" + "abc";
  mem_istream in{data};
  callback_source src{in.stream()};
  msg_reader reader{src};
  PatchHeader header;
  EXPECT_EQ(read_head(reader, header).primary, TEK_WH_ERRC_truncated);
}

TEST(framing, reports_missing_header_and_short_magic) {
  {
    mem_istream in{std::string("\x00\x5F\xEF\x0F", 4)};
    callback_source src{in.stream()};
    msg_reader reader{src};
    PatchHeader header;
    EXPECT_EQ(read_head(reader, header).primary, TEK_WH_ERRC_truncated);
  }
  {
    mem_istream in{std::string("\x00\x5F", 2)};
    callback_source src{in.stream()};
    msg_reader reader{src};
    std::uint32_t magic;
    EXPECT_EQ(reader.read_magic(magic).primary, TEK_WH_ERRC_truncated);
  }
}

TEST(framing, reports_undecodable_message) {
  // Field 1 with wire type 7, which doesn't exist
  const auto data = std::string("\x00\x5F\xEF\x0F", 4) +
                    std::string("\x02\x0F\x00", 3);
  mem_istream in{data};
  callback_source src{in.stream()};
  msg_reader reader{src};
  PatchHeader header;
  const auto res = read_head(reader, header);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_protobuf_deserialize);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
}

TEST(framing, reports_stream_errors) {
  callback_source src{failing_istream()};
  msg_reader reader{src};
  std::uint32_t magic;
  const auto res = reader.read_magic(magic);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_stream_read);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_io));
}

} // namespace tek::wharf::test
