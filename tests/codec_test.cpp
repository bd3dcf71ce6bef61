//===-- codec_test.cpp - compression transform tests ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "codec.hpp"

#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "test_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <gtest/gtest.h>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tek::wharf::test {

namespace {

/// Compress data, writing it in pieces of @p piece bytes.
tek_wh_err compress(const tek_wh_comp_settings &settings, std::string_view data,
                    std::size_t piece, std::vector<unsigned char> &out) {
  vector_sink downstream;
  std::unique_ptr<sink> comp;
  if (const auto res = make_compressor(settings, downstream, comp);
      !tek_wh_err_success(&res)) {
    return res;
  }
  for (std::size_t pos = 0; pos < data.size(); pos += piece) {
    const auto size = std::min(piece, data.size() - pos);
    if (const auto res = comp->write(data.data() + pos, size);
        !tek_wh_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = comp->finish(); !tek_wh_err_success(&res)) {
    return res;
  }
  out = std::move(downstream.data);
  return twh_err_ok();
}

/// Decompress data, reading it in pieces of @p piece bytes.
tek_wh_err decompress(tek_wh_comp comp, std::span<const unsigned char> data,
                      std::size_t piece, std::string &out) {
  span_source upstream{data};
  std::unique_ptr<source> decomp;
  if (const auto res = make_decompressor(comp, upstream, decomp);
      !tek_wh_err_success(&res)) {
    return res;
  }
  std::vector<char> buf(piece);
  for (;;) {
    std::size_t num_read;
    if (const auto res = decomp->read(buf.data(), buf.size(), num_read);
        !tek_wh_err_success(&res)) {
      return res;
    }
    out.append(buf.data(), num_read);
    if (num_read < buf.size()) {
      return twh_err_ok();
    }
  }
}

class codec_test : public ::testing::TestWithParam<tek_wh_comp> {
protected:
  /// Skip the test if the algorithm has been disabled at build time.
  void SetUp() override {
    vector_sink downstream;
    std::unique_ptr<sink> comp;
    if (make_compressor({.algorithm = GetParam(), .quality = 1}, downstream,
                        comp)
            .primary == TEK_WH_ERRC_unsupported_comp) {
      GTEST_SKIP() << "compression algorithm is disabled";
    }
  }
};

} // namespace

TEST_P(codec_test, round_trips_compressible_data) {
  std::string data;
  for (int i = 0; i < 20000; ++i) {
    data += "wharf block " + std::to_string(i % 97) + '\n';
  }
  std::vector<unsigned char> compressed;
  ASSERT_TRUE(succeeded(compress({.algorithm = GetParam(), .quality = 3}, data,
                                 1000, compressed)));
  if (GetParam() != TEK_WH_COMP_none) {
    EXPECT_LT(compressed.size(), data.size());
  }
  std::string decompressed;
  ASSERT_TRUE(
      succeeded(decompress(GetParam(), compressed, 4096, decompressed)));
  EXPECT_EQ(decompressed, data);
}

TEST_P(codec_test, round_trips_random_data_in_odd_pieces) {
  const auto data = random_data(300000, 7);
  std::vector<unsigned char> compressed;
  ASSERT_TRUE(succeeded(compress({.algorithm = GetParam(), .quality = 9}, data,
                                 70001, compressed)));
  std::string decompressed;
  ASSERT_TRUE(succeeded(decompress(GetParam(), compressed, 333, decompressed)));
  EXPECT_EQ(decompressed, data);
}

TEST_P(codec_test, round_trips_empty_stream) {
  std::vector<unsigned char> compressed;
  ASSERT_TRUE(succeeded(
      compress({.algorithm = GetParam(), .quality = 1}, "", 1, compressed)));
  std::string decompressed;
  ASSERT_TRUE(succeeded(decompress(GetParam(), compressed, 64, decompressed)));
  EXPECT_TRUE(decompressed.empty());
}

TEST_P(codec_test, detects_truncated_stream) {
  if (GetParam() == TEK_WH_COMP_none) {
    GTEST_SKIP() << "uncompressed data has no end marker";
  }
  const auto data = random_data(200000, 3);
  std::vector<unsigned char> compressed;
  ASSERT_TRUE(succeeded(compress({.algorithm = GetParam(), .quality = 1}, data,
                                 data.size(), compressed)));
  compressed.resize(compressed.size() / 2);
  std::string decompressed;
  const auto res = decompress(GetParam(), compressed, 4096, decompressed);
  EXPECT_FALSE(tek_wh_err_success(&res));
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
}

TEST_P(codec_test, rejects_garbage_input) {
  if (GetParam() == TEK_WH_COMP_none) {
    GTEST_SKIP() << "any data is valid uncompressed data";
  }
  const auto garbage = std::string(64, '\xEE') + random_data(4096, 11);
  std::string decompressed;
  const auto res = decompress(GetParam(), bytes(garbage), 4096, decompressed);
  EXPECT_FALSE(tek_wh_err_success(&res));
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
}

INSTANTIATE_TEST_SUITE_P(all, codec_test,
                         ::testing::Values(TEK_WH_COMP_none,
                                           TEK_WH_COMP_brotli,
                                           TEK_WH_COMP_gzip, TEK_WH_COMP_zstd));

TEST(codec, rejects_unknown_algorithm) {
  span_source upstream{std::span<const unsigned char>{}};
  std::unique_ptr<source> decomp;
  const auto res = make_decompressor(42, upstream, decomp);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_unknown_comp);
  EXPECT_FALSE(decomp);
  vector_sink downstream;
  std::unique_ptr<sink> comp;
  EXPECT_EQ(make_compressor({.algorithm = static_cast<tek_wh_comp>(42),
                             .quality = 1},
                            downstream, comp)
                .primary,
            TEK_WH_ERRC_unknown_comp);
}

TEST(codec, has_messages_for_library_errors) {
  EXPECT_EQ(codec_err_msg(TEK_WH_COMP_none, 1), nullptr);
  if (const auto msg = codec_err_msg(TEK_WH_COMP_brotli, 0)) {
    EXPECT_STRNE(msg, "");
  }
}

} // namespace tek::wharf::test
