//===-- hash_test.cpp - block hash tests ----------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "hash.hpp"

#include "test_utils.hpp"

#include <cstddef>
#include <cstdio>
#include <gtest/gtest.h>
#include <string>

namespace tek::wharf::test {

namespace {

std::string to_hex(const md5_digest &digest) {
  std::string res;
  for (const auto byte : digest) {
    char buf[3];
    std::snprintf(buf, sizeof buf, "%02x", byte);
    res += buf;
  }
  return res;
}

} // namespace

TEST(hash, weak_hash_of_known_block) {
  // a = 97 + 98 + 99, b = 3·97 + 2·98 + 99
  EXPECT_EQ(weak_hash(bytes("abc")), 294u | (586u << 16));
  EXPECT_EQ(weak_hash({}), 0u);
}

TEST(hash, weak_hash_wraps_sums) {
  const std::string block(1000, '\xFF');
  // a = 255000 mod 2^16, b = 255·500500 mod 2^16
  EXPECT_EQ(weak_hash(bytes(block)),
            (255000u & 0xFFFF) | ((255u * 500500u) & 0xFFFF) << 16);
}

TEST(hash, rolling_matches_direct_computation) {
  const auto data = random_data(4096, 5);
  const std::size_t window = 512;
  rolling_hash hash;
  hash.reset(bytes(data).first(window));
  for (std::size_t start = 0;; ++start) {
    ASSERT_EQ(hash.value(), weak_hash(bytes(data).subspan(start, window)))
        << "window start " << start;
    if (start + window == data.size()) {
      break;
    }
    hash.roll(static_cast<unsigned char>(data[start]),
              static_cast<unsigned char>(data[start + window]));
  }
}

TEST(hash, md5_of_known_blocks) {
  md5_digest digest;
  ASSERT_TRUE(succeeded(md5(bytes("abc"), digest)));
  EXPECT_EQ(to_hex(digest), "900150983cd24fb0d6963f7d28e17f72");
  ASSERT_TRUE(succeeded(md5({}, digest)));
  EXPECT_EQ(to_hex(digest), "d41d8cd98f00b204e9800998ecf8427e");
}

} // namespace tek::wharf::test
