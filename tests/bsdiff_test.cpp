//===-- bsdiff_test.cpp - bsdiff engine tests -----------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "engines.hpp"

#include "stream.hpp"
#include "tek-wharf/patch.h"
#include "tek/wharf/bsdiff.pb.h"
#include "test_utils.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

namespace tek::wharf::test {

namespace {

Control ctrl(std::string_view add, std::string_view copy, std::int64_t seek) {
  Control res;
  res.set_add(std::string{add});
  res.set_copy(std::string{copy});
  res.set_seek(seek);
  return res;
}

Control eof() {
  Control res;
  res.set_eof(true);
  return res;
}

std::string as_string(const vector_sink &sink) {
  return {sink.data.begin(), sink.data.end()};
}

} // namespace

TEST(bsdiff, adds_bytes_modulo_256) {
  mem_old_root old{{std::string{"\xFA\xFB", 2}}};
  const std::vector ctrls{ctrl(std::string_view{"\x05\x05", 2}, "", 0), eof()};
  vector_sink out;
  ASSERT_TRUE(succeeded(bsdiff_apply(old, 0, ctrls, 2, TEK_WH_BSDIFF_OOB_fail,
                                     out, nullptr)));
  EXPECT_EQ(as_string(out), std::string("\xFF\x00", 2));
}

TEST(bsdiff, applies_add_copy_seek_in_order) {
  mem_old_root old{{"abcdefgh"}};
  // Add 2 bytes at 0, copy "XY", skip 2 bytes, add 2 bytes at 4
  const std::string zeros(2, '\0');
  const std::vector ctrls{ctrl(zeros, "XY", 2), ctrl(zeros, "", -6),
                          ctrl(std::string_view{"\x01", 1}, "", 0), eof()};
  vector_sink out;
  ASSERT_TRUE(succeeded(bsdiff_apply(old, 0, ctrls, 7, TEK_WH_BSDIFF_OOB_fail,
                                     out, nullptr)));
  EXPECT_EQ(as_string(out), "abXYefb");
}

TEST(bsdiff, stops_at_eof_control) {
  mem_old_root old{{"abc"}};
  const std::vector ctrls{ctrl("", "new", 0), eof(), ctrl("", "ignored", 0)};
  vector_sink out;
  ASSERT_TRUE(succeeded(bsdiff_apply(old, 0, ctrls, 3, TEK_WH_BSDIFF_OOB_fail,
                                     out, nullptr)));
  EXPECT_EQ(as_string(out), "new");
}

TEST(bsdiff, fails_on_out_of_bounds_add) {
  mem_old_root old{{"abc"}};
  const std::string zeros(4, '\0');
  const std::vector ctrls{ctrl(zeros, "", 0), eof()};
  vector_sink out;
  const auto res = bsdiff_apply(old, 0, ctrls, 4, TEK_WH_BSDIFF_OOB_fail, out,
                                nullptr);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_add_oob);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_range));
}

TEST(bsdiff, zero_pads_out_of_bounds_add) {
  mem_old_root old{{"abc"}};
  const std::string ones(5, '\x01');
  // Start one byte before the file and run one byte past it
  const std::vector ctrls{ctrl("", "", -1), ctrl(ones, "", 0), eof()};
  vector_sink out;
  ASSERT_TRUE(succeeded(bsdiff_apply(
      old, 0, ctrls, 5, TEK_WH_BSDIFF_OOB_zero_pad, out, nullptr)));
  EXPECT_EQ(as_string(out), std::string("\x01" "bcd" "\x01", 5));
}

TEST(bsdiff, rejects_bad_old_index) {
  mem_old_root old{{"abc"}};
  const std::vector ctrls{eof()};
  vector_sink out;
  EXPECT_EQ(bsdiff_apply(old, 1, ctrls, 0, TEK_WH_BSDIFF_OOB_fail, out,
                         nullptr)
                .primary,
            TEK_WH_ERRC_file_index);
}

TEST(bsdiff, rejects_size_mismatch) {
  mem_old_root old{{"abc"}};
  const std::vector ctrls{ctrl("", "ab", 0), eof()};
  vector_sink out;
  EXPECT_EQ(bsdiff_apply(old, 0, ctrls, 3, TEK_WH_BSDIFF_OOB_fail, out,
                         nullptr)
                .primary,
            TEK_WH_ERRC_size_mismatch);
  vector_sink out2;
  EXPECT_EQ(bsdiff_apply(old, 0, ctrls, 1, TEK_WH_BSDIFF_OOB_fail, out2,
                         nullptr)
                .primary,
            TEK_WH_ERRC_size_mismatch);
}

} // namespace tek::wharf::test
