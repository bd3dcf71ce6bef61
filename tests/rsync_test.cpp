//===-- rsync_test.cpp - rsync engine tests -------------------------------===//
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
#include "tek/wharf/pwr.pb.h"
#include "test_utils.hpp"

#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

namespace tek::wharf::test {

namespace {

SyncOp block_range(std::int64_t file, std::int64_t block, std::int64_t span) {
  SyncOp op;
  op.set_type(SyncOp::BLOCK_RANGE);
  op.set_fileindex(file);
  op.set_blockindex(block);
  op.set_blockspan(span);
  return op;
}

SyncOp data(std::string_view bytes) {
  SyncOp op;
  op.set_type(SyncOp::DATA);
  op.set_data(std::string{bytes});
  return op;
}

SyncOp hey() {
  SyncOp op;
  op.set_type(SyncOp::HEY_YOU_DID_IT);
  return op;
}

std::string as_string(const vector_sink &sink) {
  return {sink.data.begin(), sink.data.end()};
}

/// Counts progress and optionally reports cancellation.
class counting_monitor final : public apply_monitor {
public:
  bool cancel{};
  std::int64_t written{};

  bool cancelled() const noexcept override { return cancel; }
  void on_written(std::int64_t bytes) override { written += bytes; }
};

} // namespace

TEST(rsync, interleaves_blocks_and_data) {
  mem_old_root old{{"abcd"}};
  const std::vector ops{block_range(0, 0, 1), data("XY"), block_range(0, 1, 1),
                        hey()};
  vector_sink out;
  counting_monitor monitor;
  ASSERT_TRUE(succeeded(rsync_apply(old, ops, 6, out, 2, &monitor)));
  EXPECT_EQ(as_string(out), "abXYcd");
  EXPECT_EQ(monitor.written, 6);
}

TEST(rsync, copies_across_files_and_overlapping_ranges) {
  mem_old_root old{{"0123", "abcdef"}};
  const std::vector ops{block_range(1, 1, 2), block_range(0, 0, 2),
                        block_range(1, 1, 1), hey()};
  vector_sink out;
  ASSERT_TRUE(succeeded(rsync_apply(old, ops, 10, out, 2, nullptr)));
  EXPECT_EQ(as_string(out), "cdef0123cd");
}

TEST(rsync, empty_file_from_empty_data) {
  mem_old_root old{std::vector<std::string>{}};
  const std::vector ops{data(""), hey()};
  vector_sink out;
  ASSERT_TRUE(succeeded(rsync_apply(old, ops, 0, out, 2, nullptr)));
  EXPECT_TRUE(out.data.empty());
}

TEST(rsync, rejects_range_past_old_file) {
  // The short last block can't be referenced as a whole block
  mem_old_root old{{"abc"}};
  const std::vector ops{block_range(0, 1, 1), hey()};
  vector_sink out;
  const auto res = rsync_apply(old, ops, 2, out, 2, nullptr);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_block_range);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_range));
}

TEST(rsync, rejects_negative_and_overflowing_ranges) {
  mem_old_root old{{"abcd"}};
  vector_sink out;
  const std::vector negative{block_range(0, -1, 1), hey()};
  EXPECT_EQ(rsync_apply(old, negative, 2, out, 2, nullptr).primary,
            TEK_WH_ERRC_block_range);
  const std::vector huge{block_range(0, INT64_MAX / 2, 4), hey()};
  EXPECT_EQ(rsync_apply(old, huge, 2, out, 2, nullptr).primary,
            TEK_WH_ERRC_block_range);
}

TEST(rsync, rejects_bad_file_index) {
  mem_old_root old{{"abcd"}};
  const std::vector ops{block_range(1, 0, 1), hey()};
  vector_sink out;
  EXPECT_EQ(rsync_apply(old, ops, 2, out, 2, nullptr).primary,
            TEK_WH_ERRC_file_index);
}

TEST(rsync, rejects_output_size_mismatch) {
  mem_old_root old{{"abcd"}};
  vector_sink out;
  const std::vector too_long{block_range(0, 0, 2), hey()};
  EXPECT_EQ(rsync_apply(old, too_long, 3, out, 2, nullptr).primary,
            TEK_WH_ERRC_size_mismatch);
  const std::vector too_short{data("ab"), hey()};
  vector_sink out2;
  const auto res = rsync_apply(old, too_short, 3, out2, 2, nullptr);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_size_mismatch);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_size));
}

TEST(rsync, requires_terminating_op) {
  mem_old_root old{std::vector<std::string>{}};
  const std::vector ops{data("ab")};
  vector_sink out;
  EXPECT_EQ(rsync_apply(old, ops, 2, out, 2, nullptr).primary,
            TEK_WH_ERRC_truncated);
}

TEST(rsync, stops_when_cancelled) {
  mem_old_root old{{"abcd"}};
  const std::vector ops{block_range(0, 0, 2), hey()};
  vector_sink out;
  counting_monitor monitor;
  monitor.cancel = true;
  const auto res = rsync_apply(old, ops, 4, out, 2, &monitor);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_cancelled);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_cancelled));
  EXPECT_TRUE(out.data.empty());
}

} // namespace tek::wharf::test
