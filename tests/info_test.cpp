//===-- info_test.cpp - binary identification tests -----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "tek-wharf/info.h"

#include "patch_writer.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/signature.h"
#include "tek/wharf/tlc.pb.h"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <string>
#include <utility>

namespace tek::wharf::test {

namespace {

/// Write a patch with no file records between two small containers.
std::string make_patch() {
  Container old_ctr;
  auto &old_file = *old_ctr.add_files();
  old_file.set_path("a");
  old_file.set_size(3);
  old_ctr.set_size(3);
  Container new_ctr;
  new_ctr.add_dirs()->set_path("d");
  auto &new_file = *new_ctr.add_files();
  new_file.set_path("d/b");
  new_file.set_mode(0755);
  auto &link = *new_ctr.add_symlinks();
  link.set_path("l");
  link.set_dest("d/b");
  mem_ostream out;
  callback_sink sink{out.stream()};
  patch_writer writer{sink};
  EXPECT_TRUE(succeeded(
      writer.begin({.algorithm = TEK_WH_COMP_none, .quality = 5}, old_ctr,
                   new_ctr)));
  EXPECT_TRUE(succeeded(writer.finish()));
  return std::move(out.data);
}

using signature_info = temp_dir_test;

} // namespace

TEST(identify, recognizes_patches_and_signatures) {
  const auto patch = make_patch();
  mem_istream in{patch};
  const auto stream = in.stream();
  tek_wh_bin_kind kind;
  ASSERT_TRUE(succeeded(tek_wh_identify(&stream, &kind)));
  EXPECT_EQ(kind, TEK_WH_BIN_KIND_patch);
  // Only the magic is consumed
  EXPECT_EQ(in.position(), 4u);

  mem_istream sig_in{std::string("\x01\x5F\xEF\x0F", 4) + "rest"};
  const auto sig_stream = sig_in.stream();
  ASSERT_TRUE(succeeded(tek_wh_identify(&sig_stream, &kind)));
  EXPECT_EQ(kind, TEK_WH_BIN_KIND_signature);
}

TEST(identify, rejects_unknown_and_short_input) {
  tek_wh_bin_kind kind;
  mem_istream bad{std::string("PK\x03\x04", 4)};
  const auto bad_stream = bad.stream();
  auto res = tek_wh_identify(&bad_stream, &kind);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_identify);
  EXPECT_EQ(res.auxiliary, TEK_WH_ERRC_magic_mismatch);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));

  mem_istream short_in{std::string("\x00\x5F", 2)};
  const auto short_stream = short_in.stream();
  res = tek_wh_identify(&short_stream, &kind);
  EXPECT_EQ(res.auxiliary, TEK_WH_ERRC_truncated);

  const auto failing = failing_istream();
  res = tek_wh_identify(&failing, &kind);
  EXPECT_EQ(res.auxiliary, TEK_WH_ERRC_stream_read);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_io));
}

TEST(info_read, reads_patch_containers) {
  const auto patch = make_patch();
  mem_istream in{patch, 7};
  const auto stream = in.stream();
  tek_wh_info info;
  ASSERT_TRUE(succeeded(tek_wh_info_read(&stream, &info)));
  EXPECT_EQ(info.kind, TEK_WH_BIN_KIND_patch);
  EXPECT_EQ(info.comp.algorithm, TEK_WH_COMP_none);
  EXPECT_EQ(info.comp.quality, 5);
  ASSERT_EQ(info.old_ctr.num_files, 1);
  EXPECT_STREQ(info.old_ctr.files[0].path, "a");
  EXPECT_EQ(info.old_ctr.size, 3);
  ASSERT_EQ(info.new_ctr.num_files, 1);
  EXPECT_STREQ(info.new_ctr.files[0].path, "d/b");
  EXPECT_EQ(info.new_ctr.files[0].mode, 0755u);
  ASSERT_EQ(info.new_ctr.num_dirs, 1);
  ASSERT_EQ(info.new_ctr.num_symlinks, 1);
  EXPECT_STREQ(info.new_ctr.symlinks[0].target, "d/b");
  tek_wh_info_free(&info);
  EXPECT_EQ(info.old_ctr.num_files, 0);
}

TEST_F(signature_info, reads_container) {
  write_file(dir / "x", "xyz");
  tek_wh_ctr ctr;
  ASSERT_TRUE(succeeded(tek_wh_ctr_scan(dir.c_str(), &ctr)));
  mem_ostream sig;
  const auto out = sig.stream();
  const auto res = tek_wh_sig_write(
      dir.c_str(), &ctr, {.algorithm = TEK_WH_COMP_none, .quality = 2}, &out);
  tek_wh_ctr_free(&ctr);
  ASSERT_TRUE(succeeded(res));

  mem_istream in{sig.data};
  const auto stream = in.stream();
  tek_wh_info info;
  ASSERT_TRUE(succeeded(tek_wh_info_read(&stream, &info)));
  EXPECT_EQ(info.kind, TEK_WH_BIN_KIND_signature);
  EXPECT_EQ(info.comp.quality, 2);
  ASSERT_EQ(info.old_ctr.num_files, 1);
  EXPECT_STREQ(info.old_ctr.files[0].path, "x");
  EXPECT_EQ(info.old_ctr.files[0].size, 3);
  EXPECT_EQ(info.new_ctr.num_files, 0);
  EXPECT_EQ(info.new_ctr.files, nullptr);
  tek_wh_info_free(&info);
}

TEST(info_read, reports_damaged_binaries) {
  auto patch = make_patch();
  patch.resize(patch.size() - 2);
  mem_istream in{patch};
  const auto stream = in.stream();
  tek_wh_info info;
  const auto res = tek_wh_info_read(&stream, &info);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_info);
  EXPECT_EQ(res.auxiliary, TEK_WH_ERRC_truncated);
  EXPECT_EQ(info.old_ctr.num_files, 0);

  mem_istream bad{std::string(16, 'z')};
  const auto bad_stream = bad.stream();
  EXPECT_EQ(tek_wh_info_read(&bad_stream, &info).auxiliary,
            TEK_WH_ERRC_magic_mismatch);
}

} // namespace tek::wharf::test
