//===-- container_test.cpp - container tests ------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "container.hpp"

#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek/wharf/tlc.pb.h"
#include "test_utils.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <string_view>

namespace tek::wharf::test {

TEST(container, path_safety) {
  EXPECT_TRUE(path_is_safe("a"));
  EXPECT_TRUE(path_is_safe("dir/sub/file.bin"));
  EXPECT_TRUE(path_is_safe("..hidden/x"));
  EXPECT_FALSE(path_is_safe(""));
  EXPECT_FALSE(path_is_safe("/etc/passwd"));
  EXPECT_FALSE(path_is_safe("../escape"));
  EXPECT_FALSE(path_is_safe("a/../../b"));
  EXPECT_FALSE(path_is_safe("a//b"));
  EXPECT_FALSE(path_is_safe("a/./b"));
  EXPECT_FALSE(path_is_safe("a/"));
  EXPECT_FALSE(path_is_safe("a\\..\\b"));
  EXPECT_FALSE(path_is_safe(std::string_view{"a\0b", 3}));
}

TEST(container, masks_modes) {
  EXPECT_EQ(mask_mode(0), 0644u);
  EXPECT_EQ(mask_mode(0100755), 0755u);
  EXPECT_EQ(mask_mode(04700), 0744u);
  EXPECT_EQ(mask_dir_mode(0), 0744u);
  EXPECT_EQ(mask_dir_mode(0755), 0755u);
}

TEST(container, counts_blocks) {
  EXPECT_EQ(tek_wh_file_num_blocks(0), 1);
  EXPECT_EQ(tek_wh_file_num_blocks(1), 1);
  EXPECT_EQ(tek_wh_file_num_blocks(TEK_WH_BLOCK_SIZE), 1);
  EXPECT_EQ(tek_wh_file_num_blocks(TEK_WH_BLOCK_SIZE + 1), 2);
}

TEST(container, converts_from_proto) {
  Container proto;
  auto &file = *proto.add_files();
  file.set_path("bin/tool");
  file.set_mode(0755);
  file.set_size(10);
  auto &empty = *proto.add_files();
  empty.set_path("empty");
  empty.set_mode(0644);
  auto &dir = *proto.add_dirs();
  dir.set_path("bin");
  dir.set_mode(0755);
  auto &link = *proto.add_symlinks();
  link.set_path("tool");
  link.set_dest("bin/tool");
  link.set_mode(0777);
  unique_ctr ctr;
  ASSERT_TRUE(succeeded(ctr_from_proto(proto, ctr.get())));
  ASSERT_EQ(ctr->num_files, 2);
  EXPECT_STREQ(ctr->files[0].path, "bin/tool");
  EXPECT_EQ(ctr->files[0].mode, 0755u);
  EXPECT_EQ(ctr->files[0].size, 10);
  EXPECT_STREQ(ctr->files[1].path, "empty");
  EXPECT_EQ(ctr->files[1].size, 0);
  ASSERT_EQ(ctr->num_dirs, 1);
  EXPECT_STREQ(ctr->dirs[0].path, "bin");
  ASSERT_EQ(ctr->num_symlinks, 1);
  EXPECT_STREQ(ctr->symlinks[0].path, "tool");
  EXPECT_STREQ(ctr->symlinks[0].target, "bin/tool");
  EXPECT_EQ(ctr->size, 10);
  EXPECT_EQ(tek_wh_ctr_num_entries(&ctr.get()), 4);

  Container back;
  ctr_to_proto(ctr.get(), back);
  ASSERT_EQ(back.files_size(), 2);
  EXPECT_EQ(back.files(0).path(), "bin/tool");
  EXPECT_EQ(back.files(1).offset(), 10);
  EXPECT_EQ(back.size(), 10);
  ASSERT_EQ(back.symlinks_size(), 1);
  EXPECT_EQ(back.symlinks(0).dest(), "bin/tool");
}

TEST(container, empty_proto_gives_empty_container) {
  unique_ctr ctr;
  ASSERT_TRUE(succeeded(ctr_from_proto(Container{}, ctr.get())));
  EXPECT_EQ(ctr->num_files, 0);
  EXPECT_EQ(ctr->num_dirs, 0);
  EXPECT_EQ(ctr->num_symlinks, 0);
  EXPECT_EQ(ctr->size, 0);
}

TEST(container, rejects_unsafe_paths_and_sizes) {
  {
    Container proto;
    proto.add_files()->set_path("../outside");
    unique_ctr ctr;
    const auto res = ctr_from_proto(proto, ctr.get());
    EXPECT_EQ(res.primary, TEK_WH_ERRC_unsafe_path);
    EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
  }
  {
    Container proto;
    proto.add_symlinks()->set_path("/abs");
    unique_ctr ctr;
    EXPECT_EQ(ctr_from_proto(proto, ctr.get()).primary,
              TEK_WH_ERRC_unsafe_path);
  }
  {
    Container proto;
    auto &file = *proto.add_files();
    file.set_path("f");
    file.set_size(-1);
    unique_ctr ctr;
    EXPECT_EQ(ctr_from_proto(proto, ctr.get()).primary,
              TEK_WH_ERRC_size_mismatch);
  }
}

using container_scan = temp_dir_test;

TEST_F(container_scan, lists_entries_sorted_by_path) {
  write_file(dir / "b.txt", "bbb");
  write_file(dir / "a" / "y", "y");
  write_file(dir / "a" / "x", "xx");
  fs::create_directory(dir / "a" / "empty");
  fs::create_symlink("b.txt", dir / "c");
  write_file(dir / ".tek-wharf-staging" / "junk", "junk");
  fs::permissions(dir / "b.txt", fs::perms::owner_exec, fs::perm_options::add);

  tek_wh_ctr ctr;
  ASSERT_TRUE(succeeded(tek_wh_ctr_scan(dir.c_str(), &ctr)));
  ASSERT_EQ(ctr.num_files, 3);
  EXPECT_STREQ(ctr.files[0].path, "a/x");
  EXPECT_EQ(ctr.files[0].size, 2);
  EXPECT_STREQ(ctr.files[1].path, "a/y");
  EXPECT_STREQ(ctr.files[2].path, "b.txt");
  EXPECT_EQ(ctr.files[2].size, 3);
  EXPECT_TRUE(ctr.files[2].mode & 0100);
  ASSERT_EQ(ctr.num_dirs, 2);
  EXPECT_STREQ(ctr.dirs[0].path, "a");
  EXPECT_STREQ(ctr.dirs[1].path, "a/empty");
  ASSERT_EQ(ctr.num_symlinks, 1);
  EXPECT_STREQ(ctr.symlinks[0].path, "c");
  EXPECT_STREQ(ctr.symlinks[0].target, "b.txt");
  EXPECT_EQ(ctr.size, 6);
  tek_wh_ctr_free(&ctr);
}

TEST_F(container_scan, reports_missing_root) {
  tek_wh_ctr ctr;
  auto res = tek_wh_ctr_scan((dir / "missing").c_str(), &ctr);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_ctr_scan);
  EXPECT_EQ(res.type, TEK_WH_ERR_TYPE_os);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_io));
  tek_wh_err_release(&res);
}

} // namespace tek::wharf::test
