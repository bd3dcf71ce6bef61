//===-- os_test.cpp - OS abstraction layer tests --------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "os.h"

#include "test_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace tek::wharf::test {

class os_file : public temp_dir_test {};

TEST_F(os_file, writes_whole_buffer) {
  const auto data = random_data(3 * 1024 * 1024 + 17, 11);
  const unique_handle dir_handle{twhi_os_dir_open(dir.c_str())};
  ASSERT_TRUE(dir_handle);
  {
    const unique_handle file{twhi_os_file_create_at(
        dir_handle.get(), "f", TWHI_OS_FILE_ACCESS_write)};
    ASSERT_TRUE(file);
    ASSERT_TRUE(twhi_os_file_write(file.get(), data.data(), data.size()));
  }
  EXPECT_EQ(read_file(dir / "f"), data);

  const unique_handle file{
      twhi_os_file_open_at(dir_handle.get(), "f", TWHI_OS_FILE_ACCESS_read)};
  ASSERT_TRUE(file);
  std::string tail(100, '\0');
  ASSERT_EQ(twhi_os_file_read_at(file.get(), tail.data(), tail.size(),
                                 data.size() - tail.size()),
            tail.size());
  EXPECT_EQ(tail, data.substr(data.size() - tail.size()));
}

TEST(os_pipe, write_completes_with_slow_reader) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);
  const unique_handle read_end{fds[0]};
  unique_handle write_end{fds[1]};
  // Larger than the pipe capacity, so the data is accepted in several parts
  const auto data = random_data(1024 * 1024, 12);
  std::string received;
  std::thread reader{[&] {
    char buf[1000];
    for (;;) {
      const auto n = twhi_os_file_read(read_end.get(), buf, sizeof buf);
      if (!n || n == SIZE_MAX) {
        break;
      }
      received.append(buf, n);
    }
  }};
  const bool written =
      twhi_os_file_write(write_end.get(), data.data(), data.size());
  write_end.reset();
  reader.join();
  ASSERT_TRUE(written);
  EXPECT_EQ(received, data);
}

} // namespace tek::wharf::test
