//===-- test_utils.hpp - shared test helpers ------------------------------===//
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
/// Temporary directory fixture, in-memory streams and an in-memory old tree
///    used by the tests.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "common/error.h"
#include "root.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace tek::wharf::test {

namespace fs = std::filesystem;

/// Convert a string to a byte span.
inline std::span<const unsigned char> bytes(std::string_view str) noexcept {
  return {reinterpret_cast<const unsigned char *>(str.data()), str.size()};
}

/// Write a file, creating parent directories.
inline void write_file(const fs::path &path, std::string_view data) {
  fs::create_directories(path.parent_path());
  std::ofstream{path, std::ios::binary | std::ios::trunc}.write(
      data.data(), static_cast<std::streamsize>(data.size()));
}

/// Read a whole file.
inline std::string read_file(const fs::path &path) {
  std::ifstream file{path, std::ios::binary};
  return {std::istreambuf_iterator<char>{file},
          std::istreambuf_iterator<char>{}};
}

/// Produce deterministic pseudo-random data.
inline std::string random_data(std::size_t size, std::uint32_t seed) {
  std::string res(size, '\0');
  auto state = seed * 2654435761u + 1;
  for (auto &c : res) {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    c = static_cast<char>(state);
  }
  return res;
}

/// Check whether an error has specified class, printing its codes otherwise.
inline ::testing::AssertionResult has_class(const tek_wh_err &err,
                                            tek_wh_err_class cls) {
  const auto actual = tek_wh_err_get_class(&err);
  if (actual == cls) {
    return ::testing::AssertionSuccess();
  }
  return ::testing::AssertionFailure()
         << "error class " << actual << " (type " << err.type << ", primary "
         << err.primary << ", auxiliary " << err.auxiliary << ")";
}

/// Check that an error indicates success, printing its codes otherwise.
inline ::testing::AssertionResult succeeded(tek_wh_err err) {
  if (tek_wh_err_success(&err)) {
    return ::testing::AssertionSuccess();
  }
  auto res = ::testing::AssertionFailure()
             << "type " << err.type << ", primary " << err.primary
             << ", auxiliary " << err.auxiliary;
  if (err.uri) {
    res << ", uri " << err.uri;
  }
  tek_wh_err_release(&err);
  return res;
}

/// Input stream reading from a string, optionally in small pieces.
class mem_istream {
  std::string data;
  std::size_t pos{};
  /// Maximum number of bytes returned per read call.
  std::size_t max_read;

  static std::ptrdiff_t read(void *user_data, void *buf, std::size_t size) {
    auto &self = *static_cast<mem_istream *>(user_data);
    const auto n = std::min({size, self.data.size() - self.pos, self.max_read});
    std::memcpy(buf, self.data.data() + self.pos, n);
    self.pos += n;
    return static_cast<std::ptrdiff_t>(n);
  }

public:
  explicit mem_istream(std::string data, std::size_t max_read = SIZE_MAX)
      : data{std::move(data)}, max_read{max_read} {}

  tek_wh_istream stream() noexcept { return {.read = read, .user_data = this}; }
  std::size_t position() const noexcept { return pos; }
};

/// Input stream that always fails.
inline tek_wh_istream failing_istream() noexcept {
  return {.read = [](void *, void *, std::size_t) -> std::ptrdiff_t {
            return -1;
          },
          .user_data = nullptr};
}

/// Output stream appending to a string.
class mem_ostream {
  static bool write(void *user_data, const void *buf, std::size_t size) {
    static_cast<mem_ostream *>(user_data)->data.append(
        static_cast<const char *>(buf), size);
    return true;
  }

public:
  std::string data;

  tek_wh_ostream stream() noexcept {
    return {.write = write, .user_data = this};
  }
};

/// Old tree held in memory.
class mem_old_root final : public old_root {
  std::vector<std::string> files;

public:
  explicit mem_old_root(std::vector<std::string> files)
      : files{std::move(files)} {}

  int num_files() const noexcept override {
    return static_cast<int>(files.size());
  }
  std::int64_t file_size(int index) const noexcept override {
    return static_cast<std::int64_t>(files[index].size());
  }
  tek_wh_err read(int index, std::int64_t offset, void *buf,
                  std::size_t size) override {
    const auto &file = files[index];
    if (offset < 0 || static_cast<std::size_t>(offset) + size > file.size()) {
      return twh_err_basic(TEK_WH_ERRC_old_file_short);
    }
    std::memcpy(buf, file.data() + offset, size);
    return twh_err_ok();
  }
};

/// Fixture providing a fresh temporary directory.
class temp_dir_test : public ::testing::Test {
protected:
  fs::path dir;

  void SetUp() override {
    std::string tmpl = (fs::temp_directory_path() / "tek-wharf-XXXXXX");
    ASSERT_NE(mkdtemp(tmpl.data()), nullptr);
    dir = tmpl;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }
};

} // namespace tek::wharf::test
