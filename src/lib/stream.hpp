//===-- stream.hpp - byte stream interfaces -------------------------------===//
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
/// Declarations of byte source and sink interfaces that wharf binary readers,
///    writers and patch engines operate on, and their basic implementations.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace tek::wharf {

/// Readable byte stream interface.
class [[gnu::visibility("internal")]] source {
public:
  virtual ~source() = default;

  /// Read data from the stream.
  ///
  /// @param [out] buf
  ///    Pointer to the buffer that receives the data.
  /// @param size
  ///    Number of bytes to read.
  /// @param [out] num_read
  ///    Variable that receives the number of bytes read. It's less than
  ///    @p size only if the end of stream has been reached.
  /// @return A @ref tek_wh_err indicating the result of operation.
  virtual tek_wh_err read(void *_Nonnull buf, std::size_t size,
                          std::size_t &num_read) = 0;
};

/// Writable byte stream interface.
class [[gnu::visibility("internal")]] sink {
public:
  virtual ~sink() = default;

  /// Write data to the stream.
  ///
  /// @param [in] buf
  ///    Pointer to the buffer containing the data.
  /// @param size
  ///    Number of bytes to write.
  /// @return A @ref tek_wh_err indicating the result of operation.
  virtual tek_wh_err write(const void *_Nonnull buf, std::size_t size) = 0;
  /// Flush any buffered data and finalize the stream.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  virtual tek_wh_err finish() = 0;
};

/// Source reading from a caller-provided @ref tek_wh_istream.
class [[gnu::visibility("internal")]] callback_source final : public source {
  /// Stream descriptor provided by the caller.
  tek_wh_istream stream;

public:
  constexpr callback_source(const tek_wh_istream &stream) noexcept
      : stream{stream} {}

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override;
};

/// Sink writing to a caller-provided @ref tek_wh_ostream.
class [[gnu::visibility("internal")]] callback_sink final : public sink {
  /// Stream descriptor provided by the caller.
  tek_wh_ostream stream;

public:
  constexpr callback_sink(const tek_wh_ostream &stream) noexcept
      : stream{stream} {}

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override;
  tek_wh_err finish() override;
};

/// Source reading from a memory buffer.
class [[gnu::visibility("internal")]] span_source final : public source {
  /// Remaining data.
  std::span<const unsigned char> data;

public:
  constexpr span_source(std::span<const unsigned char> data) noexcept
      : data{data} {}

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override;
};

/// Sink appending to a byte vector.
class [[gnu::visibility("internal")]] vector_sink final : public sink {
public:
  /// Data written so far.
  std::vector<unsigned char> data;

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override;
  tek_wh_err finish() override;
};

/// Sink writing to a file, tracking the number of bytes written.
class [[gnu::visibility("internal")]] file_sink final : public sink {
  /// OS handle for the file.
  tek_wh_os_handle handle;
  /// Number of bytes written so far.
  std::int64_t written{};

public:
  /// Take ownership of a file handle.
  ///
  /// @param handle
  ///    OS handle for the file opened for writing.
  explicit file_sink(tek_wh_os_handle handle) noexcept : handle{handle} {}
  file_sink(const file_sink &) = delete;
  file_sink &operator=(const file_sink &) = delete;
  ~file_sink() override;

  tek_wh_err write(const void *_Nonnull buf, std::size_t size) override;
  tek_wh_err finish() override;
  /// Get the number of bytes written to the file.
  constexpr std::int64_t size() const noexcept { return written; }
};

/// Buffered reader providing exact and byte-wise reads over another source.
///    It is itself a source, so other transforms may be stacked on top of it
///    without losing buffered data.
class [[gnu::visibility("internal")]] byte_reader final : public source {
  /// Underlying source.
  source &upstream;
  /// Read buffer.
  std::unique_ptr<unsigned char[]> buf;
  /// Offset of the next unread byte in @ref buf.
  std::size_t pos{};
  /// Number of valid bytes in @ref buf.
  std::size_t end{};
  /// Value indicating whether @ref upstream has reached its end.
  bool upstream_eof{};

  /// Refill @ref buf from @ref upstream if it's empty.
  tek_wh_err fill();

public:
  /// Size of the read buffer, in bytes.
  static constexpr std::size_t buf_size = 64 * 1024;

  explicit byte_reader(source &upstream)
      : upstream{upstream}, buf{new unsigned char[buf_size]} {}

  tek_wh_err read(void *_Nonnull buf, std::size_t size,
                  std::size_t &num_read) override;
  /// Read exactly @p size bytes.
  ///
  /// @param [out] buf
  ///    Pointer to the buffer that receives the data.
  /// @param size
  ///    Number of bytes to read.
  /// @return A @ref tek_wh_err indicating the result of operation,
  ///    @ref TEK_WH_ERRC_truncated if the stream ends before @p size bytes are
  ///    read.
  tek_wh_err read_exact(void *_Nonnull buf, std::size_t size);
};

} // namespace tek::wharf
