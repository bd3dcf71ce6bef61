//===-- stream.cpp - byte stream implementations --------------------------===//
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
/// Implementation of basic @ref tek::wharf::source and
///    @ref tek::wharf::sink classes.
///
//===----------------------------------------------------------------------===//
#include "stream.hpp"

#include "common/error.h"
#include "os.h"
#include "tek-wharf/error.h"

#include <algorithm>
#include <cstddef>
#include <cstring>

namespace tek::wharf {

//===-- callback_source ---------------------------------------------------===//

tek_wh_err callback_source::read(void *buf, std::size_t size,
                                 std::size_t &num_read) {
  const auto cbuf = reinterpret_cast<unsigned char *>(buf);
  num_read = 0;
  while (num_read < size) {
    const auto res =
        stream.read(stream.user_data, cbuf + num_read, size - num_read);
    if (res < 0) {
      return twh_err_basic(TEK_WH_ERRC_stream_read);
    }
    if (res == 0) {
      break;
    }
    num_read += static_cast<std::size_t>(res);
  }
  return twh_err_ok();
}

//===-- callback_sink -----------------------------------------------------===//

tek_wh_err callback_sink::write(const void *buf, std::size_t size) {
  if (size && !stream.write(stream.user_data, buf, size)) {
    return twh_err_basic(TEK_WH_ERRC_stream_write);
  }
  return twh_err_ok();
}

tek_wh_err callback_sink::finish() { return twh_err_ok(); }

//===-- span_source -------------------------------------------------------===//

tek_wh_err span_source::read(void *buf, std::size_t size,
                             std::size_t &num_read) {
  num_read = std::min(size, data.size());
  std::memcpy(buf, data.data(), num_read);
  data = data.subspan(num_read);
  return twh_err_ok();
}

//===-- vector_sink -------------------------------------------------------===//

tek_wh_err vector_sink::write(const void *buf, std::size_t size) {
  const auto cbuf = reinterpret_cast<const unsigned char *>(buf);
  data.insert(data.end(), cbuf, cbuf + size);
  return twh_err_ok();
}

tek_wh_err vector_sink::finish() { return twh_err_ok(); }

//===-- file_sink ---------------------------------------------------------===//

file_sink::~file_sink() {
  if (handle != TWHI_OS_INVALID_HANDLE) {
    twhi_os_close_handle(handle);
  }
}

tek_wh_err file_sink::write(const void *buf, std::size_t size) {
  if (!twhi_os_file_write(handle, buf, size)) {
    return twhi_err_os(TEK_WH_ERRC_patch_apply, twhi_os_get_last_error(),
                       TEK_WH_ERR_IO_TYPE_write);
  }
  written += size;
  return twh_err_ok();
}

tek_wh_err file_sink::finish() {
  if (handle != TWHI_OS_INVALID_HANDLE) {
    twhi_os_close_handle(handle);
    handle = TWHI_OS_INVALID_HANDLE;
  }
  return twh_err_ok();
}

//===-- byte_reader -------------------------------------------------------===//

tek_wh_err byte_reader::fill() {
  if (pos < end || upstream_eof) {
    return twh_err_ok();
  }
  std::size_t num_read;
  if (const auto res = upstream.read(buf.get(), buf_size, num_read);
      !tek_wh_err_success(&res)) {
    return res;
  }
  pos = 0;
  end = num_read;
  if (num_read < buf_size) {
    upstream_eof = true;
  }
  return twh_err_ok();
}

tek_wh_err byte_reader::read(void *buf, std::size_t size,
                             std::size_t &num_read) {
  const auto cbuf = reinterpret_cast<unsigned char *>(buf);
  num_read = 0;
  while (num_read < size) {
    if (pos == end) {
      if (upstream_eof) {
        break;
      }
      // Bypass the buffer for large reads
      if (size - num_read >= buf_size) {
        std::size_t direct_read;
        if (const auto res =
                upstream.read(cbuf + num_read, size - num_read, direct_read);
            !tek_wh_err_success(&res)) {
          return res;
        }
        num_read += direct_read;
        if (num_read < size) {
          upstream_eof = true;
        }
        break;
      }
      if (const auto res = fill(); !tek_wh_err_success(&res)) {
        return res;
      }
      continue;
    }
    const auto n = std::min(size - num_read, end - pos);
    std::memcpy(cbuf + num_read, &this->buf[pos], n);
    pos += n;
    num_read += n;
  }
  return twh_err_ok();
}

tek_wh_err byte_reader::read_exact(void *buf, std::size_t size) {
  std::size_t num_read;
  if (const auto res = read(buf, size, num_read); !tek_wh_err_success(&res)) {
    return res;
  }
  return num_read == size ? twh_err_ok()
                          : twh_err_basic(TEK_WH_ERRC_truncated);
}

} // namespace tek::wharf
