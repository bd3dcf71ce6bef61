//===-- bsdiff.cpp - bsdiff patch engine ----------------------------------===//
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
/// Implementation of @ref tek::wharf::bsdiff_applier.
///
/// Each control applies its fields in order: `add` bytes are summed modulo
///    256 with old file bytes at the read cursor, `copy` bytes are written
///    verbatim, and `seek` moves the read cursor. The cursor is only
///    validated when an `add` uses it.
///
//===----------------------------------------------------------------------===//
#include "engines.hpp"

#include "common/error.h"
#include "root.hpp"
#include "stream.hpp"
#include "tek-wharf/error.h"
#include "tek-wharf/patch.h"
#include "tek/wharf/bsdiff.pb.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tek::wharf {

tek_wh_err bsdiff_applier::begin(std::int64_t old_index) {
  if (old_index < 0 || old_index >= old.num_files()) {
    return twh_err_basic(TEK_WH_ERRC_file_index);
  }
  index = static_cast<int>(old_index);
  old_size = old.file_size(index);
  old_pos = 0;
  return twh_err_ok();
}

tek_wh_err bsdiff_applier::feed(const Control &ctrl, bool &done) {
  done = false;
  if (monitor && monitor->cancelled()) {
    return twh_err_basic(TEK_WH_ERRC_cancelled);
  }
  // Add
  if (const auto &add = ctrl.add(); !add.empty()) {
    const auto size = static_cast<std::int64_t>(add.size());
    if (size > new_size - written) {
      return twh_err_basic(TEK_WH_ERRC_size_mismatch);
    }
    std::int64_t end;
    if (__builtin_add_overflow(old_pos, size, &end)) {
      return twh_err_basic(TEK_WH_ERRC_add_oob);
    }
    if (oob == TEK_WH_BSDIFF_OOB_fail && (old_pos < 0 || end > old_size)) {
      return twh_err_basic(TEK_WH_ERRC_add_oob);
    }
    buf.assign(add.size(), 0);
    // Read the part of the range that lies within the old file, the rest
    //    stays zeroed
    const auto read_start = std::clamp<std::int64_t>(old_pos, 0, old_size);
    const auto read_end = std::clamp<std::int64_t>(end, 0, old_size);
    if (read_start < read_end) {
      if (const auto res =
              old.read(index, read_start, &buf[read_start - old_pos],
                       static_cast<std::size_t>(read_end - read_start));
          !tek_wh_err_success(&res)) {
        return res;
      }
    }
    std::ranges::transform(
        buf, add, buf.begin(), [](unsigned char o, char a) {
          return static_cast<unsigned char>(o +
                                            static_cast<unsigned char>(a));
        });
    if (const auto res = out.write(buf.data(), buf.size());
        !tek_wh_err_success(&res)) {
      return res;
    }
    old_pos = end;
    written += size;
    if (monitor) {
      monitor->on_written(size);
    }
  } // if (!add.empty())
  // Copy
  if (const auto &copy = ctrl.copy(); !copy.empty()) {
    const auto size = static_cast<std::int64_t>(copy.size());
    if (size > new_size - written) {
      return twh_err_basic(TEK_WH_ERRC_size_mismatch);
    }
    if (const auto res = out.write(copy.data(), copy.size());
        !tek_wh_err_success(&res)) {
      return res;
    }
    written += size;
    if (monitor) {
      monitor->on_written(size);
    }
  }
  // Seek
  if (__builtin_add_overflow(old_pos, ctrl.seek(), &old_pos)) {
    return twh_err_basic(TEK_WH_ERRC_add_oob);
  }
  done = ctrl.eof();
  return twh_err_ok();
}

tek_wh_err bsdiff_applier::finish() const noexcept {
  return written == new_size ? twh_err_ok()
                             : twh_err_basic(TEK_WH_ERRC_size_mismatch);
}

tek_wh_err bsdiff_apply(old_root &old, std::int64_t old_index,
                        std::span<const Control> ctrls, std::int64_t new_size,
                        tek_wh_bsdiff_oob oob, sink &out,
                        apply_monitor *monitor) {
  bsdiff_applier applier{out, old, new_size, oob, monitor};
  if (const auto res = applier.begin(old_index); !tek_wh_err_success(&res)) {
    return res;
  }
  for (const auto &ctrl : ctrls) {
    bool done;
    if (const auto res = applier.feed(ctrl, done);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (done) {
      break;
    }
  }
  return applier.finish();
}

} // namespace tek::wharf
