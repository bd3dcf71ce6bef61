//===-- rsync.cpp - rsync patch engine ------------------------------------===//
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
/// Implementation of @ref tek::wharf::rsync_applier.
///
/// The new file is built sequentially from block ranges of any old file and
///    literal data. A block range must lie entirely within the declared size
///    of its old file, so only whole blocks can be referenced.
///
//===----------------------------------------------------------------------===//
#include "engines.hpp"

#include "common/error.h"
#include "root.hpp"
#include "stream.hpp"
#include "tek-wharf/error.h"
#include "tek/wharf/pwr.pb.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace tek::wharf {

namespace {

/// Maximum number of bytes copied from an old file at once.
static constexpr std::int64_t copy_buf_size = 1024 * 1024;

} // namespace

tek_wh_err rsync_applier::feed(const SyncOp &op, bool &done) {
  done = false;
  if (monitor && monitor->cancelled()) {
    return twh_err_basic(TEK_WH_ERRC_cancelled);
  }
  switch (op.type()) {
  case SyncOp::BLOCK_RANGE: {
    const auto file_index = op.fileindex();
    if (file_index < 0 || file_index >= old.num_files()) {
      return twh_err_basic(TEK_WH_ERRC_file_index);
    }
    const auto index = static_cast<int>(file_index);
    std::int64_t offset;
    std::int64_t size;
    std::int64_t end;
    if (op.blockindex() < 0 || op.blockspan() < 0 ||
        __builtin_mul_overflow(op.blockindex(), block_size, &offset) ||
        __builtin_mul_overflow(op.blockspan(), block_size, &size) ||
        __builtin_add_overflow(offset, size, &end) ||
        end > old.file_size(index)) {
      return twh_err_basic(TEK_WH_ERRC_block_range);
    }
    if (size > new_size - written) {
      return twh_err_basic(TEK_WH_ERRC_size_mismatch);
    }
    if (!copy_buf) {
      copy_buf = std::make_unique_for_overwrite<unsigned char[]>(copy_buf_size);
    }
    while (offset < end) {
      const auto chunk = std::min(end - offset, copy_buf_size);
      if (const auto res = old.read(index, offset, copy_buf.get(),
                                    static_cast<std::size_t>(chunk));
          !tek_wh_err_success(&res)) {
        return res;
      }
      if (const auto res =
              out.write(copy_buf.get(), static_cast<std::size_t>(chunk));
          !tek_wh_err_success(&res)) {
        return res;
      }
      offset += chunk;
      written += chunk;
      if (monitor) {
        monitor->on_written(chunk);
      }
    }
    return twh_err_ok();
  } // case SyncOp::BLOCK_RANGE
  case SyncOp::DATA: {
    const auto &data = op.data();
    if (static_cast<std::int64_t>(data.size()) > new_size - written) {
      return twh_err_basic(TEK_WH_ERRC_size_mismatch);
    }
    if (data.empty()) {
      return twh_err_ok();
    }
    if (const auto res = out.write(data.data(), data.size());
        !tek_wh_err_success(&res)) {
      return res;
    }
    written += data.size();
    if (monitor) {
      monitor->on_written(data.size());
    }
    return twh_err_ok();
  }
  case SyncOp::HEY_YOU_DID_IT:
    done = true;
    return written == new_size ? twh_err_ok()
                               : twh_err_basic(TEK_WH_ERRC_size_mismatch);
  default:
    return twh_err_basic(TEK_WH_ERRC_unexpected_msg);
  } // switch (op.type())
}

tek_wh_err rsync_apply(old_root &old, std::span<const SyncOp> ops,
                       std::int64_t new_size, sink &out,
                       std::size_t block_size, apply_monitor *monitor) {
  rsync_applier applier{out, old, new_size, block_size, monitor};
  for (const auto &op : ops) {
    bool done;
    if (const auto res = applier.feed(op, done); !tek_wh_err_success(&res)) {
      return res;
    }
    if (done) {
      return twh_err_ok();
    }
  }
  return twh_err_basic(TEK_WH_ERRC_truncated);
}

} // namespace tek::wharf
