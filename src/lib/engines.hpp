//===-- engines.hpp - per-file patch engines ------------------------------===//
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
/// Declarations of engines reconstructing single new files from old tree
///    files and decoded patch operations. Appliers take operations one at a
///    time so that a record never has to be held in memory as a whole.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "root.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "tek-wharf/patch.h"
#include "tek/wharf/bsdiff.pb.h"
#include "tek/wharf/pwr.pb.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace tek::wharf {

/// Observer of engine progress, also providing the cancellation state.
class [[gnu::visibility("internal")]] apply_monitor {
public:
  virtual ~apply_monitor() = default;

  /// Check whether the operation should stop.
  virtual bool cancelled() const noexcept = 0;
  /// Report that data has been written to a new file.
  ///
  /// @param bytes
  ///    Number of bytes written.
  virtual void on_written(std::int64_t bytes) = 0;
};

/// Incremental reconstruction of a new file from rsync operations.
class [[gnu::visibility("internal")]] rsync_applier {
  sink &out;
  old_root &old;
  std::int64_t new_size;
  std::int64_t block_size;
  apply_monitor *_Nullable monitor;
  /// Number of bytes written to @ref out so far.
  std::int64_t written{};
  /// Buffer for block range copies, allocated on first use.
  std::unique_ptr<unsigned char[]> copy_buf;

public:
  rsync_applier(sink &out, old_root &old, std::int64_t new_size,
                std::size_t block_size,
                apply_monitor *_Nullable monitor) noexcept
      : out{out}, old{old}, new_size{new_size},
        block_size{static_cast<std::int64_t>(block_size)}, monitor{monitor} {}

  /// Apply a single operation.
  ///
  /// @param [in] op
  ///    The operation to apply.
  /// @param [out] done
  ///    Variable that receives the value indicating whether @p op was the
  ///    terminating operation and the file is complete.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err feed(const SyncOp &op, bool &done);
};

/// Incremental reconstruction of a new file from bsdiff controls.
class [[gnu::visibility("internal")]] bsdiff_applier {
  sink &out;
  old_root &old;
  std::int64_t new_size;
  tek_wh_bsdiff_oob oob;
  apply_monitor *_Nullable monitor;
  /// Index of the old file.
  int index{-1};
  /// Size of the old file.
  std::int64_t old_size{};
  /// Read cursor in the old file.
  std::int64_t old_pos{};
  /// Number of bytes written to @ref out so far.
  std::int64_t written{};
  /// Buffer for add results.
  std::vector<unsigned char> buf;

public:
  bsdiff_applier(sink &out, old_root &old, std::int64_t new_size,
                 tek_wh_bsdiff_oob oob,
                 apply_monitor *_Nullable monitor) noexcept
      : out{out}, old{old}, new_size{new_size}, oob{oob}, monitor{monitor} {}

  /// Select the old file that controls read from.
  ///
  /// @param old_index
  ///    Index of the old file.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err begin(std::int64_t old_index);
  /// Apply a single control.
  ///
  /// @param [in] ctrl
  ///    The control to apply.
  /// @param [out] done
  ///    Variable that receives the value indicating whether @p ctrl was the
  ///    terminating control.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err feed(const Control &ctrl, bool &done);
  /// Check that the new file has reached its declared size.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err finish() const noexcept;
};

/// Reconstruct a new file from rsync operations.
///
/// @param [in, out] old
///    Old tree reader.
/// @param ops
///    Operations of the file record, ending with `HEY_YOU_DID_IT`.
/// @param new_size
///    Declared size of the new file.
/// @param [in, out] out
///    Sink receiving the new file's data.
/// @param block_size
///    Size of a block addressed by block ranges, in bytes.
/// @param [in, out] monitor
///    Optional progress monitor.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err rsync_apply(old_root &old, std::span<const SyncOp> ops,
                       std::int64_t new_size, sink &out,
                       std::size_t block_size,
                       apply_monitor *_Nullable monitor);

/// Reconstruct a new file from bsdiff controls.
///
/// @param [in, out] old
///    Old tree reader.
/// @param old_index
///    Index of the old file to read from.
/// @param ctrls
///    Controls of the file record, the last one having `eof` set.
/// @param new_size
///    Declared size of the new file.
/// @param oob
///    Behavior of add operations reading outside of the old file.
/// @param [in, out] out
///    Sink receiving the new file's data.
/// @param [in, out] monitor
///    Optional progress monitor.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err bsdiff_apply(old_root &old, std::int64_t old_index,
                        std::span<const Control> ctrls, std::int64_t new_size,
                        tek_wh_bsdiff_oob oob, sink &out,
                        apply_monitor *_Nullable monitor);

} // namespace tek::wharf
