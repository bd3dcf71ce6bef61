//===-- patch_writer.hpp - patch construction -----------------------------===//
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
/// Declaration of @ref tek::wharf::patch_writer.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "msg_stream.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "tek/wharf/bsdiff.pb.h"
#include "tek/wharf/pwr.pb.h"
#include "tek/wharf/tlc.pb.h"

#include <cstdint>
#include <span>

namespace tek::wharf {

/// Sequential writer of patch streams. A patch consists of the header, both
///    containers, and a record per new file started with @ref begin_rsync or
///    @ref begin_bsdiff and closed with @ref end_file.
class [[gnu::visibility("internal")]] patch_writer {
  msg_writer writer;
  /// Value indicating whether the current record is a bsdiff one.
  bool in_bsdiff{};
  // Message objects reused between writes
  SyncHeader sync_header;
  SyncOp op;
  Control ctrl;

public:
  explicit patch_writer(sink &out) noexcept : writer{out} {}

  /// Write the magic number, the header and both containers.
  ///
  /// @param [in] comp
  ///    Compression settings for the body.
  /// @param [in] old_ctr
  ///    Container describing the old tree.
  /// @param [in] new_ctr
  ///    Container describing the new tree.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err begin(const tek_wh_comp_settings &comp, const Container &old_ctr,
                   const Container &new_ctr);
  /// Start an rsync record.
  ///
  /// @param file_index
  ///    Index of the new file.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err begin_rsync(std::int64_t file_index);
  /// Write a block range operation.
  tek_wh_err block_range(std::int64_t file_index, std::int64_t block_index,
                         std::int64_t block_span);
  /// Write a literal data operation.
  tek_wh_err data(std::span<const unsigned char> bytes);
  /// Start a bsdiff record.
  ///
  /// @param file_index
  ///    Index of the new file.
  /// @param old_index
  ///    Index of the old file to diff against.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err begin_bsdiff(std::int64_t file_index, std::int64_t old_index);
  /// Write a bsdiff control.
  tek_wh_err control(std::span<const unsigned char> add,
                     std::span<const unsigned char> copy, std::int64_t seek);
  /// Close the current record.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err end_file();
  /// Flush the body and finish the output sink.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err finish() { return writer.finish(); }
};

} // namespace tek::wharf
