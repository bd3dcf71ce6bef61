//===-- patch_writer.cpp - patch construction -----------------------------===//
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
/// Implementation of @ref tek::wharf::patch_writer.
///
//===----------------------------------------------------------------------===//
#include "patch_writer.hpp"

#include "common/error.h"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "tek/wharf/bsdiff.pb.h"
#include "tek/wharf/pwr.pb.h"
#include "tek/wharf/tlc.pb.h"

#include <cstdint>
#include <span>

namespace tek::wharf {

tek_wh_err patch_writer::begin(const tek_wh_comp_settings &comp,
                               const Container &old_ctr,
                               const Container &new_ctr) {
  if (const auto res = writer.write_magic(TEK_WH_PATCH_MAGIC);
      !tek_wh_err_success(&res)) {
    return res;
  }
  PatchHeader header;
  auto &settings = *header.mutable_compression();
  settings.set_algorithm(static_cast<CompressionAlgorithm>(comp.algorithm));
  settings.set_quality(comp.quality);
  if (const auto res = writer.write_header(header);
      !tek_wh_err_success(&res)) {
    return res;
  }
  if (const auto res = writer.begin_body(comp); !tek_wh_err_success(&res)) {
    return res;
  }
  if (const auto res = writer.write(old_ctr); !tek_wh_err_success(&res)) {
    return res;
  }
  return writer.write(new_ctr);
}

tek_wh_err patch_writer::begin_rsync(std::int64_t file_index) {
  in_bsdiff = false;
  sync_header.Clear();
  sync_header.set_type(SyncHeader::RSYNC);
  sync_header.set_fileindex(file_index);
  return writer.write(sync_header);
}

tek_wh_err patch_writer::block_range(std::int64_t file_index,
                                     std::int64_t block_index,
                                     std::int64_t block_span) {
  op.Clear();
  op.set_type(SyncOp::BLOCK_RANGE);
  op.set_fileindex(file_index);
  op.set_blockindex(block_index);
  op.set_blockspan(block_span);
  return writer.write(op);
}

tek_wh_err patch_writer::data(std::span<const unsigned char> bytes) {
  op.Clear();
  op.set_type(SyncOp::DATA);
  op.set_data(reinterpret_cast<const char *>(bytes.data()),
              bytes.size());
  return writer.write(op);
}

tek_wh_err patch_writer::begin_bsdiff(std::int64_t file_index,
                                      std::int64_t old_index) {
  in_bsdiff = true;
  sync_header.Clear();
  sync_header.set_type(SyncHeader::BSDIFF);
  sync_header.set_fileindex(file_index);
  if (const auto res = writer.write(sync_header); !tek_wh_err_success(&res)) {
    return res;
  }
  BsdiffHeader bsdiff_header;
  bsdiff_header.set_targetindex(old_index);
  return writer.write(bsdiff_header);
}

tek_wh_err patch_writer::control(std::span<const unsigned char> add,
                                 std::span<const unsigned char> copy,
                                 std::int64_t seek) {
  ctrl.Clear();
  ctrl.set_add(reinterpret_cast<const char *>(add.data()), add.size());
  ctrl.set_copy(reinterpret_cast<const char *>(copy.data()), copy.size());
  ctrl.set_seek(seek);
  return writer.write(ctrl);
}

tek_wh_err patch_writer::end_file() {
  if (in_bsdiff) {
    ctrl.Clear();
    ctrl.set_eof(true);
    if (const auto res = writer.write(ctrl); !tek_wh_err_success(&res)) {
      return res;
    }
    in_bsdiff = false;
  }
  op.Clear();
  op.set_type(SyncOp::HEY_YOU_DID_IT);
  return writer.write(op);
}

} // namespace tek::wharf
