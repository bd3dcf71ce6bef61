//===-- root.cpp - old and new tree access --------------------------------===//
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
/// Implementation of @ref tek::wharf::dir_old_root and
///    @ref tek::wharf::staging_area.
///
//===----------------------------------------------------------------------===//
#include "root.hpp"

#include "common/error.h"
#include "container.hpp"
#include "os.h"
#include "stream.hpp"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace tek::wharf {

namespace {

/// Buffer holding the name of a staged file.
struct staged_name {
  std::array<char, 16> buf;

  explicit staged_name(int index) noexcept {
    *std::to_chars(buf.data(), buf.data() + buf.size() - 1, index).ptr = '\0';
  }
  constexpr const char *_Nonnull c_str() const noexcept { return buf.data(); }
};

} // namespace

//===-- dir_old_root ------------------------------------------------------===//

tek_wh_err dir_old_root::get_handle(int index, tek_wh_os_handle &handle) {
  const std::scoped_lock lock{handles_mtx};
  auto &file_handle = handles[index];
  if (!file_handle) {
    file_handle.reset(twhi_os_file_open_at(
        root_handle, ctr.files[index].path, TWHI_OS_FILE_ACCESS_read));
    if (!file_handle) {
      return twhi_os_io_err_at(root_handle, ctr.files[index].path,
                               TEK_WH_ERRC_patch_apply,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_open);
    }
  }
  handle = file_handle.get();
  return twh_err_ok();
}

tek_wh_err dir_old_root::read(int index, std::int64_t offset, void *buf,
                              std::size_t size) {
  if (!size) {
    return twh_err_ok();
  }
  tek_wh_os_handle handle;
  if (const auto res = get_handle(index, handle); !tek_wh_err_success(&res)) {
    return res;
  }
  const auto num_read = twhi_os_file_read_at(handle, buf, size, offset);
  if (num_read == SIZE_MAX) {
    return twhi_os_io_err_at(root_handle, ctr.files[index].path,
                             TEK_WH_ERRC_patch_apply, twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_read);
  }
  if (num_read < size) {
    return twh_err_basic(TEK_WH_ERRC_old_file_short);
  }
  return twh_err_ok();
}

//===-- staging_area ------------------------------------------------------===//

tek_wh_err staging_area::open() {
  if (const auto res = twhi_os_dir_delete_at_rec(root_handle, staging_dir_name,
                                                 TEK_WH_ERRC_patch_apply);
      !tek_wh_err_success(&res)) {
    return res;
  }
  if (!twhi_os_dir_make_at(root_handle, staging_dir_name)) {
    return twhi_os_io_err_at(root_handle, staging_dir_name,
                             TEK_WH_ERRC_patch_apply, twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_create_dir);
  }
  dir_handle.reset(twhi_os_dir_open_at(root_handle, staging_dir_name));
  if (!dir_handle) {
    return twhi_os_io_err_at(root_handle, staging_dir_name,
                             TEK_WH_ERRC_patch_apply, twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_open);
  }
  return twh_err_ok();
}

tek_wh_err staging_area::create(int index, std::unique_ptr<file_sink> &out) {
  const staged_name name{index};
  const auto handle = twhi_os_file_create_at(dir_handle.get(), name.c_str(),
                                             TWHI_OS_FILE_ACCESS_write);
  if (handle == TWHI_OS_INVALID_HANDLE) {
    return twhi_os_io_err_at(dir_handle.get(), name.c_str(),
                             TEK_WH_ERRC_patch_apply, twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_open);
  }
  out = std::make_unique<file_sink>(handle);
  return twh_err_ok();
}

tek_wh_err staging_area::commit(int index, const tek_wh_ctr_file &file) {
  const staged_name name{index};
  if (!twhi_os_set_mode_at(dir_handle.get(), name.c_str(),
                           mask_mode(file.mode))) {
    return twhi_os_io_err_at(dir_handle.get(), name.c_str(),
                             TEK_WH_ERRC_patch_apply, twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_set_mode);
  }
  if (const auto res =
          ctr_make_parents(root_handle, file.path, TEK_WH_ERRC_patch_apply);
      !tek_wh_err_success(&res)) {
    return res;
  }
  if (!twhi_os_file_move(dir_handle.get(), name.c_str(), root_handle,
                         file.path)) {
    return twhi_os_io_err_at(root_handle, file.path, TEK_WH_ERRC_patch_apply,
                             twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_move);
  }
  return twh_err_ok();
}

tek_wh_err staging_area::cleanup() {
  dir_handle.reset();
  return twhi_os_dir_delete_at_rec(root_handle, staging_dir_name,
                                   TEK_WH_ERRC_patch_apply);
}

} // namespace tek::wharf
