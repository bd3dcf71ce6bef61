//===-- container.cpp - container model -----------------------------------===//
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
/// Implementation of container conversion, scanning and materialization
///    functions, @ref tek_wh_ctr_scan and @ref tek_wh_ctr_free.
///
/// A parsed container stores all its entry arrays and strings in a single
///    buffer allocated directly from the system, with `files` always pointing
///    to its beginning.
///
//===----------------------------------------------------------------------===//
#include "container.hpp"

#include "common/error.h"
#include "os.h"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"
#include "tek/wharf/tlc.pb.h"

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace tek::wharf {

namespace {

//===-- Private functions -------------------------------------------------===//

/// Copy a string into the container's string area.
///
/// @param [in, out] next
///    Pointer to the next available character in the string area.
/// @param str
///    String to copy.
/// @return Pointer to the copied null-terminated string.
static const char *_Nonnull copy_str(char *_Nonnull &next,
                                     std::string_view str) noexcept {
  const auto res = next;
  std::ranges::copy(str, next);
  next[str.length()] = '\0';
  next += str.length() + 1;
  return res;
}

/// Recursively add entries of a directory to a Protobuf container.
///
/// @param dir_handle
///    Handle for the directory to scan.
/// @param prefix
///    Container path of the directory, empty for the root.
/// @param [in, out] proto
///    Protobuf container to add entries to.
/// @return A @ref tek_wh_err indicating the result of operation.
static tek_wh_err scan_subdir(tek_wh_os_handle dir_handle,
                              const std::string &prefix, Container &proto) {
  std::vector<std::string> names;
  {
    const std::unique_ptr<std::remove_pointer_t<twhi_os_dir_iter>,
                          decltype(&twhi_os_dir_iter_close)>
        iter{twhi_os_dir_iter_open(dir_handle), twhi_os_dir_iter_close};
    if (!iter) {
      return twhi_os_io_err_at(dir_handle, ".", TEK_WH_ERRC_ctr_scan,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_list_dir);
    }
    for (;;) {
      const auto name = twhi_os_dir_iter_next(iter.get());
      if (!name) {
        if (const auto errc = twhi_os_get_last_error(); errc) {
          return twhi_os_io_err_at(dir_handle, ".", TEK_WH_ERRC_ctr_scan, errc,
                                   TEK_WH_ERR_IO_TYPE_list_dir);
        }
        break;
      }
      if (prefix.empty() && std::strcmp(name, staging_dir_name) == 0) {
        continue;
      }
      names.emplace_back(name);
    }
  } // Listing scope
  std::ranges::sort(names);
  for (const auto &name : names) {
    twhi_os_stat st;
    if (!twhi_os_stat_at(dir_handle, name.c_str(), &st)) {
      return twhi_os_io_err_at(dir_handle, name.c_str(), TEK_WH_ERRC_ctr_scan,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_stat);
    }
    auto path = prefix.empty() ? name : prefix + '/' + name;
    switch (st.type) {
    case TWHI_OS_ENTRY_TYPE_file: {
      auto &file = *proto.add_files();
      file.set_path(std::move(path));
      file.set_mode(st.mode);
      file.set_size(st.size);
      file.set_offset(proto.size());
      proto.set_size(proto.size() + st.size);
      break;
    }
    case TWHI_OS_ENTRY_TYPE_dir: {
      auto &dir = *proto.add_dirs();
      dir.set_path(path);
      dir.set_mode(st.mode);
      const unique_handle subdir_handle{
          twhi_os_dir_open_at(dir_handle, name.c_str())};
      if (!subdir_handle) {
        return twhi_os_io_err_at(dir_handle, name.c_str(),
                                 TEK_WH_ERRC_ctr_scan, twhi_os_get_last_error(),
                                 TEK_WH_ERR_IO_TYPE_open);
      }
      if (const auto res = scan_subdir(subdir_handle.get(), path, proto);
          !tek_wh_err_success(&res)) {
        return res;
      }
      break;
    }
    case TWHI_OS_ENTRY_TYPE_symlink: {
      const std::unique_ptr<char, decltype(&std::free)> target{
          twhi_os_readlink_at(dir_handle, name.c_str()), std::free};
      if (!target) {
        return twhi_os_io_err_at(dir_handle, name.c_str(),
                                 TEK_WH_ERRC_ctr_scan, twhi_os_get_last_error(),
                                 TEK_WH_ERR_IO_TYPE_readlink);
      }
      auto &symlink = *proto.add_symlinks();
      symlink.set_path(std::move(path));
      symlink.set_mode(st.mode);
      symlink.set_dest(target.get());
      break;
    }
    case TWHI_OS_ENTRY_TYPE_other:
      // Device nodes, FIFOs and sockets are not representable
      break;
    }
  }
  return twh_err_ok();
}

/// Remove a filesystem entry, whatever its type is.
///
/// @param root_handle
///    Handle for the root directory.
/// @param [in] path
///    Path of the entry relative to the root.
/// @param prim
///    Primary error code to use for I/O errors.
/// @return A @ref tek_wh_err indicating the result of operation. A missing
///    entry is not an error.
static tek_wh_err remove_entry(tek_wh_os_handle root_handle,
                               const char *_Nonnull path, tek_wh_errc prim) {
  twhi_os_stat st;
  if (!twhi_os_stat_at(root_handle, path, &st)) {
    const auto errc = twhi_os_get_last_error();
    if (errc == TWHI_OS_ERR_FILE_NOT_FOUND) {
      return twh_err_ok();
    }
    return twhi_os_io_err_at(root_handle, path, prim, errc,
                             TEK_WH_ERR_IO_TYPE_stat);
  }
  if (st.type == TWHI_OS_ENTRY_TYPE_dir) {
    return twhi_os_dir_delete_at_rec(root_handle, path, prim);
  }
  if (!twhi_os_file_delete_at(root_handle, path)) {
    return twhi_os_io_err_at(root_handle, path, prim, twhi_os_get_last_error(),
                             TEK_WH_ERR_IO_TYPE_delete);
  }
  return twh_err_ok();
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

bool path_is_safe(std::string_view path) noexcept {
  if (path.empty() || path.front() == '/') {
    return false;
  }
  for (const auto component : std::views::split(path, '/')) {
    const std::string_view comp{component.begin(), component.end()};
    if (comp.empty() || comp == "." || comp == ".." ||
        comp.find('\\') != std::string_view::npos ||
        comp.find('\0') != std::string_view::npos) {
      return false;
    }
  }
  return true;
}

tek_wh_err ctr_from_proto(const Container &proto, tek_wh_ctr &ctr) {
  ctr = {};
  if (proto.files_size() >= INT_MAX || proto.dirs_size() >= INT_MAX ||
      proto.symlinks_size() >= INT_MAX) {
    return twh_err_basic(TEK_WH_ERRC_file_index);
  }
  // Validate entries and compute the buffer size
  std::size_t str_size = 0;
  std::int64_t total_size = 0;
  for (const auto &file : proto.files()) {
    if (!path_is_safe(file.path())) {
      return twh_err_basic(TEK_WH_ERRC_unsafe_path);
    }
    if (file.size() < 0 ||
        __builtin_add_overflow(total_size, file.size(), &total_size)) {
      return twh_err_basic(TEK_WH_ERRC_size_mismatch);
    }
    str_size += file.path().length() + 1;
  }
  for (const auto &dir : proto.dirs()) {
    if (!path_is_safe(dir.path())) {
      return twh_err_basic(TEK_WH_ERRC_unsafe_path);
    }
    str_size += dir.path().length() + 1;
  }
  for (const auto &symlink : proto.symlinks()) {
    if (!path_is_safe(symlink.path())) {
      return twh_err_basic(TEK_WH_ERRC_unsafe_path);
    }
    str_size += symlink.path().length() + symlink.dest().length() + 2;
  }
  const std::size_t buf_size =
      sizeof(tek_wh_ctr_file) * proto.files_size() +
      sizeof(tek_wh_ctr_dir) * proto.dirs_size() +
      sizeof(tek_wh_ctr_symlink) * proto.symlinks_size() + str_size;
  if (buf_size > INT_MAX) {
    return twh_err_basic(TEK_WH_ERRC_mem_alloc);
  }
  if (!buf_size) {
    return twh_err_ok();
  }
  // Allocate the buffer and set array pointers
  const auto buf = twhi_os_mem_alloc(buf_size);
  if (!buf) {
    return twh_err_basic(TEK_WH_ERRC_mem_alloc);
  }
  ctr.files = reinterpret_cast<tek_wh_ctr_file *>(buf);
  ctr.dirs = reinterpret_cast<tek_wh_ctr_dir *>(ctr.files + proto.files_size());
  ctr.symlinks =
      reinterpret_cast<tek_wh_ctr_symlink *>(ctr.dirs + proto.dirs_size());
  ctr.num_files = proto.files_size();
  ctr.num_dirs = proto.dirs_size();
  ctr.num_symlinks = proto.symlinks_size();
  ctr.size = total_size;
  ctr.buf_size = static_cast<int>(buf_size);
  auto next_str =
      reinterpret_cast<char *>(ctr.symlinks + proto.symlinks_size());
  // Copy entries
  for (int i = 0; const auto &file : proto.files()) {
    ctr.files[i++] = {.path = copy_str(next_str, file.path()),
                      .mode = file.mode(),
                      .size = file.size()};
  }
  for (int i = 0; const auto &dir : proto.dirs()) {
    ctr.dirs[i++] = {.path = copy_str(next_str, dir.path()),
                     .mode = dir.mode()};
  }
  for (int i = 0; const auto &symlink : proto.symlinks()) {
    const auto path = copy_str(next_str, symlink.path());
    ctr.symlinks[i++] = {.path = path,
                         .target = copy_str(next_str, symlink.dest()),
                         .mode = symlink.mode()};
  }
  if (!ctr.num_dirs) {
    ctr.dirs = nullptr;
  }
  if (!ctr.num_symlinks) {
    ctr.symlinks = nullptr;
  }
  return twh_err_ok();
}

void ctr_to_proto(const tek_wh_ctr &ctr, Container &proto) {
  proto.Clear();
  std::int64_t offset = 0;
  for (const auto &file : std::span{ctr.files, static_cast<std::size_t>(
                                                   ctr.num_files)}) {
    auto &pfile = *proto.add_files();
    pfile.set_path(file.path);
    pfile.set_mode(file.mode);
    pfile.set_size(file.size);
    pfile.set_offset(offset);
    offset += file.size;
  }
  for (const auto &dir :
       std::span{ctr.dirs, static_cast<std::size_t>(ctr.num_dirs)}) {
    auto &pdir = *proto.add_dirs();
    pdir.set_path(dir.path);
    pdir.set_mode(dir.mode);
  }
  for (const auto &symlink :
       std::span{ctr.symlinks, static_cast<std::size_t>(ctr.num_symlinks)}) {
    auto &psymlink = *proto.add_symlinks();
    psymlink.set_path(symlink.path);
    psymlink.set_mode(symlink.mode);
    psymlink.set_dest(symlink.target);
  }
  proto.set_size(ctr.size);
}

tek_wh_err ctr_scan_dir(tek_wh_os_handle root_handle, Container &proto) {
  proto.Clear();
  return scan_subdir(root_handle, {}, proto);
}

tek_wh_err ctr_make_parents(tek_wh_os_handle root_handle,
                            std::string_view path, tek_wh_errc prim) {
  for (auto pos = path.find('/'); pos != std::string_view::npos;
       pos = path.find('/', pos + 1)) {
    const std::string parent{path.substr(0, pos)};
    if (!twhi_os_dir_make_at(root_handle, parent.c_str())) {
      return twhi_os_io_err_at(root_handle, parent.c_str(), prim,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_create_dir);
    }
  }
  return twh_err_ok();
}

tek_wh_err ctr_make_dirs(tek_wh_os_handle root_handle, const tek_wh_ctr &ctr,
                         tek_wh_errc prim) {
  for (const auto &dir :
       std::span{ctr.dirs, static_cast<std::size_t>(ctr.num_dirs)}) {
    if (const auto res = ctr_make_parents(root_handle, dir.path, prim);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (!twhi_os_dir_make_at(root_handle, dir.path)) {
      return twhi_os_io_err_at(root_handle, dir.path, prim,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_create_dir);
    }
  }
  return twh_err_ok();
}

tek_wh_err ctr_make_symlinks(tek_wh_os_handle root_handle,
                             const tek_wh_ctr &ctr, tek_wh_errc prim) {
  for (const auto &symlink :
       std::span{ctr.symlinks, static_cast<std::size_t>(ctr.num_symlinks)}) {
    if (const auto res = ctr_make_parents(root_handle, symlink.path, prim);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (const auto res = remove_entry(root_handle, symlink.path, prim);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (!twhi_os_symlink_at(symlink.target, root_handle, symlink.path)) {
      return twhi_os_io_err_at(root_handle, symlink.path, prim,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_symlink);
    }
  }
  return twh_err_ok();
}

tek_wh_err ctr_set_dir_modes(tek_wh_os_handle root_handle,
                             const tek_wh_ctr &ctr, tek_wh_errc prim) {
  for (const auto &dir :
       std::span{ctr.dirs, static_cast<std::size_t>(ctr.num_dirs)}) {
    if (!twhi_os_set_mode_at(root_handle, dir.path, mask_dir_mode(dir.mode))) {
      return twhi_os_io_err_at(root_handle, dir.path, prim,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_set_mode);
    }
  }
  return twh_err_ok();
}

tek_wh_err ctr_remove_ghosts(tek_wh_os_handle root_handle,
                             const tek_wh_ctr &old_ctr,
                             const tek_wh_ctr &new_ctr, tek_wh_errc prim) {
  std::unordered_set<std::string_view> new_paths;
  new_paths.reserve(tek_wh_ctr_num_entries(&new_ctr));
  for (const auto &file : std::span{new_ctr.files, static_cast<std::size_t>(
                                                       new_ctr.num_files)}) {
    new_paths.emplace(file.path);
  }
  for (const auto &dir :
       std::span{new_ctr.dirs, static_cast<std::size_t>(new_ctr.num_dirs)}) {
    new_paths.emplace(dir.path);
  }
  for (const auto &symlink : std::span{
           new_ctr.symlinks, static_cast<std::size_t>(new_ctr.num_symlinks)}) {
    new_paths.emplace(symlink.path);
  }
  // Files and symlinks
  for (const auto &file : std::span{old_ctr.files, static_cast<std::size_t>(
                                                       old_ctr.num_files)}) {
    if (!new_paths.contains(file.path) &&
        !twhi_os_file_delete_at(root_handle, file.path)) {
      if (const auto errc = twhi_os_get_last_error();
          errc != TWHI_OS_ERR_FILE_NOT_FOUND) {
        return twhi_os_io_err_at(root_handle, file.path, prim, errc,
                                 TEK_WH_ERR_IO_TYPE_delete);
      }
    }
  }
  for (const auto &symlink : std::span{
           old_ctr.symlinks, static_cast<std::size_t>(old_ctr.num_symlinks)}) {
    if (!new_paths.contains(symlink.path) &&
        !twhi_os_file_delete_at(root_handle, symlink.path)) {
      if (const auto errc = twhi_os_get_last_error();
          errc != TWHI_OS_ERR_FILE_NOT_FOUND) {
        return twhi_os_io_err_at(root_handle, symlink.path, prim, errc,
                                 TEK_WH_ERR_IO_TYPE_delete);
      }
    }
  }
  // Directories, deepest first. Ones that still hold foreign entries are kept
  for (const auto &dir : std::span{old_ctr.dirs, static_cast<std::size_t>(
                                                     old_ctr.num_dirs)} |
                             std::views::reverse) {
    if (!new_paths.contains(dir.path) &&
        !twhi_os_dir_delete_at(root_handle, dir.path)) {
      if (const auto errc = twhi_os_get_last_error();
          errc != TWHI_OS_ERR_FILE_NOT_FOUND &&
          errc != TWHI_OS_ERR_DIR_NOT_EMPTY) {
        return twhi_os_io_err_at(root_handle, dir.path, prim, errc,
                                 TEK_WH_ERR_IO_TYPE_delete);
      }
    }
  }
  return twh_err_ok();
}

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_wh_err tek_wh_ctr_scan(const char *path, tek_wh_ctr *ctr) {
  *ctr = {};
  try {
    const unique_handle root_handle{twhi_os_dir_open(path)};
    if (!root_handle) {
      return twhi_os_io_err(path, TEK_WH_ERRC_ctr_scan,
                            twhi_os_get_last_error(), TEK_WH_ERR_IO_TYPE_open);
    }
    Container proto;
    if (const auto res = ctr_scan_dir(root_handle.get(), proto);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (const auto res = ctr_from_proto(proto, *ctr);
        !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_ctr_scan, res);
    }
    return twh_err_ok();
  } catch (const std::bad_alloc &) {
    return twh_err_sub(TEK_WH_ERRC_ctr_scan, TEK_WH_ERRC_mem_alloc);
  }
}

void tek_wh_ctr_free(tek_wh_ctr *ctr) {
  if (ctr->buf_size) {
    twhi_os_mem_free(ctr->files, ctr->buf_size);
  }
  *ctr = {};
}

} // extern "C"

} // namespace tek::wharf
