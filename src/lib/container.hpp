//===-- container.hpp - container model -----------------------------------===//
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
/// Declarations of functions for converting, scanning and materializing
///    containers.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"
#include "tek/wharf/tlc.pb.h"

#include <cstdint>
#include <string_view>
#include <utility>

namespace tek::wharf {

/// Name of the staging directory created in the new root during patching.
///    It's excluded from scans.
inline constexpr char staging_dir_name[] = ".tek-wharf-staging";

/// Owning wrapper of a @ref tek_wh_ctr.
class [[gnu::visibility("internal")]] unique_ctr {
  tek_wh_ctr ctr{};

public:
  unique_ctr() noexcept = default;
  unique_ctr(const unique_ctr &) = delete;
  unique_ctr &operator=(const unique_ctr &) = delete;
  unique_ctr(unique_ctr &&other) noexcept
      : ctr{std::exchange(other.ctr, {})} {}
  ~unique_ctr() { tek_wh_ctr_free(&ctr); }

  constexpr tek_wh_ctr &get() noexcept { return ctr; }
  constexpr const tek_wh_ctr &get() const noexcept { return ctr; }
  constexpr const tek_wh_ctr *operator->() const noexcept { return &ctr; }
  /// Give up ownership of the container.
  tek_wh_ctr release() noexcept { return std::exchange(ctr, {}); }
};

/// Apply the permission mask used when materializing entries.
///
/// @param mode
///    Mode stored in the container.
/// @return Permission bits to set on the filesystem.
constexpr std::uint32_t mask_mode(std::uint32_t mode) noexcept {
  return (mode & 0777) | 0644;
}

/// Apply the permission mask for directories, which additionally keeps them
///    searchable by the owner.
///
/// @param mode
///    Mode stored in the container.
/// @return Permission bits to set on the filesystem.
constexpr std::uint32_t mask_dir_mode(std::uint32_t mode) noexcept {
  return mask_mode(mode) | 0100;
}

/// Check whether a container path is safe to resolve against a root
///    directory: relative, non-empty, `/`-separated, with no empty, `.` or
///    `..` components.
///
/// @param path
///    Path to check.
/// @return Value indicating whether @p path is safe.
[[gnu::visibility("internal")]]
bool path_is_safe(std::string_view path) noexcept;

/// Convert a Protobuf container into a @ref tek_wh_ctr, validating its
///    paths and sizes.
///
/// @param [in] proto
///    Protobuf container to convert.
/// @param [out] ctr
///    Container that receives the converted data. It must be freed with
///    @ref tek_wh_ctr_free after use.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_from_proto(const Container &proto, tek_wh_ctr &ctr);

/// Convert a @ref tek_wh_ctr into a Protobuf container.
///
/// @param [in] ctr
///    Container to convert.
/// @param [out] proto
///    Protobuf container that receives the converted data.
[[gnu::visibility("internal")]]
void ctr_to_proto(const tek_wh_ctr &ctr, Container &proto);

/// Build a Protobuf container describing the contents of a directory.
///
/// @param root_handle
///    Handle for the directory to scan.
/// @param [out] proto
///    Protobuf container that receives the entries.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_scan_dir(tek_wh_os_handle root_handle, Container &proto);

/// Create all missing parent directories of a container path.
///
/// @param root_handle
///    Handle for the root directory.
/// @param path
///    Container path whose parents are created.
/// @param prim
///    Primary error code to use for I/O errors.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_make_parents(tek_wh_os_handle root_handle,
                            std::string_view path, tek_wh_errc prim);

/// Create all directories of a container.
///
/// @param root_handle
///    Handle for the root directory.
/// @param [in] ctr
///    Container to create directories of.
/// @param prim
///    Primary error code to use for I/O errors.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_make_dirs(tek_wh_os_handle root_handle, const tek_wh_ctr &ctr,
                         tek_wh_errc prim);

/// Create all symbolic links of a container, replacing existing entries at
///    their paths.
///
/// @param root_handle
///    Handle for the root directory.
/// @param [in] ctr
///    Container to create symbolic links of.
/// @param prim
///    Primary error code to use for I/O errors.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_make_symlinks(tek_wh_os_handle root_handle,
                             const tek_wh_ctr &ctr, tek_wh_errc prim);

/// Set permissions of all directories of a container.
///
/// @param root_handle
///    Handle for the root directory.
/// @param [in] ctr
///    Container to set directory permissions of.
/// @param prim
///    Primary error code to use for I/O errors.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_set_dir_modes(tek_wh_os_handle root_handle,
                             const tek_wh_ctr &ctr, tek_wh_errc prim);

/// Remove files, symbolic links and directories of one container that are
///    not present in another. Directories are only removed if they are empty.
///
/// @param root_handle
///    Handle for the root directory.
/// @param [in] old_ctr
///    Container that previously described the root.
/// @param [in] new_ctr
///    Container that describes the root now.
/// @param prim
///    Primary error code to use for I/O errors.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err ctr_remove_ghosts(tek_wh_os_handle root_handle,
                             const tek_wh_ctr &old_ctr,
                             const tek_wh_ctr &new_ctr, tek_wh_errc prim);

} // namespace tek::wharf
