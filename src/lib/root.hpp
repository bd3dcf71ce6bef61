//===-- root.hpp - old and new tree access --------------------------------===//
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
/// Declarations of interfaces for reading files of the old tree by index and
///    staging files of the new tree.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "os.h"
#include "stream.hpp"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace tek::wharf {

/// Random-access reader of old tree files. Implementations must be safe to
///    use from multiple threads at once.
class [[gnu::visibility("internal")]] old_root {
public:
  virtual ~old_root() = default;

  /// Get the number of files in the old tree.
  virtual int num_files() const noexcept = 0;
  /// Get the declared size of a file.
  ///
  /// @param index
  ///    Index of the file, must be in range.
  /// @return Size of the file in bytes.
  virtual std::int64_t file_size(int index) const noexcept = 0;
  /// Read data from a file.
  ///
  /// @param index
  ///    Index of the file, must be in range.
  /// @param offset
  ///    Offset in the file to read from.
  /// @param [out] buf
  ///    Pointer to the buffer that receives the data.
  /// @param size
  ///    Number of bytes to read.
  /// @return A @ref tek_wh_err indicating the result of operation,
  ///    @ref TEK_WH_ERRC_old_file_short if the file ends before @p size bytes
  ///    are read.
  virtual tek_wh_err read(int index, std::int64_t offset, void *_Nonnull buf,
                          std::size_t size) = 0;
};

/// Old tree reader over a directory described by a container. File handles
///    are opened lazily and shared between threads.
class [[gnu::visibility("internal")]] dir_old_root final : public old_root {
  /// Handle for the root directory, not owned.
  tek_wh_os_handle root_handle;
  /// Container describing the tree.
  const tek_wh_ctr &ctr;
  /// File handles, indexed by file index.
  std::unique_ptr<unique_handle[]> handles;
  /// Mutex locking concurrent access to @ref handles.
  std::mutex handles_mtx;

  /// Get the handle for a file, opening it if necessary.
  tek_wh_err get_handle(int index, tek_wh_os_handle &handle);

public:
  dir_old_root(tek_wh_os_handle root_handle, const tek_wh_ctr &ctr)
      : root_handle{root_handle}, ctr{ctr},
        handles{new unique_handle[ctr.num_files]} {}

  int num_files() const noexcept override { return ctr.num_files; }
  std::int64_t file_size(int index) const noexcept override {
    return ctr.files[index].size;
  }
  tek_wh_err read(int index, std::int64_t offset, void *_Nonnull buf,
                  std::size_t size) override;
};

/// Staging directory in the new tree where files are reconstructed before
///    being moved to their final paths.
class [[gnu::visibility("internal")]] staging_area {
  /// Handle for the new tree's root directory, not owned.
  tek_wh_os_handle root_handle;
  /// Handle for the staging directory.
  unique_handle dir_handle;

public:
  explicit staging_area(tek_wh_os_handle root_handle) noexcept
      : root_handle{root_handle} {}

  /// Create the staging directory, removing a stale one if present.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err open();
  /// Create a staged file for specified file index.
  ///
  /// @param index
  ///    Index of the file in the new container.
  /// @param [out] out
  ///    Variable that receives the sink writing to the staged file.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err create(int index, std::unique_ptr<file_sink> &out);
  /// Set permissions of a staged file and move it to its final path.
  ///
  /// @param index
  ///    Index of the file in the new container.
  /// @param [in] file
  ///    Container entry of the file.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err commit(int index, const tek_wh_ctr_file &file);
  /// Remove the staging directory along with all remaining staged files.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err cleanup();
};

} // namespace tek::wharf
