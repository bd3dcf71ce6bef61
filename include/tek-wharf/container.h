//===-- container.h - wharf container types and functions -----------------===//
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
/// Declarations of types and functions for working with wharf containers.
///
/// Container is the ordered manifest of a directory tree, listing its
///    directories, regular files and symbolic links with their permissions.
///    Files additionally carry their sizes, and their positions in the file
///    array (file indices) are how patches and signatures refer to them.
///    All paths are relative to the root of the tree and use `/` as the
///    separator.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"

#include <stdint.h>

//===-- Types -------------------------------------------------------------===//

/// Container directory entry.
typedef struct tek_wh_ctr_dir tek_wh_ctr_dir;
/// @copydoc tek_wh_ctr_dir
struct tek_wh_ctr_dir {
  /// Path to the directory, as a null-terminated UTF-8 string.
  const char *_Nonnull path;
  /// Permission bits of the directory.
  uint32_t mode;
};

/// Container file entry.
typedef struct tek_wh_ctr_file tek_wh_ctr_file;
/// @copydoc tek_wh_ctr_file
struct tek_wh_ctr_file {
  /// Path to the file, as a null-terminated UTF-8 string.
  const char *_Nonnull path;
  /// Permission bits of the file.
  uint32_t mode;
  /// Size of the file, in bytes.
  int64_t size;
};

/// Container symbolic link entry.
typedef struct tek_wh_ctr_symlink tek_wh_ctr_symlink;
/// @copydoc tek_wh_ctr_symlink
struct tek_wh_ctr_symlink {
  /// Path to the symbolic link, as a null-terminated UTF-8 string.
  const char *_Nonnull path;
  /// Target of the symbolic link, as a null-terminated UTF-8 string.
  const char *_Nonnull target;
  /// Permission bits of the symbolic link.
  uint32_t mode;
};

/// wharf container.
typedef struct tek_wh_ctr tek_wh_ctr;
/// @copydoc tek_wh_ctr
struct tek_wh_ctr {
  /// Pointer to the container's file entry array. Array index is the file
  ///    index.
  tek_wh_ctr_file *_Nullable files;
  /// Pointer to the container's directory entry array.
  tek_wh_ctr_dir *_Nullable dirs;
  /// Pointer to the container's symbolic link entry array.
  tek_wh_ctr_symlink *_Nullable symlinks;
  /// Total number of file entries in the container.
  int num_files;
  /// Total number of directory entries in the container.
  int num_dirs;
  /// Total number of symbolic link entries in the container.
  int num_symlinks;
  /// Total size of all files in the container, in bytes.
  int64_t size;
  /// Size of the buffer storing all entries, in bytes.
  int buf_size;
};

//===-- Functions ---------------------------------------------------------===//

/// Get the number of blocks that a file of specified size is split into.
///    Empty files still have one (empty) block.
///
/// @param size
///    Size of the file, in bytes.
/// @return Number of @ref TEK_WH_BLOCK_SIZE blocks covering the file.
[[gnu::nothrow, gnu::const]]
static inline int64_t tek_wh_file_num_blocks(int64_t size) {
  const int64_t num_blocks = (size + TEK_WH_BLOCK_SIZE - 1) / TEK_WH_BLOCK_SIZE;
  return num_blocks ? num_blocks : 1;
}

/// Get the total number of entries in a container.
///
/// @param [in] ctr
///    Pointer to the container to examine.
/// @return Sum of file, directory and symbolic link entry counts.
[[gnu::nothrow, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline int tek_wh_ctr_num_entries(const tek_wh_ctr *_Nonnull ctr) {
  return ctr->num_files + ctr->num_dirs + ctr->num_symlinks;
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Build a container describing the contents of a directory. Entries are
///    sorted by path; filesystem objects other than directories, regular
///    files and symbolic links are skipped.
///
/// @param [in] path
///    Path to the root directory to scan, as a null-terminated UTF-8 string.
/// @param [out] ctr
///    Address of variable that receives the container. It must be freed with
///    @ref tek_wh_ctr_free after use.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::TEK_WH_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1), gnu::access(write_only, 2)]]
tek_wh_err tek_wh_ctr_scan(const char *_Nonnull path,
                           tek_wh_ctr *_Nonnull ctr);

/// Free the memory allocated for a container.
///
/// @param [in, out] ctr
///    Pointer to the container to free.
[[gnu::TEK_WH_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void tek_wh_ctr_free(tek_wh_ctr *_Nonnull ctr);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
