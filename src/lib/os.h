//===-- os.h - OS-specific code -------------------------------------------===//
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
/// Declarations of macros, types and functions that are implemented
///    differently on different operating systems. Implementations are provided
///    by corresponding os_*.cpp.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-wharf/base.h" // IWYU pragma: keep
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"

#include <stddef.h>
#include <stdint.h>

//===-- OS-specific declarations ------------------------------------------===//

#ifdef __linux__

#include <dirent.h>
#include <errno.h> // IWYU pragma: keep
#include <fcntl.h>

/// @def TWHI_OS_ERR_ALREADY_EXISTS
/// @ref tek_wh_os_errc value indicating that target file/directory already
///    exists.
#define TWHI_OS_ERR_ALREADY_EXISTS EEXIST
/// @def TWHI_OS_ERR_FILE_NOT_FOUND
/// @ref tek_wh_os_errc value indicating that a file was not found.
#define TWHI_OS_ERR_FILE_NOT_FOUND ENOENT
/// @def TWHI_OS_ERR_DIR_NOT_EMPTY
/// @ref tek_wh_os_errc value indicating that a directory is not empty.
#define TWHI_OS_ERR_DIR_NOT_EMPTY ENOTEMPTY
/// @def TWHI_OS_INVALID_HANDLE
/// Invalid value for @ref tek_wh_os_handle.
#define TWHI_OS_INVALID_HANDLE -1

/// File access modes.
enum twhi_os_file_access {
  TWHI_OS_FILE_ACCESS_read = O_RDONLY,
  TWHI_OS_FILE_ACCESS_write = O_WRONLY,
  TWHI_OS_FILE_ACCESS_rdwr = O_RDWR
};

/// Directory listing iterator.
typedef DIR *twhi_os_dir_iter;

#endif // def __linux__

//===-- OS-independent types ----------------------------------------------===//

/// @copydoc twhi_os_file_access
typedef enum twhi_os_file_access twhi_os_file_access;

/// Types of filesystem entries.
enum twhi_os_entry_type {
  /// Entry of a type that is not handled by the library.
  TWHI_OS_ENTRY_TYPE_other,
  /// Regular file.
  TWHI_OS_ENTRY_TYPE_file,
  /// Directory.
  TWHI_OS_ENTRY_TYPE_dir,
  /// Symbolic link.
  TWHI_OS_ENTRY_TYPE_symlink
};
/// @copydoc twhi_os_entry_type
typedef enum twhi_os_entry_type twhi_os_entry_type;

/// Filesystem entry status.
typedef struct twhi_os_stat twhi_os_stat;
/// @copydoc twhi_os_stat
struct twhi_os_stat {
  /// Type of the entry.
  twhi_os_entry_type type;
  /// Permission bits of the entry.
  uint32_t mode;
  /// For regular files, size of the file in bytes.
  int64_t size;
};

//===-- Functions ---------------------------------------------------------===//

/// Create a @ref tek_wh_err out of a @ref tek_wh_errc and a
///    @ref tek_wh_os_errc.
///
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref tek_wh_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline tek_wh_err twhi_err_os(tek_wh_errc prim, tek_wh_os_errc errc,
                                     tek_wh_err_io_type io_type) {
  return
#ifdef __cplusplus
      {.type = TEK_WH_ERR_TYPE_os,
       .primary = prim,
       .auxiliary = static_cast<int>(errc),
       .extra = static_cast<int>(io_type),
       .uri = nullptr};
#else  // def __cplusplus
      (tek_wh_err){.type = TEK_WH_ERR_TYPE_os,
                   .primary = prim,
                   .auxiliary = (int)errc,
                   .extra = (int)io_type};
#endif // def __cplusplus else
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===-- General functions -------------------------------------------------===//

/// Close operating system resource handle.
///
/// @param handle
///    OS handle to close.
[[gnu::visibility("internal"), gnu::fd_arg(1)]]
void twhi_os_close_handle(
    [[clang::release_handle("os")]] tek_wh_os_handle handle);

/// Get the message for specified error code.
///
/// @param errc
///    OS error code to get the message for.
/// @return Human-readable message for @p errc, as a heap-allocated
///    null-terminated UTF-8 string. It must be freed with `free` after use.
[[gnu::visibility("internal"), gnu::returns_nonnull]]
char *_Nonnull twhi_os_get_err_msg(tek_wh_os_errc errc);

/// Get the last error code set by a system call.
///
/// @return OS-specific error code.
[[gnu::visibility("internal")]] tek_wh_os_errc twhi_os_get_last_error(void);

/// Get the number of available logical processors in the system.
///
/// @return Number of available logical processors.
[[gnu::visibility("internal")]] int twhi_os_get_nproc(void);

/// Allocate a memory region directly from the system.
///
/// @param size
///    Size of the region to allocate, in bytes.
/// @return Pointer to the allocated zero-filled region, or `nullptr` on
///    failure. Use @ref twhi_os_get_last_error to get the error code. The
///    region must be freed with @ref twhi_os_mem_free after use.
[[gnu::visibility("internal")]]
void *_Nullable twhi_os_mem_alloc(size_t size);

/// Free a memory region allocated by @ref twhi_os_mem_alloc.
///
/// @param [in] addr
///    Pointer to the region to free.
/// @param size
///    Size of the region, in bytes.
[[gnu::visibility("internal"), gnu::nonnull(1)]]
void twhi_os_mem_free(const void *_Nonnull addr, size_t size);

//===-- I/O functions -----------------------------------------------------===//

/// Create an I/O error object for specified path and OS error code.
///
/// @param [in] path
///    Path to the file/directory that was subject to failed I/O operation, as
///    a null-terminated string.
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref tek_wh_err describing the I/O error, with `uri` set to a
///    copy of @p path.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1)]]
tek_wh_err twhi_os_io_err(const tek_wh_os_char *_Nonnull path,
                          tek_wh_errc prim, tek_wh_os_errc errc,
                          tek_wh_err_io_type io_type);

/// Create an I/O error object for specified parent directory handle,
///     file/directory name, and OS error code.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Name of the file/directory that was subject to failed I/O operation, as a
///    null-terminated string.
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref tek_wh_err describing the I/O error, with `uri` set to the
///    full path to the file/directory.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::fd_arg(1),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
tek_wh_err twhi_os_io_err_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name, tek_wh_errc prim, tek_wh_os_errc errc,
    tek_wh_err_io_type io_type);

/// Get status of a filesystem entry at specified directory. Symbolic links
///    are not followed.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Pathname of the entry, as a null-terminated string.
/// @param [out] st
///    Address of variable that receives the status.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2, 3),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2),
  gnu::access(write_only, 3)]]
bool twhi_os_stat_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name, twhi_os_stat *_Nonnull st);

/// Check whether two handles refer to the same file or directory.
///
/// @param first
///    First handle to compare.
/// @param second
///    Second handle to compare.
/// @return Value indicating whether both handles refer to the same object.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::fd_arg(2)]]
bool twhi_os_same_object([[clang::use_handle("os")]] tek_wh_os_handle first,
                         [[clang::use_handle("os")]] tek_wh_os_handle second);

//===--- Directory functions ----------------------------------------------===//

/// Open a directory, or create it if it doesn't exist.
///
/// @param [in] path
///    Path to the directory to open/create, as a null-terminated string.
/// @return Handle for the opened directory, or @ref TWHI_OS_INVALID_HANDLE if
///    the function fails. Use @ref twhi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref twhi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1), clang::acquire_handle("os")]]
tek_wh_os_handle twhi_os_dir_create(const tek_wh_os_char *_Nonnull path);

/// Open a directory.
///
/// @param [in] path
///    Path to the directory to open, as a null-terminated string.
/// @return Handle for the opened directory, or @ref TWHI_OS_INVALID_HANDLE if
///    the function fails. Use @ref twhi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref twhi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1), clang::acquire_handle("os")]]
tek_wh_os_handle twhi_os_dir_open(const tek_wh_os_char *_Nonnull path);

/// Open a subdirectory at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Pathname of the subdirectory to open, as a null-terminated string.
/// @return Handle for the opened subdirectory, or @ref TWHI_OS_INVALID_HANDLE
///    if the function fails. Use @ref twhi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref twhi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2),
  clang::acquire_handle("os")]]
tek_wh_os_handle twhi_os_dir_open_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name);

/// Create a subdirectory at specified directory, succeeding if it already
///    exists.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Pathname of the subdirectory to create, as a null-terminated string.
///    Its parent directories must exist.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
bool twhi_os_dir_make_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name);

/// Recursively delete a subdirectory of specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Name of the subdirectory to delete, as a null-terminated string.
/// @param errc
///    Primary error code to return in the error in case of failure.
/// @return A @ref tek_wh_err indicating the result of operation. A missing
///    subdirectory is not an error.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
tek_wh_err twhi_os_dir_delete_at_rec(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name, tek_wh_errc errc);

/// Delete an empty subdirectory of specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Pathname of the subdirectory to delete, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
bool twhi_os_dir_delete_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name);

/// Begin listing entries of a directory.
///
/// @param handle
///    Handle for the directory to list. It's not consumed by the function.
/// @return Iterator for the directory entries, or `nullptr` if the function
///    fails. Use @ref twhi_os_get_last_error to get the error code. The
///    iterator must be closed with @ref twhi_os_dir_iter_close after use.
[[gnu::visibility("internal"), gnu::fd_arg(1)]]
twhi_os_dir_iter _Nullable twhi_os_dir_iter_open(
    [[clang::use_handle("os")]] tek_wh_os_handle handle);

/// Get the next entry of a directory listing. `.` and `..` are skipped.
///
/// @param iter
///    Iterator for the directory entries.
/// @return Name of the next entry as a null-terminated string, valid until
///    the next call, or `nullptr` when there are no more entries or the
///    function fails. In the latter case, @ref twhi_os_get_last_error returns
///    a non-zero value.
[[gnu::visibility("internal"), gnu::nonnull(1)]]
const tek_wh_os_char *_Nullable twhi_os_dir_iter_next(
    twhi_os_dir_iter _Nonnull iter);

/// Close a directory listing iterator.
///
/// @param iter
///    Iterator to close.
[[gnu::visibility("internal"), gnu::nonnull(1)]]
void twhi_os_dir_iter_close(twhi_os_dir_iter _Nonnull iter);

//===--- File functions ---------------------------------------------------===//

/// Create a file at specified directory, truncating it if it already exists.
///
/// @param parent_dir_handle
///    Handle for the parent directory of the file.
/// @param [in] name
///    Pathname of the file to create, as a null-terminated string.
/// @param access
///    Access mode for the file.
/// @return Handle for the created file, or @ref TWHI_OS_INVALID_HANDLE if the
///    function fails. Use @ref twhi_os_get_last_error to get the error code.
///    The returned handle must be closed with @ref twhi_os_close_handle after
///    use.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2),
  clang::acquire_handle("os")]]
tek_wh_os_handle twhi_os_file_create_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name, twhi_os_file_access access);

/// Open a file at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory of the file.
/// @param [in] name
///    Pathname of the file to open, as a null-terminated string.
/// @param access
///    Access mode for the file.
/// @return Handle for the opened file, or @ref TWHI_OS_INVALID_HANDLE if the
///    function fails. Use @ref twhi_os_get_last_error to get the error code.
///    The returned handle must be closed with @ref twhi_os_close_handle after
///    use.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2),
  clang::acquire_handle("os")]]
tek_wh_os_handle twhi_os_file_open_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name, twhi_os_file_access access);

/// Read data from file at its current position.
///
/// @param handle
///    OS handle for the file.
/// @param [out] buf
///    Pointer to the buffer that receives the read data.
/// @param n
///    Maximum number of bytes to read.
/// @return Number of bytes read, which is less than @p n only if the end of
///    file has been reached, or `SIZE_MAX` if the function fails. Use
///    @ref twhi_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::fd_arg_read(1), gnu::nonnull(2),
  gnu::access(write_only, 2, 3)]]
size_t twhi_os_file_read([[clang::use_handle("os")]] tek_wh_os_handle handle,
                         void *_Nonnull buf, size_t n);

/// Read data from file at specified offset, without changing its current
///    position. Safe to call concurrently on the same handle.
///
/// @param handle
///    OS handle for the file.
/// @param [out] buf
///    Pointer to the buffer that receives the read data.
/// @param n
///    Maximum number of bytes to read.
/// @param offset
///    Offset in the file to read from, in bytes.
/// @return Number of bytes read, which is less than @p n only if the end of
///    file has been reached, or `SIZE_MAX` if the function fails. Use
///    @ref twhi_os_get_last_error to get the error code.
[[gnu::visibility("internal"), gnu::fd_arg_read(1), gnu::nonnull(2),
  gnu::access(write_only, 2, 3)]]
size_t twhi_os_file_read_at([[clang::use_handle("os")]] tek_wh_os_handle handle,
                            void *_Nonnull buf, size_t n, int64_t offset);

/// Write data to file. Exactly @p n bytes will be written.
///
/// @param handle
///    OS handle for the file.
/// @param [in] buf
///    Pointer to the buffer containing the data to write.
/// @param n
///    Number of bytes to write.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg_write(1), gnu::nonnull(2),
  gnu::access(read_only, 2, 3)]]
bool twhi_os_file_write([[clang::use_handle("os")]] tek_wh_os_handle handle,
                        const void *_Nonnull buf, size_t n);

/// Move a file, replacing the target if it exists.
///
/// @param src_dir_handle
///    Handle for the directory to move the file from.
/// @param [in] src_name
///    Pathname of the file to move, as a null-terminated string.
/// @param tgt_dir_handle
///    Handle for the directory to move the file to.
/// @param [in] tgt_name
///    New pathname of the file, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2),
  gnu::fd_arg(3), gnu::nonnull(4), gnu::access(read_only, 4),
  gnu::null_terminated_string_arg(4)]]
bool twhi_os_file_move(
    [[clang::use_handle("os")]] tek_wh_os_handle src_dir_handle,
    const tek_wh_os_char *_Nonnull src_name,
    [[clang::use_handle("os")]] tek_wh_os_handle tgt_dir_handle,
    const tek_wh_os_char *_Nonnull tgt_name);

/// Delete a file or symbolic link at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory of the file.
/// @param [in] name
///    Pathname of the file to delete, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
bool twhi_os_file_delete_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name);

/// Set permission bits of a file or directory at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Pathname of the file or directory, as a null-terminated string.
/// @param mode
///    Permission bits to set.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
bool twhi_os_set_mode_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name, uint32_t mode);

//===--- Symbolic link ----------------------------------------------------===//

/// Create a symbolic link at specified directory.
///
/// @param [in] target
///    Target of the symbolic link, as a null-terminated string.
/// @param parent_dir_handle
///    Handle for the parent directory of the symbolic link.
/// @param [in] name
///    Pathname of the symbolic link to create, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref twhi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(1, 3), gnu::access(read_only, 1),
  gnu::null_terminated_string_arg(1), gnu::fd_arg(2), gnu::access(read_only, 3),
  gnu::null_terminated_string_arg(3)]]
bool twhi_os_symlink_at(
    const tek_wh_os_char *_Nonnull target,
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name);

/// Read the target of a symbolic link at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory of the symbolic link.
/// @param [in] name
///    Pathname of the symbolic link, as a null-terminated string.
/// @return Target of the symbolic link, as a heap-allocated null-terminated
///    string, or `nullptr` if the function fails. Use
///    @ref twhi_os_get_last_error to get the error code. The returned pointer
///    must be freed with `free` after use.
[[gnu::visibility("internal"), gnu::fd_arg(1), gnu::nonnull(2),
  gnu::access(read_only, 2), gnu::null_terminated_string_arg(2)]]
tek_wh_os_char *_Nullable twhi_os_readlink_at(
    [[clang::use_handle("os")]] tek_wh_os_handle parent_dir_handle,
    const tek_wh_os_char *_Nonnull name);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus

#ifdef __cplusplus

#include <utility>

namespace tek::wharf {

/// Owning wrapper of an OS handle, closing it on destruction.
class [[gnu::visibility("internal")]] unique_handle {
  tek_wh_os_handle handle;

public:
  constexpr unique_handle() noexcept : handle{TWHI_OS_INVALID_HANDLE} {}
  constexpr explicit unique_handle(tek_wh_os_handle handle) noexcept
      : handle{handle} {}
  constexpr unique_handle(unique_handle &&other) noexcept
      : handle{std::exchange(other.handle, TWHI_OS_INVALID_HANDLE)} {}
  unique_handle &operator=(unique_handle &&other) noexcept {
    if (this != &other) {
      reset(std::exchange(other.handle, TWHI_OS_INVALID_HANDLE));
    }
    return *this;
  }
  ~unique_handle() { reset(); }

  constexpr tek_wh_os_handle get() const noexcept { return handle; }
  constexpr explicit operator bool() const noexcept {
    return handle != TWHI_OS_INVALID_HANDLE;
  }
  /// Give up ownership of the handle.
  constexpr tek_wh_os_handle release() noexcept {
    return std::exchange(handle, TWHI_OS_INVALID_HANDLE);
  }
  /// Close the owned handle, if any, and take ownership of @p new_handle.
  void reset(tek_wh_os_handle new_handle = TWHI_OS_INVALID_HANDLE) noexcept {
    if (handle != TWHI_OS_INVALID_HANDLE) {
      twhi_os_close_handle(handle);
    }
    handle = new_handle;
  }
};

} // namespace tek::wharf

#endif // def __cplusplus
