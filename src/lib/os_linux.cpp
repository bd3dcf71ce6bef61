//===-- os_linux.cpp - Linux implementation of OS functions ---------------===//
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
/// Linux implementation of functions declared in os.h.
///
//===----------------------------------------------------------------------===//
#include "os.h"

#include "common/error.h"
#include "tek-wharf/base.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <string>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

/// Convert a `stat` structure into a @ref twhi_os_stat.
///
/// @param [in] st
///    Status structure returned by the system.
/// @return Converted status structure.
static twhi_os_stat convert_stat(const struct stat &st) noexcept {
  twhi_os_entry_type type;
  switch (st.st_mode & S_IFMT) {
  case S_IFREG:
    type = TWHI_OS_ENTRY_TYPE_file;
    break;
  case S_IFDIR:
    type = TWHI_OS_ENTRY_TYPE_dir;
    break;
  case S_IFLNK:
    type = TWHI_OS_ENTRY_TYPE_symlink;
    break;
  default:
    type = TWHI_OS_ENTRY_TYPE_other;
  }
  return {.type = type,
          .mode = static_cast<std::uint32_t>(st.st_mode & 07777),
          .size = type == TWHI_OS_ENTRY_TYPE_file
                      ? static_cast<std::int64_t>(st.st_size)
                      : 0};
}

/// Recursively delete contents of a directory.
///
/// @param dir_handle
///    Handle for the directory to clear.
/// @return Value indicating whether the function succeeded. `errno` is set
///    in case of failure.
static bool clear_dir(int dir_handle) noexcept {
  const auto iter = twhi_os_dir_iter_open(dir_handle);
  if (!iter) {
    return false;
  }
  bool res = true;
  for (;;) {
    const auto name = twhi_os_dir_iter_next(iter);
    if (!name) {
      if (errno) {
        res = false;
      }
      break;
    }
    struct stat st;
    if (fstatat(dir_handle, name, &st, AT_SYMLINK_NOFOLLOW) < 0) {
      res = false;
      break;
    }
    if (S_ISDIR(st.st_mode)) {
      const int subdir = openat(dir_handle, name,
                                O_RDONLY | O_DIRECTORY | O_CLOEXEC);
      if (subdir < 0) {
        res = false;
        break;
      }
      const bool cleared = clear_dir(subdir);
      close(subdir);
      if (!cleared || unlinkat(dir_handle, name, AT_REMOVEDIR) < 0) {
        res = false;
        break;
      }
    } else if (unlinkat(dir_handle, name, 0) < 0) {
      res = false;
      break;
    }
  }
  const int errc = errno;
  twhi_os_dir_iter_close(iter);
  errno = errc;
  return res;
}

} // namespace

extern "C" {

//===-- General functions -------------------------------------------------===//

void twhi_os_close_handle(int handle) { close(handle); }

char *twhi_os_get_err_msg(int errc) {
  char buf[256];
  // GNU strerror_r may return a static string instead of filling buf
  const auto msg = strerror_r(errc, buf, sizeof buf);
  return strdup(msg);
}

int twhi_os_get_last_error(void) { return errno; }

int twhi_os_get_nproc(void) {
  const auto res = sysconf(_SC_NPROCESSORS_ONLN);
  return res > 0 ? static_cast<int>(res) : 1;
}

void *twhi_os_mem_alloc(size_t size) {
  const auto res = mmap(nullptr, size, PROT_READ | PROT_WRITE,
                        MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  return res == MAP_FAILED ? nullptr : res;
}

void twhi_os_mem_free(const void *addr, size_t size) {
  munmap(const_cast<void *>(addr), size);
}

//===-- I/O functions -----------------------------------------------------===//

tek_wh_err twhi_os_io_err(const char *path, tek_wh_errc prim, int errc,
                          tek_wh_err_io_type io_type) {
  auto err = twhi_err_os(prim, errc, io_type);
  err.uri = strdup(path);
  return err;
}

tek_wh_err twhi_os_io_err_at(int parent_dir_handle, const char *name,
                             tek_wh_errc prim, int errc,
                             tek_wh_err_io_type io_type) {
  auto err = twhi_err_os(prim, errc, io_type);
  char link_path[32];
  std::snprintf(link_path, sizeof link_path, "/proc/self/fd/%d",
                parent_dir_handle);
  std::string path;
  char dir_path[PATH_MAX];
  if (const auto len = readlink(link_path, dir_path, sizeof dir_path - 1);
      len > 0) {
    path.assign(dir_path, len);
    path.push_back('/');
  }
  path.append(name);
  err.uri = strdup(path.c_str());
  return err;
}

bool twhi_os_stat_at(int parent_dir_handle, const char *name,
                     twhi_os_stat *st) {
  struct stat sys_st;
  if (fstatat(parent_dir_handle, name, &sys_st, AT_SYMLINK_NOFOLLOW) < 0) {
    return false;
  }
  *st = convert_stat(sys_st);
  return true;
}

bool twhi_os_same_object(int first, int second) {
  struct stat first_st;
  struct stat second_st;
  if (fstat(first, &first_st) < 0 || fstat(second, &second_st) < 0) {
    return false;
  }
  return first_st.st_dev == second_st.st_dev &&
         first_st.st_ino == second_st.st_ino;
}

//===--- Directory functions ----------------------------------------------===//

int twhi_os_dir_create(const char *path) {
  if (mkdir(path, 0755) < 0 && errno != EEXIST) {
    return -1;
  }
  return open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

int twhi_os_dir_open(const char *path) {
  return open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

int twhi_os_dir_open_at(int parent_dir_handle, const char *name) {
  return openat(parent_dir_handle, name, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

bool twhi_os_dir_make_at(int parent_dir_handle, const char *name) {
  if (mkdirat(parent_dir_handle, name, 0755) == 0) {
    return true;
  }
  if (errno != EEXIST) {
    return false;
  }
  // Make sure that the existing entry is a directory, not a file
  struct stat st;
  if (fstatat(parent_dir_handle, name, &st, 0) < 0) {
    return false;
  }
  if (!S_ISDIR(st.st_mode)) {
    errno = ENOTDIR;
    return false;
  }
  return true;
}

tek_wh_err twhi_os_dir_delete_at_rec(int parent_dir_handle, const char *name,
                                     tek_wh_errc errc) {
  const int dir_handle = openat(parent_dir_handle, name,
                                O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_handle < 0) {
    if (errno == ENOENT) {
      return twh_err_ok();
    }
    return twhi_os_io_err_at(parent_dir_handle, name, errc, errno,
                             TEK_WH_ERR_IO_TYPE_open);
  }
  const bool cleared = clear_dir(dir_handle);
  const int clear_errc = errno;
  close(dir_handle);
  if (!cleared) {
    return twhi_os_io_err_at(parent_dir_handle, name, errc, clear_errc,
                             TEK_WH_ERR_IO_TYPE_delete);
  }
  if (unlinkat(parent_dir_handle, name, AT_REMOVEDIR) < 0) {
    return twhi_os_io_err_at(parent_dir_handle, name, errc, errno,
                             TEK_WH_ERR_IO_TYPE_delete);
  }
  return twh_err_ok();
}

bool twhi_os_dir_delete_at(int parent_dir_handle, const char *name) {
  return unlinkat(parent_dir_handle, name, AT_REMOVEDIR) == 0;
}

DIR *twhi_os_dir_iter_open(int handle) {
  // fdopendir takes ownership of the descriptor, so give it a duplicate
  const int dup_handle = fcntl(handle, F_DUPFD_CLOEXEC, 0);
  if (dup_handle < 0) {
    return nullptr;
  }
  const auto dir = fdopendir(dup_handle);
  if (!dir) {
    const int errc = errno;
    close(dup_handle);
    errno = errc;
    return nullptr;
  }
  rewinddir(dir);
  return dir;
}

const char *twhi_os_dir_iter_next(DIR *iter) {
  for (;;) {
    errno = 0;
    const auto ent = readdir(iter);
    if (!ent) {
      return nullptr;
    }
    if (std::strcmp(ent->d_name, ".") != 0 &&
        std::strcmp(ent->d_name, "..") != 0) {
      return ent->d_name;
    }
  }
}

void twhi_os_dir_iter_close(DIR *iter) { closedir(iter); }

//===--- File functions ---------------------------------------------------===//

int twhi_os_file_create_at(int parent_dir_handle, const char *name,
                           twhi_os_file_access access) {
  return openat(parent_dir_handle, name,
                access | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW, 0644);
}

int twhi_os_file_open_at(int parent_dir_handle, const char *name,
                         twhi_os_file_access access) {
  return openat(parent_dir_handle, name, access | O_CLOEXEC);
}

size_t twhi_os_file_read(int handle, void *buf, size_t n) {
  const auto cbuf = reinterpret_cast<char *>(buf);
  size_t total = 0;
  while (total < n) {
    const auto res = read(handle, cbuf + total, n - total);
    if (res < 0) {
      if (errno == EINTR) {
        continue;
      }
      return SIZE_MAX;
    }
    if (res == 0) {
      break;
    }
    total += res;
  }
  return total;
}

size_t twhi_os_file_read_at(int handle, void *buf, size_t n, int64_t offset) {
  const auto cbuf = reinterpret_cast<char *>(buf);
  size_t total = 0;
  while (total < n) {
    const auto res = pread(handle, cbuf + total, n - total, offset + total);
    if (res < 0) {
      if (errno == EINTR) {
        continue;
      }
      return SIZE_MAX;
    }
    if (res == 0) {
      break;
    }
    total += res;
  }
  return total;
}

bool twhi_os_file_write(int handle, const void *buf, size_t n) {
  auto cbuf = reinterpret_cast<const char *>(buf);
  while (n) {
    const auto res = write(handle, cbuf, n);
    if (res < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    cbuf += res;
    n -= res;
  }
  return true;
}

bool twhi_os_file_move(int src_dir_handle, const char *src_name,
                       int tgt_dir_handle, const char *tgt_name) {
  return renameat(src_dir_handle, src_name, tgt_dir_handle, tgt_name) == 0;
}

bool twhi_os_file_delete_at(int parent_dir_handle, const char *name) {
  return unlinkat(parent_dir_handle, name, 0) == 0;
}

bool twhi_os_set_mode_at(int parent_dir_handle, const char *name,
                         uint32_t mode) {
  return fchmodat(parent_dir_handle, name, mode, 0) == 0;
}

//===--- Symbolic link ----------------------------------------------------===//

bool twhi_os_symlink_at(const char *target, int parent_dir_handle,
                        const char *name) {
  return symlinkat(target, parent_dir_handle, name) == 0;
}

char *twhi_os_readlink_at(int parent_dir_handle, const char *name) {
  struct stat st;
  if (fstatat(parent_dir_handle, name, &st, AT_SYMLINK_NOFOLLOW) < 0) {
    return nullptr;
  }
  // st_size may be 0 for some pseudo-filesystems
  std::size_t buf_size = st.st_size > 0 ? st.st_size + 1 : PATH_MAX;
  for (;;) {
    const auto buf = static_cast<char *>(std::malloc(buf_size));
    if (!buf) {
      errno = ENOMEM;
      return nullptr;
    }
    const auto len = readlinkat(parent_dir_handle, name, buf, buf_size);
    if (len < 0) {
      const int errc = errno;
      std::free(buf);
      errno = errc;
      return nullptr;
    }
    if (static_cast<std::size_t>(len) < buf_size) {
      buf[len] = '\0';
      return buf;
    }
    // Target may have been truncated, retry with a bigger buffer
    std::free(buf);
    buf_size *= 2;
  }
}

} // extern "C"
