//===-- os.h - OS-specific types ------------------------------------------===//
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
/// Declarations of types that vary across different operating systems.
///
//===----------------------------------------------------------------------===//
#pragma once

#ifdef __linux__
// Linux-specific declarations

/// OS type for pathname characters.
typedef char tek_wh_os_char;
/// OS error code type.
typedef int tek_wh_os_errc;
/// OS type for handles for files or other system resources.
typedef int tek_wh_os_handle;
/// @def TEK_WH_OS_STR
/// Make a string literal for @ref tek_wh_os_char string.
#define TEK_WH_OS_STR(str) str

#else // def __linux__

#error Unsupported target OS. Only Linux (__linux__) is supported.

#endif // def __linux__ else
