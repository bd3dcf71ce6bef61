//===-- base.cpp - library-wide functions ---------------------------------===//
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
/// Implementation of @ref tek_wh_version.
///
//===----------------------------------------------------------------------===//
#include "tek-wharf/base.h"

#include "config.h"

namespace tek::wharf {

extern "C" const char *tek_wh_version(void) { return TEK_WH_VERSION; }

} // namespace tek::wharf
