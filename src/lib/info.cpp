//===-- info.cpp - wharf binary inspection --------------------------------===//
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
/// Implementation of @ref tek_wh_identify and @ref tek_wh_info_read.
///
//===----------------------------------------------------------------------===//
#include "tek-wharf/info.h"

#include "common/error.h"
#include "container.hpp"
#include "msg_stream.hpp"
#include "patch.hpp"
#include "signature.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <new>

namespace tek::wharf {

namespace {

/// Map a magic number to the binary kind.
static tek_wh_err kind_from_magic(std::uint32_t magic, tek_wh_bin_kind &kind) {
  switch (magic) {
  case TEK_WH_PATCH_MAGIC:
    kind = TEK_WH_BIN_KIND_patch;
    return twh_err_ok();
  case TEK_WH_SIG_MAGIC:
    kind = TEK_WH_BIN_KIND_signature;
    return twh_err_ok();
  default:
    return twh_err_basic(TEK_WH_ERRC_magic_mismatch);
  }
}

} // namespace

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_wh_err tek_wh_identify(const tek_wh_istream *in, tek_wh_bin_kind *kind) {
  // Read the stream directly so that nothing past the magic is consumed
  callback_source source{*in};
  std::array<unsigned char, 4> bytes;
  std::size_t num_read;
  if (const auto res = source.read(bytes.data(), bytes.size(), num_read);
      !tek_wh_err_success(&res)) {
    return twh_err_rebase(TEK_WH_ERRC_identify, res);
  }
  if (num_read != bytes.size()) {
    return twh_err_sub(TEK_WH_ERRC_identify, TEK_WH_ERRC_truncated);
  }
  const auto magic = static_cast<std::uint32_t>(bytes[0]) |
                     static_cast<std::uint32_t>(bytes[1]) << 8 |
                     static_cast<std::uint32_t>(bytes[2]) << 16 |
                     static_cast<std::uint32_t>(bytes[3]) << 24;
  if (const auto res = kind_from_magic(magic, *kind);
      !tek_wh_err_success(&res)) {
    return twh_err_rebase(TEK_WH_ERRC_identify, res);
  }
  return twh_err_ok();
}

tek_wh_err tek_wh_info_read(const tek_wh_istream *in, tek_wh_info *info) {
  *info = {};
  try {
    callback_source source{*in};
    msg_reader reader{source};
    std::uint32_t magic;
    if (const auto res = reader.read_magic(magic); !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_info, res);
    }
    tek_wh_bin_kind kind;
    if (const auto res = kind_from_magic(magic, kind);
        !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_info, res);
    }
    unique_ctr old_ctr;
    unique_ctr new_ctr;
    tek_wh_comp_settings comp;
    const auto res =
        kind == TEK_WH_BIN_KIND_patch
            ? patch_read_header(reader, comp, old_ctr.get(), new_ctr.get())
            : sig_read_header(reader, comp, old_ctr.get());
    if (!tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_info, res);
    }
    *info = {.kind = kind,
             .comp = comp,
             .old_ctr = old_ctr.release(),
             .new_ctr = new_ctr.release()};
    return twh_err_ok();
  } catch (const std::bad_alloc &) {
    return twh_err_sub(TEK_WH_ERRC_info, TEK_WH_ERRC_mem_alloc);
  }
}

void tek_wh_info_free(tek_wh_info *info) {
  tek_wh_ctr_free(&info->old_ctr);
  tek_wh_ctr_free(&info->new_ctr);
  *info = {};
}

} // extern "C"

} // namespace tek::wharf
