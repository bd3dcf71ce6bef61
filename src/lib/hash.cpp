//===-- hash.cpp - block hashing ------------------------------------------===//
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
/// Implementation of block hash functions.
///
//===----------------------------------------------------------------------===//
#include "hash.hpp"

#include "common/error.h"
#include "tek-wharf/error.h"

#include <cstddef>
#include <cstdint>
#include <openssl/evp.h>
#include <span>

namespace tek::wharf {

std::uint32_t weak_hash(std::span<const unsigned char> data) noexcept {
  rolling_hash hash;
  hash.reset(data);
  return hash.value();
}

void rolling_hash::reset(std::span<const unsigned char> window) noexcept {
  a = 0;
  b = 0;
  len = static_cast<std::uint32_t>(window.size());
  auto weight = len;
  for (const auto byte : window) {
    a += byte;
    b += weight-- * byte;
  }
  a &= 0xFFFF;
  b &= 0xFFFF;
}

tek_wh_err md5(std::span<const unsigned char> data, md5_digest &digest) {
  unsigned digest_size;
  if (!EVP_Digest(data.data(), data.size(), digest.data(), &digest_size,
                  EVP_md5(), nullptr) ||
      digest_size != digest.size()) {
    return twh_err_basic(TEK_WH_ERRC_md5);
  }
  return twh_err_ok();
}

} // namespace tek::wharf
