//===-- hash.hpp - block hashing ------------------------------------------===//
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
/// Declarations of block hash functions used by signatures and the diff
///    encoder.
///
/// The weak hash is the rsync rolling checksum: for block bytes x[0..n),
///    a = Σx[i] and b = Σ(n - i)·x[i], both modulo 2^16, combined as
///    a + 2^16·b. The strong hash is MD5.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-wharf/error.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace tek::wharf {

/// MD5 digest of a block.
using md5_digest = std::array<unsigned char, 16>;

/// Compute the weak hash of a block.
///
/// @param data
///    Block data.
/// @return Weak hash value.
[[gnu::visibility("internal")]]
std::uint32_t weak_hash(std::span<const unsigned char> data) noexcept;

/// Compute the MD5 digest of a block.
///
/// @param data
///    Block data.
/// @param [out] digest
///    Variable that receives the digest.
/// @return A @ref tek_wh_err indicating the result of operation.
[[gnu::visibility("internal")]]
tek_wh_err md5(std::span<const unsigned char> data, md5_digest &digest);

/// Get a view of a digest as a byte string, for storing in messages.
///
/// @param [in] digest
///    Digest to view.
/// @return String view over digest bytes.
inline std::string_view digest_view(const md5_digest &digest) noexcept {
  return {reinterpret_cast<const char *>(digest.data()), digest.size()};
}

/// Weak hash over a window sliding through data one byte at a time.
class [[gnu::visibility("internal")]] rolling_hash {
  /// Plain byte sum, modulo 2^16.
  std::uint32_t a{};
  /// Weighted byte sum, modulo 2^16.
  std::uint32_t b{};
  /// Size of the window.
  std::uint32_t len{};

public:
  /// Compute the hash of the initial window.
  ///
  /// @param window
  ///    Initial window data.
  void reset(std::span<const unsigned char> window) noexcept;
  /// Slide the window by one byte.
  ///
  /// @param out
  ///    Byte leaving the window at its start.
  /// @param in
  ///    Byte entering the window at its end.
  constexpr void roll(unsigned char out, unsigned char in) noexcept {
    a = (a - out + in) & 0xFFFF;
    b = (b - len * out + a) & 0xFFFF;
  }
  /// Get the hash of the current window.
  constexpr std::uint32_t value() const noexcept { return a | (b << 16); }
};

} // namespace tek::wharf
