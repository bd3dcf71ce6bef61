//===-- diff.cpp - patch creation -----------------------------------------===//
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
/// Implementation of @ref tek_wh_diff.
///
/// Every whole block of the old tree is indexed by its weak hash. Each new
///    file is scanned with a rolling window of one block; a window whose weak
///    hash and MD5 both match an old block is emitted as a block range, and
///    bytes between matches are emitted as literal data. Consecutive matched
///    blocks of the same old file are merged into a single range.
///
//===----------------------------------------------------------------------===//
#include "patch.hpp"

#include "common/error.h"
#include "container.hpp"
#include "hash.hpp"
#include "msg_stream.hpp"
#include "os.h"
#include "patch_writer.hpp"
#include "signature.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"
#include "tek-wharf/patch.h"
#include "tek/wharf/pwr.pb.h"
#include "tek/wharf/tlc.pb.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <new>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace tek::wharf {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Reference to a whole block of an old file.
struct block_ref {
  int file_index;
  std::int64_t block_index;
  md5_digest strong;
};

/// Index of old blocks by weak hash.
using block_index = std::unordered_map<std::uint32_t, std::vector<block_ref>>;

/// Block range not yet written to the patch.
struct pending_range {
  int file_index;
  std::int64_t block_index;
  std::int64_t block_span;
};

/// Encoder of rsync records for new files.
class file_encoder {
  patch_writer &writer;
  const block_index &index;
  const std::size_t block_size;
  /// Maximum size of a single literal data operation.
  const std::size_t max_data;
  /// File data buffer.
  std::vector<unsigned char> buf;
  /// Offset of the first byte of pending literal data in @ref buf.
  std::size_t lit;
  /// Offset of the rolling window in @ref buf.
  std::size_t pos;
  /// Number of bytes of the current file left to read.
  std::int64_t remaining;
  std::optional<pending_range> range;
  /// Value indicating whether any operation has been written for the current
  ///    file.
  bool any_ops;

  /// Read more data from the file, discarding consumed data.
  tek_wh_err fill(tek_wh_os_handle handle) {
    if (lit) {
      buf.erase(buf.begin(), buf.begin() + lit);
      pos -= lit;
      lit = 0;
    }
    const auto want =
        static_cast<std::size_t>(std::min<std::int64_t>(remaining, max_data));
    const auto old_size = buf.size();
    buf.resize(old_size + want);
    const auto num_read = twhi_os_file_read(handle, &buf[old_size], want);
    if (num_read == SIZE_MAX) {
      return twhi_err_os(TEK_WH_ERRC_diff, twhi_os_get_last_error(),
                         TEK_WH_ERR_IO_TYPE_read);
    }
    if (!num_read) {
      // The file has been truncated since the scan
      return twh_err_basic(TEK_WH_ERRC_size_mismatch);
    }
    buf.resize(old_size + num_read);
    remaining -= num_read;
    return twh_err_ok();
  }

  tek_wh_err flush_range() {
    if (!range) {
      return twh_err_ok();
    }
    const auto res =
        writer.block_range(range->file_index, range->block_index,
                           range->block_span);
    range.reset();
    any_ops = true;
    return res;
  }

  /// Write literal data up to @p end.
  tek_wh_err flush_data(std::size_t end) {
    if (lit == end) {
      return twh_err_ok();
    }
    if (const auto res = flush_range(); !tek_wh_err_success(&res)) {
      return res;
    }
    while (lit < end) {
      const auto size = std::min(end - lit, max_data);
      if (const auto res = writer.data({&buf[lit], size});
          !tek_wh_err_success(&res)) {
        return res;
      }
      lit += size;
    }
    any_ops = true;
    return twh_err_ok();
  }

  /// Find an old block matching the window at @ref pos.
  tek_wh_err find_match(std::uint32_t weak, const block_ref *_Nullable &match) {
    match = nullptr;
    const auto it = index.find(weak);
    if (it == index.end()) {
      return twh_err_ok();
    }
    md5_digest digest;
    if (const auto res = md5({&buf[pos], block_size}, digest);
        !tek_wh_err_success(&res)) {
      return res;
    }
    for (const auto &ref : it->second) {
      if (ref.strong != digest) {
        continue;
      }
      // Prefer the block that extends the pending range
      if (range && ref.file_index == range->file_index &&
          ref.block_index == range->block_index + range->block_span) {
        match = &ref;
        break;
      }
      if (!match) {
        match = &ref;
      }
    }
    return twh_err_ok();
  }

  /// Record a matched block.
  tek_wh_err add_block(const block_ref &ref) {
    if (range && ref.file_index == range->file_index &&
        ref.block_index == range->block_index + range->block_span) {
      ++range->block_span;
      return twh_err_ok();
    }
    if (const auto res = flush_range(); !tek_wh_err_success(&res)) {
      return res;
    }
    range.emplace(ref.file_index, ref.block_index, 1);
    return twh_err_ok();
  }

public:
  file_encoder(patch_writer &writer, const block_index &index,
               std::size_t block_size)
      : writer{writer}, index{index}, block_size{block_size},
        max_data{block_size * 4} {}

  /// Write the record for a new file.
  ///
  /// @param file_index
  ///    Index of the file in the new container.
  /// @param handle
  ///    OS handle for the file opened for reading.
  /// @param size
  ///    Size of the file in bytes.
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err encode(int file_index, tek_wh_os_handle handle,
                    std::int64_t size) {
    buf.clear();
    lit = 0;
    pos = 0;
    remaining = size;
    range.reset();
    any_ops = false;
    if (const auto res = writer.begin_rsync(file_index);
        !tek_wh_err_success(&res)) {
      return res;
    }
    rolling_hash hash;
    bool hashed = false;
    for (;;) {
      while (remaining && buf.size() - pos <= block_size) {
        if (const auto res = fill(handle); !tek_wh_err_success(&res)) {
          return res;
        }
      }
      const auto avail = buf.size() - pos;
      if (avail < block_size) {
        break;
      }
      if (!hashed) {
        hash.reset({&buf[pos], block_size});
        hashed = true;
      }
      const block_ref *match;
      if (const auto res = find_match(hash.value(), match);
          !tek_wh_err_success(&res)) {
        return res;
      }
      if (match) {
        if (const auto res = flush_data(pos); !tek_wh_err_success(&res)) {
          return res;
        }
        if (const auto res = add_block(*match); !tek_wh_err_success(&res)) {
          return res;
        }
        pos += block_size;
        lit = pos;
        hashed = false;
        continue;
      }
      if (avail == block_size) {
        break;
      }
      hash.roll(buf[pos], buf[pos + block_size]);
      ++pos;
      if (pos - lit >= max_data) {
        if (const auto res = flush_data(pos); !tek_wh_err_success(&res)) {
          return res;
        }
      }
    } // for (;;)
    if (const auto res = flush_data(buf.size()); !tek_wh_err_success(&res)) {
      return res;
    }
    if (const auto res = flush_range(); !tek_wh_err_success(&res)) {
      return res;
    }
    if (!any_ops) {
      if (const auto res = writer.data({}); !tek_wh_err_success(&res)) {
        return res;
      }
    }
    return writer.end_file();
  }
};

//===-- Private functions -------------------------------------------------===//

/// Read block hashes of the old tree and index its whole blocks.
static tek_wh_err read_block_index(msg_reader &reader, const tek_wh_ctr &ctr,
                                   std::size_t block_size, block_index &index) {
  const auto bs = static_cast<std::int64_t>(block_size);
  BlockHash hash;
  for (int file_index = 0; file_index < ctr.num_files; ++file_index) {
    const auto size = ctr.files[file_index].size;
    const auto blocks = num_blocks(size, block_size);
    for (std::int64_t i = 0; i < blocks; ++i) {
      bool eos;
      if (const auto res = reader.next(hash, eos); !tek_wh_err_success(&res)) {
        return res;
      }
      if (eos) {
        return twh_err_basic(TEK_WH_ERRC_hash_count);
      }
      const auto &strong = hash.stronghash();
      if (size - i * bs < bs || strong.size() != sizeof(md5_digest)) {
        continue;
      }
      block_ref ref{.file_index = file_index, .block_index = i, .strong = {}};
      std::ranges::copy(strong, ref.strong.begin());
      index[hash.weakhash()].emplace_back(ref);
    }
  }
  bool eos;
  if (const auto res = reader.next(hash, eos); !tek_wh_err_success(&res)) {
    return res;
  }
  return eos ? twh_err_ok() : twh_err_basic(TEK_WH_ERRC_hash_count);
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

tek_wh_err diff(const tek_wh_diff_args &args, std::size_t block_size) {
  callback_source source{args.old_sig};
  msg_reader reader{source};
  tek_wh_comp_settings sig_comp;
  unique_ctr old_ctr;
  if (const auto res = sig_read_head(reader, sig_comp, old_ctr.get());
      !tek_wh_err_success(&res)) {
    return res;
  }
  block_index index;
  if (const auto res =
          read_block_index(reader, old_ctr.get(), block_size, index);
      !tek_wh_err_success(&res)) {
    return res;
  }
  const unique_handle root_handle{twhi_os_dir_open(args.new_root)};
  if (!root_handle) {
    return twhi_os_io_err(args.new_root, TEK_WH_ERRC_diff,
                          twhi_os_get_last_error(), TEK_WH_ERR_IO_TYPE_open);
  }
  Container new_proto;
  if (const auto res = ctr_scan_dir(root_handle.get(), new_proto);
      !tek_wh_err_success(&res)) {
    return res;
  }
  unique_ctr new_ctr;
  if (const auto res = ctr_from_proto(new_proto, new_ctr.get());
      !tek_wh_err_success(&res)) {
    return res;
  }
  Container old_proto;
  ctr_to_proto(old_ctr.get(), old_proto);
  callback_sink out{args.out};
  patch_writer writer{out};
  if (const auto res = writer.begin(args.comp, old_proto, new_proto);
      !tek_wh_err_success(&res)) {
    return res;
  }
  file_encoder encoder{writer, index, block_size};
  for (int i = 0; i < new_ctr->num_files; ++i) {
    const auto &file = new_ctr->files[i];
    const unique_handle handle{twhi_os_file_open_at(
        root_handle.get(), file.path, TWHI_OS_FILE_ACCESS_read)};
    if (!handle) {
      return twhi_os_io_err_at(root_handle.get(), file.path, TEK_WH_ERRC_diff,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_open);
    }
    if (const auto res = encoder.encode(i, handle.get(), file.size);
        !tek_wh_err_success(&res)) {
      return res;
    }
  }
  return writer.finish();
}

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_wh_err tek_wh_diff(const tek_wh_diff_args *args) {
  try {
    const auto res = diff(*args);
    return tek_wh_err_success(&res) ? res
                                    : twh_err_rebase(TEK_WH_ERRC_diff, res);
  } catch (const std::bad_alloc &) {
    return twh_err_sub(TEK_WH_ERRC_diff, TEK_WH_ERRC_mem_alloc);
  }
}

} // extern "C"

} // namespace tek::wharf
