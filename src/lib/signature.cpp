//===-- signature.cpp - signature engine ----------------------------------===//
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
/// Implementation of signature generation and verification, along with
///    @ref tek_wh_sig_write, @ref tek_wh_sig_verify and
///    @ref tek_wh_findings_free.
///
/// A signature body holds the container followed by one block hash message
///    per block of every file, in file index order. There are no per-file
///    delimiters, so readers derive block counts from file sizes.
///
//===----------------------------------------------------------------------===//
#include "signature.hpp"

#include "common/error.h"
#include "container.hpp"
#include "hash.hpp"
#include "msg_stream.hpp"
#include "os.h"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"
#include "tek-wharf/signature.h"
#include "tek/wharf/pwr.pb.h"
#include "tek/wharf/tlc.pb.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <new>
#include <ranges>
#include <span>
#include <vector>

namespace tek::wharf {

namespace {

/// Consume block hash messages without checking them.
///
/// @param [in, out] reader
///    Reader positioned at a block hash.
/// @param count
///    Number of block hashes to skip.
/// @return A @ref tek_wh_err indicating the result of operation.
static tek_wh_err skip_hashes(msg_reader &reader, std::int64_t count) {
  BlockHash hash;
  for (std::int64_t i = 0; i < count; ++i) {
    bool eos;
    if (const auto res = reader.next(hash, eos); !tek_wh_err_success(&res)) {
      return res;
    }
    if (eos) {
      return twh_err_basic(TEK_WH_ERRC_hash_count);
    }
  }
  return twh_err_ok();
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

tek_wh_err sig_write(tek_wh_os_handle root_handle, const tek_wh_ctr &ctr,
                     const tek_wh_comp_settings &comp, sink &out,
                     std::size_t block_size) {
  msg_writer writer{out};
  if (const auto res = writer.write_magic(TEK_WH_SIG_MAGIC);
      !tek_wh_err_success(&res)) {
    return res;
  }
  SignatureHeader header;
  auto &settings = *header.mutable_compression();
  settings.set_algorithm(static_cast<CompressionAlgorithm>(comp.algorithm));
  settings.set_quality(comp.quality);
  if (const auto res = writer.write_header(header);
      !tek_wh_err_success(&res)) {
    return res;
  }
  if (const auto res = writer.begin_body(comp); !tek_wh_err_success(&res)) {
    return res;
  }
  {
    Container proto;
    ctr_to_proto(ctr, proto);
    if (const auto res = writer.write(proto); !tek_wh_err_success(&res)) {
      return res;
    }
  }
  const auto bs = static_cast<std::int64_t>(block_size);
  const auto buf = std::make_unique_for_overwrite<unsigned char[]>(block_size);
  BlockHash hash;
  md5_digest digest;
  for (const auto &file :
       std::span{ctr.files, static_cast<std::size_t>(ctr.num_files)}) {
    const unique_handle handle{
        twhi_os_file_open_at(root_handle, file.path, TWHI_OS_FILE_ACCESS_read)};
    if (!handle) {
      return twhi_os_io_err_at(root_handle, file.path, TEK_WH_ERRC_sig_write,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_open);
    }
    const auto blocks = num_blocks(file.size, block_size);
    for (std::int64_t i = 0; i < blocks; ++i) {
      const auto want = static_cast<std::size_t>(
          std::min(bs, file.size - i * bs));
      const auto num_read = twhi_os_file_read(handle.get(), buf.get(), want);
      if (num_read == SIZE_MAX) {
        return twhi_os_io_err_at(root_handle, file.path, TEK_WH_ERRC_sig_write,
                                 twhi_os_get_last_error(),
                                 TEK_WH_ERR_IO_TYPE_read);
      }
      if (num_read != want) {
        return twh_err_basic(TEK_WH_ERRC_size_mismatch);
      }
      const std::span block{buf.get(), want};
      if (const auto res = md5(block, digest); !tek_wh_err_success(&res)) {
        return res;
      }
      hash.set_weakhash(weak_hash(block));
      hash.set_stronghash(std::string{digest_view(digest)});
      if (const auto res = writer.write(hash); !tek_wh_err_success(&res)) {
        return res;
      }
    }
  }
  return writer.finish();
}

tek_wh_err sig_read_head(msg_reader &reader, tek_wh_comp_settings &comp,
                         tek_wh_ctr &ctr) {
  std::uint32_t magic;
  if (const auto res = reader.read_magic(magic); !tek_wh_err_success(&res)) {
    return res;
  }
  if (magic != TEK_WH_SIG_MAGIC) {
    return twh_err_basic(TEK_WH_ERRC_magic_mismatch);
  }
  return sig_read_header(reader, comp, ctr);
}

tek_wh_err sig_read_header(msg_reader &reader, tek_wh_comp_settings &comp,
                           tek_wh_ctr &ctr) {
  SignatureHeader header;
  if (const auto res = reader.read_header(header);
      !tek_wh_err_success(&res)) {
    return res;
  }
  comp = {.algorithm =
              static_cast<tek_wh_comp>(header.compression().algorithm()),
          .quality = header.compression().quality()};
  if (const auto res =
          reader.begin_body(static_cast<int>(header.compression().algorithm()));
      !tek_wh_err_success(&res)) {
    return res;
  }
  Container proto;
  if (const auto res = reader.read(proto); !tek_wh_err_success(&res)) {
    return res;
  }
  return ctr_from_proto(proto, ctr);
}

tek_wh_err sig_verify_body(tek_wh_os_handle root_handle,
                           const tek_wh_ctr &ctr, msg_reader &reader,
                           std::vector<tek_wh_finding> &findings,
                           std::size_t block_size) {
  const auto bs = static_cast<std::int64_t>(block_size);
  const auto buf = std::make_unique_for_overwrite<unsigned char[]>(block_size);
  BlockHash hash;
  md5_digest digest;
  for (int file_index = 0; file_index < ctr.num_files; ++file_index) {
    const auto &file = ctr.files[file_index];
    const auto blocks = num_blocks(file.size, block_size);
    twhi_os_stat st;
    if (!twhi_os_stat_at(root_handle, file.path, &st)) {
      const auto errc = twhi_os_get_last_error();
      if (errc != TWHI_OS_ERR_FILE_NOT_FOUND) {
        return twhi_os_io_err_at(root_handle, file.path, TEK_WH_ERRC_sig_verify,
                                 errc, TEK_WH_ERR_IO_TYPE_stat);
      }
      st.type = TWHI_OS_ENTRY_TYPE_other;
    }
    if (st.type != TWHI_OS_ENTRY_TYPE_file || st.size < file.size) {
      findings.push_back({.type = TEK_WH_FINDING_TYPE_missing,
                          .file_index = file_index,
                          .block_index = -1});
      if (const auto res = skip_hashes(reader, blocks);
          !tek_wh_err_success(&res)) {
        return res;
      }
      continue;
    }
    if (st.size > file.size) {
      findings.push_back({.type = TEK_WH_FINDING_TYPE_oversized,
                          .file_index = file_index,
                          .block_index = -1});
    }
    const unique_handle handle{
        twhi_os_file_open_at(root_handle, file.path, TWHI_OS_FILE_ACCESS_read)};
    if (!handle) {
      return twhi_os_io_err_at(root_handle, file.path, TEK_WH_ERRC_sig_verify,
                               twhi_os_get_last_error(),
                               TEK_WH_ERR_IO_TYPE_open);
    }
    for (std::int64_t i = 0; i < blocks; ++i) {
      bool eos;
      if (const auto res = reader.next(hash, eos); !tek_wh_err_success(&res)) {
        return res;
      }
      if (eos) {
        return twh_err_basic(TEK_WH_ERRC_hash_count);
      }
      const auto want = static_cast<std::size_t>(
          std::min(bs, file.size - i * bs));
      const auto num_read = twhi_os_file_read(handle.get(), buf.get(), want);
      if (num_read == SIZE_MAX) {
        return twhi_os_io_err_at(root_handle, file.path, TEK_WH_ERRC_sig_verify,
                                 twhi_os_get_last_error(),
                                 TEK_WH_ERR_IO_TYPE_read);
      }
      if (num_read != want) {
        // The file has been truncated since stat
        findings.push_back({.type = TEK_WH_FINDING_TYPE_missing,
                            .file_index = file_index,
                            .block_index = -1});
        if (const auto res = skip_hashes(reader, blocks - i - 1);
            !tek_wh_err_success(&res)) {
          return res;
        }
        break;
      }
      const std::span block{buf.get(), want};
      if (const auto res = md5(block, digest); !tek_wh_err_success(&res)) {
        return res;
      }
      if (hash.weakhash() != weak_hash(block) ||
          hash.stronghash() != digest_view(digest)) {
        findings.push_back({.type = TEK_WH_FINDING_TYPE_corrupted,
                            .file_index = file_index,
                            .block_index = i});
      }
    }
  }
  // There must be no hashes left
  bool eos;
  if (const auto res = reader.next(hash, eos); !tek_wh_err_success(&res)) {
    return res;
  }
  return eos ? twh_err_ok() : twh_err_basic(TEK_WH_ERRC_hash_count);
}

tek_wh_err findings_export(const std::vector<tek_wh_finding> &items,
                           tek_wh_findings &findings) {
  findings = {};
  if (items.empty()) {
    return twh_err_ok();
  }
  findings.items = static_cast<tek_wh_finding *>(
      std::malloc(sizeof *findings.items * items.size()));
  if (!findings.items) {
    return twh_err_basic(TEK_WH_ERRC_mem_alloc);
  }
  std::ranges::copy(items, findings.items);
  findings.num_items = static_cast<int>(items.size());
  return twh_err_ok();
}

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_wh_err tek_wh_sig_write(const char *root, const tek_wh_ctr *ctr,
                            tek_wh_comp_settings comp,
                            const tek_wh_ostream *out) {
  try {
    const unique_handle root_handle{twhi_os_dir_open(root)};
    if (!root_handle) {
      return twhi_os_io_err(root, TEK_WH_ERRC_sig_write,
                            twhi_os_get_last_error(), TEK_WH_ERR_IO_TYPE_open);
    }
    callback_sink sink{*out};
    if (const auto res = sig_write(root_handle.get(), *ctr, comp, sink);
        !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_sig_write, res);
    }
    return twh_err_ok();
  } catch (const std::bad_alloc &) {
    return twh_err_sub(TEK_WH_ERRC_sig_write, TEK_WH_ERRC_mem_alloc);
  }
}

tek_wh_err tek_wh_sig_verify(const char *root, const tek_wh_istream *sig,
                             tek_wh_findings *findings) {
  *findings = {};
  try {
    callback_source source{*sig};
    msg_reader reader{source};
    unique_ctr ctr;
    tek_wh_comp_settings comp;
    if (const auto res = sig_read_head(reader, comp, ctr.get());
        !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_sig_verify, res);
    }
    const unique_handle root_handle{twhi_os_dir_open(root)};
    if (!root_handle) {
      return twhi_os_io_err(root, TEK_WH_ERRC_sig_verify,
                            twhi_os_get_last_error(), TEK_WH_ERR_IO_TYPE_open);
    }
    std::vector<tek_wh_finding> items;
    if (const auto res =
            sig_verify_body(root_handle.get(), ctr.get(), reader, items);
        !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_sig_verify, res);
    }
    if (const auto res = findings_export(items, *findings);
        !tek_wh_err_success(&res)) {
      return twh_err_rebase(TEK_WH_ERRC_sig_verify, res);
    }
    return twh_err_ok();
  } catch (const std::bad_alloc &) {
    return twh_err_sub(TEK_WH_ERRC_sig_verify, TEK_WH_ERRC_mem_alloc);
  }
}

void tek_wh_findings_free(tek_wh_findings *findings) {
  std::free(findings->items);
  *findings = {};
}

} // extern "C"

} // namespace tek::wharf
