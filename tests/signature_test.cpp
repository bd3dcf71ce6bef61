//===-- signature_test.cpp - signature tests ------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "signature.hpp"

#include "container.hpp"
#include "msg_stream.hpp"
#include "os.h"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/signature.h"
#include "test_utils.hpp"

#include <cstddef>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace tek::wharf::test {

namespace {

class signature : public temp_dir_test {
protected:
  /// Write the signature of @ref dir with specified block size.
  std::vector<unsigned char> write_sig(std::size_t block_size) {
    unique_ctr ctr;
    EXPECT_TRUE(succeeded(tek_wh_ctr_scan(dir.c_str(), &ctr.get())));
    const unique_handle root_handle{twhi_os_dir_open(dir.c_str())};
    EXPECT_TRUE(root_handle);
    vector_sink out;
    EXPECT_TRUE(succeeded(
        sig_write(root_handle.get(), ctr.get(),
                  {.algorithm = TEK_WH_COMP_none, .quality = 0}, out,
                  block_size)));
    return std::move(out.data);
  }

  /// Verify @ref dir against a signature with specified block size.
  tek_wh_err verify(const std::vector<unsigned char> &sig,
                    std::size_t block_size,
                    std::vector<tek_wh_finding> &findings) {
    span_source src{sig};
    msg_reader reader{src};
    unique_ctr ctr;
    tek_wh_comp_settings comp;
    if (const auto res = sig_read_head(reader, comp, ctr.get());
        !tek_wh_err_success(&res)) {
      return res;
    }
    const unique_handle root_handle{twhi_os_dir_open(dir.c_str())};
    EXPECT_TRUE(root_handle);
    return sig_verify_body(root_handle.get(), ctr.get(), reader, findings,
                           block_size);
  }
};

} // namespace

TEST_F(signature, clean_tree_has_no_findings) {
  write_file(dir / "a.bin", random_data(200000, 1));
  write_file(dir / "sub" / "b.bin", "small");
  write_file(dir / "empty", "");
  tek_wh_ctr ctr;
  ASSERT_TRUE(succeeded(tek_wh_ctr_scan(dir.c_str(), &ctr)));
  mem_ostream sig;
  const auto out = sig.stream();
  const auto res = tek_wh_sig_write(
      dir.c_str(), &ctr, {.algorithm = TEK_WH_COMP_none, .quality = 0}, &out);
  tek_wh_ctr_free(&ctr);
  ASSERT_TRUE(succeeded(res));

  mem_istream in{sig.data, 1000};
  const auto in_stream = in.stream();
  tek_wh_findings findings;
  ASSERT_TRUE(succeeded(tek_wh_sig_verify(dir.c_str(), &in_stream, &findings)));
  EXPECT_EQ(findings.num_items, 0);
  EXPECT_EQ(findings.items, nullptr);
  tek_wh_findings_free(&findings);
}

TEST_F(signature, reports_all_discrepancies) {
  write_file(dir / "a.bin", "abcdefgh");
  write_file(dir / "b.bin", "12345678");
  write_file(dir / "c.bin", "xyz");
  write_file(dir / "d.bin", "wxyz");
  const auto sig = write_sig(4);

  // Corrupt both blocks of a.bin, remove b.bin, grow c.bin, shrink d.bin
  write_file(dir / "a.bin", "abcXefgY");
  fs::remove(dir / "b.bin");
  write_file(dir / "c.bin", "xyz!");
  write_file(dir / "d.bin", "wx");

  std::vector<tek_wh_finding> findings;
  ASSERT_TRUE(succeeded(verify(sig, 4, findings)));
  ASSERT_EQ(findings.size(), 5u);
  EXPECT_EQ(findings[0].type, TEK_WH_FINDING_TYPE_corrupted);
  EXPECT_EQ(findings[0].file_index, 0);
  EXPECT_EQ(findings[0].block_index, 0);
  EXPECT_EQ(findings[1].type, TEK_WH_FINDING_TYPE_corrupted);
  EXPECT_EQ(findings[1].block_index, 1);
  EXPECT_EQ(findings[2].type, TEK_WH_FINDING_TYPE_missing);
  EXPECT_EQ(findings[2].file_index, 1);
  EXPECT_EQ(findings[2].block_index, -1);
  EXPECT_EQ(findings[3].type, TEK_WH_FINDING_TYPE_oversized);
  EXPECT_EQ(findings[3].file_index, 2);
  EXPECT_EQ(findings[4].type, TEK_WH_FINDING_TYPE_missing);
  EXPECT_EQ(findings[4].file_index, 3);
}

TEST_F(signature, oversized_file_still_checks_declared_blocks) {
  write_file(dir / "f", "abcd");
  const auto sig = write_sig(2);
  write_file(dir / "f", "abXdefgh");
  std::vector<tek_wh_finding> findings;
  ASSERT_TRUE(succeeded(verify(sig, 2, findings)));
  ASSERT_EQ(findings.size(), 2u);
  EXPECT_EQ(findings[0].type, TEK_WH_FINDING_TYPE_oversized);
  EXPECT_EQ(findings[1].type, TEK_WH_FINDING_TYPE_corrupted);
  EXPECT_EQ(findings[1].block_index, 1);
}

TEST_F(signature, empty_file_has_one_block) {
  write_file(dir / "empty", "");
  const auto sig = write_sig(4);
  std::vector<tek_wh_finding> findings;
  ASSERT_TRUE(succeeded(verify(sig, 4, findings)));
  EXPECT_TRUE(findings.empty());
}

TEST_F(signature, rejects_hash_count_mismatch) {
  write_file(dir / "f", "abcdefgh");
  // 4 hashes written, 2 expected with the larger block size
  const auto sig = write_sig(2);
  std::vector<tek_wh_finding> findings;
  const auto res = verify(sig, 4, findings);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_hash_count);
  EXPECT_TRUE(has_class(res, TEK_WH_ERR_CLASS_format));
  // 1 hash written, 2 expected
  const auto short_sig = write_sig(8);
  findings.clear();
  EXPECT_EQ(verify(short_sig, 4, findings).primary, TEK_WH_ERRC_hash_count);
}

TEST_F(signature, rejects_other_binaries) {
  write_file(dir / "f", "data");
  auto sig = write_sig(TEK_WH_BLOCK_SIZE);
  // Turn the magic into the patch one
  sig[0] = 0x00;
  mem_istream in{std::string{sig.begin(), sig.end()}};
  const auto in_stream = in.stream();
  tek_wh_findings findings;
  const auto res = tek_wh_sig_verify(dir.c_str(), &in_stream, &findings);
  EXPECT_EQ(res.type, TEK_WH_ERR_TYPE_sub);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_sig_verify);
  EXPECT_EQ(res.auxiliary, TEK_WH_ERRC_magic_mismatch);
  EXPECT_EQ(findings.num_items, 0);
}

TEST_F(signature, reports_missing_root) {
  write_file(dir / "f", "data");
  const auto sig = write_sig(TEK_WH_BLOCK_SIZE);
  mem_istream in{std::string{sig.begin(), sig.end()}};
  const auto in_stream = in.stream();
  tek_wh_findings findings;
  auto res = tek_wh_sig_verify((dir / "none").c_str(), &in_stream, &findings);
  EXPECT_EQ(res.type, TEK_WH_ERR_TYPE_os);
  EXPECT_EQ(res.primary, TEK_WH_ERRC_sig_verify);
  tek_wh_err_release(&res);
}

} // namespace tek::wharf::test
