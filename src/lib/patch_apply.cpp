//===-- patch_apply.cpp - patch application -------------------------------===//
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
/// Implementation of @ref tek_wh_patch_apply.
///
/// The calling thread decodes the patch body and collects every file record
///    into a job, which is then handed to the worker pool. Workers reconstruct
///    files into the staging directory and commit them. A record whose
///    buffered payload grows past the limit is not buffered further; the
///    decoding thread applies it directly as its operations are read. When
///    the patch is applied in-place, commits are deferred until all jobs are
///    done so that no old file is replaced while another job may still read
///    from it.
///
//===----------------------------------------------------------------------===//
#include "patch.hpp"

#include "common/error.h"
#include "container.hpp"
#include "engines.hpp"
#include "msg_stream.hpp"
#include "os.h"
#include "root.hpp"
#include "signature.hpp"
#include "stream.hpp"
#include "tek-wharf/base.h"
#include "tek-wharf/container.h"
#include "tek-wharf/error.h"
#include "tek-wharf/os.h"
#include "tek-wharf/patch.h"
#include "tek-wharf/signature.h"
#include "tek/wharf/bsdiff.pb.h"
#include "tek/wharf/pwr.pb.h"
#include "tek/wharf/tlc.pb.h"
#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace tek::wharf {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Reconstruction job for a single new file.
struct file_job {
  /// Index of the file in the new container.
  int index;
  /// Type of the file record.
  SyncHeader::Type type;
  /// For bsdiff records, index of the old file to diff against.
  std::int64_t old_index;
  /// For rsync records, operations including the terminating one.
  std::vector<SyncOp> ops;
  /// For bsdiff records, controls including the terminating one.
  std::vector<Control> ctrls;
};

/// State shared between the decoder and workers.
class apply_ctx final : public apply_monitor {
  /// Cancellation flag provided by the caller.
  std::uint32_t *_Nullable cancel_flag;
  /// Progress handler provided by the caller.
  tek_wh_progress_func *_Nullable progress;
  /// Opaque pointer passed to @ref progress.
  void *_Nullable progress_data;
  /// Value indicating whether any job or the decoder has failed.
  std::atomic_bool failed;
  /// Mutex locking concurrent access to @ref first_err and @ref deferred.
  std::mutex mtx;
  /// The first error that occurred.
  tek_wh_err first_err;
  /// Indices of staged files waiting for commit.
  std::vector<int> deferred;
  /// Mutex serializing progress handler calls.
  std::mutex progress_mtx;
  /// Number of bytes written to new files so far.
  std::int64_t progress_current{};

public:
  old_root &old;
  staging_area &staging;
  const tek_wh_ctr &new_ctr;
  tek_wh_bsdiff_oob oob;
  std::size_t block_size;
  /// Maximum number of payload bytes buffered for a single job.
  std::size_t payload_limit;
  /// Value indicating whether the old and new roots are the same directory.
  bool in_place;

  apply_ctx(const tek_wh_patch_apply_args &args, old_root &old,
            staging_area &staging, const tek_wh_ctr &new_ctr,
            std::size_t block_size, std::size_t payload_limit, bool in_place)
      : cancel_flag{args.cancel}, progress{args.progress},
        progress_data{args.progress_data}, failed{false},
        first_err{twh_err_ok()}, old{old}, staging{staging}, new_ctr{new_ctr},
        oob{args.bsdiff_oob}, block_size{block_size},
        payload_limit{payload_limit}, in_place{in_place} {}

  bool cancelled() const noexcept override {
    if (failed.load(std::memory_order::relaxed)) {
      return true;
    }
    return cancel_flag &&
           std::atomic_ref{*cancel_flag}.load(std::memory_order::relaxed);
  }

  void on_written(std::int64_t bytes) override {
    if (!progress) {
      return;
    }
    const std::scoped_lock lock{progress_mtx};
    progress_current += bytes;
    progress(progress_data, progress_current, new_ctr.size);
  }

  /// Record an error. Only the first one is kept.
  void fail(tek_wh_err err) noexcept {
    {
      const std::scoped_lock lock{mtx};
      if (tek_wh_err_success(&first_err)) {
        first_err = err;
        failed.store(true, std::memory_order::relaxed);
        return;
      }
    }
    tek_wh_err_release(&err);
  }

  /// Check whether an error has been recorded.
  bool has_failed() const noexcept {
    return failed.load(std::memory_order::relaxed);
  }

  /// Take the recorded error.
  tek_wh_err take_err() noexcept {
    const std::scoped_lock lock{mtx};
    return std::exchange(first_err, twh_err_ok());
  }

  /// Add a staged file to the list of deferred commits.
  void defer(int index) {
    const std::scoped_lock lock{mtx};
    deferred.emplace_back(index);
  }

  /// Take the list of deferred commits, sorted by file index.
  std::vector<int> take_deferred() {
    const std::scoped_lock lock{mtx};
    std::ranges::sort(deferred);
    return std::move(deferred);
  }
};

/// File record applied on the decoder thread.
///
/// @tparam Applier
///    Engine type, constructed from the staged file's sink followed by the
///    remaining arguments.
template <typename Applier> struct direct_record {
  /// Staged new file.
  std::unique_ptr<file_sink> out;
  Applier applier;

  template <typename... Args>
  direct_record(std::unique_ptr<file_sink> &&staged, Args &&...args)
      : out{std::move(staged)}, applier{*out, std::forward<Args>(args)...} {}
};

/// Decoder state: expecting the next file record or the end of the body.
struct reading_sync_header {};
/// Decoder state: collecting operations of an rsync record.
struct running_rsync {
  std::shared_ptr<file_job> job;
  /// Number of payload bytes held by @ref job.
  std::size_t buffered;
  /// Set once the record outgrows the payload limit, operations are applied
  ///    through it from then on.
  std::unique_ptr<direct_record<rsync_applier>> direct;
};
/// Decoder state: collecting controls of a bsdiff record.
struct running_bsdiff {
  std::shared_ptr<file_job> job;
  /// Value indicating whether the terminating control has been read, so the
  ///    terminating operation is expected next.
  bool ctrls_done;
  /// Number of payload bytes held by @ref job.
  std::size_t buffered;
  /// Set once the record outgrows the payload limit, controls are applied
  ///    through it from then on.
  std::unique_ptr<direct_record<bsdiff_applier>> direct;
};
/// Decoder state: the body has ended cleanly.
struct done {};

using decoder_state =
    std::variant<reading_sync_header, running_rsync, running_bsdiff, done>;

//===-- Private functions -------------------------------------------------===//

/// Finish a reconstructed staged file and commit it, or defer the commit
///    when applying in-place.
///
/// @param [in, out] ctx
///    Shared application state.
/// @param index
///    Index of the file in the new container.
/// @param out
///    Sink of the staged file.
/// @return A @ref tek_wh_err indicating the result of operation.
static tek_wh_err commit_staged(apply_ctx &ctx, int index,
                                std::unique_ptr<file_sink> out) {
  const auto &file = ctx.new_ctr.files[index];
  if (const auto res = out->finish(); !tek_wh_err_success(&res)) {
    return res;
  }
  if (out->size() != file.size) {
    return twh_err_basic(TEK_WH_ERRC_size_mismatch);
  }
  out.reset();
  if (ctx.in_place) {
    ctx.defer(index);
    return twh_err_ok();
  }
  return ctx.staging.commit(index, file);
}

/// Reconstruct a new file and commit or defer it.
///
/// @param [in, out] ctx
///    Shared application state.
/// @param [in] job
///    The job to run.
/// @return A @ref tek_wh_err indicating the result of operation.
static tek_wh_err run_job(apply_ctx &ctx, const file_job &job) {
  if (ctx.cancelled()) {
    return twh_err_basic(TEK_WH_ERRC_cancelled);
  }
  const auto &file = ctx.new_ctr.files[job.index];
  std::unique_ptr<file_sink> out;
  if (const auto res = ctx.staging.create(job.index, out);
      !tek_wh_err_success(&res)) {
    return res;
  }
  const auto apply_res =
      job.type == SyncHeader::RSYNC
          ? rsync_apply(ctx.old, job.ops, file.size, *out, ctx.block_size,
                        &ctx)
          : bsdiff_apply(ctx.old, job.old_index, job.ctrls, file.size,
                         ctx.oob, *out, &ctx);
  if (!tek_wh_err_success(&apply_res)) {
    return apply_res;
  }
  return commit_staged(ctx, job.index, std::move(out));
}

/// Create an empty new file that has no record in the patch.
static tek_wh_err make_empty_file(apply_ctx &ctx, int index) {
  const auto &file = ctx.new_ctr.files[index];
  if (file.size) {
    return twh_err_basic(TEK_WH_ERRC_size_mismatch);
  }
  std::unique_ptr<file_sink> out;
  if (const auto res = ctx.staging.create(index, out);
      !tek_wh_err_success(&res)) {
    return res;
  }
  if (const auto res = out->finish(); !tek_wh_err_success(&res)) {
    return res;
  }
  out.reset();
  return ctx.staging.commit(index, file);
}

/// Decoder of file records, feeding jobs to the worker pool.
class decoder {
  msg_reader &reader;
  apply_ctx &ctx;
  worker_pool &pool;
  /// Value indicating for each new file whether its record has been seen.
  std::vector<bool> &seen;
  decoder_state state{reading_sync_header{}};
  // Message objects reused between reads
  SyncHeader sync_header;
  SyncOp op;
  Control ctrl;

  void submit(std::shared_ptr<file_job> job) {
    pool.submit([&ctx = ctx, job = std::move(job)] {
      tek_wh_err res;
      try {
        res = run_job(ctx, *job);
      } catch (const std::bad_alloc &) {
        res = twh_err_basic(TEK_WH_ERRC_mem_alloc);
      }
      if (!tek_wh_err_success(&res)) {
        ctx.fail(res);
      }
    });
  }

  tek_wh_err step(reading_sync_header &, std::optional<decoder_state> &next) {
    bool eos;
    if (const auto res = reader.next(sync_header, eos);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (eos) {
      next.emplace(done{});
      return twh_err_ok();
    }
    const auto index = sync_header.fileindex();
    if (index < 0 || index >= ctx.new_ctr.num_files) {
      return twh_err_basic(TEK_WH_ERRC_file_index);
    }
    if (seen[index]) {
      return twh_err_basic(TEK_WH_ERRC_duplicate_file);
    }
    seen[index] = true;
    auto job = std::make_shared<file_job>();
    job->index = static_cast<int>(index);
    job->type = sync_header.type();
    switch (sync_header.type()) {
    case SyncHeader::RSYNC:
      next.emplace(running_rsync{std::move(job), 0, nullptr});
      return twh_err_ok();
    case SyncHeader::BSDIFF: {
      BsdiffHeader bsdiff_header;
      if (const auto res = reader.read(bsdiff_header);
          !tek_wh_err_success(&res)) {
        return res;
      }
      job->old_index = bsdiff_header.targetindex();
      next.emplace(running_bsdiff{std::move(job), false, 0, nullptr});
      return twh_err_ok();
    }
    default:
      return twh_err_basic(TEK_WH_ERRC_unexpected_msg);
    }
  }

  /// Stop buffering an rsync record and apply it on this thread, starting
  ///    with the operations buffered so far.
  tek_wh_err apply_directly(running_rsync &st) {
    const auto index = st.job->index;
    std::unique_ptr<file_sink> out;
    if (const auto res = ctx.staging.create(index, out);
        !tek_wh_err_success(&res)) {
      return res;
    }
    st.direct = std::make_unique<direct_record<rsync_applier>>(
        std::move(out), ctx.old, ctx.new_ctr.files[index].size,
        ctx.block_size, &ctx);
    for (const auto &buffered_op : st.job->ops) {
      bool last;
      if (const auto res = st.direct->applier.feed(buffered_op, last);
          !tek_wh_err_success(&res)) {
        return res;
      }
    }
    st.job->ops = {};
    st.buffered = 0;
    return twh_err_ok();
  }

  /// Stop buffering a bsdiff record and apply it on this thread, starting
  ///    with the controls buffered so far.
  tek_wh_err apply_directly(running_bsdiff &st) {
    const auto index = st.job->index;
    std::unique_ptr<file_sink> out;
    if (const auto res = ctx.staging.create(index, out);
        !tek_wh_err_success(&res)) {
      return res;
    }
    st.direct = std::make_unique<direct_record<bsdiff_applier>>(
        std::move(out), ctx.old, ctx.new_ctr.files[index].size, ctx.oob,
        &ctx);
    if (const auto res = st.direct->applier.begin(st.job->old_index);
        !tek_wh_err_success(&res)) {
      return res;
    }
    for (const auto &buffered_ctrl : st.job->ctrls) {
      bool last;
      if (const auto res = st.direct->applier.feed(buffered_ctrl, last);
          !tek_wh_err_success(&res)) {
        return res;
      }
    }
    st.job->ctrls = {};
    st.buffered = 0;
    return twh_err_ok();
  }

  tek_wh_err step(running_rsync &st, std::optional<decoder_state> &next) {
    if (const auto res = reader.read(op); !tek_wh_err_success(&res)) {
      return res;
    }
    if (st.direct) {
      bool last;
      if (const auto res = st.direct->applier.feed(op, last);
          !tek_wh_err_success(&res)) {
        return res;
      }
      if (last) {
        if (const auto res = commit_staged(ctx, st.job->index,
                                           std::move(st.direct->out));
            !tek_wh_err_success(&res)) {
          return res;
        }
        next.emplace(reading_sync_header{});
      }
      return twh_err_ok();
    }
    const bool last = op.type() == SyncOp::HEY_YOU_DID_IT;
    st.buffered += op.data().size();
    st.job->ops.emplace_back(std::move(op));
    op.Clear();
    if (last) {
      submit(std::move(st.job));
      next.emplace(reading_sync_header{});
      return twh_err_ok();
    }
    return st.buffered > ctx.payload_limit ? apply_directly(st)
                                           : twh_err_ok();
  }

  tek_wh_err step(running_bsdiff &st, std::optional<decoder_state> &next) {
    if (st.ctrls_done) {
      if (const auto res = reader.read(op); !tek_wh_err_success(&res)) {
        return res;
      }
      if (op.type() != SyncOp::HEY_YOU_DID_IT) {
        return twh_err_basic(TEK_WH_ERRC_unexpected_msg);
      }
      if (st.direct) {
        if (const auto res = st.direct->applier.finish();
            !tek_wh_err_success(&res)) {
          return res;
        }
        if (const auto res = commit_staged(ctx, st.job->index,
                                           std::move(st.direct->out));
            !tek_wh_err_success(&res)) {
          return res;
        }
      } else {
        submit(std::move(st.job));
      }
      next.emplace(reading_sync_header{});
      return twh_err_ok();
    }
    if (const auto res = reader.read(ctrl); !tek_wh_err_success(&res)) {
      return res;
    }
    if (st.direct) {
      return st.direct->applier.feed(ctrl, st.ctrls_done);
    }
    st.ctrls_done = ctrl.eof();
    st.buffered += ctrl.add().size() + ctrl.copy().size();
    st.job->ctrls.emplace_back(std::move(ctrl));
    ctrl.Clear();
    return !st.ctrls_done && st.buffered > ctx.payload_limit
               ? apply_directly(st)
               : twh_err_ok();
  }

  tek_wh_err step(done &, std::optional<decoder_state> &) {
    return twh_err_ok();
  }

public:
  decoder(msg_reader &reader, apply_ctx &ctx, worker_pool &pool,
          std::vector<bool> &seen) noexcept
      : reader{reader}, ctx{ctx}, pool{pool}, seen{seen} {}

  /// Decode all file records.
  ///
  /// @return A @ref tek_wh_err indicating the result of operation.
  tek_wh_err run() {
    while (!std::holds_alternative<done>(state)) {
      if (ctx.cancelled()) {
        return twh_err_basic(TEK_WH_ERRC_cancelled);
      }
      std::optional<decoder_state> next;
      const auto res =
          std::visit([&](auto &st) { return step(st, next); }, state);
      if (!tek_wh_err_success(&res)) {
        return res;
      }
      if (next) {
        state = std::move(*next);
      }
    }
    return twh_err_ok();
  }
};

/// Complete the tree after all jobs are done.
static tek_wh_err finalize(apply_ctx &ctx, tek_wh_os_handle root_handle,
                           const tek_wh_ctr &old_ctr,
                           const std::vector<bool> &seen) {
  for (int i = 0; i < ctx.new_ctr.num_files; ++i) {
    if (!seen[i]) {
      if (const auto res = make_empty_file(ctx, i);
          !tek_wh_err_success(&res)) {
        return res;
      }
    }
  }
  if (ctx.in_place) {
    for (const auto index : ctx.take_deferred()) {
      if (const auto res =
              ctx.staging.commit(index, ctx.new_ctr.files[index]);
          !tek_wh_err_success(&res)) {
        return res;
      }
    }
    if (const auto res = ctr_make_symlinks(root_handle, ctx.new_ctr,
                                           TEK_WH_ERRC_patch_apply);
        !tek_wh_err_success(&res)) {
      return res;
    }
    if (const auto res = ctr_remove_ghosts(root_handle, old_ctr, ctx.new_ctr,
                                           TEK_WH_ERRC_patch_apply);
        !tek_wh_err_success(&res)) {
      return res;
    }
  }
  return ctr_set_dir_modes(root_handle, ctx.new_ctr, TEK_WH_ERRC_patch_apply);
}

/// Verify the new tree against its signature.
static tek_wh_err verify(const tek_wh_istream &sig,
                         tek_wh_os_handle root_handle,
                         tek_wh_findings *_Nullable findings,
                         std::size_t block_size) {
  callback_source source{sig};
  msg_reader reader{source};
  tek_wh_comp_settings comp;
  unique_ctr ctr;
  if (const auto res = sig_read_head(reader, comp, ctr.get());
      !tek_wh_err_success(&res)) {
    return res;
  }
  std::vector<tek_wh_finding> items;
  if (const auto res =
          sig_verify_body(root_handle, ctr.get(), reader, items, block_size);
      !tek_wh_err_success(&res)) {
    return res;
  }
  return findings ? findings_export(items, *findings) : twh_err_ok();
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

tek_wh_err patch_read_head(msg_reader &reader, tek_wh_comp_settings &comp,
                           tek_wh_ctr &old_ctr, tek_wh_ctr &new_ctr) {
  std::uint32_t magic;
  if (const auto res = reader.read_magic(magic); !tek_wh_err_success(&res)) {
    return res;
  }
  if (magic != TEK_WH_PATCH_MAGIC) {
    return twh_err_basic(TEK_WH_ERRC_magic_mismatch);
  }
  return patch_read_header(reader, comp, old_ctr, new_ctr);
}

tek_wh_err patch_read_header(msg_reader &reader, tek_wh_comp_settings &comp,
                             tek_wh_ctr &old_ctr, tek_wh_ctr &new_ctr) {
  PatchHeader header;
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
  if (const auto res = ctr_from_proto(proto, old_ctr);
      !tek_wh_err_success(&res)) {
    return res;
  }
  proto.Clear();
  if (const auto res = reader.read(proto); !tek_wh_err_success(&res)) {
    return res;
  }
  return ctr_from_proto(proto, new_ctr);
}

tek_wh_err patch_apply(const tek_wh_patch_apply_args &args,
                       tek_wh_findings *findings, std::size_t block_size,
                       std::size_t payload_limit) {
  callback_source source{args.patch};
  msg_reader reader{source};
  tek_wh_comp_settings comp;
  unique_ctr old_ctr;
  unique_ctr new_ctr;
  if (const auto res =
          patch_read_head(reader, comp, old_ctr.get(), new_ctr.get());
      !tek_wh_err_success(&res)) {
    return res;
  }
  unique_handle old_handle{twhi_os_dir_open(args.old_root)};
  if (!old_handle) {
    const auto errc = twhi_os_get_last_error();
    // A missing old root is an empty tree
    if (errc != TWHI_OS_ERR_FILE_NOT_FOUND || old_ctr->num_files) {
      return twhi_os_io_err(args.old_root, TEK_WH_ERRC_patch_apply, errc,
                            TEK_WH_ERR_IO_TYPE_open);
    }
  }
  const unique_handle new_handle{twhi_os_dir_create(args.new_root)};
  if (!new_handle) {
    return twhi_os_io_err(args.new_root, TEK_WH_ERRC_patch_apply,
                          twhi_os_get_last_error(),
                          TEK_WH_ERR_IO_TYPE_create_dir);
  }
  const bool in_place =
      old_handle && twhi_os_same_object(old_handle.get(), new_handle.get());
  if (const auto res = ctr_make_dirs(new_handle.get(), new_ctr.get(),
                                     TEK_WH_ERRC_patch_apply);
      !tek_wh_err_success(&res)) {
    return res;
  }
  if (!in_place) {
    if (const auto res = ctr_make_symlinks(new_handle.get(), new_ctr.get(),
                                           TEK_WH_ERRC_patch_apply);
        !tek_wh_err_success(&res)) {
      return res;
    }
  }
  staging_area staging{new_handle.get()};
  if (const auto res = staging.open(); !tek_wh_err_success(&res)) {
    return res;
  }
  dir_old_root old{old_handle.get(), old_ctr.get()};
  apply_ctx ctx{args,       old,           staging,
                new_ctr.get(), block_size, payload_limit,
                in_place};
  std::vector<bool> seen(new_ctr->num_files);
  {
    worker_pool pool;
    auto res = pool.start(args.num_threads > 0 ? args.num_threads
                                               : twhi_os_get_nproc());
    if (tek_wh_err_success(&res)) {
      res = decoder{reader, ctx, pool, seen}.run();
    }
    if (!tek_wh_err_success(&res)) {
      ctx.fail(res);
    }
    pool.wait_and_stop();
  }
  if (!ctx.has_failed()) {
    if (const auto res = finalize(ctx, new_handle.get(), old_ctr.get(), seen);
        !tek_wh_err_success(&res)) {
      ctx.fail(res);
    }
  }
  auto cleanup_res = staging.cleanup();
  if (ctx.has_failed()) {
    tek_wh_err_release(&cleanup_res);
    return ctx.take_err();
  }
  if (!tek_wh_err_success(&cleanup_res)) {
    return cleanup_res;
  }
  if (args.new_sig) {
    return verify(*args.new_sig, new_handle.get(), findings, block_size);
  }
  return twh_err_ok();
}

//===-- Public functions --------------------------------------------------===//

extern "C" {

tek_wh_err tek_wh_patch_apply(const tek_wh_patch_apply_args *args,
                              tek_wh_findings *findings) {
  if (findings) {
    *findings = {};
  }
  try {
    const auto res = patch_apply(*args, findings);
    return tek_wh_err_success(&res)
               ? res
               : twh_err_rebase(TEK_WH_ERRC_patch_apply, res);
  } catch (const std::bad_alloc &) {
    return twh_err_sub(TEK_WH_ERRC_patch_apply, TEK_WH_ERRC_mem_alloc);
  }
}

} // extern "C"

} // namespace tek::wharf
