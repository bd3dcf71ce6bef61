//===-- worker_pool.hpp - bounded worker thread pool ----------------------===//
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
/// Declaration of @ref tek::wharf::worker_pool.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "tek-wharf/error.h"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tek::wharf {

/// Fixed-size pool of worker threads fed through a bounded job queue.
///    Producers submitting to a full queue block until a worker takes a job.
class [[gnu::visibility("internal")]] worker_pool {
  /// Worker threads.
  std::vector<std::thread> workers;
  /// Pending jobs.
  std::queue<std::function<void()>> jobs;
  /// Maximum number of pending jobs.
  std::size_t capacity{};
  /// Mutex locking concurrent access to @ref jobs and @ref stopping.
  std::mutex mtx;
  /// Condition variable notified when a job is queued or the pool stops.
  std::condition_variable job_cv;
  /// Condition variable notified when a job is taken from the queue.
  std::condition_variable space_cv;
  /// Value indicating whether workers should exit once the queue is empty.
  bool stopping{};

  /// Worker thread procedure.
  void run();

public:
  worker_pool() = default;
  worker_pool(const worker_pool &) = delete;
  worker_pool &operator=(const worker_pool &) = delete;
  ~worker_pool() { wait_and_stop(); }

  /// Start worker threads.
  ///
  /// @param num_threads
  ///    Number of threads to start, must be positive. The queue capacity is
  ///    twice this number.
  /// @return A @ref tek_wh_err indicating the result of operation,
  ///    @ref TEK_WH_ERRC_wt_start if a thread couldn't be started.
  tek_wh_err start(int num_threads);
  /// Queue a job, waiting for free space in the queue if necessary.
  ///
  /// @param job
  ///    Job to run on a worker thread. It must not throw.
  void submit(std::function<void()> job);
  /// Wait until all queued jobs are done and stop worker threads.
  void wait_and_stop();
};

} // namespace tek::wharf
