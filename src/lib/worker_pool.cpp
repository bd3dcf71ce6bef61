//===-- worker_pool.cpp - bounded worker thread pool ----------------------===//
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
/// Implementation of @ref tek::wharf::worker_pool.
///
//===----------------------------------------------------------------------===//
#include "worker_pool.hpp"

#include "common/error.h"
#include "tek-wharf/error.h"

#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace tek::wharf {

void worker_pool::run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock lock{mtx};
      job_cv.wait(lock, [this] { return stopping || !jobs.empty(); });
      if (jobs.empty()) {
        return;
      }
      job = std::move(jobs.front());
      jobs.pop();
    }
    space_cv.notify_one();
    job();
  }
}

tek_wh_err worker_pool::start(int num_threads) {
  capacity = static_cast<std::size_t>(num_threads) * 2;
  workers.reserve(num_threads);
  try {
    for (int i = 0; i < num_threads; ++i) {
      workers.emplace_back(&worker_pool::run, this);
    }
  } catch (const std::system_error &) {
    wait_and_stop();
    return twh_err_basic(TEK_WH_ERRC_wt_start);
  }
  return twh_err_ok();
}

void worker_pool::submit(std::function<void()> job) {
  {
    std::unique_lock lock{mtx};
    space_cv.wait(lock, [this] { return jobs.size() < capacity; });
    jobs.emplace(std::move(job));
  }
  job_cv.notify_one();
}

void worker_pool::wait_and_stop() {
  {
    const std::scoped_lock lock{mtx};
    stopping = true;
  }
  job_cv.notify_all();
  for (auto &worker : workers) {
    worker.join();
  }
  workers.clear();
}

} // namespace tek::wharf
