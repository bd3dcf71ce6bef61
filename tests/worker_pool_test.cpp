//===-- worker_pool_test.cpp - worker pool tests --------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of tek-wharf, under the GNU General Public License v3.0 or later
// See https://github.com/teknology-hub/tek-wharf/blob/main/COPYING for
//    license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "worker_pool.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <thread>

namespace tek::wharf::test {

TEST(worker_pool, runs_every_job) {
  worker_pool pool;
  ASSERT_TRUE(succeeded(pool.start(4)));
  std::atomic_int sum{};
  for (int i = 1; i <= 1000; ++i) {
    pool.submit([&sum, i] { sum += i; });
  }
  pool.wait_and_stop();
  EXPECT_EQ(sum, 500500);
}

TEST(worker_pool, runs_jobs_on_multiple_threads) {
  worker_pool pool;
  ASSERT_TRUE(succeeded(pool.start(3)));
  std::mutex mtx;
  std::set<std::thread::id> ids;
  std::atomic_int waiting{};
  for (int i = 0; i < 3; ++i) {
    pool.submit([&] {
      {
        const std::scoped_lock lock{mtx};
        ids.insert(std::this_thread::get_id());
      }
      // Hold every worker until all of them have picked up a job
      ++waiting;
      while (waiting < 3) {
        std::this_thread::yield();
      }
    });
  }
  pool.wait_and_stop();
  EXPECT_EQ(ids.size(), 3u);
  EXPECT_EQ(ids.count(std::this_thread::get_id()), 0u);
}

TEST(worker_pool, blocks_producer_on_full_queue) {
  worker_pool pool;
  ASSERT_TRUE(succeeded(pool.start(1)));
  std::atomic_bool release{};
  std::atomic_int done{};
  // One running job plus a queue of 2
  pool.submit([&] {
    while (!release) {
      std::this_thread::yield();
    }
    ++done;
  });
  std::atomic_int submitted{};
  std::thread producer{[&] {
    for (int i = 0; i < 4; ++i) {
      pool.submit([&] { ++done; });
      ++submitted;
    }
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_LE(submitted, 2);
  release = true;
  producer.join();
  pool.wait_and_stop();
  EXPECT_EQ(submitted, 4);
  EXPECT_EQ(done, 5);
}

TEST(worker_pool, stop_without_jobs_is_idempotent) {
  worker_pool pool;
  ASSERT_TRUE(succeeded(pool.start(2)));
  pool.wait_and_stop();
  pool.wait_and_stop();
}

} // namespace tek::wharf::test
