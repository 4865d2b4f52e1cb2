// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "foliocore/async/async_semaphore.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace foliocore::async {
namespace {

namespace asio = boost::asio;

/// @brief Yield back to the io_context once so other coroutines can run.
asio::awaitable<void> Yield() {
  co_await asio::post(co_await asio::this_coro::executor,
                      asio::use_awaitable);
}

// ============================================================================
// AsyncSemaphore Tests
// ============================================================================

TEST(AsyncSemaphoreTest, ZeroPermitsRejected) {
  asio::io_context ctx;
  EXPECT_THROW(AsyncSemaphore(ctx.get_executor(), 0), std::invalid_argument);
}

TEST(AsyncSemaphoreTest, AcquireWithinCapacityDoesNotSuspend) {
  asio::io_context ctx;
  AsyncSemaphore sem(ctx.get_executor(), 2);
  int acquired = 0;

  asio::co_spawn(
      ctx,
      [&]() -> asio::awaitable<void> {
        auto a = co_await sem.Acquire();
        auto b = co_await sem.Acquire();
        acquired = 2;
        EXPECT_EQ(sem.Available(), 0u);
      },
      asio::detached);
  ctx.run();

  EXPECT_EQ(acquired, 2);
  EXPECT_EQ(sem.Available(), 2u);  // Both permits returned by RAII
}

TEST(AsyncSemaphoreTest, InFlightNeverExceedsCapacity) {
  asio::io_context ctx;
  constexpr std::size_t kCapacity = 3;
  AsyncSemaphore sem(ctx.get_executor(), kCapacity);

  std::size_t in_flight = 0;
  std::size_t peak = 0;
  int finished = 0;

  for (int i = 0; i < 20; ++i) {
    asio::co_spawn(
        ctx,
        [&]() -> asio::awaitable<void> {
          auto permit = co_await sem.Acquire();
          ++in_flight;
          peak = std::max(peak, in_flight);
          co_await Yield();
          co_await Yield();
          --in_flight;
          ++finished;
        },
        asio::detached);
  }
  ctx.run();

  EXPECT_EQ(finished, 20);
  EXPECT_EQ(peak, kCapacity);
  EXPECT_EQ(sem.Available(), kCapacity);
  EXPECT_EQ(sem.Waiting(), 0u);
}

TEST(AsyncSemaphoreTest, WaitersAreServedInArrivalOrder) {
  asio::io_context ctx;
  AsyncSemaphore sem(ctx.get_executor(), 1);
  std::vector<int> order;

  for (int i = 0; i < 5; ++i) {
    asio::co_spawn(
        ctx,
        [&, i]() -> asio::awaitable<void> {
          auto permit = co_await sem.Acquire();
          order.push_back(i);
          co_await Yield();
        },
        asio::detached);
  }
  ctx.run();

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(AsyncSemaphoreTest, MovedPermitReleasesOnce) {
  asio::io_context ctx;
  AsyncSemaphore sem(ctx.get_executor(), 1);

  asio::co_spawn(
      ctx,
      [&]() -> asio::awaitable<void> {
        SemaphorePermit outer;
        {
          auto inner = co_await sem.Acquire();
          outer = std::move(inner);
          EXPECT_FALSE(inner.Valid());
        }
        EXPECT_TRUE(outer.Valid());
        EXPECT_EQ(sem.Available(), 0u);
        outer.Release();
        EXPECT_EQ(sem.Available(), 1u);
        outer.Release();
        EXPECT_EQ(sem.Available(), 1u);
      },
      asio::detached);
  ctx.run();
}

// ============================================================================
// CompletionLatch Tests
// ============================================================================

TEST(CompletionLatchTest, ZeroCountDoesNotSuspend) {
  asio::io_context ctx;
  CompletionLatch latch(ctx.get_executor(), 0);
  bool done = false;

  asio::co_spawn(
      ctx,
      [&]() -> asio::awaitable<void> {
        co_await latch.Wait();
        done = true;
      },
      asio::detached);
  ctx.run();

  EXPECT_TRUE(done);
}

TEST(CompletionLatchTest, ResumesAfterAllTasksFinish) {
  asio::io_context ctx;
  constexpr int kTasks = 4;
  CompletionLatch latch(ctx.get_executor(), kTasks);
  int finished = 0;
  int seen_by_waiter = -1;

  asio::co_spawn(
      ctx,
      [&]() -> asio::awaitable<void> {
        co_await latch.Wait();
        seen_by_waiter = finished;
      },
      asio::detached);

  for (int i = 0; i < kTasks; ++i) {
    asio::co_spawn(
        ctx,
        [&, i]() -> asio::awaitable<void> {
          asio::steady_timer timer(co_await asio::this_coro::executor,
                                   std::chrono::milliseconds(i));
          co_await timer.async_wait(asio::use_awaitable);
          ++finished;
          latch.CountDown();
        },
        asio::detached);
  }
  ctx.run();

  EXPECT_EQ(seen_by_waiter, kTasks);
  EXPECT_EQ(latch.Remaining(), 0u);
}

}  // namespace
}  // namespace foliocore::async
