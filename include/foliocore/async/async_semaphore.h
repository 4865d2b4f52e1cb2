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

#ifndef FOLIO_FOLIOCORE_INCLUDE_FOLIOCORE_ASYNC_ASYNC_SEMAPHORE_H_
#define FOLIO_FOLIOCORE_INCLUDE_FOLIOCORE_ASYNC_ASYNC_SEMAPHORE_H_

#include <cstddef>
#include <deque>
#include <memory>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

/**
 * @file async_semaphore.h
 * @brief Cooperative synchronisation for coroutines on one io_context
 *
 * Neither class is thread-safe: both assume every coroutine that touches them
 * runs on the same single-threaded io_context, which is the scheduling model
 * of the whole download engine. Waiting never blocks the thread; a waiter is
 * parked on a steady_timer that is cancelled to wake it up.
 */

namespace foliocore::async {

class AsyncSemaphore;

/// @brief RAII permit; returns its slot to the semaphore on destruction.
class SemaphorePermit {
 public:
  SemaphorePermit() = default;
  explicit SemaphorePermit(AsyncSemaphore* owner) : owner_(owner) {}
  ~SemaphorePermit() { Release(); }

  SemaphorePermit(const SemaphorePermit&) = delete;
  SemaphorePermit& operator=(const SemaphorePermit&) = delete;

  SemaphorePermit(SemaphorePermit&& other) noexcept : owner_(other.owner_) {
    other.owner_ = nullptr;
  }
  SemaphorePermit& operator=(SemaphorePermit&& other) noexcept {
    if (this != &other) {
      Release();
      owner_ = other.owner_;
      other.owner_ = nullptr;
    }
    return *this;
  }

  [[nodiscard]] bool Valid() const { return owner_ != nullptr; }

  void Release();

 private:
  AsyncSemaphore* owner_ = nullptr;
};

/// @brief Counting semaphore for coroutines.
///
/// Permits are handed to waiters in FIFO order. A released permit goes
/// straight to the oldest waiter, so a late arrival can never overtake a
/// coroutine that is already parked.
class AsyncSemaphore {
 public:
  /// @param executor Executor of the io_context the waiters run on
  /// @param permits Maximum number of concurrent holders (must be > 0)
  AsyncSemaphore(boost::asio::any_io_executor executor, std::size_t permits);

  AsyncSemaphore(const AsyncSemaphore&) = delete;
  AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

  /// @brief Suspend until a permit is available and take it.
  boost::asio::awaitable<SemaphorePermit> Acquire();

  /// @brief Give one permit back (prefer letting SemaphorePermit do this).
  void Release();

  [[nodiscard]] std::size_t Capacity() const { return capacity_; }
  [[nodiscard]] std::size_t Available() const { return available_; }
  [[nodiscard]] std::size_t Waiting() const { return waiters_.size(); }

 private:
  struct Waiter {
    explicit Waiter(const boost::asio::any_io_executor& executor)
        : timer(executor) {}
    boost::asio::steady_timer timer;
    bool granted = false;
  };

  boost::asio::any_io_executor executor_;
  std::size_t capacity_;
  std::size_t available_;
  std::deque<std::shared_ptr<Waiter>> waiters_;
};

/// @brief Fan-in point: resumes the waiter once `count` tasks have finished.
class CompletionLatch {
 public:
  CompletionLatch(boost::asio::any_io_executor executor, std::size_t count);

  CompletionLatch(const CompletionLatch&) = delete;
  CompletionLatch& operator=(const CompletionLatch&) = delete;

  /// @brief Mark one task as finished.
  void CountDown();

  /// @brief Suspend until the count reaches zero (returns at once if it is).
  boost::asio::awaitable<void> Wait();

  [[nodiscard]] std::size_t Remaining() const { return remaining_; }

 private:
  boost::asio::steady_timer timer_;
  std::size_t remaining_;
};

}  // namespace foliocore::async

#endif  // FOLIO_FOLIOCORE_INCLUDE_FOLIOCORE_ASYNC_ASYNC_SEMAPHORE_H_
