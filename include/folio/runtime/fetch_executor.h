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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_FETCH_EXECUTOR_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_FETCH_EXECUTOR_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "absl/status/statusor.h"
#include "folio/net/http_client.h"
#include "foliocore/async/async_semaphore.h"

/**
 * @file fetch_executor.h
 * @brief Bounded-concurrency byte fetching with retry and backoff
 *
 * Shared by tile fetches (one executor per page) and whole-image fetches
 * (one executor shared by every canvas of a manifest run). Concurrency is
 * cooperative: all tasks run as coroutines on one io_context and the
 * semaphore bounds how many requests are on the wire at once. A permit is
 * held for one attempt only, so a task sleeping in backoff does not occupy a
 * slot.
 */

namespace folio {
namespace runtime {

/// @brief Exponential backoff schedule
///
/// The wait after failed attempt k (1-based) is
/// clamp(multiplier * 2^(k-1), min_wait, max_wait).
struct RetryPolicy {
  int max_attempts = 5;
  std::chrono::milliseconds multiplier = std::chrono::seconds(1);
  std::chrono::milliseconds min_wait = std::chrono::seconds(1);
  std::chrono::milliseconds max_wait = std::chrono::seconds(10);

  /// @brief Wait before the attempt following failed attempt `attempt`
  [[nodiscard]] std::chrono::milliseconds BackoffAfter(int attempt) const;
};

/// @brief Executor configuration
struct FetchOptions {
  size_t max_in_flight = 5;
  RetryPolicy retry;
};

/// @brief Outcome of one fetch task; failures are values
struct FetchResult {
  std::string url;
  int attempts = 0;
  absl::StatusOr<std::vector<uint8_t>> bytes;

  [[nodiscard]] bool ok() const { return bytes.ok(); }
};

/// @brief Runs fetch tasks under a concurrency ceiling
///
/// Not thread-safe; use from coroutines of a single io_context. The executor
/// must outlive every coroutine started through it.
class FetchExecutor {
 public:
  /// @param client HTTP client (not owned)
  /// @param executor Executor of the io_context the tasks run on
  /// @param options Ceiling and retry policy
  /// @throws std::invalid_argument if max_in_flight is 0
  FetchExecutor(net::HttpClient& client,
                boost::asio::any_io_executor executor, FetchOptions options);

  FetchExecutor(const FetchExecutor&) = delete;
  FetchExecutor& operator=(const FetchExecutor&) = delete;

  /// @brief Fetch one URL, retrying transient failures
  ///
  /// Only failures classified by net::IsTransientError() are retried, at most
  /// `retry.max_attempts` attempts in total.
  boost::asio::awaitable<FetchResult> FetchOne(std::string url);

  /// @brief Fetch many URLs concurrently
  ///
  /// Every task runs to completion; one task exhausting its retries neither
  /// cancels nor delays its siblings. Results are in input order.
  boost::asio::awaitable<std::vector<FetchResult>> FetchAll(
      std::vector<std::string> urls);

  [[nodiscard]] const FetchOptions& GetOptions() const { return options_; }

 private:
  net::HttpClient& client_;
  boost::asio::any_io_executor executor_;
  FetchOptions options_;
  foliocore::async::AsyncSemaphore semaphore_;
};

}  // namespace runtime

using runtime::FetchExecutor;
using runtime::FetchOptions;
using runtime::FetchResult;
using runtime::RetryPolicy;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_FETCH_EXECUTOR_H_
