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

#include "folio/runtime/fetch_executor.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace runtime {

namespace asio = boost::asio;

namespace {

/// @brief Turns an escaped exception into a failed result
FetchResult ExceptionResult(const std::string& url, std::exception_ptr error) {
  std::string what = "unknown exception";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    what = e.what();
  } catch (...) {
    // Non-std exception: nothing more to report than its existence.
  }
  FetchResult result;
  result.url = url;
  result.bytes = MAKE_STATUS(
      absl::StatusCode::kInternal,
      absl::StrFormat("Fetch of %s threw: %s", url, what));
  return result;
}

}  // namespace

std::chrono::milliseconds RetryPolicy::BackoffAfter(int attempt) const {
  const int exponent = std::clamp(attempt - 1, 0, 30);
  const auto raw = multiplier * (int64_t{1} << exponent);
  return std::clamp<std::chrono::milliseconds>(
      std::chrono::duration_cast<std::chrono::milliseconds>(raw), min_wait,
      std::max(min_wait, max_wait));
}

FetchExecutor::FetchExecutor(net::HttpClient& client,
                             asio::any_io_executor executor,
                             FetchOptions options)
    : client_(client),
      executor_(executor),
      options_(std::move(options)),
      semaphore_(std::move(executor), options_.max_in_flight) {}

asio::awaitable<FetchResult> FetchExecutor::FetchOne(std::string url) {
  FetchResult result;
  result.url = url;
  const int max_attempts = std::max(1, options_.retry.max_attempts);

  for (int attempt = 1;; ++attempt) {
    result.attempts = attempt;

    absl::StatusOr<net::HttpResponse> response_or;
    {
      auto permit = co_await semaphore_.Acquire();
      response_or = co_await client_.Get(url);
    }

    if (response_or.ok()) {
      result.bytes = std::move(response_or->body);
      co_return result;
    }

    const absl::Status& status = response_or.status();
    if (!net::IsTransientError(status) || attempt >= max_attempts) {
      if (attempt > 1) {
        VLOG(1) << "Giving up on " << url << " after " << attempt
                << " attempts";
      }
      result.bytes = foliocore::status::AddTrace(
          status, __func__, __FILE__, __LINE__,
          absl::StrFormat("attempt %d of %d", attempt, max_attempts));
      co_return result;
    }

    const auto wait = options_.retry.BackoffAfter(attempt);
    VLOG(1) << "Attempt " << attempt << " for " << url << " failed ("
            << foliocore::status::StripStackTrace(status.message())
            << "); retrying in " << wait.count() << " ms";
    asio::steady_timer timer(executor_, wait);
    co_await timer.async_wait(asio::use_awaitable);
  }
}

asio::awaitable<std::vector<FetchResult>> FetchExecutor::FetchAll(
    std::vector<std::string> urls) {
  std::vector<FetchResult> results(urls.size());
  foliocore::async::CompletionLatch latch(executor_, urls.size());

  for (size_t i = 0; i < urls.size(); ++i) {
    asio::co_spawn(
        executor_, FetchOne(urls[i]),
        [&results, &latch, &urls, i](std::exception_ptr error,
                                     FetchResult result) {
          results[i] = error ? ExceptionResult(urls[i], error)
                             : std::move(result);
          latch.CountDown();
        });
  }

  co_await latch.Wait();
  co_return results;
}

}  // namespace runtime
}  // namespace folio
