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

#include <memory>
#include <stdexcept>
#include <utility>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace foliocore::async {

namespace asio = boost::asio;

void SemaphorePermit::Release() {
  if (owner_ != nullptr) {
    owner_->Release();
    owner_ = nullptr;
  }
}

AsyncSemaphore::AsyncSemaphore(asio::any_io_executor executor,
                               std::size_t permits)
    : executor_(std::move(executor)), capacity_(permits), available_(permits) {
  if (permits == 0) {
    throw std::invalid_argument("AsyncSemaphore needs at least one permit");
  }
}

asio::awaitable<SemaphorePermit> AsyncSemaphore::Acquire() {
  if (available_ > 0 && waiters_.empty()) {
    --available_;
    co_return SemaphorePermit(this);
  }

  auto waiter = std::make_shared<Waiter>(executor_);
  waiter->timer.expires_at(asio::steady_timer::time_point::max());
  waiters_.push_back(waiter);

  // Woken by Release() cancelling the timer; the permit is transferred
  // directly, `available_` is not touched on this path.
  while (!waiter->granted) {
    boost::system::error_code ec;
    co_await waiter->timer.async_wait(
        asio::redirect_error(asio::use_awaitable, ec));
  }
  co_return SemaphorePermit(this);
}

void AsyncSemaphore::Release() {
  if (!waiters_.empty()) {
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->granted = true;
    next->timer.cancel();
    return;
  }
  if (available_ < capacity_) {
    ++available_;
  }
}

CompletionLatch::CompletionLatch(asio::any_io_executor executor,
                                 std::size_t count)
    : timer_(std::move(executor)), remaining_(count) {
  timer_.expires_at(asio::steady_timer::time_point::max());
}

void CompletionLatch::CountDown() {
  if (remaining_ == 0) {
    return;
  }
  if (--remaining_ == 0) {
    timer_.cancel();
  }
}

asio::awaitable<void> CompletionLatch::Wait() {
  while (remaining_ > 0) {
    boost::system::error_code ec;
    co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }
}

}  // namespace foliocore::async
