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

#ifndef FOLIO_FOLIO_SRC_FOLIO_TESTING_RUN_SYNC_H_
#define FOLIO_FOLIO_SRC_FOLIO_TESTING_RUN_SYNC_H_

#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace folio {
namespace testing {

/// @brief Run `task` on `io` until the context is out of work
///
/// Exceptions escaping the coroutine are rethrown to the caller.
template <typename T>
T RunSync(boost::asio::io_context& io, boost::asio::awaitable<T> task) {
  std::optional<T> out;
  std::exception_ptr failure;
  boost::asio::co_spawn(io, std::move(task),
                        [&out, &failure](std::exception_ptr error, T value) {
                          if (error) {
                            failure = error;
                          } else {
                            out.emplace(std::move(value));
                          }
                        });
  io.run();
  io.restart();
  if (failure) {
    std::rethrow_exception(failure);
  }
  if (!out.has_value()) {
    throw std::logic_error("coroutine did not complete");
  }
  return std::move(*out);
}

}  // namespace testing
}  // namespace folio

#endif  // FOLIO_FOLIO_SRC_FOLIO_TESTING_RUN_SYNC_H_
