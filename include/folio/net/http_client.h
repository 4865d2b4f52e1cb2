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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_NET_HTTP_CLIENT_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_NET_HTTP_CLIENT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

/**
 * @file http_client.h
 * @brief Abstract HTTP GET interface and its error vocabulary
 *
 * Error contract of HttpClient::Get():
 * - network-level failure (resolve, connect, TLS, read, write): kUnavailable
 * - request deadline exceeded: kDeadlineExceeded
 * - final response not 2xx: HttpStatusError(), whose code follows the HTTP
 *   status class and which carries the numeric status as a payload
 * - malformed URL: kInvalidArgument
 *
 * Redirects are followed by the client; a 3xx is never returned.
 */

namespace folio {
namespace net {

/// @brief Payload type URL carrying the numeric HTTP status of a failure
inline constexpr char kHttpStatusPayload[] = "folio.http_status";

/// @brief Successful (2xx) response
struct HttpResponse {
  int status_code = 200;
  std::string content_type;
  std::string final_url;  ///< URL after following redirects
  std::vector<uint8_t> body;

  [[nodiscard]] std::string_view BodyText() const {
    return {reinterpret_cast<const char*>(body.data()), body.size()};
  }
};

/// @brief Abstract HTTP client
///
/// Implementations run on the caller's io_context; Get() suspends the calling
/// coroutine at I/O boundaries and never blocks the thread.
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  /// @brief Fetch a URL
  /// @param url Absolute http(s) URL
  /// @return 2xx response or an error following the contract above
  virtual boost::asio::awaitable<absl::StatusOr<HttpResponse>> Get(
      std::string url) = 0;
};

/// @brief Status for a non-2xx response
/// @param http_status Numeric HTTP status, e.g. 404
/// @param url Requested URL (for the message)
absl::Status HttpStatusError(int http_status, std::string_view url);

/// @brief HTTP status carried by a status, if any
std::optional<int> GetHttpStatus(const absl::Status& status);

/// @brief Whether a failed fetch is worth retrying
///
/// True for network failures, timeouts and HTTP status errors. Parse and
/// validation errors are permanent.
bool IsTransientError(const absl::Status& status);

}  // namespace net
}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_NET_HTTP_CLIENT_H_
