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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_NET_BEAST_HTTP_CLIENT_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_NET_BEAST_HTTP_CLIENT_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "absl/status/statusor.h"
#include "folio/net/http_client.h"
#include "folio/net/url.h"

namespace folio {
namespace net {

/// @brief HttpClient over Boost.Beast (http and https)
///
/// One connection per request, no keep-alive. All I/O runs on the executor of
/// the calling coroutine.
class BeastHttpClient : public HttpClient {
 public:
  struct Options {
    std::string user_agent = "Mozilla/5.0";
    /// Overall budget for connect, TLS handshake, request and response of
    /// one hop; every redirect hop shares the same deadline.
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
    int max_redirects = 10;
    uint64_t body_limit = uint64_t{512} * 1024 * 1024;
  };

  explicit BeastHttpClient(Options options);
  BeastHttpClient();

  BeastHttpClient(const BeastHttpClient&) = delete;
  BeastHttpClient& operator=(const BeastHttpClient&) = delete;

  boost::asio::awaitable<absl::StatusOr<HttpResponse>> Get(
      std::string url) override;

  [[nodiscard]] const Options& GetOptions() const { return options_; }

 private:
  struct RawResponse {
    int status_code = 0;
    std::string location;
    std::string content_type;
    std::vector<uint8_t> body;
  };

  /// @brief One request/response exchange on a fresh connection
  boost::asio::awaitable<absl::StatusOr<RawResponse>> Exchange(
      const Url& url, std::chrono::steady_clock::time_point deadline);

  template <typename Stream>
  boost::asio::awaitable<absl::StatusOr<RawResponse>> Transact(
      Stream& stream, const Url& url);

  Options options_;
  boost::asio::ssl::context ssl_context_;
};

}  // namespace net
}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_NET_BEAST_HTTP_CLIENT_H_
