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

#include "folio/net/beast_http_client.h"

#include <openssl/ssl.h>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace net {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

bool IsRedirect(int status_code) {
  return status_code == 301 || status_code == 302 || status_code == 303 ||
         status_code == 307 || status_code == 308;
}

/// @brief Maps a transport error to the HttpClient error contract
absl::Status TransportError(const boost::system::error_code& ec,
                            std::string_view stage, const Url& url) {
  if (ec == beast::error::timeout) {
    return MAKE_STATUS(absl::StatusCode::kDeadlineExceeded,
                       absl::StrFormat("Timed out during %s for %s", stage,
                                       url.ToString()));
  }
  if (ec == http::error::body_limit) {
    return MAKE_STATUS(absl::StatusCode::kResourceExhausted,
                       absl::StrFormat("Response body of %s exceeds the limit",
                                       url.ToString()));
  }
  return MAKE_STATUS(absl::StatusCode::kUnavailable,
                     absl::StrFormat("%s failed for %s: %s", stage,
                                     url.ToString(), ec.message()));
}

}  // namespace

BeastHttpClient::BeastHttpClient(Options options)
    : options_(std::move(options)), ssl_context_(ssl::context::tls_client) {
  boost::system::error_code ec;
  ssl_context_.set_default_verify_paths(ec);
  if (ec) {
    LOG(WARNING) << "Could not load the system trust store: " << ec.message();
  }
  ssl_context_.set_verify_mode(ssl::verify_peer);
}

BeastHttpClient::BeastHttpClient() : BeastHttpClient(Options{}) {}

asio::awaitable<absl::StatusOr<HttpResponse>> BeastHttpClient::Get(
    std::string url) {
  Url current;
  CO_ASSIGN_OR_RETURN(current, ParseUrl(url));

  const auto deadline = std::chrono::steady_clock::now() + options_.timeout;

  for (int hop = 0; hop <= options_.max_redirects; ++hop) {
    RawResponse raw;
    CO_ASSIGN_OR_RETURN(raw, co_await Exchange(current, deadline));

    if (IsRedirect(raw.status_code)) {
      if (raw.location.empty()) {
        co_return HttpStatusError(raw.status_code, current.ToString());
      }
      Url next;
      CO_ASSIGN_OR_RETURN(next, ResolveLocation(current, raw.location));
      VLOG(1) << "HTTP " << raw.status_code << " redirect " << current.ToString()
              << " -> " << next.ToString();
      current = std::move(next);
      continue;
    }

    if (raw.status_code < 200 || raw.status_code >= 300) {
      co_return HttpStatusError(raw.status_code, current.ToString());
    }

    HttpResponse response;
    response.status_code = raw.status_code;
    response.content_type = std::move(raw.content_type);
    response.final_url = current.ToString();
    response.body = std::move(raw.body);
    co_return response;
  }

  co_return MAKE_STATUS(
      absl::StatusCode::kFailedPrecondition,
      absl::StrFormat("More than %d redirects for %s", options_.max_redirects,
                      url));
}

asio::awaitable<absl::StatusOr<BeastHttpClient::RawResponse>>
BeastHttpClient::Exchange(const Url& url,
                          std::chrono::steady_clock::time_point deadline) {
  auto executor = co_await asio::this_coro::executor;
  boost::system::error_code ec;

  if (std::chrono::steady_clock::now() >= deadline) {
    co_return TransportError(beast::error::timeout, "resolve", url);
  }

  // Resolution has no expiry of its own; a timer cancels it at the deadline.
  tcp::resolver resolver(executor);
  asio::steady_timer resolve_timer(executor, deadline);
  bool resolve_timed_out = false;
  resolve_timer.async_wait([&](const boost::system::error_code& wait_ec) {
    if (!wait_ec) {
      resolve_timed_out = true;
      resolver.cancel();
    }
  });
  auto endpoints = co_await resolver.async_resolve(
      url.host, std::to_string(url.port),
      asio::redirect_error(asio::use_awaitable, ec));
  resolve_timer.cancel();
  if (resolve_timed_out) {
    co_return TransportError(beast::error::timeout, "resolve", url);
  }
  if (ec) {
    co_return TransportError(ec, "resolve", url);
  }

  beast::tcp_stream tcp_stream(executor);
  tcp_stream.expires_at(deadline);
  co_await tcp_stream.async_connect(
      endpoints, asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    co_return TransportError(ec, "connect", url);
  }

  if (!url.IsTls()) {
    auto result = co_await Transact(tcp_stream, url);
    tcp_stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      VLOG(1) << "Socket shutdown for " << url.host << ": " << ec.message();
    }
    co_return result;
  }

  beast::ssl_stream<beast::tcp_stream> tls_stream(std::move(tcp_stream),
                                                  ssl_context_);
  // SNI; many IIIF hosts sit behind shared CDN front-ends.
  if (!SSL_set_tlsext_host_name(tls_stream.native_handle(), url.host.c_str())) {
    co_return MAKE_STATUS(
        absl::StatusCode::kUnavailable,
        absl::StrFormat("Cannot set TLS server name for %s", url.host));
  }
  tls_stream.set_verify_callback(ssl::host_name_verification(url.host));

  co_await tls_stream.async_handshake(
      ssl::stream_base::client, asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    co_return TransportError(ec, "TLS handshake", url);
  }

  auto result = co_await Transact(tls_stream, url);

  co_await tls_stream.async_shutdown(
      asio::redirect_error(asio::use_awaitable, ec));
  if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
    VLOG(1) << "TLS shutdown for " << url.host << ": " << ec.message();
  }
  co_return result;
}

template <typename Stream>
asio::awaitable<absl::StatusOr<BeastHttpClient::RawResponse>>
BeastHttpClient::Transact(Stream& stream, const Url& url) {
  boost::system::error_code ec;

  http::request<http::empty_body> request{http::verb::get, url.target, 11};
  request.set(http::field::host, url.HostHeader());
  request.set(http::field::user_agent, options_.user_agent);
  request.set(http::field::accept, "*/*");

  VLOG(1) << "GET " << url.ToString();
  co_await http::async_write(stream, request,
                             asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    co_return TransportError(ec, "write", url);
  }

  beast::flat_buffer buffer;
  http::response_parser<http::vector_body<uint8_t>> parser;
  parser.body_limit(options_.body_limit);
  co_await http::async_read(stream, buffer, parser,
                            asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    co_return TransportError(ec, "read", url);
  }

  auto message = parser.release();
  RawResponse raw;
  raw.status_code = static_cast<int>(message.result_int());
  if (auto it = message.find(http::field::location); it != message.end()) {
    raw.location = std::string(it->value());
  }
  if (auto it = message.find(http::field::content_type); it != message.end()) {
    raw.content_type = std::string(it->value());
  }
  raw.body = std::move(message.body());
  VLOG(1) << "HTTP " << raw.status_code << " " << url.ToString() << " ("
          << raw.body.size() << " bytes)";
  co_return raw;
}

}  // namespace net
}  // namespace folio
