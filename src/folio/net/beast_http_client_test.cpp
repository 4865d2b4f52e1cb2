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

#include <gtest/gtest.h>

#include <chrono>

#include <boost/asio/io_context.hpp>

#include "folio/testing/run_sync.h"

namespace folio {
namespace net {

using testing::RunSync;

// ============================================================================
// Deadline
// ============================================================================

TEST(BeastHttpClientTest, ExpiredDeadlineStopsBeforeResolving) {
  BeastHttpClient::Options options;
  options.timeout = std::chrono::milliseconds(0);
  BeastHttpClient client(options);

  boost::asio::io_context io;
  auto response_or = RunSync(io, client.Get("http://folio.invalid/page.xml"));
  ASSERT_FALSE(response_or.ok());
  EXPECT_EQ(response_or.status().code(), absl::StatusCode::kDeadlineExceeded);
  EXPECT_TRUE(IsTransientError(response_or.status()));
}

TEST(BeastHttpClientTest, UnsupportedSchemeIsRejected) {
  BeastHttpClient client;
  boost::asio::io_context io;
  auto response_or = RunSync(io, client.Get("ftp://example.org/page.xml"));
  ASSERT_FALSE(response_or.ok());
  EXPECT_EQ(response_or.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace net
}  // namespace folio
