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

#include "folio/net/http_client.h"

#include <gtest/gtest.h>

#include "foliocore/status/status_macros.h"

namespace folio {
namespace net {

TEST(HttpStatusErrorTest, MapsStatusClassToCode) {
  EXPECT_EQ(HttpStatusError(404, "u").code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(HttpStatusError(403, "u").code(),
            absl::StatusCode::kPermissionDenied);
  EXPECT_EQ(HttpStatusError(401, "u").code(),
            absl::StatusCode::kPermissionDenied);
  EXPECT_EQ(HttpStatusError(429, "u").code(),
            absl::StatusCode::kResourceExhausted);
  EXPECT_EQ(HttpStatusError(503, "u").code(), absl::StatusCode::kUnavailable);
  EXPECT_EQ(HttpStatusError(400, "u").code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST(HttpStatusErrorTest, CarriesNumericStatus) {
  const absl::Status status = HttpStatusError(418, "http://h/teapot");
  ASSERT_TRUE(GetHttpStatus(status).has_value());
  EXPECT_EQ(*GetHttpStatus(status), 418);
  EXPECT_NE(status.message().find("http://h/teapot"), std::string::npos);
}

TEST(HttpStatusErrorTest, PayloadSurvivesPropagation) {
  auto propagate = []() -> absl::Status {
    RETURN_IF_ERROR(HttpStatusError(500, "u"), "while fetching tile");
    return absl::OkStatus();
  };
  const absl::Status status = propagate();
  ASSERT_TRUE(GetHttpStatus(status).has_value());
  EXPECT_EQ(*GetHttpStatus(status), 500);
}

TEST(IsTransientErrorTest, NetworkAndHttpFailuresAreTransient) {
  EXPECT_TRUE(IsTransientError(absl::UnavailableError("connection reset")));
  EXPECT_TRUE(IsTransientError(absl::DeadlineExceededError("timeout")));
  EXPECT_TRUE(IsTransientError(HttpStatusError(404, "u")));
  EXPECT_TRUE(IsTransientError(HttpStatusError(500, "u")));
}

TEST(IsTransientErrorTest, ParseErrorsAreNotTransient) {
  EXPECT_FALSE(IsTransientError(absl::OkStatus()));
  EXPECT_FALSE(IsTransientError(absl::InvalidArgumentError("bad xml")));
  EXPECT_FALSE(IsTransientError(absl::DataLossError("bad jpeg")));
  EXPECT_FALSE(IsTransientError(absl::NotFoundError("no payload")));
  EXPECT_FALSE(IsTransientError(absl::InternalError("bug")));
}

TEST(GetHttpStatusTest, AbsentWithoutPayload) {
  EXPECT_FALSE(GetHttpStatus(absl::UnavailableError("x")).has_value());
  EXPECT_FALSE(GetHttpStatus(absl::OkStatus()).has_value());
}

}  // namespace net
}  // namespace folio
