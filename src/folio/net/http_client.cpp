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

#include <optional>
#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace net {

namespace {

absl::StatusCode CodeForHttpStatus(int http_status) {
  if (http_status == 404 || http_status == 410) {
    return absl::StatusCode::kNotFound;
  }
  if (http_status == 401 || http_status == 403) {
    return absl::StatusCode::kPermissionDenied;
  }
  if (http_status == 429) {
    return absl::StatusCode::kResourceExhausted;
  }
  if (http_status >= 500) {
    return absl::StatusCode::kUnavailable;
  }
  return absl::StatusCode::kFailedPrecondition;
}

}  // namespace

absl::Status HttpStatusError(int http_status, std::string_view url) {
  absl::Status status =
      MAKE_STATUS(CodeForHttpStatus(http_status),
                  absl::StrFormat("HTTP %d for %s", http_status, url));
  status.SetPayload(kHttpStatusPayload,
                    absl::Cord(std::to_string(http_status)));
  return status;
}

std::optional<int> GetHttpStatus(const absl::Status& status) {
  std::optional<absl::Cord> payload = status.GetPayload(kHttpStatusPayload);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  int http_status = 0;
  if (!absl::SimpleAtoi(std::string(*payload), &http_status)) {
    return std::nullopt;
  }
  return http_status;
}

bool IsTransientError(const absl::Status& status) {
  if (status.ok()) {
    return false;
  }
  if (GetHttpStatus(status).has_value()) {
    return true;
  }
  return status.code() == absl::StatusCode::kUnavailable ||
         status.code() == absl::StatusCode::kDeadlineExceeded;
}

}  // namespace net
}  // namespace folio
