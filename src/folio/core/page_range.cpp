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

#include "folio/core/page_range.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace core {

namespace {

std::string UsageMessage(std::string_view text) {
  return absl::StrFormat(
      "Invalid range format: '%s'. Use start-end (e.g., 1-10)", text);
}

}  // namespace

absl::StatusOr<PageRange> ParsePageRange(std::string_view text) {
  std::vector<std::string_view> parts = absl::StrSplit(text, '-');
  if (parts.size() != 2) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument, UsageMessage(text));
  }

  int64_t start = 0;
  int64_t end = 0;
  if (!absl::SimpleAtoi(parts[0], &start) ||
      !absl::SimpleAtoi(parts[1], &end)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument, UsageMessage(text));
  }

  if (start < 1) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Range '%s' must start at 1 or later", text));
  }
  if (start > end) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Range '%s' has start after end", text));
  }
  if (end > kMaxPageNumber) {
    return MAKE_STATUS(absl::StatusCode::kOutOfRange,
                       absl::StrFormat("Range '%s' goes past page %d", text,
                                       kMaxPageNumber));
  }

  return PageRange{static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
}

absl::Status ValidateRange(const PageRange& range, size_t item_count) {
  if (range.start < 1 || range.start > range.end) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Malformed range %d-%d", range.start,
                                       range.end));
  }
  if (range.end > item_count) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        absl::StrFormat("Range %d-%d exceeds the %d available items",
                        range.start, range.end, item_count));
  }
  return absl::OkStatus();
}

}  // namespace core
}  // namespace folio
