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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_CORE_PAGE_RANGE_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_CORE_PAGE_RANGE_H_

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace folio {
namespace core {

/// @brief Highest page or canvas number a range may address
inline constexpr uint32_t kMaxPageNumber = 9999;

/// @brief Inclusive, 1-based page range
struct PageRange {
  uint32_t start;
  uint32_t end;

  [[nodiscard]] size_t Count() const {
    return static_cast<size_t>(end - start) + 1;
  }

  bool operator==(const PageRange& other) const {
    return start == other.start && end == other.end;
  }
};

/// @brief Parse a "START-END" range string
///
/// Checks syntax, ordering (1 <= START <= END) and the global cap
/// kMaxPageNumber; the document bound is checked by ValidateRange().
///
/// @param text Range string, e.g. "1-10"
/// @return Parsed range, kInvalidArgument, or kOutOfRange above the cap
absl::StatusOr<PageRange> ParsePageRange(std::string_view text);

/// @brief Check that a range addresses existing items
///
/// @param range Parsed range
/// @param item_count Number of addressable items
/// @return OkStatus, or kOutOfRange if END exceeds item_count
absl::Status ValidateRange(const PageRange& range, size_t item_count);

}  // namespace core

using core::PageRange;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_CORE_PAGE_RANGE_H_
