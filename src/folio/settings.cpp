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


#include "folio/settings.h"

#include <cstdlib>
#include <optional>
#include <string>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "folio/core/page_range.h"
#include "foliocore/status/status_macros.h"

namespace folio {

namespace {

/// @brief Value of BLTOOLS_<name>, or nullopt if unset
std::optional<std::string> GetEnv(const char* name) {
  const std::string key = absl::StrCat(kEnvPrefix, name);
  const char* value = std::getenv(key.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

/// @brief Parse a set variable as an unsigned integer >= minimum
template <typename T>
absl::Status ReadUnsigned(const char* name, T minimum, T* out) {
  const std::optional<std::string> value = GetEnv(name);
  if (!value.has_value()) {
    return absl::OkStatus();
  }
  uint64_t parsed = 0;
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(*value), &parsed) ||
      parsed < minimum || parsed > static_cast<uint64_t>(T(~T{0}))) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("%s%s=\"%s\" is not an integer >= %d", kEnvPrefix,
                        name, *value, static_cast<uint64_t>(minimum)));
  }
  *out = static_cast<T>(parsed);
  return absl::OkStatus();
}

}  // namespace

absl::Status Settings::Validate() const {
  if (range_begin == 0 || range_begin > range_end) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("Invalid default page range %d-%d",
                                       range_begin, range_end));
  }
  if (range_end > core::kMaxPageNumber) {
    return MAKE_STATUS(absl::StatusCode::kOutOfRange,
                       absl::StrFormat("Default page range ends past page %d",
                                       core::kMaxPageNumber));
  }
  if (base_url.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Base URL must not be empty");
  }
  if (request_timeout.count() <= 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Request timeout must be positive");
  }
  if (tile_concurrency == 0 || canvas_concurrency == 0 ||
      page_batch_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Concurrency limits and batch size must be positive");
  }
  if (jpeg_quality < 1 || jpeg_quality > 100) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("JPEG quality %d is outside 1..100", jpeg_quality));
  }
  if (retry.max_attempts < 1) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "At least one fetch attempt is required");
  }
  return absl::OkStatus();
}

absl::StatusOr<Settings> LoadSettingsFromEnv(Settings base) {
  Settings settings = std::move(base);

  if (auto dir = GetEnv("BASEDIR"); dir.has_value() && !dir->empty()) {
    settings.base_dir = *dir;
  }
  if (auto url = GetEnv("BASEURL"); url.has_value()) {
    settings.base_url = *url;
  }
  if (auto agent = GetEnv("USER_AGENT"); agent.has_value()) {
    settings.user_agent = *agent;
  }

  RETURN_IF_ERROR(ReadUnsigned<uint32_t>("RANGEBEGIN", 1, &settings.range_begin));
  RETURN_IF_ERROR(ReadUnsigned<uint32_t>("RANGEEND", 1, &settings.range_end));
  RETURN_IF_ERROR(ReadUnsigned<size_t>("TILE_CONCURRENCY", 1,
                                       &settings.tile_concurrency));
  RETURN_IF_ERROR(ReadUnsigned<size_t>("CANVAS_CONCURRENCY", 1,
                                       &settings.canvas_concurrency));
  RETURN_IF_ERROR(ReadUnsigned<size_t>("PAGE_BATCH_SIZE", 1,
                                       &settings.page_batch_size));

  uint32_t timeout_seconds = static_cast<uint32_t>(
      settings.request_timeout.count());
  RETURN_IF_ERROR(ReadUnsigned<uint32_t>("TIMEOUT_SECONDS", 1,
                                         &timeout_seconds));
  settings.request_timeout = std::chrono::seconds(timeout_seconds);

  RETURN_IF_ERROR(settings.Validate());
  return settings;
}

}  // namespace folio
