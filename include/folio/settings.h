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


#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_SETTINGS_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_SETTINGS_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "folio/codec/jpeg_codec.h"
#include "folio/legacy/page_metadata.h"
#include "folio/runtime/fetch_executor.h"

/**
 * @file settings.h
 * @brief Run configuration: defaults, environment overrides, validation
 *
 * Precedence is defaults < environment < command-line flags. Environment
 * variables use the BLTOOLS_ prefix:
 *
 *     BLTOOLS_BASEDIR             output parent directory
 *     BLTOOLS_RANGEBEGIN          first legacy page
 *     BLTOOLS_RANGEEND            last legacy page
 *     BLTOOLS_BASEURL             legacy viewer base URL
 *     BLTOOLS_USER_AGENT          User-Agent header
 *     BLTOOLS_TIMEOUT_SECONDS     per-request deadline
 *     BLTOOLS_TILE_CONCURRENCY    tile requests in flight per page
 *     BLTOOLS_CANVAS_CONCURRENCY  image requests in flight per manifest run
 *     BLTOOLS_PAGE_BATCH_SIZE     legacy pages per batch
 */

namespace fs = std::filesystem;

namespace folio {

inline constexpr char kEnvPrefix[] = "BLTOOLS_";

/// @brief Everything a download run can be tuned with
struct Settings {
  fs::path base_dir = ".";
  uint32_t range_begin = 1;
  uint32_t range_end = 259;
  std::string base_url = "http://www.bl.uk/manuscripts/Proxy.ashx?view=";
  std::string user_agent = "Mozilla/5.0";
  std::chrono::seconds request_timeout{60};
  size_t tile_concurrency = 5;
  size_t canvas_concurrency = 5;
  size_t page_batch_size = 5;
  uint32_t zoom_level = legacy::kDefaultZoomLevel;
  int jpeg_quality = codec::kDefaultJpegQuality;
  runtime::RetryPolicy retry;

  /// @brief kInvalidArgument naming the first out-of-range field
  [[nodiscard]] absl::Status Validate() const;
};

/// @brief Apply BLTOOLS_* environment overrides to `base`
///
/// Unset variables leave the field alone; a set variable that does not parse
/// (or is zero where zero makes no sense) is kInvalidArgument.
absl::StatusOr<Settings> LoadSettingsFromEnv(Settings base = {});

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_SETTINGS_H_
