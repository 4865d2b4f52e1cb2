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


#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_ORCHESTRATOR_MANUSCRIPT_ORCHESTRATOR_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_ORCHESTRATOR_MANUSCRIPT_ORCHESTRATOR_H_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "absl/status/statusor.h"
#include "folio/core/page_range.h"
#include "folio/legacy/page_metadata.h"
#include "folio/net/http_client.h"
#include "folio/orchestrator/page_orchestrator.h"
#include "folio/runtime/progress.h"

namespace fs = std::filesystem;

namespace folio {
namespace orchestrator {

/// @brief How an input string is downloaded
enum class DownloadMode : uint8_t {
  kManifest,  ///< IIIF manifest URL
  kLegacy,    ///< Bare manuscript id of the tile viewer
};

/// @brief Inputs starting with "http" are manifest URLs
DownloadMode DetectMode(std::string_view input);

/// @brief What to download
struct DownloadRequest {
  std::string input;                 ///< Manuscript id or manifest URL
  fs::path output_dir = ".";         ///< Parent of the run's folder
  std::optional<std::string> range;  ///< "START-END", 1-based inclusive
};

/// @brief Run-wide tunables
struct DownloadOptions {
  std::string base_url = "http://www.bl.uk/manuscripts/Proxy.ashx?view=";
  uint32_t zoom_level = legacy::kDefaultZoomLevel;
  /// Legacy page range used when the request has none
  core::PageRange default_range{1, 259};
  size_t canvas_concurrency = 5;  ///< Image requests in flight per run
  size_t page_batch_size = 5;     ///< Legacy pages per batch
  PageOptions page;
};

/// @brief Downloads a whole manuscript
///
/// The range string is checked before any request is made. In manifest mode
/// the manifest is fetched and parsed first (either failing ends the run),
/// then every selected canvas is started at once; they share one
/// FetchExecutor so at most `canvas_concurrency` images are in flight. In
/// legacy mode folio sides are processed in batches of `page_batch_size`,
/// each batch settling before the next starts. Page failures never end the
/// run.
class ManuscriptOrchestrator {
 public:
  ManuscriptOrchestrator(net::HttpClient& client,
                         boost::asio::any_io_executor executor,
                         runtime::ProgressReporter& reporter,
                         DownloadOptions options);

  ManuscriptOrchestrator(const ManuscriptOrchestrator&) = delete;
  ManuscriptOrchestrator& operator=(const ManuscriptOrchestrator&) = delete;

  /// @return Page counts, or the input/manifest/output error ending the run
  boost::asio::awaitable<absl::StatusOr<runtime::RunSummary>> Run(
      DownloadRequest request);

 private:
  boost::asio::awaitable<absl::StatusOr<runtime::RunSummary>> RunManifest(
      std::string url, std::optional<core::PageRange> range,
      fs::path output_dir);

  boost::asio::awaitable<absl::StatusOr<runtime::RunSummary>> RunLegacy(
      std::string manuscript_id, core::PageRange range, fs::path output_dir);

  /// @brief Run page tasks concurrently until all have settled
  boost::asio::awaitable<std::vector<runtime::PageEvent>> RunAll(
      std::vector<boost::asio::awaitable<runtime::PageEvent>> tasks,
      std::vector<std::string> pages);

  net::HttpClient& client_;
  boost::asio::any_io_executor executor_;
  runtime::ProgressReporter& reporter_;
  DownloadOptions options_;
  PageOrchestrator pages_;
};

}  // namespace orchestrator

using orchestrator::DownloadMode;
using orchestrator::DownloadOptions;
using orchestrator::DownloadRequest;
using orchestrator::ManuscriptOrchestrator;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_ORCHESTRATOR_MANUSCRIPT_ORCHESTRATOR_H_
