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


#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_ORCHESTRATOR_PAGE_ORCHESTRATOR_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_ORCHESTRATOR_PAGE_ORCHESTRATOR_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "folio/codec/jpeg_codec.h"
#include "folio/core/page_descriptor.h"
#include "folio/legacy/page_metadata.h"
#include "folio/manifest/iiif_manifest.h"
#include "folio/net/http_client.h"
#include "folio/runtime/fetch_executor.h"
#include "folio/runtime/progress.h"

/**
 * @file page_orchestrator.h
 * @brief Per-page state machine
 *
 *     Pending -> Skip
 *     Pending -> Fetching -> Composing -> Saved     (legacy page)
 *     Pending -> Fetching -> Saved                  (manifest canvas)
 *     Fetching | Composing -> Failed
 *
 * A page whose target file exists is skipped without any request, so a rerun
 * only fetches what is missing. Pages with some failed tiles are still saved
 * (black gaps) and reported as kSavedWithFailedTiles; a page without a
 * single usable tile fails and writes nothing.
 */

namespace folio {
namespace orchestrator {

/// @brief Page lifecycle states
enum class PageState : uint8_t {
  kPending,
  kSkip,
  kFetching,
  kComposing,
  kSaved,
  kFailed,
};

const char* ToString(PageState state);

/// @brief Whether `to` may follow `from`
bool IsValidTransition(PageState from, PageState to);

/// @brief Tunables of a single page
struct PageOptions {
  size_t tile_concurrency = 5;  ///< Tile requests in flight per page
  runtime::RetryPolicy retry;
  int jpeg_quality = codec::kDefaultJpegQuality;
};

/// @brief Drives pages to a terminal state and reports each one
///
/// Every Process* call reports exactly one PageEvent and returns it as well.
/// Not thread-safe; all pages of a run share one io_context.
class PageOrchestrator {
 public:
  /// @param client HTTP client (not owned)
  /// @param executor Executor of the run's io_context
  /// @param reporter Receiver of page events (not owned)
  /// @param options Per-page tunables
  PageOrchestrator(net::HttpClient& client,
                   boost::asio::any_io_executor executor,
                   runtime::ProgressReporter& reporter, PageOptions options);

  PageOrchestrator(const PageOrchestrator&) = delete;
  PageOrchestrator& operator=(const PageOrchestrator&) = delete;

  /// @brief Download one legacy folio side as a tile composite
  ///
  /// Fetches the page descriptor, then every tile with at most
  /// `tile_concurrency` requests in flight, composites and writes
  /// `page.target_path`.
  boost::asio::awaitable<runtime::PageEvent> ProcessLegacyPage(
      const legacy::LegacyEndpoint& endpoint, core::FolioRef ref,
      core::PageDescriptor page);

  /// @brief Download one manifest canvas as a single image
  ///
  /// @param shared Executor shared by all canvases of the run
  boost::asio::awaitable<runtime::PageEvent> ProcessCanvas(
      runtime::FetchExecutor& shared, manifest::ResolvedCanvas canvas,
      core::PageDescriptor page);

  [[nodiscard]] const PageOptions& GetOptions() const { return options_; }

 private:
  runtime::PageEvent Finish(runtime::PageEvent event);

  net::HttpClient& client_;
  boost::asio::any_io_executor executor_;
  runtime::ProgressReporter& reporter_;
  PageOptions options_;
};

}  // namespace orchestrator

using orchestrator::PageOptions;
using orchestrator::PageOrchestrator;
using orchestrator::PageState;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_ORCHESTRATOR_PAGE_ORCHESTRATOR_H_
