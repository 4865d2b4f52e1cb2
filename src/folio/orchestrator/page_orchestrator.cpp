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


#include "folio/orchestrator/page_orchestrator.h"

#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "folio/core/tile_grid.h"
#include "folio/runtime/compositor.h"
#include "folio/runtime/io/file_writer.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace orchestrator {

namespace asio = boost::asio;

using runtime::PageEvent;
using runtime::PageOutcome;

namespace {

/// Current state of one page; every transition is logged at VLOG(1).
class PageTracker {
 public:
  explicit PageTracker(std::string page) : page_(std::move(page)) {}

  void TransitionTo(PageState next) {
    if (!IsValidTransition(state_, next)) {
      LOG(ERROR) << page_ << ": invalid transition " << ToString(state_)
                 << " -> " << ToString(next);
    }
    VLOG(1) << page_ << ": " << ToString(state_) << " -> " << ToString(next);
    state_ = next;
  }

  [[nodiscard]] PageState State() const { return state_; }

 private:
  std::string page_;
  PageState state_ = PageState::kPending;
};

/// Pending step shared by both page kinds: skip if the target exists.
absl::StatusOr<bool> TargetExists(const fs::path& target) {
  std::error_code ec;
  const bool exists = fs::exists(target, ec);
  if (ec) {
    return MAKE_STATUS(absl::StatusCode::kPermissionDenied,
                       absl::StrFormat("Cannot stat %s: %s", target.string(),
                                       ec.message()));
  }
  return exists;
}

PageEvent FailedEvent(PageTracker& tracker, PageEvent event,
                      absl::Status status) {
  tracker.TransitionTo(PageState::kFailed);
  event.outcome = PageOutcome::kFailed;
  event.status = std::move(status);
  return event;
}

}  // namespace

const char* ToString(PageState state) {
  switch (state) {
    case PageState::kPending:
      return "Pending";
    case PageState::kSkip:
      return "Skip";
    case PageState::kFetching:
      return "Fetching";
    case PageState::kComposing:
      return "Composing";
    case PageState::kSaved:
      return "Saved";
    case PageState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

bool IsValidTransition(PageState from, PageState to) {
  switch (from) {
    case PageState::kPending:
      return to == PageState::kSkip || to == PageState::kFetching ||
             to == PageState::kFailed;
    case PageState::kFetching:
      return to == PageState::kComposing || to == PageState::kSaved ||
             to == PageState::kFailed;
    case PageState::kComposing:
      return to == PageState::kSaved || to == PageState::kFailed;
    case PageState::kSkip:
    case PageState::kSaved:
    case PageState::kFailed:
      return false;
  }
  return false;
}

PageOrchestrator::PageOrchestrator(net::HttpClient& client,
                                   asio::any_io_executor executor,
                                   runtime::ProgressReporter& reporter,
                                   PageOptions options)
    : client_(client),
      executor_(std::move(executor)),
      reporter_(reporter),
      options_(std::move(options)) {}

PageEvent PageOrchestrator::Finish(PageEvent event) {
  switch (event.outcome) {
    case PageOutcome::kSaved:
      LOG(INFO) << event.page << ": saved";
      break;
    case PageOutcome::kSavedWithFailedTiles:
      LOG(WARNING) << event.page << ": saved with " << event.failed_tiles
                   << " of " << event.total_tiles << " tiles missing";
      break;
    case PageOutcome::kSkipped:
      VLOG(1) << event.page << ": already present, skipped";
      break;
    case PageOutcome::kNoImage:
      LOG(WARNING) << event.page << ": no image ("
                   << foliocore::status::StripStackTrace(
                          event.status.message())
                   << ")";
      break;
    case PageOutcome::kFailed:
      LOG(ERROR) << event.page << ": failed: " << event.status;
      break;
  }
  reporter_.OnPageEvent(event);
  return event;
}

asio::awaitable<PageEvent> PageOrchestrator::ProcessLegacyPage(
    const legacy::LegacyEndpoint& endpoint, core::FolioRef ref,
    core::PageDescriptor page) {
  const fs::path& target = page.target_path;
  PageEvent event;
  event.page = page.FileName();
  PageTracker tracker(event.page);

  // Pending
  absl::StatusOr<bool> exists_or = TargetExists(target);
  if (!exists_or.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 exists_or.status()));
  }
  if (*exists_or) {
    tracker.TransitionTo(PageState::kSkip);
    event.outcome = PageOutcome::kSkipped;
    co_return Finish(std::move(event));
  }

  // Fetching
  tracker.TransitionTo(PageState::kFetching);
  runtime::FetchExecutor fetcher(
      client_, executor_,
      runtime::FetchOptions{options_.tile_concurrency, options_.retry});

  absl::StatusOr<legacy::PageMetadata> metadata_or =
      co_await legacy::FetchPageMetadata(fetcher, endpoint.MetadataUrl(ref));
  if (!metadata_or.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 metadata_or.status()));
  }
  const core::PageGeometry geometry = metadata_or->ToGeometry();

  absl::StatusOr<core::TileGrid> grid_or =
      core::PlanTileGrid(geometry, endpoint.TilePrefix(ref));
  if (!grid_or.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event), grid_or.status()));
  }
  event.total_tiles = grid_or->GetTileCount();

  std::vector<std::string> urls;
  urls.reserve(grid_or->tasks.size());
  for (const auto& task : grid_or->tasks) {
    urls.push_back(task.url);
  }
  VLOG(1) << event.page << ": " << geometry.width << "x" << geometry.height
          << ", " << grid_or->rows << "x" << grid_or->cols << " tiles of "
          << geometry.tile_size;

  std::vector<runtime::FetchResult> fetched =
      co_await fetcher.FetchAll(std::move(urls));

  std::vector<runtime::EncodedTile> tiles;
  tiles.reserve(fetched.size());
  size_t fetch_failures = 0;
  absl::Status first_error;
  for (size_t i = 0; i < fetched.size(); ++i) {
    if (fetched[i].ok()) {
      tiles.push_back({grid_or->tasks[i].coord, std::move(*fetched[i].bytes)});
      continue;
    }
    ++fetch_failures;
    VLOG(1) << event.page << ": tile " << fetched[i].url << " failed: "
            << foliocore::status::StripStackTrace(
                   fetched[i].bytes.status().message());
    if (first_error.ok()) {
      first_error = fetched[i].bytes.status();
    }
  }

  // Composing
  tracker.TransitionTo(PageState::kComposing);
  if (tiles.empty()) {
    absl::Status status = foliocore::status::AddTrace(
        first_error, __func__, __FILE__, __LINE__,
        absl::StrFormat("none of %d tiles could be fetched",
                        event.total_tiles));
    co_return Finish(FailedEvent(tracker, std::move(event), std::move(status)));
  }

  absl::StatusOr<runtime::CompositeResult> composite_or =
      runtime::ComposeTiles(geometry, tiles);
  if (!composite_or.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 composite_or.status()));
  }
  if (composite_or->placed_tiles == 0) {
    absl::Status status = MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        absl::StrFormat("none of %d tiles could be decoded",
                        event.total_tiles));
    co_return Finish(FailedEvent(tracker, std::move(event), std::move(status)));
  }
  event.failed_tiles = fetch_failures + composite_or->decode_failures;

  absl::StatusOr<std::vector<uint8_t>> encoded_or =
      codec::EncodeJpeg(composite_or->image, options_.jpeg_quality);
  if (!encoded_or.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 encoded_or.status()));
  }
  if (absl::Status written =
          runtime::io::WriteFileAtomically(target, *encoded_or);
      !written.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 std::move(written)));
  }

  // Saved
  tracker.TransitionTo(PageState::kSaved);
  event.outcome = event.failed_tiles == 0 ? PageOutcome::kSaved
                                          : PageOutcome::kSavedWithFailedTiles;
  co_return Finish(std::move(event));
}

asio::awaitable<PageEvent> PageOrchestrator::ProcessCanvas(
    runtime::FetchExecutor& shared, manifest::ResolvedCanvas canvas,
    core::PageDescriptor page) {
  const fs::path& target = page.target_path;
  PageEvent event;
  event.page = page.FileName();
  PageTracker tracker(event.page);

  // Pending
  absl::StatusOr<bool> exists_or = TargetExists(target);
  if (!exists_or.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 exists_or.status()));
  }
  if (*exists_or) {
    tracker.TransitionTo(PageState::kSkip);
    event.outcome = PageOutcome::kSkipped;
    co_return Finish(std::move(event));
  }
  if (!canvas.image.Available()) {
    tracker.TransitionTo(PageState::kSkip);
    event.outcome = PageOutcome::kNoImage;
    event.status = MAKE_STATUS(
        absl::StatusCode::kNotFound,
        absl::StrFormat("canvas %s: %s", canvas.canvas_id,
                        manifest::ToString(canvas.image.reason)));
    co_return Finish(std::move(event));
  }

  // Fetching
  tracker.TransitionTo(PageState::kFetching);
  runtime::FetchResult fetched = co_await shared.FetchOne(canvas.image.url);
  if (!fetched.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 fetched.bytes.status()));
  }
  if (absl::Status written =
          runtime::io::WriteFileAtomically(target, *fetched.bytes);
      !written.ok()) {
    co_return Finish(FailedEvent(tracker, std::move(event),
                                 std::move(written)));
  }

  // Saved
  tracker.TransitionTo(PageState::kSaved);
  event.outcome = PageOutcome::kSaved;
  co_return Finish(std::move(event));
}

}  // namespace orchestrator
}  // namespace folio
