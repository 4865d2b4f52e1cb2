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


#include "folio/orchestrator/manuscript_orchestrator.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "folio/core/page_descriptor.h"
#include "folio/manifest/iiif_manifest.h"
#include "folio/net/url.h"
#include "folio/runtime/fetch_executor.h"
#include "folio/runtime/io/file_writer.h"
#include "foliocore/async/async_semaphore.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace orchestrator {

namespace asio = boost::asio;

using runtime::PageEvent;
using runtime::PageOutcome;
using runtime::RunSummary;

namespace {

constexpr char kFallbackFolder[] = "download";

std::string ManifestFolder(const std::string& url) {
  std::string folder = net::LastPathSegment(url);
  if (folder.empty() || folder == "." || folder == "..") {
    return kFallbackFolder;
  }
  return folder;
}

PageEvent CrashedEvent(const std::string& page, std::exception_ptr error) {
  std::string what = "unknown exception";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    what = e.what();
  } catch (...) {
    // Not a std::exception; the message above is all there is.
  }
  PageEvent event;
  event.page = page;
  event.outcome = PageOutcome::kFailed;
  event.status = MAKE_STATUS(absl::StatusCode::kInternal,
                             absl::StrFormat("page task threw: %s", what));
  return event;
}

}  // namespace

DownloadMode DetectMode(std::string_view input) {
  return absl::StartsWith(input, "http") ? DownloadMode::kManifest
                                         : DownloadMode::kLegacy;
}

ManuscriptOrchestrator::ManuscriptOrchestrator(
    net::HttpClient& client, asio::any_io_executor executor,
    runtime::ProgressReporter& reporter, DownloadOptions options)
    : client_(client),
      executor_(executor),
      reporter_(reporter),
      options_(std::move(options)),
      pages_(client, std::move(executor), reporter, options_.page) {}

asio::awaitable<absl::StatusOr<RunSummary>> ManuscriptOrchestrator::Run(
    DownloadRequest request) {
  if (request.input.empty()) {
    co_return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                          "No manuscript id or manifest URL given");
  }

  std::optional<core::PageRange> range;
  if (request.range.has_value()) {
    absl::StatusOr<core::PageRange> range_or =
        core::ParsePageRange(*request.range);
    if (!range_or.ok()) {
      LOG(ERROR) << "Invalid range " << *request.range;
      co_return foliocore::status::AddTrace(range_or.status(), __func__,
                                            __FILE__, __LINE__);
    }
    range = *range_or;
  }

  if (DetectMode(request.input) == DownloadMode::kManifest) {
    co_return co_await RunManifest(std::move(request.input), range,
                                   std::move(request.output_dir));
  }

  const core::PageRange pages = range.value_or(options_.default_range);
  if (pages.start == 0 || pages.start > pages.end) {
    co_return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Invalid page range %d-%d", pages.start, pages.end));
  }
  if (pages.end > core::kMaxPageNumber) {
    co_return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        absl::StrFormat("Page range %d-%d goes past page %d", pages.start,
                        pages.end, core::kMaxPageNumber));
  }
  co_return co_await RunLegacy(std::move(request.input), pages,
                               std::move(request.output_dir));
}

asio::awaitable<absl::StatusOr<RunSummary>>
ManuscriptOrchestrator::RunManifest(std::string url,
                                    std::optional<core::PageRange> range,
                                    fs::path output_dir) {
  runtime::FetchExecutor shared(
      client_, executor_,
      runtime::FetchOptions{options_.canvas_concurrency, options_.page.retry});

  LOG(INFO) << "Fetching manifest " << url;
  runtime::FetchResult fetched = co_await shared.FetchOne(url);
  CO_RETURN_IF_ERROR(fetched.bytes.status(),
                     absl::StrFormat("fetching manifest %s", url));

  const std::vector<uint8_t>& body = *fetched.bytes;
  manifest::Manifest document;
  CO_ASSIGN_OR_RETURN(
      document,
      manifest::ParseManifest(std::string_view(
          reinterpret_cast<const char*>(body.data()), body.size())),
      absl::StrFormat("parsing manifest %s", url));

  std::vector<manifest::ResolvedCanvas> canvases;
  CO_ASSIGN_OR_RETURN(canvases, manifest::ResolveCanvases(document, range));

  const std::string folder = ManifestFolder(url);
  const fs::path dir = output_dir / folder;
  CO_RETURN_IF_ERROR(runtime::io::EnsureDirectory(dir));

  RunSummary summary;
  summary.total = canvases.size();
  reporter_.OnRunStarted(folder, canvases.size());
  LOG(INFO) << "Manifest " << url << ": " << document.items.size()
            << " canvases, downloading " << canvases.size() << " into "
            << dir.string();

  std::vector<asio::awaitable<PageEvent>> tasks;
  std::vector<std::string> names;
  tasks.reserve(canvases.size());
  names.reserve(canvases.size());
  for (auto& canvas : canvases) {
    core::PageDescriptor page{
        canvas.index, canvas.label,
        dir / core::CanvasFileName(canvas.index, canvas.label)};
    names.push_back(page.FileName());
    tasks.push_back(
        pages_.ProcessCanvas(shared, std::move(canvas), std::move(page)));
  }

  const std::vector<PageEvent> events =
      co_await RunAll(std::move(tasks), std::move(names));
  for (const auto& event : events) {
    summary.Record(event.outcome);
  }

  reporter_.OnRunFinished(summary);
  co_return summary;
}

asio::awaitable<absl::StatusOr<RunSummary>> ManuscriptOrchestrator::RunLegacy(
    std::string manuscript_id, core::PageRange range, fs::path output_dir) {
  const fs::path dir = output_dir / manuscript_id;
  CO_RETURN_IF_ERROR(runtime::io::EnsureDirectory(dir));

  const legacy::LegacyEndpoint endpoint{options_.base_url, manuscript_id,
                                        options_.zoom_level};
  const std::vector<core::FolioRef> refs =
      core::ExpandFolioRange(range.start, range.end);
  const size_t batch_size = std::max<size_t>(1, options_.page_batch_size);

  RunSummary summary;
  summary.total = refs.size();
  reporter_.OnRunStarted(manuscript_id, refs.size());
  LOG(INFO) << "Manuscript " << manuscript_id << ": pages " << range.start
            << "-" << range.end << " (" << refs.size() << " sides) into "
            << dir.string();

  for (size_t first = 0; first < refs.size(); first += batch_size) {
    const size_t last = std::min(refs.size(), first + batch_size);
    VLOG(1) << "Batch of sides " << first + 1 << "-" << last;

    std::vector<asio::awaitable<PageEvent>> tasks;
    std::vector<std::string> names;
    for (size_t i = first; i < last; ++i) {
      core::PageDescriptor page{static_cast<uint32_t>(i + 1),
                                core::LegacyFileStem(refs[i]),
                                dir / core::LegacyFileName(refs[i])};
      names.push_back(page.FileName());
      tasks.push_back(
          pages_.ProcessLegacyPage(endpoint, refs[i], std::move(page)));
    }

    const std::vector<PageEvent> events =
        co_await RunAll(std::move(tasks), std::move(names));
    for (const auto& event : events) {
      summary.Record(event.outcome);
    }
  }

  reporter_.OnRunFinished(summary);
  co_return summary;
}

asio::awaitable<std::vector<PageEvent>> ManuscriptOrchestrator::RunAll(
    std::vector<asio::awaitable<PageEvent>> tasks,
    std::vector<std::string> pages) {
  std::vector<PageEvent> events(tasks.size());
  foliocore::async::CompletionLatch latch(executor_, tasks.size());

  for (size_t i = 0; i < tasks.size(); ++i) {
    asio::co_spawn(executor_, std::move(tasks[i]),
                   [this, &events, &latch, &pages, i](std::exception_ptr error,
                                                      PageEvent event) {
                     if (error) {
                       event = CrashedEvent(pages[i], error);
                       LOG(ERROR) << event.page << ": " << event.status;
                       reporter_.OnPageEvent(event);
                     }
                     events[i] = std::move(event);
                     latch.CountDown();
                   });
  }

  co_await latch.Wait();
  co_return events;
}

}  // namespace orchestrator
}  // namespace folio
