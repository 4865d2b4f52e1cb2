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


#include "folio/downloader.h"

#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "foliocore/status/status_macros.h"

namespace folio {

net::BeastHttpClient::Options MakeHttpOptions(const Settings& settings) {
  net::BeastHttpClient::Options options;
  options.user_agent = settings.user_agent;
  options.timeout = settings.request_timeout;
  return options;
}

orchestrator::DownloadOptions MakeDownloadOptions(const Settings& settings) {
  orchestrator::DownloadOptions options;
  options.base_url = settings.base_url;
  options.zoom_level = settings.zoom_level;
  options.default_range = core::PageRange{settings.range_begin,
                                          settings.range_end};
  options.canvas_concurrency = settings.canvas_concurrency;
  options.page_batch_size = settings.page_batch_size;
  options.page.tile_concurrency = settings.tile_concurrency;
  options.page.retry = settings.retry;
  options.page.jpeg_quality = settings.jpeg_quality;
  return options;
}

absl::Status AbortedRunStatus(std::exception_ptr error) {
  std::string what = "unknown exception";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    what = e.what();
  } catch (...) {
    // Not a std::exception; nothing more to report.
  }
  return MAKE_STATUS(absl::StatusCode::kInternal,
                     absl::StrCat("Download aborted: ", what));
}

absl::StatusOr<runtime::RunSummary> Download(
    const Settings& settings, orchestrator::DownloadRequest request,
    runtime::ProgressReporter& reporter) {
  RETURN_IF_ERROR(settings.Validate());
  if (request.output_dir.empty()) {
    request.output_dir = settings.base_dir;
  }

  boost::asio::io_context io;
  net::BeastHttpClient client(MakeHttpOptions(settings));
  orchestrator::ManuscriptOrchestrator orchestrator(
      client, io.get_executor(), reporter, MakeDownloadOptions(settings));

  std::optional<absl::StatusOr<runtime::RunSummary>> result;
  boost::asio::co_spawn(
      io, orchestrator.Run(std::move(request)),
      [&result](std::exception_ptr error,
                absl::StatusOr<runtime::RunSummary> summary) {
        if (error) {
          result = AbortedRunStatus(error);
        } else {
          result = std::move(summary);
        }
      });
  io.run();

  if (!result.has_value()) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Download did not complete");
  }
  return *std::move(result);
}

}  // namespace folio
