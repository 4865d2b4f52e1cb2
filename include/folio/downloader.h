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


#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_DOWNLOADER_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_DOWNLOADER_H_

#include <exception>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "folio/net/beast_http_client.h"
#include "folio/orchestrator/manuscript_orchestrator.h"
#include "folio/runtime/progress.h"
#include "folio/settings.h"

namespace folio {

/// @brief HTTP client options of a run
net::BeastHttpClient::Options MakeHttpOptions(const Settings& settings);

/// @brief Orchestrator options of a run
orchestrator::DownloadOptions MakeDownloadOptions(const Settings& settings);

/// @brief kInternal status for a run whose coroutine threw `error`
absl::Status AbortedRunStatus(std::exception_ptr error);

/// @brief Run a whole download on a fresh io_context and return its counts
///
/// Blocks until every page has settled. `request.output_dir` defaults to
/// `settings.base_dir` when empty.
absl::StatusOr<runtime::RunSummary> Download(
    const Settings& settings, orchestrator::DownloadRequest request,
    runtime::ProgressReporter& reporter);

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_DOWNLOADER_H_
