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


#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_PROGRESS_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_PROGRESS_H_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "absl/status/status.h"

/**
 * @file progress.h
 * @brief Page lifecycle events and the reporter interface that receives them
 *
 * Orchestrators get a ProgressReporter passed in and call it once per page
 * when the page reaches a terminal state. There is no process-wide progress
 * state.
 */

namespace folio {
namespace runtime {

/// @brief Terminal state of one page, as seen by the operator
enum class PageOutcome : uint8_t {
  kSkipped,               ///< Target file already present
  kSaved,                 ///< Written, every tile present
  kSavedWithFailedTiles,  ///< Written with black gaps
  kNoImage,               ///< Canvas has no downloadable image
  kFailed,                ///< Nothing written
};

/// @brief Short lower-case name, e.g. "saved"
const char* ToString(PageOutcome outcome);

/// @brief One terminal page event
struct PageEvent {
  std::string page;  ///< Output file name
  PageOutcome outcome = PageOutcome::kFailed;
  size_t failed_tiles = 0;  ///< Only for kSavedWithFailedTiles
  size_t total_tiles = 0;   ///< Legacy pages only
  absl::Status status;      ///< Cause for kFailed / kNoImage
};

/// @brief Counts of a finished run
struct RunSummary {
  size_t total = 0;
  size_t skipped = 0;
  size_t saved = 0;
  size_t degraded = 0;
  size_t no_image = 0;
  size_t failed = 0;

  void Record(PageOutcome outcome);

  [[nodiscard]] size_t Settled() const {
    return skipped + saved + degraded + no_image + failed;
  }

  bool operator==(const RunSummary& other) const = default;
};

/// @brief Receiver of run progress
///
/// All calls come from the thread running the download's io_context.
class ProgressReporter {
 public:
  virtual ~ProgressReporter() = default;

  /// @param name Output folder of the run
  /// @param total_pages Number of pages that will be reported
  virtual void OnRunStarted(const std::string& name, size_t total_pages) = 0;

  virtual void OnPageEvent(const PageEvent& event) = 0;

  virtual void OnRunFinished(const RunSummary& summary) = 0;
};

/// @brief Prints one line per page event and a final summary
class ConsoleProgressReporter : public ProgressReporter {
 public:
  /// @param out Stream to print to (not owned)
  /// @param verbose Print failure causes with their full trace
  explicit ConsoleProgressReporter(std::ostream& out, bool verbose = false)
      : out_(out), verbose_(verbose) {}

  void OnRunStarted(const std::string& name, size_t total_pages) override;
  void OnPageEvent(const PageEvent& event) override;
  void OnRunFinished(const RunSummary& summary) override;

 private:
  std::ostream& out_;
  bool verbose_;
  size_t total_ = 0;
  size_t seen_ = 0;
};

/// @brief Reporter that ignores everything
class NullProgressReporter : public ProgressReporter {
 public:
  void OnRunStarted(const std::string&, size_t) override {}
  void OnPageEvent(const PageEvent&) override {}
  void OnRunFinished(const RunSummary&) override {}
};

}  // namespace runtime

using runtime::PageEvent;
using runtime::PageOutcome;
using runtime::ProgressReporter;
using runtime::RunSummary;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_PROGRESS_H_
