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


#include "folio/runtime/progress.h"

#include <string>

#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace runtime {

const char* ToString(PageOutcome outcome) {
  switch (outcome) {
    case PageOutcome::kSkipped:
      return "skipped";
    case PageOutcome::kSaved:
      return "saved";
    case PageOutcome::kSavedWithFailedTiles:
      return "saved with failed tiles";
    case PageOutcome::kNoImage:
      return "no image";
    case PageOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

void RunSummary::Record(PageOutcome outcome) {
  switch (outcome) {
    case PageOutcome::kSkipped:
      ++skipped;
      break;
    case PageOutcome::kSaved:
      ++saved;
      break;
    case PageOutcome::kSavedWithFailedTiles:
      ++degraded;
      break;
    case PageOutcome::kNoImage:
      ++no_image;
      break;
    case PageOutcome::kFailed:
      ++failed;
      break;
  }
}

void ConsoleProgressReporter::OnRunStarted(const std::string& name,
                                           size_t total_pages) {
  total_ = total_pages;
  seen_ = 0;
  out_ << "Downloading " << total_pages << " page(s) into " << name << '\n';
}

void ConsoleProgressReporter::OnPageEvent(const PageEvent& event) {
  ++seen_;
  out_ << absl::StrFormat("[%*d/%d] %s: ", static_cast<int>(
                                               std::to_string(total_).size()),
                          seen_, total_, event.page);
  switch (event.outcome) {
    case PageOutcome::kSavedWithFailedTiles:
      out_ << absl::StrFormat("saved with %d of %d tiles missing",
                              event.failed_tiles, event.total_tiles);
      break;
    case PageOutcome::kNoImage:
    case PageOutcome::kFailed: {
      out_ << ToString(event.outcome);
      if (!event.status.ok()) {
        const std::string message(event.status.message());
        out_ << " ("
             << (verbose_ ? message
                          : foliocore::status::StripStackTrace(message))
             << ")";
      }
      break;
    }
    default:
      out_ << ToString(event.outcome);
      break;
  }
  out_ << '\n';
}

void ConsoleProgressReporter::OnRunFinished(const RunSummary& summary) {
  out_ << absl::StrFormat(
      "Done: %d saved, %d saved with failed tiles, %d skipped, %d without "
      "image, %d failed (of %d)\n",
      summary.saved, summary.degraded, summary.skipped, summary.no_image,
      summary.failed, summary.total);
}

}  // namespace runtime
}  // namespace folio
