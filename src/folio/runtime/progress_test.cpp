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

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace runtime {
namespace {

absl::Status TracedFailure() {
  return MAKE_STATUS(absl::StatusCode::kNotFound, "HTTP 404 for http://h/x");
}

}  // namespace

TEST(RunSummaryTest, RecordsEveryOutcome) {
  RunSummary summary;
  summary.total = 6;
  for (PageOutcome outcome :
       {PageOutcome::kSkipped, PageOutcome::kSaved, PageOutcome::kSaved,
        PageOutcome::kSavedWithFailedTiles, PageOutcome::kNoImage,
        PageOutcome::kFailed}) {
    summary.Record(outcome);
  }
  EXPECT_EQ(summary.skipped, 1u);
  EXPECT_EQ(summary.saved, 2u);
  EXPECT_EQ(summary.degraded, 1u);
  EXPECT_EQ(summary.no_image, 1u);
  EXPECT_EQ(summary.failed, 1u);
  EXPECT_EQ(summary.Settled(), summary.total);
}

TEST(ConsoleProgressReporterTest, PrintsOneLinePerEvent) {
  std::ostringstream out;
  ConsoleProgressReporter reporter(out);
  reporter.OnRunStarted("ms1", 12);

  reporter.OnPageEvent({"f001r.jpg", PageOutcome::kSaved});
  PageEvent degraded{"f001v.jpg", PageOutcome::kSavedWithFailedTiles};
  degraded.failed_tiles = 2;
  degraded.total_tiles = 9;
  reporter.OnPageEvent(degraded);
  PageEvent failed{"f002r.jpg", PageOutcome::kFailed};
  failed.status = TracedFailure();
  reporter.OnPageEvent(failed);

  const std::string text = out.str();
  EXPECT_TRUE(absl::StrContains(text, "Downloading 12 page(s) into ms1"));
  EXPECT_TRUE(absl::StrContains(text, "[ 1/12] f001r.jpg: saved\n"));
  EXPECT_TRUE(absl::StrContains(
      text, "[ 2/12] f001v.jpg: saved with 2 of 9 tiles missing\n"));
  EXPECT_TRUE(absl::StrContains(
      text, "[ 3/12] f002r.jpg: failed (HTTP 404 for http://h/x)\n"));
  EXPECT_FALSE(absl::StrContains(text, "  at "));
}

TEST(ConsoleProgressReporterTest, VerbosePrintsTrace) {
  std::ostringstream out;
  ConsoleProgressReporter reporter(out, /*verbose=*/true);
  reporter.OnRunStarted("ms1", 1);
  PageEvent failed{"f001r.jpg", PageOutcome::kFailed};
  failed.status = TracedFailure();
  reporter.OnPageEvent(failed);
  EXPECT_TRUE(absl::StrContains(out.str(), "  at TracedFailure"));
}

TEST(ConsoleProgressReporterTest, PrintsSummary) {
  std::ostringstream out;
  ConsoleProgressReporter reporter(out);
  RunSummary summary;
  summary.total = 4;
  summary.saved = 2;
  summary.failed = 1;
  summary.skipped = 1;
  reporter.OnRunFinished(summary);
  EXPECT_EQ(out.str(),
            "Done: 2 saved, 0 saved with failed tiles, 1 skipped, 0 without "
            "image, 1 failed (of 4)\n");
}

}  // namespace runtime
}  // namespace folio
