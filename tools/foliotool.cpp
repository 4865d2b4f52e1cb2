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


#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "folio/downloader.h"
#include "folio/runtime/progress.h"
#include "folio/settings.h"
#include "foliocore/status/status_macros.h"

// Download command flags
ABSL_FLAG(std::string, output, "",
          "Parent directory of the download folder (default: BLTOOLS_BASEDIR "
          "or the current directory)");
ABSL_FLAG(std::string, range, "",
          "Inclusive page range START-END (legacy pages or manifest canvases)");
ABSL_FLAG(bool, verbose, false,
          "Log page lifecycle and print full error traces");

// Tuning flags (0 keeps the environment/default value)
ABSL_FLAG(uint32_t, tile_concurrency, 0, "Tile requests in flight per page");
ABSL_FLAG(uint32_t, canvas_concurrency, 0,
          "Image requests in flight per manifest download");
ABSL_FLAG(uint32_t, timeout_seconds, 0, "Per-request timeout in seconds");

namespace {

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name
            << " download <manuscript-id | manifest-url> [options]\n\n";
  std::cerr << "Commands:\n";
  std::cerr << "  download   Download every page of a manuscript\n";
  std::cerr << "\n";
  std::cerr << "Options:\n";
  std::cerr << "  --output=<dir>              Output parent directory\n";
  std::cerr << "  --range=<start-end>         Pages to download, e.g. 1-10\n";
  std::cerr << "  --verbose                   Detailed logging\n";
  std::cerr << "  --tile_concurrency=<n>      Tile requests per page\n";
  std::cerr << "  --canvas_concurrency=<n>    Image requests per manifest\n";
  std::cerr << "  --timeout_seconds=<n>       Per-request timeout\n";
  std::cerr << "  --flagfile=<path>           Read flags from a file\n";
  std::cerr << "\n";
  std::cerr << "Environment: BLTOOLS_BASEDIR, BLTOOLS_RANGEBEGIN, "
               "BLTOOLS_RANGEEND, BLTOOLS_BASEURL,\n"
               "  BLTOOLS_USER_AGENT, BLTOOLS_TIMEOUT_SECONDS, "
               "BLTOOLS_TILE_CONCURRENCY,\n"
               "  BLTOOLS_CANVAS_CONCURRENCY, BLTOOLS_PAGE_BATCH_SIZE\n";
  std::cerr << "\n";
  std::cerr << "Examples:\n";
  std::cerr << "  " << program_name << " download add_ms_19352 --range=1-10\n";
  std::cerr << "  " << program_name
            << " download https://iiif.example.org/ms1/manifest.json "
               "--output=scans\n";
}

void PrintError(const std::string& what, const absl::Status& status,
                bool verbose) {
  std::cerr << "Error: " << what << '\n';
  if (verbose) {
    std::cerr << "Status: " << status << '\n';
  } else {
    std::cerr << "Cause: "
              << foliocore::status::StripStackTrace(status.message()) << '\n';
  }
}

/// @brief Environment settings with non-zero flags layered on top
absl::StatusOr<folio::Settings> LoadSettings() {
  DECLARE_ASSIGN_OR_RETURN(folio::Settings, settings,
                           folio::LoadSettingsFromEnv());
  if (const uint32_t tiles = absl::GetFlag(FLAGS_tile_concurrency);
      tiles != 0) {
    settings.tile_concurrency = tiles;
  }
  if (const uint32_t canvases = absl::GetFlag(FLAGS_canvas_concurrency);
      canvases != 0) {
    settings.canvas_concurrency = canvases;
  }
  if (const uint32_t timeout = absl::GetFlag(FLAGS_timeout_seconds);
      timeout != 0) {
    settings.request_timeout = std::chrono::seconds(timeout);
  }
  if (const std::string output = absl::GetFlag(FLAGS_output);
      !output.empty()) {
    settings.base_dir = output;
  }
  RETURN_IF_ERROR(settings.Validate());
  return settings;
}

int DownloadCommand(const std::string& input, bool verbose) {
  auto settings_or = LoadSettings();
  if (!settings_or.ok()) {
    PrintError("Invalid configuration", settings_or.status(), verbose);
    return 1;
  }

  folio::DownloadRequest request;
  request.input = input;
  request.output_dir = settings_or->base_dir;
  if (const std::string range = absl::GetFlag(FLAGS_range); !range.empty()) {
    request.range = range;
  }

  folio::runtime::ConsoleProgressReporter reporter(std::cout, verbose);
  auto summary_or = folio::Download(*settings_or, std::move(request), reporter);
  if (!summary_or.ok()) {
    PrintError("Download of " + input + " failed", summary_or.status(),
               verbose);
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      "Download manuscript page images from a tile viewer or IIIF manifest");
  std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  if (args.size() < 2) {
    PrintUsage(argv[0]);
    return 1;
  }

  const bool verbose = absl::GetFlag(FLAGS_verbose);
  if (verbose) {
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
    absl::SetGlobalVLogLevel(1);
  }

  const std::string command = args[1];
  if (command == "download") {
    if (args.size() != 3) {
      std::cerr << "Error: download takes exactly one manuscript id or "
                   "manifest URL\n\n";
      PrintUsage(argv[0]);
      return 1;
    }
    return DownloadCommand(args[2], verbose);
  }

  std::cerr << "Error: Unknown command '" << command << "'\n\n";
  PrintUsage(argv[0]);
  return 1;
}
