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

#include "folio/runtime/io/file_writer.h"

#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace runtime {
namespace io {

absl::StatusOr<FileWriter> FileWriter::Open(const fs::path& path) {
  FILE* file = fopen(path.string().c_str(), "wb");
  if (!file) {
    return MAKE_STATUS(
        absl::StatusCode::kPermissionDenied,
        absl::StrFormat("Cannot create file: %s", path.string()));
  }
  return FileWriter(file);
}

absl::Status FileWriter::Write(const std::vector<uint8_t>& bytes) const {
  if (!file_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Write on a closed file");
  }
  if (bytes.empty()) {
    return absl::OkStatus();
  }
  if (fwrite(bytes.data(), 1, bytes.size(), file_.get()) != bytes.size()) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       absl::StrFormat("Failed to write %zu bytes",
                                       bytes.size()));
  }
  return absl::OkStatus();
}

absl::Status FileWriter::Close() {
  if (!file_) {
    return absl::OkStatus();
  }
  FILE* file = file_.release();
  const bool flushed = fflush(file) == 0;
  const bool closed = fclose(file) == 0;
  if (!flushed || !closed) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to flush file to disk");
  }
  return absl::OkStatus();
}

fs::path PartialPath(const fs::path& target) {
  fs::path partial = target;
  partial += kPartialSuffix;
  return partial;
}

absl::Status WriteFileAtomically(const fs::path& target,
                                 const std::vector<uint8_t>& bytes) {
  const fs::path partial = PartialPath(target);

  absl::Status written = [&]() -> absl::Status {
    ASSIGN_OR_RETURN(auto writer, FileWriter::Open(partial));
    RETURN_IF_ERROR(writer.Write(bytes));
    RETURN_IF_ERROR(writer.Close());
    return absl::OkStatus();
  }();

  if (written.ok()) {
    std::error_code ec;
    fs::rename(partial, target, ec);
    if (!ec) {
      return absl::OkStatus();
    }
    written = MAKE_STATUS(
        absl::StatusCode::kInternal,
        absl::StrFormat("Cannot rename %s to %s: %s", partial.string(),
                        target.string(), ec.message()));
  }

  std::error_code remove_ec;
  fs::remove(partial, remove_ec);
  if (remove_ec) {
    LOG(WARNING) << "Could not remove partial file " << partial << ": "
                 << remove_ec.message();
  }
  RETURN_IF_ERROR(written,
                  absl::StrFormat("while writing %s", target.string()));
  return absl::OkStatus();
}

absl::Status EnsureDirectory(const fs::path& dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return MAKE_STATUS(
        absl::StatusCode::kPermissionDenied,
        absl::StrFormat("Cannot create directory %s: %s", dir.string(),
                        ec.message()));
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace runtime
}  // namespace folio
