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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_IO_FILE_WRITER_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_IO_FILE_WRITER_H_

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace folio {
namespace runtime {
namespace io {

/// @brief Suffix of the temporary file a page is written to before rename
inline constexpr char kPartialSuffix[] = ".part";

/// @brief RAII wrapper for a FILE* opened for writing
///
/// Example usage:
/// ```cpp
/// ASSIGN_OR_RETURN(auto writer, FileWriter::Open(path));
/// RETURN_IF_ERROR(writer.Write(bytes));
/// RETURN_IF_ERROR(writer.Close());
/// ```
class FileWriter {
 public:
  /// @brief Default constructor (creates invalid writer)
  FileWriter() : file_(nullptr, fclose) {}

  /// @brief Open (truncate or create) a file for binary writing
  /// @param path Path to file
  /// @return FileWriter instance or error
  /// @retval absl::PermissionDeniedError if the file cannot be created
  static absl::StatusOr<FileWriter> Open(const fs::path& path);

  FileWriter(FileWriter&& other) noexcept = default;
  FileWriter& operator=(FileWriter&& other) noexcept = default;
  ~FileWriter() = default;

  FileWriter(const FileWriter&) = delete;
  FileWriter& operator=(const FileWriter&) = delete;

  /// @brief Write the whole buffer
  absl::Status Write(const std::vector<uint8_t>& bytes) const;

  /// @brief Flush and close; reports errors fclose would otherwise swallow
  absl::Status Close();

  [[nodiscard]] bool IsOpen() const { return file_ != nullptr; }

 private:
  explicit FileWriter(FILE* file) : file_(file, fclose) {}

  std::unique_ptr<FILE, decltype(&fclose)> file_;
};

/// @brief Path of the in-progress file for `target`
fs::path PartialPath(const fs::path& target);

/// @brief Write `bytes` to `target` so that `target` only ever exists complete
///
/// Writes to PartialPath(target) first and renames it over `target` once the
/// data is flushed. A leftover partial file from an earlier run is replaced.
///
/// @param target Final file path
/// @param bytes File contents
/// @return OkStatus or the first I/O error (the partial file is removed)
absl::Status WriteFileAtomically(const fs::path& target,
                                 const std::vector<uint8_t>& bytes);

/// @brief Create `dir` and its parents if missing
absl::Status EnsureDirectory(const fs::path& dir);

}  // namespace io
}  // namespace runtime

using runtime::io::FileWriter;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_IO_FILE_WRITER_H_
