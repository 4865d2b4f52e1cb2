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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_CORE_PAGE_DESCRIPTOR_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_CORE_PAGE_DESCRIPTOR_H_

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @file page_descriptor.h
 * @brief Output units of a manuscript download
 *
 * A PageDescriptor names one output file. It is created by the manifest
 * resolver (one per canvas) or by legacy range expansion (one per folio
 * side) and is read-only afterwards.
 */

namespace fs = std::filesystem;

namespace folio {
namespace core {

/// @brief Side of a folio in the legacy naming scheme
enum class FolioSide : uint8_t {
  kRecto,  ///< Front ("r")
  kVerso,  ///< Back ("v")
};

/// @brief Single-letter suffix used in legacy file names
constexpr char GetSuffix(FolioSide side) {
  return side == FolioSide::kRecto ? 'r' : 'v';
}

/// @brief One output unit
struct PageDescriptor {
  uint32_t index = 0;      ///< 1-based position in the run
  std::string label;       ///< Human-readable label
  fs::path target_path;    ///< Final output file

  /// @brief File name component of target_path
  [[nodiscard]] std::string FileName() const {
    return target_path.filename().string();
  }
};

/// @brief A legacy folio side, before it is bound to an output directory
struct FolioRef {
  uint32_t page = 0;
  FolioSide side = FolioSide::kRecto;

  bool operator==(const FolioRef& other) const {
    return page == other.page && side == other.side;
  }
};

/// @brief Legacy file stem, e.g. page 1 recto -> "f001r"
std::string LegacyFileStem(const FolioRef& ref);

/// @brief Legacy file name, e.g. page 1 recto -> "f001r.jpg"
std::string LegacyFileName(const FolioRef& ref);

/// @brief Manifest file name: "{index:04d}_{label}.jpg"
///
/// Spaces and path separators in the label are replaced with '_' so the
/// label can never escape the output directory.
std::string CanvasFileName(uint32_t index, const std::string& label);

/// @brief Expand an inclusive page range into recto/verso pairs
///
/// [start, end] -> (start r), (start v), ..., (end r), (end v)
std::vector<FolioRef> ExpandFolioRange(uint32_t start, uint32_t end);

}  // namespace core

using core::FolioRef;
using core::FolioSide;
using core::PageDescriptor;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_CORE_PAGE_DESCRIPTOR_H_
