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

#include "folio/core/page_descriptor.h"

#include <cstdint>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace folio {
namespace core {

std::string LegacyFileStem(const FolioRef& ref) {
  return fmt::format("f{:03d}{}", ref.page, GetSuffix(ref.side));
}

std::string LegacyFileName(const FolioRef& ref) {
  return LegacyFileStem(ref) + ".jpg";
}

std::string CanvasFileName(uint32_t index, const std::string& label) {
  std::string safe_label = label;
  for (char& c : safe_label) {
    if (c == ' ' || c == '/' || c == '\\') {
      c = '_';
    }
  }
  return fmt::format("{:04d}_{}.jpg", index, safe_label);
}

std::vector<FolioRef> ExpandFolioRange(uint32_t start, uint32_t end) {
  std::vector<FolioRef> refs;
  if (start > end) {
    return refs;
  }
  refs.reserve(static_cast<size_t>(end - start + 1) * 2);
  for (uint64_t page = start; page <= end; ++page) {
    refs.push_back({static_cast<uint32_t>(page), FolioSide::kRecto});
    refs.push_back({static_cast<uint32_t>(page), FolioSide::kVerso});
  }
  return refs;
}

}  // namespace core
}  // namespace folio
