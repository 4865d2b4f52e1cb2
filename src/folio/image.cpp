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

#include "folio/image.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace folio {

void Image::FillWithColor(uint8_t r, uint8_t g, uint8_t b) {
  for (size_t i = 0; i + 2 < data_.size(); i += kChannels) {
    data_[i + 0] = r;
    data_[i + 1] = g;
    data_[i + 2] = b;
  }
}

void Image::CopyRect(const Image& src, uint32_t src_x, uint32_t src_y,
                     uint32_t dst_x, uint32_t dst_y, uint32_t width,
                     uint32_t height) {
  if (src_x >= src.GetWidth() || src_y >= src.GetHeight() ||
      dst_x >= GetWidth() || dst_y >= GetHeight()) {
    return;
  }

  const uint32_t copy_w = std::min(
      {width, src.GetWidth() - src_x, GetWidth() - dst_x});
  const uint32_t copy_h = std::min(
      {height, src.GetHeight() - src_y, GetHeight() - dst_y});
  if (copy_w == 0 || copy_h == 0) {
    return;
  }

  // Row-wise memcpy; both buffers are packed RGB8.
  const size_t row_bytes = static_cast<size_t>(copy_w) * kChannels;
  for (uint32_t y = 0; y < copy_h; ++y) {
    const uint8_t* src_row =
        src.GetData() + (static_cast<size_t>(src_y + y) * src.GetWidth() +
                         src_x) * kChannels;
    uint8_t* dst_row =
        GetData() +
        (static_cast<size_t>(dst_y + y) * GetWidth() + dst_x) * kChannels;
    std::memcpy(dst_row, src_row, row_bytes);
  }
}

}  // namespace folio
