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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_IMAGE_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_IMAGE_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace folio {

/// @brief Image dimensions [width, height]
using ImageDimensions = std::array<uint32_t, 2>;

/// @brief Interleaved 8-bit RGB raster (RGBRGB..., row-major, no padding)
class Image {
 public:
  static constexpr uint32_t kChannels = 3;

  /// @brief Default constructor for empty image
  Image() : dimensions_({0, 0}) {}

  /// @brief Allocate a blank (black) image
  /// @param dimensions Image dimensions [width, height]
  explicit Image(const ImageDimensions& dimensions)
      : dimensions_(dimensions),
        data_(static_cast<size_t>(dimensions[0]) * dimensions[1] * kChannels,
              0) {}

  /// @brief Wrap already decoded pixel data
  /// @throws std::invalid_argument if the buffer size does not match
  Image(const ImageDimensions& dimensions, std::vector<uint8_t> data)
      : dimensions_(dimensions), data_(std::move(data)) {
    if (data_.size() !=
        static_cast<size_t>(dimensions[0]) * dimensions[1] * kChannels) {
      throw std::invalid_argument("Pixel buffer does not match dimensions");
    }
  }

  Image(const Image& other) = default;
  Image(Image&& other) noexcept = default;
  Image& operator=(const Image& other) = default;
  Image& operator=(Image&& other) noexcept = default;
  ~Image() = default;

  [[nodiscard]] const ImageDimensions& GetDimensions() const noexcept {
    return dimensions_;
  }
  [[nodiscard]] uint32_t GetWidth() const noexcept { return dimensions_[0]; }
  [[nodiscard]] uint32_t GetHeight() const noexcept { return dimensions_[1]; }
  [[nodiscard]] uint32_t GetChannels() const noexcept { return kChannels; }

  /// @brief Bytes per row
  [[nodiscard]] size_t GetStride() const noexcept {
    return static_cast<size_t>(dimensions_[0]) * kChannels;
  }

  [[nodiscard]] bool Empty() const noexcept {
    return dimensions_[0] == 0 || dimensions_[1] == 0;
  }

  [[nodiscard]] size_t SizeBytes() const noexcept { return data_.size(); }

  [[nodiscard]] const uint8_t* GetData() const noexcept { return data_.data(); }
  [[nodiscard]] uint8_t* GetData() noexcept { return data_.data(); }

  [[nodiscard]] const std::vector<uint8_t>& GetDataVector() const noexcept {
    return data_;
  }

  /// @brief Pixel sample access (no bounds check)
  /// @param x Column
  /// @param y Row
  /// @param c Channel
  [[nodiscard]] uint8_t& At(uint32_t x, uint32_t y, uint32_t c) {
    return data_[(static_cast<size_t>(y) * dimensions_[0] + x) * kChannels + c];
  }
  [[nodiscard]] uint8_t At(uint32_t x, uint32_t y, uint32_t c) const {
    return data_[(static_cast<size_t>(y) * dimensions_[0] + x) * kChannels + c];
  }

  /// @brief Fill every pixel with one color
  void FillWithColor(uint8_t r, uint8_t g, uint8_t b);

  /// @brief Copy a rectangle of `src` into this image
  ///
  /// The rectangle is clipped against both images; nothing is written outside
  /// either buffer.
  ///
  /// @param src Source image
  /// @param src_x Left edge in the source
  /// @param src_y Top edge in the source
  /// @param dst_x Left edge in this image
  /// @param dst_y Top edge in this image
  /// @param width Rectangle width before clipping
  /// @param height Rectangle height before clipping
  void CopyRect(const Image& src, uint32_t src_x, uint32_t src_y,
                uint32_t dst_x, uint32_t dst_y, uint32_t width,
                uint32_t height);

  bool operator==(const Image& other) const {
    return dimensions_ == other.dimensions_ && data_ == other.data_;
  }

 private:
  ImageDimensions dimensions_;
  std::vector<uint8_t> data_;
};

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_IMAGE_H_
