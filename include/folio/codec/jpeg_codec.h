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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_CODEC_JPEG_CODEC_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_CODEC_JPEG_CODEC_H_

#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "folio/image.h"

namespace folio::codec {

/// @brief Default encoder quality for composited pages
inline constexpr int kDefaultJpegQuality = 95;

/// @brief Decode JPEG bytes to an RGB8 image
///
/// Grayscale sources are expanded to RGB. libjpeg errors are caught and
/// returned as status instead of terminating the process.
///
/// @param data JPEG-compressed data
/// @return Decoded image
/// @retval absl::InvalidArgumentError if data is empty
/// @retval absl::DataLossError if the stream is corrupt or unsupported
absl::StatusOr<Image> DecodeJpeg(const std::vector<uint8_t>& data);

/// @brief Encode an RGB8 image as baseline JPEG
///
/// @param image Image to encode (must not be empty)
/// @param quality libjpeg quality, 1..100
/// @return JPEG-compressed bytes
absl::StatusOr<std::vector<uint8_t>> EncodeJpeg(
    const Image& image, int quality = kDefaultJpegQuality);

}  // namespace folio::codec

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_CODEC_JPEG_CODEC_H_
