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

#include "folio/runtime/compositor.h"

#include <algorithm>
#include <cstdint>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "folio/codec/jpeg_codec.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace runtime {

CellRect GetCellRect(const core::PageGeometry& geometry,
                     core::TileCoordinate coord) {
  const uint64_t x = static_cast<uint64_t>(coord.row) * geometry.tile_size;
  const uint64_t y = static_cast<uint64_t>(coord.col) * geometry.tile_size;
  if (x >= geometry.width || y >= geometry.height) {
    return CellRect{};
  }

  CellRect rect;
  rect.x = static_cast<uint32_t>(x);
  rect.y = static_cast<uint32_t>(y);
  rect.width = std::min<uint32_t>(geometry.tile_size, geometry.width - rect.x);
  rect.height =
      std::min<uint32_t>(geometry.tile_size, geometry.height - rect.y);
  return rect;
}

absl::StatusOr<CompositeResult> ComposeTiles(
    const core::PageGeometry& geometry, const std::vector<EncodedTile>& tiles) {
  if (geometry.width == 0 || geometry.height == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Cannot composite a %dx%d page", geometry.width,
                        geometry.height));
  }
  if (geometry.tile_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Tile size must be greater than zero");
  }

  CompositeResult result;
  result.image = Image(ImageDimensions{geometry.width, geometry.height});

  for (const auto& tile : tiles) {
    const CellRect cell = GetCellRect(geometry, tile.coord);
    if (cell.width == 0 || cell.height == 0) {
      VLOG(1) << "Tile (" << tile.coord.row << ", " << tile.coord.col
              << ") lies outside the " << geometry.width << "x"
              << geometry.height << " page";
      continue;
    }

    auto decoded_or = codec::DecodeJpeg(tile.bytes);
    if (!decoded_or.ok()) {
      LOG(WARNING) << "Failed to decode tile at (" << tile.coord.row << ", "
                   << tile.coord.col << "): "
                   << foliocore::status::StripStackTrace(
                          decoded_or.status().message());
      ++result.decode_failures;
      continue;
    }

    // Source may be smaller (edge tiles) or larger (overlap) than the cell.
    result.image.CopyRect(*decoded_or, 0, 0, cell.x, cell.y, cell.width,
                          cell.height);
    ++result.placed_tiles;
  }

  return result;
}

}  // namespace runtime
}  // namespace folio
