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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_COMPOSITOR_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_COMPOSITOR_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "folio/core/tile_grid.h"
#include "folio/image.h"

namespace folio {
namespace runtime {

/// @brief A fetched, still-encoded tile
struct EncodedTile {
  core::TileCoordinate coord;
  std::vector<uint8_t> bytes;
};

/// @brief Result of compositing one page
struct CompositeResult {
  Image image;
  size_t placed_tiles = 0;   ///< Tiles decoded and pasted
  size_t decode_failures = 0;  ///< Tiles whose bytes were not a valid image
};

/// @brief Pixel rectangle of a tile's grid cell, clipped to the page
struct CellRect {
  uint32_t x = 0;
  uint32_t y = 0;
  uint32_t width = 0;
  uint32_t height = 0;
};

/// @brief Cell of `coord` clipped to the page; width/height 0 if outside
CellRect GetCellRect(const core::PageGeometry& geometry,
                     core::TileCoordinate coord);

/// @brief Assembles tiles into one page raster
///
/// Allocates a black canvas of geometry.width x geometry.height, decodes each
/// tile and pastes it at (row * tile_size, col * tile_size). A tile only ever
/// writes inside its own cell, so the result does not depend on tile order.
/// Tiles that fail to decode are logged, counted and left black.
///
/// @param geometry Effective page geometry
/// @param tiles Successfully fetched tiles (missing tiles are simply absent)
/// @return Composite, or kInvalidArgument for a degenerate geometry
absl::StatusOr<CompositeResult> ComposeTiles(
    const core::PageGeometry& geometry, const std::vector<EncodedTile>& tiles);

}  // namespace runtime
}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_RUNTIME_COMPOSITOR_H_
