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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_CORE_TILE_GRID_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_CORE_TILE_GRID_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/statusor.h"

/**
 * @file tile_grid.h
 * @brief Deep-zoom tile grid planning (pure metadata, no I/O)
 *
 * Axis convention, pinned to the tiling server's behaviour:
 * - `row` indexes the x axis: rows = width / tile_size + 1
 * - `col` indexes the y axis: cols = height / tile_size + 1
 * - a tile (row, col) is placed at pixel (row * tile_size, col * tile_size)
 * - its URL is ".../{zoom}/{row}_{col}.jpg"
 *
 * The "+ 1" is applied unconditionally, also when the dimension is an exact
 * multiple of the tile size; the server answers that extra tile (or fails it,
 * which the compositor tolerates).
 */

namespace folio {
namespace core {

/// @brief Tile position in grid space (not pixels)
struct TileCoordinate {
  uint32_t row;  ///< x index
  uint32_t col;  ///< y index

  bool operator==(const TileCoordinate& other) const {
    return row == other.row && col == other.col;
  }
  bool operator!=(const TileCoordinate& other) const {
    return !(*this == other);
  }
};

/// @brief Page geometry in pixels, already off-by-one corrected
struct PageGeometry {
  uint32_t width;      ///< Effective width
  uint32_t height;     ///< Effective height
  uint32_t tile_size;  ///< Tile edge length
};

/// @brief One tile to fetch
struct TileTask {
  TileCoordinate coord;
  std::string url;
};

/// @brief Grid dimensions and the tile fetch plan for one page
struct TileGrid {
  PageGeometry geometry;
  uint32_t rows;  ///< Tiles along x
  uint32_t cols;  ///< Tiles along y
  std::vector<TileTask> tasks;  ///< rows * cols tasks, row-major

  [[nodiscard]] size_t GetTileCount() const {
    return static_cast<size_t>(rows) * cols;
  }
};

/// @brief Plans the tile grid for a page
///
/// @param geometry Page geometry (tile_size must be > 0)
/// @param url_prefix Everything before "{row}_{col}.jpg", i.e.
///        "{base}{manuscript}_{stem}_files/{zoom}/"
/// @return Tile grid, or kInvalidArgument for tile_size == 0
absl::StatusOr<TileGrid> PlanTileGrid(const PageGeometry& geometry,
                                      const std::string& url_prefix);

/// @brief Tile URL for a coordinate under a prefix
std::string TileUrl(const std::string& url_prefix, TileCoordinate coord);

}  // namespace core

using core::PageGeometry;
using core::TileCoordinate;
using core::TileGrid;
using core::TileTask;

}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_CORE_TILE_GRID_H_
