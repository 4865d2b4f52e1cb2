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

#include "folio/core/tile_grid.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace core {

std::string TileUrl(const std::string& url_prefix, TileCoordinate coord) {
  return absl::StrCat(url_prefix, coord.row, "_", coord.col, ".jpg");
}

absl::StatusOr<TileGrid> PlanTileGrid(const PageGeometry& geometry,
                                      const std::string& url_prefix) {
  if (geometry.tile_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Tile size must be greater than zero");
  }

  TileGrid grid;
  grid.geometry = geometry;
  grid.rows = geometry.width / geometry.tile_size + 1;
  grid.cols = geometry.height / geometry.tile_size + 1;

  grid.tasks.reserve(grid.GetTileCount());
  for (uint32_t row = 0; row < grid.rows; ++row) {
    for (uint32_t col = 0; col < grid.cols; ++col) {
      const TileCoordinate coord{row, col};
      grid.tasks.push_back({coord, TileUrl(url_prefix, coord)});
    }
  }

  return grid;
}

}  // namespace core
}  // namespace folio
