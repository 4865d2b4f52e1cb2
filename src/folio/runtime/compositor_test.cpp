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

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <vector>

#include "folio/codec/jpeg_codec.h"
#include "folio/image.h"

namespace folio {
namespace runtime {
namespace {

std::vector<uint8_t> SolidJpeg(uint32_t width, uint32_t height, uint8_t gray) {
  Image image(ImageDimensions{width, height});
  image.FillWithColor(gray, gray, gray);
  auto bytes_or = codec::EncodeJpeg(image, 95);
  EXPECT_TRUE(bytes_or.ok()) << bytes_or.status();
  return bytes_or.ok() ? *bytes_or : std::vector<uint8_t>{};
}

/// Every cell of a 25x15 page with 10px tiles: 3 rows (x) by 2 cols (y),
/// all with a non-empty clipped area.
std::vector<EncodedTile> FullTileSet(const core::PageGeometry& geometry) {
  std::vector<EncodedTile> tiles;
  const uint32_t rows = geometry.width / geometry.tile_size + 1;
  const uint32_t cols = geometry.height / geometry.tile_size + 1;
  for (uint32_t row = 0; row < rows; ++row) {
    for (uint32_t col = 0; col < cols; ++col) {
      const auto gray = static_cast<uint8_t>(100 + 20 * (row * cols + col));
      tiles.push_back({{row, col},
                       SolidJpeg(geometry.tile_size, geometry.tile_size,
                                 gray)});
    }
  }
  return tiles;
}

bool CellIsBlack(const Image& image, const CellRect& cell) {
  for (uint32_t y = cell.y; y < cell.y + cell.height; ++y) {
    for (uint32_t x = cell.x; x < cell.x + cell.width; ++x) {
      for (uint32_t c = 0; c < Image::kChannels; ++c) {
        if (image.At(x, y, c) != 0) {
          return false;
        }
      }
    }
  }
  return true;
}

constexpr core::PageGeometry kGeometry{25, 15, 10};

}  // namespace

// ============================================================================
// Cell geometry
// ============================================================================

TEST(CompositorTest, CellRectUsesRowForXAndColForY) {
  const CellRect rect = GetCellRect(kGeometry, {2, 1});
  EXPECT_EQ(rect.x, 20u);
  EXPECT_EQ(rect.y, 10u);
  EXPECT_EQ(rect.width, 5u);
  EXPECT_EQ(rect.height, 5u);
}

TEST(CompositorTest, CellRectOutsidePageIsEmpty) {
  // 20 / 10 + 1 = 3 rows, but the third starts at x = 20 = width.
  const core::PageGeometry exact{20, 20, 10};
  const CellRect rect = GetCellRect(exact, {2, 0});
  EXPECT_EQ(rect.width, 0u);
  EXPECT_EQ(rect.height, 0u);
}

// ============================================================================
// Compositing
// ============================================================================

TEST(CompositorTest, CanvasHasPageDimensions) {
  auto result_or = ComposeTiles(kGeometry, {});
  ASSERT_TRUE(result_or.ok()) << result_or.status();
  EXPECT_EQ(result_or->image.GetWidth(), 25u);
  EXPECT_EQ(result_or->image.GetHeight(), 15u);
  EXPECT_EQ(result_or->placed_tiles, 0u);
}

TEST(CompositorTest, RejectsDegenerateGeometry) {
  EXPECT_FALSE(ComposeTiles({0, 10, 10}, {}).ok());
  EXPECT_FALSE(ComposeTiles({10, 10, 0}, {}).ok());
}

TEST(CompositorTest, PermutationsProduceIdenticalOutput) {
  std::vector<EncodedTile> tiles = FullTileSet(kGeometry);
  auto reference_or = ComposeTiles(kGeometry, tiles);
  ASSERT_TRUE(reference_or.ok()) << reference_or.status();
  EXPECT_EQ(reference_or->placed_tiles, 6u);

  std::mt19937 rng(1234);
  for (int i = 0; i < 10; ++i) {
    std::shuffle(tiles.begin(), tiles.end(), rng);
    auto shuffled_or = ComposeTiles(kGeometry, tiles);
    ASSERT_TRUE(shuffled_or.ok()) << shuffled_or.status();
    EXPECT_EQ(shuffled_or->image, reference_or->image) << "permutation " << i;
  }
}

TEST(CompositorTest, MissingTilesLeaveExactlyThoseCellsBlank) {
  std::vector<EncodedTile> tiles = FullTileSet(kGeometry);
  // Drop (0, 1) and (2, 0)
  std::vector<EncodedTile> partial;
  for (auto& tile : tiles) {
    const bool dropped = (tile.coord == core::TileCoordinate{0, 1}) ||
                         (tile.coord == core::TileCoordinate{2, 0});
    if (!dropped) {
      partial.push_back(std::move(tile));
    }
  }

  auto result_or = ComposeTiles(kGeometry, partial);
  ASSERT_TRUE(result_or.ok()) << result_or.status();
  EXPECT_EQ(result_or->placed_tiles, 4u);

  size_t blank = 0;
  for (uint32_t row = 0; row < 3; ++row) {
    for (uint32_t col = 0; col < 2; ++col) {
      if (CellIsBlack(result_or->image, GetCellRect(kGeometry, {row, col}))) {
        ++blank;
      }
    }
  }
  EXPECT_EQ(blank, 2u);
  EXPECT_TRUE(CellIsBlack(result_or->image, GetCellRect(kGeometry, {0, 1})));
  EXPECT_TRUE(CellIsBlack(result_or->image, GetCellRect(kGeometry, {2, 0})));
}

TEST(CompositorTest, UndecodableTileIsCountedAndLeftBlank) {
  std::vector<EncodedTile> tiles = FullTileSet(kGeometry);
  tiles[0].bytes = {'n', 'o', 't', ' ', 'a', ' ', 'j', 'p', 'e', 'g'};

  auto result_or = ComposeTiles(kGeometry, tiles);
  ASSERT_TRUE(result_or.ok()) << result_or.status();
  EXPECT_EQ(result_or->decode_failures, 1u);
  EXPECT_EQ(result_or->placed_tiles, 5u);
  EXPECT_TRUE(
      CellIsBlack(result_or->image, GetCellRect(kGeometry, tiles[0].coord)));
}

TEST(CompositorTest, OversizedTileDoesNotBleedIntoNeighbours) {
  // A 16x16 tile at (0, 0) must stay inside its 10x10 cell.
  std::vector<EncodedTile> tiles = {{{0, 0}, SolidJpeg(16, 16, 250)}};
  auto result_or = ComposeTiles(kGeometry, tiles);
  ASSERT_TRUE(result_or.ok()) << result_or.status();

  EXPECT_FALSE(CellIsBlack(result_or->image, GetCellRect(kGeometry, {0, 0})));
  EXPECT_TRUE(CellIsBlack(result_or->image, GetCellRect(kGeometry, {1, 0})));
  EXPECT_TRUE(CellIsBlack(result_or->image, GetCellRect(kGeometry, {0, 1})));
}

}  // namespace runtime
}  // namespace folio
