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

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace folio {

TEST(ImageTest, BlankImageIsBlack) {
  Image image(ImageDimensions{4, 3});
  EXPECT_EQ(image.GetWidth(), 4u);
  EXPECT_EQ(image.GetHeight(), 3u);
  EXPECT_EQ(image.GetStride(), 12u);
  EXPECT_EQ(image.SizeBytes(), 36u);
  for (uint8_t value : image.GetDataVector()) {
    EXPECT_EQ(value, 0);
  }
  EXPECT_TRUE(Image().Empty());
}

TEST(ImageTest, RejectsMismatchedBuffer) {
  EXPECT_THROW(
      static_cast<void>(Image(ImageDimensions{2, 2}, std::vector<uint8_t>(11))),
      std::invalid_argument);
}

TEST(ImageTest, CopyRectClipsToDestination) {
  Image tile(ImageDimensions{4, 4});
  tile.FillWithColor(10, 20, 30);
  Image canvas(ImageDimensions{6, 5});

  canvas.CopyRect(tile, 0, 0, 4, 3, 4, 4);

  EXPECT_EQ(canvas.At(4, 3, 0), 10);
  EXPECT_EQ(canvas.At(5, 4, 2), 30);
  EXPECT_EQ(canvas.At(3, 3, 0), 0);
  EXPECT_EQ(canvas.At(4, 2, 1), 0);
}

TEST(ImageTest, CopyRectClipsToSource) {
  Image tile(ImageDimensions{3, 3});
  tile.FillWithColor(200, 200, 200);
  Image canvas(ImageDimensions{8, 8});

  canvas.CopyRect(tile, 1, 1, 0, 0, 5, 5);

  EXPECT_EQ(canvas.At(1, 1, 0), 200);
  EXPECT_EQ(canvas.At(2, 1, 0), 0);
  EXPECT_EQ(canvas.At(1, 2, 0), 0);
}

TEST(ImageTest, Equality) {
  Image a(ImageDimensions{2, 2});
  Image b(ImageDimensions{2, 2});
  EXPECT_EQ(a, b);
  b.At(1, 1, 1) = 7;
  EXPECT_FALSE(a == b);
}

}  // namespace folio
