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

#include "slidepatch/tiling/coordinate_mapper.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>

#include "absl/status/status.h"
#include "slidepatch/tiling/tile_grid.h"

namespace slidepatch::tiling {
namespace {

TEST(CoordinateMapperTest, ExactRatio) {
  auto mapper = CoordinateMapper::Create({10000, 10000}, {100, 100});
  ASSERT_TRUE(mapper.ok()) << mapper.status();

  EXPECT_EQ(mapper->MapToMask(
                Tile{.x = 0, .y = 0, .width = 1000, .height = 1000}),
            (MaskRect{.x0 = 0, .y0 = 0, .x1 = 10, .y1 = 10}));
  EXPECT_EQ(mapper->MapToMask(
                Tile{.x = 9000, .y = 4000, .width = 1000, .height = 1000}),
            (MaskRect{.x0 = 90, .y0 = 40, .x1 = 100, .y1 = 50}));
  EXPECT_DOUBLE_EQ(mapper->GetScale()[0], 0.01);
}

TEST(CoordinateMapperTest, FloorsStartAndCeilsEnd) {
  auto mapper = CoordinateMapper::Create({1000, 1000}, {333, 333});
  ASSERT_TRUE(mapper.ok());

  // 100 * 0.333 = 33.3, 300 * 0.333 = 99.9
  const MaskRect rect =
      mapper->MapToMask(Tile{.x = 100, .y = 0, .width = 200, .height = 10});
  EXPECT_EQ(rect.x0, 33);
  EXPECT_EQ(rect.x1, 100);
  EXPECT_EQ(rect.y0, 0);
  EXPECT_EQ(rect.y1, 4);
}

TEST(CoordinateMapperTest, ClampsToMask) {
  auto mapper = CoordinateMapper::Create({1001, 999}, {10, 10});
  ASSERT_TRUE(mapper.ok());
  const MaskRect rect =
      mapper->MapToMask(Tile{.x = 900, .y = 900, .width = 101, .height = 99});
  EXPECT_LE(rect.x1, 10);
  EXPECT_LE(rect.y1, 10);
  EXPECT_GT(rect.Area(), 0);
}

TEST(CoordinateMapperTest, RoundTripEnclosesTile) {
  const ImageDimensions full{4567, 3210};
  for (const ImageDimensions& mask : {ImageDimensions{4567, 3210},
                                      ImageDimensions{2283, 1605},
                                      ImageDimensions{100, 70},
                                      ImageDimensions{37, 29}}) {
    auto mapper = CoordinateMapper::Create(full, mask);
    ASSERT_TRUE(mapper.ok());
    auto grid = TileGrid::Create(full, {300, 300}, {250, 250});
    ASSERT_TRUE(grid.ok());

    for (const Tile& tile : *grid) {
      const Tile back = mapper->MapToFull(mapper->MapToMask(tile));
      EXPECT_LE(back.x, tile.x);
      EXPECT_LE(back.y, tile.y);
      EXPECT_GE(back.x + back.width, tile.x + tile.width);
      EXPECT_GE(back.y + back.height, tile.y + tile.height);
    }
  }
}

TEST(CoordinateMapperTest, MappingIsMonotonic) {
  auto mapper = CoordinateMapper::Create({5000, 5000}, {77, 77});
  ASSERT_TRUE(mapper.ok());
  MaskRect previous = mapper->MapToMask(Tile{0, 0, 64, 64});
  for (uint32_t x = 64; x < 5000; x += 64) {
    const MaskRect current = mapper->MapToMask(Tile{x, 0, 64, 64});
    EXPECT_GE(current.x0, previous.x0);
    EXPECT_GE(current.x1, previous.x1);
    previous = current;
  }
}

TEST(CoordinateMapperTest, RejectsZeroDimensions) {
  EXPECT_EQ(CoordinateMapper::Create({0, 10}, {1, 1}).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_FALSE(CoordinateMapper::Create({10, 10}, {1, 0}).ok());
}

}  // namespace
}  // namespace slidepatch::tiling
