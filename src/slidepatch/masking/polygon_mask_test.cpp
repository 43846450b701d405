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

#include "slidepatch/masking/polygon_mask.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "absl/status/status.h"

namespace slidepatch::masking {
namespace {

TEST(PolygonMaskTest, RectangleIsBoundaryInclusive) {
  const Polygon rectangle = {{0, 0}, {10, 0}, {10, 5}, {0, 5}};
  auto mask = TissueMaskFromPolygons(ImageDimensions{15, 15},
                                     Size<double, 2>{1.0, 1.0}, {rectangle});
  ASSERT_TRUE(mask.ok()) << mask.status();

  for (uint32_t y = 0; y < 15; ++y) {
    for (uint32_t x = 0; x < 15; ++x) {
      EXPECT_EQ(mask->Get(x, y), x <= 10 && y <= 5) << x << "," << y;
    }
  }
}

TEST(PolygonMaskTest, VerticesAreScaledIntoMaskSpace) {
  const Polygon rectangle = {{0, 0}, {40, 0}, {40, 20}, {0, 20}};
  auto mask = TissueMaskFromPolygons(ImageDimensions{15, 15},
                                     Size<double, 2>{0.25, 0.25}, {rectangle});
  ASSERT_TRUE(mask.ok()) << mask.status();
  EXPECT_EQ(mask->CountTissue(), 11 * 6);
  EXPECT_TRUE(mask->Get(10, 5));
  EXPECT_FALSE(mask->Get(11, 5));
}

TEST(PolygonMaskTest, TriangleIncludesDiagonalEdge) {
  const Polygon triangle = {{0, 0}, {8, 0}, {0, 8}};
  auto mask = TissueMaskFromPolygons(ImageDimensions{12, 12},
                                     Size<double, 2>{1.0, 1.0}, {triangle});
  ASSERT_TRUE(mask.ok()) << mask.status();
  for (uint32_t y = 0; y < 12; ++y) {
    for (uint32_t x = 0; x < 12; ++x) {
      EXPECT_EQ(mask->Get(x, y), x + y <= 8) << x << "," << y;
    }
  }
}

TEST(PolygonMaskTest, ClipsToMaskAndUnitesPolygons) {
  const Polygon outside = {{5, 5}, {30, 5}, {30, 30}, {5, 30}};
  const Polygon corner = {{0, 0}, {1, 0}, {1, 1}, {0, 1}};
  auto mask = TissueMaskFromPolygons(ImageDimensions{15, 15},
                                     Size<double, 2>{1.0, 1.0},
                                     {outside, corner});
  ASSERT_TRUE(mask.ok()) << mask.status();
  EXPECT_EQ(mask->CountTissue(), 100 + 4);
}

TEST(PolygonMaskTest, OverlappingPolygonsAreUnited) {
  const Polygon left = {{0, 0}, {6, 0}, {6, 6}, {0, 6}};
  const Polygon right = {{3, 0}, {9, 0}, {9, 6}, {3, 6}};
  auto mask = TissueMaskFromPolygons(ImageDimensions{12, 12},
                                     Size<double, 2>{1.0, 1.0}, {left, right});
  ASSERT_TRUE(mask.ok()) << mask.status();
  EXPECT_EQ(mask->CountTissue(), 10 * 7);
  EXPECT_TRUE(mask->Get(4, 3));
}

TEST(PolygonMaskTest, RejectsDegeneratePolygons) {
  const Polygon segment = {{0, 0}, {5, 5}};
  EXPECT_EQ(TissueMaskFromPolygons(ImageDimensions{10, 10},
                                   Size<double, 2>{1.0, 1.0}, {segment})
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_FALSE(TissueMaskFromPolygons(ImageDimensions{10, 10},
                                      Size<double, 2>{0.0, 1.0}, {})
                   .ok());
}

}  // namespace
}  // namespace slidepatch::masking
