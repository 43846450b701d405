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

#include "slidepatch/masking/morphology.h"

#include <gtest/gtest.h>

#include <cstdint>

namespace slidepatch::masking {
namespace {

TissueMask Square(uint32_t size, uint32_t x0, uint32_t y0, uint32_t side) {
  TissueMask mask(size, size);
  for (uint32_t y = y0; y < y0 + side; ++y) {
    for (uint32_t x = x0; x < x0 + side; ++x) {
      mask.Set(x, y, true);
    }
  }
  return mask;
}

TEST(MorphologyTest, DilateGrowsBySquareElement) {
  const TissueMask dilated = BinaryDilate(Square(11, 5, 5, 1), 3);
  EXPECT_EQ(dilated, Square(11, 4, 4, 3));
}

TEST(MorphologyTest, ErodeShrinksBySquareElement) {
  const TissueMask eroded = BinaryErode(Square(11, 4, 4, 3), 3);
  EXPECT_EQ(eroded, Square(11, 5, 5, 1));
}

TEST(MorphologyTest, EvenElementIsAnchoredConsistently) {
  // Dilation reaches up/left, erosion reaches back down/right
  const TissueMask dilated = BinaryDilate(Square(11, 5, 5, 1), 2);
  EXPECT_EQ(dilated, Square(11, 4, 4, 2));
  EXPECT_EQ(BinaryClose(Square(11, 5, 5, 1), 2), Square(11, 5, 5, 1));
}

TEST(MorphologyTest, ErosionTreatsOutsideAsTissue) {
  const TissueMask full(10, 10, true);
  EXPECT_EQ(BinaryErode(full, 5), full);
}

TEST(MorphologyTest, CloseFillsSmallHoles) {
  TissueMask mask(10, 10, true);
  mask.Set(5, 5, false);
  mask.Set(2, 7, false);
  EXPECT_EQ(BinaryClose(mask, 3), TissueMask(10, 10, true));
}

TEST(MorphologyTest, SmallElementsAreNoOps) {
  const TissueMask mask = Square(8, 2, 2, 3);
  EXPECT_EQ(BinaryDilate(mask, 0), mask);
  EXPECT_EQ(BinaryErode(mask, 1), mask);
}

TEST(RemoveSmallObjectsTest, RemovesComponentsBelowMinimum) {
  TissueMask mask(12, 12);
  // 2x2 component (4 px) and 3x3 component (9 px)
  for (uint32_t y = 0; y < 2; ++y) {
    for (uint32_t x = 0; x < 2; ++x) {
      mask.Set(x, y, true);
    }
  }
  for (uint32_t y = 6; y < 9; ++y) {
    for (uint32_t x = 6; x < 9; ++x) {
      mask.Set(x, y, true);
    }
  }

  const TissueMask strict = RemoveSmallObjects(mask, 5.0);
  EXPECT_EQ(strict.CountTissue(), 9);
  EXPECT_FALSE(strict.Get(0, 0));
  EXPECT_TRUE(strict.Get(7, 7));

  // A component of exactly the minimum size is kept
  EXPECT_EQ(RemoveSmallObjects(mask, 4.0).CountTissue(), 13);
}

TEST(RemoveSmallObjectsTest, DiagonalNeighborsAreSeparateComponents) {
  TissueMask mask(4, 4);
  mask.Set(1, 1, true);
  mask.Set(2, 2, true);
  EXPECT_EQ(RemoveSmallObjects(mask, 2.0).CountTissue(), 0);

  mask.Set(2, 1, true);
  EXPECT_EQ(RemoveSmallObjects(mask, 2.0).CountTissue(), 3);
}

TEST(PostProcessTest, ConvertsMicronsToOverviewPixels) {
  auto params = ComputePostProcessParams(16.0, 100.0, 2500.0, 1000);
  ASSERT_TRUE(params.has_value());
  EXPECT_EQ(params->element_size, 6);
  EXPECT_DOUBLE_EQ(params->min_object_area, 2500.0 / 256.0);

  EXPECT_FALSE(ComputePostProcessParams(0.0, 100.0, 2500.0, 1000).has_value());
  EXPECT_EQ(ComputePostProcessParams(200.0, 100.0, 2500.0, 1000)->element_size,
            0);
}

TEST(PostProcessTest, ElementIsBoundedByTheMask) {
  // A bogus, tiny resolution would otherwise overflow the element size
  auto params = ComputePostProcessParams(1e-9, 100.0, 2500.0, 64);
  ASSERT_TRUE(params.has_value());
  EXPECT_EQ(params->element_size, 64);

  EXPECT_EQ(ComputePostProcessParams(1e-300, 100.0, 2500.0, 512)->element_size,
            512);
  EXPECT_EQ(ComputePostProcessParams(16.0, 100.0, 2500.0, 4)->element_size, 4);
}

TEST(PostProcessTest, MaskSizedElementKeepsFullMask) {
  const TissueMask full(16, 12, true);
  EXPECT_EQ(PostProcessMask(full, 16, 1.0), full);
}

TEST(PostProcessTest, ClosesThenDropsSpecks) {
  TissueMask mask = Square(20, 2, 2, 8);
  mask.Set(5, 5, false);
  mask.Set(16, 16, true);

  const TissueMask cleaned = PostProcessMask(mask, 3, 10.0);
  EXPECT_TRUE(cleaned.Get(5, 5));
  EXPECT_FALSE(cleaned.Get(16, 16));
  EXPECT_EQ(cleaned.CountTissue(), 64);
}

}  // namespace
}  // namespace slidepatch::masking
