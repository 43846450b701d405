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

#include "slidepatch/readers/memory_reader.h"

#include <gtest/gtest.h>

#include <cstdint>

#include "absl/status/status.h"
#include "slidepatch/resample/average.h"

namespace slidepatch {
namespace {

Image MakeGradient(uint32_t width, uint32_t height) {
  Image image(ImageDimensions{width, height}, ImageFormat::kRGB,
              DataType::kUInt8);
  for (uint32_t y = 0; y < height; ++y) {
    for (uint32_t x = 0; x < width; ++x) {
      image.At<uint8_t>(y, x, 0) = static_cast<uint8_t>(x % 256);
      image.At<uint8_t>(y, x, 1) = static_cast<uint8_t>(y % 256);
      image.At<uint8_t>(y, x, 2) = 100;
    }
  }
  return image;
}

TEST(MemoryReaderTest, BuildsPyramidDownToMinimumSize) {
  auto reader = MemoryReader::Create(MakeGradient(1000, 600), SlideProperties(),
                                     "MEMORY", 128);
  ASSERT_TRUE(reader.ok()) << reader.status();

  // 1000 -> 500 -> 250 -> 125
  ASSERT_EQ((*reader)->GetLevelCount(), 4);
  auto level3 = (*reader)->GetLevelInfo(3);
  ASSERT_TRUE(level3.ok());
  EXPECT_EQ(level3->dimensions, (ImageDimensions{125, 75}));
  EXPECT_DOUBLE_EQ(level3->downsample_factor, 8.0);
}

TEST(MemoryReaderTest, ReadRegionCopiesPixels) {
  auto reader = MemoryReader::Create(MakeGradient(64, 48));
  ASSERT_TRUE(reader.ok()) << reader.status();

  auto image = (*reader)->ReadRegion(
      RegionSpec{.top_left = {10, 20}, .size = {5, 4}, .level = 0});
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->At<uint8_t>(0, 0, 0), 10);
  EXPECT_EQ(image->At<uint8_t>(3, 4, 0), 14);
  EXPECT_EQ(image->At<uint8_t>(3, 4, 1), 23);
  EXPECT_EQ(image->At<uint8_t>(3, 4, 2), 100);
}

TEST(MemoryReaderTest, RejectsRegionsOutsideLevel) {
  auto reader = MemoryReader::Create(MakeGradient(64, 48));
  ASSERT_TRUE(reader.ok()) << reader.status();

  EXPECT_EQ((*reader)
                ->ReadRegion(RegionSpec{
                    .top_left = {60, 0}, .size = {8, 8}, .level = 0})
                .status()
                .code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_FALSE((*reader)
                   ->ReadRegion(RegionSpec{
                       .top_left = {0, 0}, .size = {8, 8}, .level = 5})
                   .ok());
}

TEST(MemoryReaderTest, EmptyImageIsRejected) {
  EXPECT_EQ(MemoryReader::Create(Image()).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(AverageResampleTest, AveragesBlocksAndOddEdges) {
  Image image(ImageDimensions{3, 1}, ImageFormat::kGray, DataType::kUInt8);
  image.At<uint8_t>(0, 0, 0) = 10;
  image.At<uint8_t>(0, 1, 0) = 20;
  image.At<uint8_t>(0, 2, 0) = 41;

  const Image half = resample::Downsample2x(image);
  ASSERT_EQ(half.GetWidth(), 2U);
  ASSERT_EQ(half.GetHeight(), 1U);
  EXPECT_EQ(half.At<uint8_t>(0, 0, 0), 15);
  EXPECT_EQ(half.At<uint8_t>(0, 1, 0), 41);
}

}  // namespace
}  // namespace slidepatch
