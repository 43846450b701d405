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

#include "slidepatch/masking/strategies.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "slidepatch/errors.h"
#include "slidepatch/masking/masking_registry.h"

namespace slidepatch::masking {
namespace {

constexpr uint32_t kWidth = 64;
constexpr uint32_t kHeight = 32;

void SetPixel(Image& image, uint32_t x, uint32_t y, uint8_t r, uint8_t g,
              uint8_t b) {
  image.At<uint8_t>(y, x, 0) = r;
  image.At<uint8_t>(y, x, 1) = g;
  image.At<uint8_t>(y, x, 2) = b;
}

// Left half: textured stained tissue. Right half: flat near-white glass.
Image MakeOverview() {
  Image image(ImageDimensions{kWidth, kHeight}, ImageFormat::kRGB,
              DataType::kUInt8);
  for (uint32_t y = 0; y < kHeight; ++y) {
    for (uint32_t x = 0; x < kWidth; ++x) {
      if (x >= kWidth / 2) {
        SetPixel(image, x, y, 240, 240, 240);
      } else if ((x + y) % 2 == 0) {
        SetPixel(image, x, y, 180, 100, 160);
      } else {
        SetPixel(image, x, y, 150, 70, 140);
      }
    }
  }
  return image;
}

// Checks the halves away from the tissue/glass border
void ExpectLeftHalfIsTissue(const TissueMask& mask) {
  ASSERT_EQ(mask.GetDimensions(), (ImageDimensions{kWidth, kHeight}));
  for (uint32_t y = 0; y < kHeight; ++y) {
    for (uint32_t x = 0; x < kWidth / 2 - 6; ++x) {
      EXPECT_TRUE(mask.Get(x, y)) << "x=" << x << " y=" << y;
    }
    for (uint32_t x = kWidth / 2 + 6; x < kWidth; ++x) {
      EXPECT_FALSE(mask.Get(x, y)) << "x=" << x << " y=" << y;
    }
  }
}

class MaskingStrategyTest : public ::testing::TestWithParam<MaskingStrategy> {};

TEST_P(MaskingStrategyTest, FindsTissueOnTheLeft) {
  auto mask = GetParam().produce_mask(MakeOverview(), MaskingOptions());
  ASSERT_TRUE(mask.ok()) << mask.status();
  ExpectLeftHalfIsTissue(*mask);
}

TEST_P(MaskingStrategyTest, RejectsNonRgbInput) {
  Image gray(ImageDimensions{8, 8}, ImageFormat::kGray, DataType::kUInt8);
  auto mask = GetParam().produce_mask(gray, MaskingOptions());
  EXPECT_TRUE(IsErrorKind(mask.status(), ErrorKind::kUnsupportedFormat));

  Image wide(ImageDimensions{8, 8}, ImageFormat::kRGB, DataType::kUInt16);
  EXPECT_TRUE(IsErrorKind(GetParam().produce_mask(wide, {}).status(),
                          ErrorKind::kUnsupportedFormat));
}

TEST_P(MaskingStrategyTest, EmptyImageGivesEmptyMask) {
  Image empty(ImageDimensions{0, 0}, ImageFormat::kRGB, DataType::kUInt8);
  auto mask = GetParam().produce_mask(empty, MaskingOptions());
  ASSERT_TRUE(mask.ok()) << mask.status();
  EXPECT_TRUE(mask->Empty());
}

INSTANTIATE_TEST_SUITE_P(
    AllMethods, MaskingStrategyTest,
    ::testing::ValuesIn(GetMaskingStrategies()),
    [](const ::testing::TestParamInfo<MaskingStrategy>& info) {
      std::string name(info.param.name);
      for (char& c : name) {
        if (c == '-') {
          c = '_';
        }
      }
      return name;
    });

TEST(KMeansMaskTest, SameSeedSameMask) {
  MaskingOptions options;
  options.kmeans_seed = 1234;
  const Image overview = MakeOverview();

  auto first = MaskWithKMeans(overview, options);
  auto second = MaskWithKMeans(overview, options);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(*first, *second);
}

TEST(KMeansMaskTest, LighterPolarityInvertsForeground) {
  MaskingOptions options;
  options.kmeans_foreground = ForegroundPolarity::kLighter;

  auto mask = MaskWithKMeans(MakeOverview(), options);
  ASSERT_TRUE(mask.ok()) << mask.status();
  EXPECT_FALSE(mask->Get(0, 0));
  EXPECT_TRUE(mask->Get(kWidth - 1, kHeight - 1));
}

TEST(KMeansMaskTest, SingleColorHasNoTissue) {
  Image flat(ImageDimensions{16, 16}, ImageFormat::kRGB, DataType::kUInt8);
  for (uint32_t y = 0; y < 16; ++y) {
    for (uint32_t x = 0; x < 16; ++x) {
      SetPixel(flat, x, y, 90, 30, 90);
    }
  }
  auto mask = MaskWithKMeans(flat, MaskingOptions());
  ASSERT_TRUE(mask.ok());
  EXPECT_EQ(mask->CountTissue(), 0);
}

TEST(EntropyMaskTest, RejectsZeroFootprint) {
  MaskingOptions options;
  options.entropy_footprint = 0;
  EXPECT_EQ(MaskWithEntropy(MakeOverview(), options).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(EntropyMaskTest, SmallFootprintStillSeparatesTexture) {
  MaskingOptions options;
  options.entropy_footprint = 3;
  auto mask = MaskWithEntropy(MakeOverview(), options);
  ASSERT_TRUE(mask.ok()) << mask.status();
  ExpectLeftHalfIsTissue(*mask);
}

TEST(OtsuMaskTest, UniformImageHasNoTissue) {
  Image flat(ImageDimensions{8, 8}, ImageFormat::kRGB, DataType::kUInt8);
  auto mask = MaskWithOtsu(flat, MaskingOptions());
  ASSERT_TRUE(mask.ok());
  EXPECT_EQ(mask->CountTissue(), 0);
}

}  // namespace
}  // namespace slidepatch::masking
