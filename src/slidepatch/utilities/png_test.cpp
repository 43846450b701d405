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

#include "slidepatch/utilities/png.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <vector>

#include "absl/status/status.h"
#include "lodepng/lodepng.h"
#include "slidepatch/errors.h"
#include "slidepatch/utilities/temporary.h"

namespace slidepatch::utilities {
namespace {

TEST(PngTest, EncodedImageDecodesToSamePixels) {
  Image image(ImageDimensions{3, 2}, ImageFormat::kRGB, DataType::kUInt8);
  image.At<uint8_t>(1, 2, 0) = 200;
  image.At<uint8_t>(0, 1, 2) = 17;

  auto encoded = EncodePng(image);
  ASSERT_TRUE(encoded.ok()) << encoded.status();

  std::vector<unsigned char> decoded;
  unsigned width = 0;
  unsigned height = 0;
  ASSERT_EQ(lodepng::decode(decoded, width, height, *encoded, LCT_RGB, 8), 0U);
  EXPECT_EQ(width, 3U);
  EXPECT_EQ(height, 2U);
  EXPECT_EQ(decoded, std::vector<unsigned char>(
                         image.GetData(), image.GetData() + image.SizeBytes()));
}

TEST(PngTest, GrayMaskIsSingleChannel) {
  Image mask(ImageDimensions{4, 4}, ImageFormat::kGray, DataType::kUInt8);
  mask.At<uint8_t>(2, 2, 0) = 255;
  auto encoded = EncodePng(mask);
  ASSERT_TRUE(encoded.ok()) << encoded.status();

  lodepng::State state;
  unsigned width = 0;
  unsigned height = 0;
  ASSERT_EQ(lodepng_inspect(&width, &height, &state, encoded->data(),
                            encoded->size()),
            0U);
  EXPECT_EQ(state.info_png.color.colortype, LCT_GREY);
}

TEST(PngTest, RejectsWidePixels) {
  Image wide(ImageDimensions{2, 2}, ImageFormat::kRGB, DataType::kUInt16);
  auto encoded = EncodePng(wide);
  ASSERT_FALSE(encoded.ok());
  EXPECT_TRUE(IsErrorKind(encoded.status(), ErrorKind::kUnsupportedFormat));
}

TEST(PngTest, WriteFailureIsWriteError) {
  TemporaryDirectory temp;
  Image image(ImageDimensions{1, 1}, ImageFormat::kRGB, DataType::kUInt8);
  EXPECT_TRUE(WritePng(temp.Path() / "ok.png", image).ok());
  EXPECT_TRUE(std::filesystem::exists(temp.Path() / "ok.png"));

  const absl::Status status =
      WritePng(temp.Path() / "missing" / "dir" / "x.png", image);
  EXPECT_TRUE(IsErrorKind(status, ErrorKind::kWrite));
}

}  // namespace
}  // namespace slidepatch::utilities
