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

#include "slidepatch/masking/tissue_mask.h"

#include <algorithm>
#include <cstring>
#include <numeric>

#include "absl/status/status.h"
#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch {

absl::StatusOr<TissueMask> TissueMask::FromImage(const Image& image) {
  if (image.GetChannels() != 1 || image.GetDataType() != DataType::kUInt8) {
    return MAKE_ERROR(
        ErrorKind::kUnsupportedFormat,
        slidepatch::fmt::format(
            "Mask image must be single-channel uint8, got {} channel(s) of {}",
            image.GetChannels(), GetName(image.GetDataType())));
  }

  TissueMask mask(image.GetWidth(), image.GetHeight());
  const uint8_t* pixels = image.GetData();
  std::transform(pixels, pixels + mask.data_.size(), mask.data_.begin(),
                 [](uint8_t value) -> uint8_t { return value != 0 ? 1 : 0; });
  return mask;
}

size_t TissueMask::CountTissue() const {
  return std::accumulate(data_.begin(), data_.end(), size_t{0});
}

size_t TissueMask::CountTissue(const MaskRect& rect) const {
  const uint32_t x1 = std::min(rect.x1, width_);
  const uint32_t y1 = std::min(rect.y1, height_);
  size_t count = 0;
  for (uint32_t y = rect.y0; y < y1; ++y) {
    const uint8_t* row = data_.data() + static_cast<size_t>(y) * width_;
    for (uint32_t x = rect.x0; x < x1; ++x) {
      count += row[x];
    }
  }
  return count;
}

Image TissueMask::ToImage() const {
  Image image(GetDimensions(), ImageFormat::kGray, DataType::kUInt8);
  std::transform(data_.begin(), data_.end(), image.GetData(),
                 [](uint8_t value) -> uint8_t { return value != 0 ? 255 : 0; });
  return image;
}

absl::StatusOr<Image> ApplyMask(const Image& rgb, const TissueMask& mask) {
  if (!rgb.IsRGB8()) {
    return MAKE_ERROR(ErrorKind::kUnsupportedFormat,
                      "Masked overview requires an RGB uint8 image");
  }
  if (rgb.GetWidth() != mask.GetWidth() ||
      rgb.GetHeight() != mask.GetHeight()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Mask {} does not match overview {}",
                                mask.GetDimensions(), rgb.GetDimensions()));
  }

  Image masked = rgb;
  uint8_t* pixels = masked.GetData();
  const std::vector<uint8_t>& tissue = mask.GetData();
  for (size_t i = 0; i < tissue.size(); ++i) {
    if (tissue[i] == 0) {
      std::memset(pixels + i * 3, 0, 3);
    }
  }
  return masked;
}

}  // namespace slidepatch
