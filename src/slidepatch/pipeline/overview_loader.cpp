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

#include "slidepatch/pipeline/overview_loader.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::pipeline {

namespace {

template <typename T, typename ToByte>
void ConvertPixels(const Image& in, Image& out, ToByte to_byte) {
  const T* src = in.GetDataAs<T>();
  uint8_t* dst = out.GetData();
  const uint32_t channels = in.GetChannels();
  const size_t count = in.GetPixelCount();
  for (size_t i = 0; i < count; ++i) {
    const T* pixel = src + i * channels;
    uint8_t* rgb = dst + i * 3;
    if (channels == 1) {
      rgb[0] = rgb[1] = rgb[2] = to_byte(pixel[0]);
    } else {
      rgb[0] = to_byte(pixel[0]);
      rgb[1] = to_byte(pixel[1]);
      rgb[2] = to_byte(pixel[2]);
    }
  }
}

absl::Status AsDecodeError(absl::Status status) {
  const ErrorKind kind = GetErrorKind(status);
  if (kind == ErrorKind::kNone || kind == ErrorKind::kTileRead) {
    return WithErrorKind(std::move(status), ErrorKind::kDecode);
  }
  return status;
}

}  // namespace

absl::StatusOr<int> SelectOverviewLevel(const SlideReader& reader,
                                        uint32_t target_size) {
  if (target_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Overview target size must be positive");
  }
  const int level_count = reader.GetLevelCount();
  if (level_count <= 0) {
    return MAKE_ERROR(ErrorKind::kDecode, "Slide has no pyramid levels");
  }

  int best_level = 0;
  uint32_t best_side = 0;
  for (int level = 0; level < level_count; ++level) {
    auto info = reader.GetLevelInfo(level);
    if (!info.ok()) {
      return AsDecodeError(info.status());
    }
    const uint32_t side = std::max(info->dimensions[0], info->dimensions[1]);
    if (side >= target_size && (best_side == 0 || side < best_side)) {
      best_side = side;
      best_level = level;
    }
  }
  return best_level;
}

absl::StatusOr<Image> ConvertToRGB8(const Image& image) {
  const uint32_t channels = image.GetChannels();
  if (channels != 1 && channels != 3 && channels != 4) {
    return MAKE_ERROR(
        ErrorKind::kUnsupportedFormat,
        slidepatch::fmt::format("Cannot convert {} channel(s) to RGB",
                                channels));
  }
  if (image.IsRGB8()) {
    return image;
  }

  Image rgb(image.GetDimensions(), ImageFormat::kRGB, DataType::kUInt8);
  switch (image.GetDataType()) {
    case DataType::kUInt8:
      ConvertPixels<uint8_t>(image, rgb, [](uint8_t v) { return v; });
      break;
    case DataType::kUInt16:
      ConvertPixels<uint16_t>(image, rgb, [](uint16_t v) {
        return static_cast<uint8_t>((static_cast<uint32_t>(v) + 128) / 257);
      });
      break;
    case DataType::kFloat32:
      ConvertPixels<float>(image, rgb, [](float v) {
        const float scaled = std::round(std::clamp(v, 0.0f, 1.0f) * 255.0f);
        return static_cast<uint8_t>(scaled);
      });
      break;
    default:
      return MAKE_ERROR(ErrorKind::kUnsupportedFormat,
                        slidepatch::fmt::format("Cannot convert {} to RGB",
                                                GetName(image.GetDataType())));
  }
  return rgb;
}

absl::StatusOr<Overview> LoadOverview(const SlideReader& reader,
                                      uint32_t target_size) {
  DECLARE_ASSIGN_OR_RETURN(int, level,
                           SelectOverviewLevel(reader, target_size));

  auto info = reader.GetLevelInfo(level);
  if (!info.ok()) {
    return AsDecodeError(info.status());
  }

  const RegionSpec region{
      .top_left = {0, 0}, .size = info->dimensions, .level = level};
  auto pixels = reader.ReadRegion(region);
  if (!pixels.ok()) {
    return AsDecodeError(pixels.status());
  }

  DECLARE_ASSIGN_OR_RETURN(Image, rgb, ConvertToRGB8(*pixels));
  VLOG(1) << "Overview from level " << level << " (" << info->dimensions
          << ", downsample " << info->downsample_factor << ")";

  return Overview{.image = std::move(rgb),
                  .level = level,
                  .downsample = info->downsample_factor,
                  .full_dimensions = reader.GetDimensions()};
}

}  // namespace slidepatch::pipeline
