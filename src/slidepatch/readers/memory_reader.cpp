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

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "slidepatch/resample/average.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch {

absl::StatusOr<std::unique_ptr<MemoryReader>> MemoryReader::Create(
    Image level0, SlideProperties properties, std::string format_name,
    uint32_t min_level_size) {
  if (level0.Empty() || level0.GetWidth() == 0 || level0.GetHeight() == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot build a slide from an empty image");
  }

  std::unique_ptr<MemoryReader> reader(
      new MemoryReader(std::move(properties), std::move(format_name)));

  const double base_width = level0.GetWidth();
  reader->level_info_.emplace_back(level0.GetDimensions(), 1.0);
  reader->levels_.push_back(std::move(level0));

  while (true) {
    const Image& last = reader->levels_.back();
    if (std::max(last.GetWidth(), last.GetHeight()) <= min_level_size ||
        last.GetWidth() < 2 || last.GetHeight() < 2) {
      break;
    }
    Image next = resample::Downsample2x(last);
    reader->level_info_.emplace_back(next.GetDimensions(),
                                     base_width / next.GetWidth());
    reader->levels_.push_back(std::move(next));
  }

  return reader;
}

MemoryReader::MemoryReader(SlideProperties properties, std::string format_name)
    : properties_(std::move(properties)), format_name_(std::move(format_name)) {}

absl::StatusOr<LevelInfo> MemoryReader::GetLevelInfo(int level) const {
  if (level < 0 || level >= GetLevelCount()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Invalid level {} (slide has {} levels)",
                                level, GetLevelCount()));
  }
  return level_info_[static_cast<size_t>(level)];
}

absl::StatusOr<Image> MemoryReader::ReadRegion(const RegionSpec& region) const {
  if (!region.IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Region must have a positive size");
  }
  DECLARE_ASSIGN_OR_RETURN(LevelInfo, info, GetLevelInfo(region.level));
  if (static_cast<uint64_t>(region.top_left[0]) + region.size[0] >
          info.dimensions[0] ||
      static_cast<uint64_t>(region.top_left[1]) + region.size[1] >
          info.dimensions[1]) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidepatch::fmt::format("Region at {} of size {} exceeds level {} {}",
                                region.top_left, region.size, region.level,
                                info.dimensions));
  }

  const Image& source = levels_[static_cast<size_t>(region.level)];
  Image out(region.size, source.GetChannels(), source.GetDataType());

  const size_t pixel_bytes =
      source.GetChannels() * GetDataTypeSize(source.GetDataType());
  const size_t row_bytes = region.size[0] * pixel_bytes;
  for (uint32_t row = 0; row < region.size[1]; ++row) {
    const size_t src_offset =
        (static_cast<size_t>(region.top_left[1] + row) * source.GetWidth() +
         region.top_left[0]) *
        pixel_bytes;
    std::memcpy(out.GetData() + static_cast<size_t>(row) * row_bytes,
                source.GetData() + src_offset, row_bytes);
  }
  return out;
}

}  // namespace slidepatch
