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

#include <algorithm>
#include <cstdint>

#include "absl/status/status.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::tiling {

namespace {

// floor(value * numerator / denominator)
uint32_t ScaleFloor(uint64_t value, uint64_t numerator, uint64_t denominator) {
  return static_cast<uint32_t>(value * numerator / denominator);
}

// ceil(value * numerator / denominator)
uint32_t ScaleCeil(uint64_t value, uint64_t numerator, uint64_t denominator) {
  return static_cast<uint32_t>((value * numerator + denominator - 1) /
                               denominator);
}

}  // namespace

absl::StatusOr<CoordinateMapper> CoordinateMapper::Create(
    const ImageDimensions& full_dims, const ImageDimensions& mask_dims) {
  if (full_dims[0] == 0 || full_dims[1] == 0 || mask_dims[0] == 0 ||
      mask_dims[1] == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format(
            "Cannot map between {} and {}: dimensions must be positive",
            full_dims, mask_dims));
  }
  return CoordinateMapper(full_dims, mask_dims);
}

MaskRect CoordinateMapper::MapToMask(const Tile& tile) const {
  const uint32_t mw = mask_dims_[0];
  const uint32_t mh = mask_dims_[1];
  const uint32_t fw = full_dims_[0];
  const uint32_t fh = full_dims_[1];
  const uint64_t right = static_cast<uint64_t>(tile.x) + tile.width;
  const uint64_t bottom = static_cast<uint64_t>(tile.y) + tile.height;

  return MaskRect{.x0 = std::min(ScaleFloor(tile.x, mw, fw), mw),
                  .y0 = std::min(ScaleFloor(tile.y, mh, fh), mh),
                  .x1 = std::min(ScaleCeil(right, mw, fw), mw),
                  .y1 = std::min(ScaleCeil(bottom, mh, fh), mh)};
}

Tile CoordinateMapper::MapToFull(const MaskRect& rect) const {
  const uint32_t mw = mask_dims_[0];
  const uint32_t mh = mask_dims_[1];
  const uint32_t fw = full_dims_[0];
  const uint32_t fh = full_dims_[1];

  const uint32_t x = std::min(ScaleFloor(rect.x0, fw, mw), fw);
  const uint32_t y = std::min(ScaleFloor(rect.y0, fh, mh), fh);
  const uint32_t right = std::min(ScaleCeil(rect.x1, fw, mw), fw);
  const uint32_t bottom = std::min(ScaleCeil(rect.y1, fh, mh), fh);
  return Tile{.x = x,
              .y = y,
              .width = right > x ? right - x : 0,
              .height = bottom > y ? bottom - y : 0};
}

Size<double, 2> CoordinateMapper::GetScale() const {
  return Size<double, 2>{static_cast<double>(mask_dims_[0]) / full_dims_[0],
                         static_cast<double>(mask_dims_[1]) / full_dims_[1]};
}

}  // namespace slidepatch::tiling
