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

#include "slidepatch/tiling/tile_grid.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::tiling {

namespace {

// Number of origins i * stride < extent whose tile passes the edge policy
uint32_t CountOrigins(uint32_t extent, uint32_t patch, uint32_t stride,
                      EdgePolicy edge_policy, double min_edge_fraction) {
  const auto count = static_cast<uint32_t>(
      (static_cast<uint64_t>(extent) + stride - 1) / stride);
  if (edge_policy == EdgePolicy::kClip) {
    return count;
  }

  // Clipped sizes only shrink with i, so the kept tiles form a prefix
  const double minimum = min_edge_fraction * patch;
  uint32_t kept = 0;
  while (kept < count) {
    const uint64_t origin = static_cast<uint64_t>(kept) * stride;
    const uint64_t clipped = std::min<uint64_t>(patch, extent - origin);
    if (static_cast<double>(clipped) < minimum) {
      break;
    }
    ++kept;
  }
  return kept;
}

}  // namespace

std::string_view GetName(EdgePolicy policy) {
  switch (policy) {
    case EdgePolicy::kClip:
      return "clip";
    case EdgePolicy::kDrop:
      return "drop";
  }
  return "unknown";
}

absl::StatusOr<EdgePolicy> ParseEdgePolicy(std::string_view name) {
  const std::string lowered = absl::AsciiStrToLower(name);
  if (lowered == "clip") {
    return EdgePolicy::kClip;
  }
  if (lowered == "drop") {
    return EdgePolicy::kDrop;
  }
  return MAKE_STATUS(
      absl::StatusCode::kInvalidArgument,
      slidepatch::fmt::format("Unknown edge policy '{}' (expected clip or drop)",
                              name));
}

absl::StatusOr<TileGrid> TileGrid::Create(const ImageDimensions& dimensions,
                                          const ImageDimensions& patch_size,
                                          const ImageDimensions& stride,
                                          EdgePolicy edge_policy,
                                          double min_edge_fraction) {
  if (dimensions[0] == 0 || dimensions[1] == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Slide dimensions must be positive, got {}",
                                dimensions));
  }
  if (patch_size[0] == 0 || patch_size[1] == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Patch size must be positive, got {}",
                                patch_size));
  }
  if (stride[0] == 0 || stride[1] == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Stride must be positive, got {}", stride));
  }
  if (!(min_edge_fraction > 0.0 && min_edge_fraction <= 1.0)) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format(
            "Minimum edge fraction must be in (0, 1], got {}",
            min_edge_fraction));
  }

  const uint32_t columns = CountOrigins(dimensions[0], patch_size[0], stride[0],
                                        edge_policy, min_edge_fraction);
  const uint32_t rows = CountOrigins(dimensions[1], patch_size[1], stride[1],
                                     edge_policy, min_edge_fraction);
  return TileGrid(dimensions, patch_size, stride, edge_policy, columns, rows);
}

TileGrid::TileGrid(const ImageDimensions& dimensions,
                   const ImageDimensions& patch_size,
                   const ImageDimensions& stride, EdgePolicy edge_policy,
                   uint32_t columns, uint32_t rows)
    : dimensions_(dimensions),
      patch_size_(patch_size),
      stride_(stride),
      edge_policy_(edge_policy),
      columns_(columns),
      rows_(rows) {}

Tile TileGrid::At(size_t index) const {
  const auto column = static_cast<uint32_t>(index % columns_);
  const auto row = static_cast<uint32_t>(index / columns_);
  const uint32_t x = column * stride_[0];
  const uint32_t y = row * stride_[1];
  return Tile{.x = x,
              .y = y,
              .width = std::min(patch_size_[0], dimensions_[0] - x),
              .height = std::min(patch_size_[1], dimensions_[1] - y)};
}

}  // namespace slidepatch::tiling
