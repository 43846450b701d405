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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_COORDINATE_MAPPER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_COORDINATE_MAPPER_H_

#include "absl/status/statusor.h"
#include "slidepatch/concepts/numeric.h"
#include "slidepatch/core/tile.h"
#include "slidepatch/image.h"

namespace slidepatch::tiling {

/// @brief Maps tiles between level-0 space and mask space
///
/// The per-axis ratio is mask / full. Mapping to the mask floors the top-left
/// corner, ceils the bottom-right corner and clamps to the mask, so that the
/// mask rectangle covers every mask pixel the tile touches. All arithmetic is
/// done on integers; an exact ratio such as 1/100 never picks up
/// floating-point noise.
class CoordinateMapper {
 public:
  /// @brief Create a mapper
  /// @return Mapper, or InvalidArgument if any dimension is zero
  static absl::StatusOr<CoordinateMapper> Create(
      const ImageDimensions& full_dims, const ImageDimensions& mask_dims);

  /// @brief Mask rectangle covering @p tile
  [[nodiscard]] MaskRect MapToMask(const Tile& tile) const;

  /// @brief Level-0 tile covering @p rect
  ///
  /// For ratios in (0, 1], MapToFull(MapToMask(t)) encloses t.
  [[nodiscard]] Tile MapToFull(const MaskRect& rect) const;

  /// @brief Mask pixels per level-0 pixel, per axis
  [[nodiscard]] Size<double, 2> GetScale() const;

  [[nodiscard]] const ImageDimensions& GetFullDimensions() const {
    return full_dims_;
  }

  [[nodiscard]] const ImageDimensions& GetMaskDimensions() const {
    return mask_dims_;
  }

 private:
  CoordinateMapper(const ImageDimensions& full_dims,
                   const ImageDimensions& mask_dims)
      : full_dims_(full_dims), mask_dims_(mask_dims) {}

  ImageDimensions full_dims_;
  ImageDimensions mask_dims_;
};

}  // namespace slidepatch::tiling

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_COORDINATE_MAPPER_H_
