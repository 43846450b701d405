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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_CORE_TILE_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_CORE_TILE_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "slidepatch/core/slide_descriptor.h"

/**
 * @file tile.h
 * @brief Tiles in level-0 space and their mask-space footprints
 *
 * These are aggregates so that they can be built with designated
 * initializers, e.g. `Tile{.x = 0, .y = 0, .width = 512, .height = 512}`.
 */

namespace slidepatch {
namespace core {

/// @brief Candidate region of the full-resolution slide
///
/// Tiles always refer to level 0; the grid generator guarantees that a tile
/// lies within the slide.
struct Tile {
  uint32_t x;       ///< Left edge in level-0 pixels
  uint32_t y;       ///< Top edge in level-0 pixels
  uint32_t width;   ///< Width in level-0 pixels
  uint32_t height;  ///< Height in level-0 pixels

  [[nodiscard]] bool IsValid() const noexcept {
    return width > 0 && height > 0;
  }

  /// @brief Region spec reading this tile at level 0
  [[nodiscard]] RegionSpec ToRegionSpec() const {
    return RegionSpec{.top_left = {x, y}, .size = {width, height}, .level = 0};
  }

  bool operator==(const Tile& other) const = default;
};

/// @brief Half-open rectangle [x0, x1) x [y0, y1) in mask pixels
struct MaskRect {
  uint32_t x0;
  uint32_t y0;
  uint32_t x1;
  uint32_t y1;

  [[nodiscard]] uint32_t Width() const noexcept {
    return x1 > x0 ? x1 - x0 : 0;
  }

  [[nodiscard]] uint32_t Height() const noexcept {
    return y1 > y0 ? y1 - y0 : 0;
  }

  [[nodiscard]] size_t Area() const noexcept {
    return static_cast<size_t>(Width()) * Height();
  }

  bool operator==(const MaskRect& other) const = default;
};

/// @brief Tile that passed the coverage filter
///
/// Created by the coverage filter; `index` and `output_path` are assigned by
/// the patch writer once the patch is persisted.
struct AcceptedPatch {
  size_t index;             ///< Position among written patches
  Tile tile;                ///< Footprint in level-0 pixels
  double coverage;          ///< Tissue fraction in [0, 1]
  std::string output_path;  ///< Where the patch was persisted
};

}  // namespace core

using core::AcceptedPatch;
using core::MaskRect;
using core::Tile;

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_CORE_TILE_H_
