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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_COVERAGE_FILTER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_COVERAGE_FILTER_H_

#include <cstddef>

#include "slidepatch/core/tile.h"
#include "slidepatch/masking/tissue_mask.h"
#include "slidepatch/tiling/coordinate_mapper.h"

/**
 * @file coverage_filter.h
 * @brief Tissue coverage of tiles
 *
 * Pure functions of (tile, mask, threshold): the same inputs always give the
 * same decision, which is what lets the extractor evaluate tiles on worker
 * threads.
 */

namespace slidepatch::tiling {

/// @brief Tissue statistics of a tile's mask footprint
struct CoverageResult {
  MaskRect rect;         ///< Footprint in mask pixels
  size_t tissue_pixels;  ///< Tissue pixels inside the footprint
  size_t area;           ///< Footprint area in mask pixels
  double coverage;       ///< tissue_pixels / area, 0 for an empty footprint
};

/// @brief Outcome of the coverage test
struct TileDecision {
  bool accepted;
  double coverage;
};

[[nodiscard]] CoverageResult ComputeCoverage(const Tile& tile,
                                             const TissueMask& mask,
                                             const CoordinateMapper& mapper);

/// @brief Accept a tile iff its footprint is non-empty and
///        coverage >= threshold
[[nodiscard]] TileDecision EvaluateTile(const Tile& tile,
                                        const TissueMask& mask,
                                        const CoordinateMapper& mapper,
                                        double threshold);

}  // namespace slidepatch::tiling

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_COVERAGE_FILTER_H_
