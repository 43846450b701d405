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

#include "slidepatch/tiling/coverage_filter.h"

#include <cstddef>

namespace slidepatch::tiling {

CoverageResult ComputeCoverage(const Tile& tile, const TissueMask& mask,
                               const CoordinateMapper& mapper) {
  const MaskRect rect = mapper.MapToMask(tile);
  const size_t area = rect.Area();
  const size_t tissue = area > 0 ? mask.CountTissue(rect) : 0;
  return CoverageResult{
      .rect = rect,
      .tissue_pixels = tissue,
      .area = area,
      .coverage = area > 0 ? static_cast<double>(tissue) /
                                 static_cast<double>(area)
                           : 0.0};
}

TileDecision EvaluateTile(const Tile& tile, const TissueMask& mask,
                          const CoordinateMapper& mapper, double threshold) {
  const CoverageResult result = ComputeCoverage(tile, mask, mapper);
  return TileDecision{
      .accepted = result.area > 0 && result.coverage >= threshold,
      .coverage = result.coverage};
}

}  // namespace slidepatch::tiling
