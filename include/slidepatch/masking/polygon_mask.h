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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_POLYGON_MASK_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_POLYGON_MASK_H_

#include <vector>

#include "absl/status/statusor.h"
#include "slidepatch/concepts/numeric.h"
#include "slidepatch/image.h"
#include "slidepatch/masking/tissue_mask.h"

namespace slidepatch::masking {

/// @brief Polygon vertex in level-0 pixels
struct PolygonVertex {
  double x;
  double y;
};

using Polygon = std::vector<PolygonVertex>;

/// @brief Rasterize annotation polygons into a tissue mask
///
/// Vertices are multiplied by @p scale (mask pixels per level-0 pixel),
/// rounded to the nearest mask pixel and filled with cv::fillPoly, so every
/// pixel inside or on the boundary of any polygon is set. Polygons may
/// overlap; the result is their union.
///
/// @param mask_dims Dimensions of the mask to produce
/// @param scale Per-axis mask / level-0 ratio
/// @param polygons Closed polygons; the last vertex connects to the first
/// @return Mask, or InvalidArgument for a polygon with fewer than 3 vertices
absl::StatusOr<TissueMask> TissueMaskFromPolygons(
    const ImageDimensions& mask_dims, const Size<double, 2>& scale,
    const std::vector<Polygon>& polygons);

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_POLYGON_MASK_H_
