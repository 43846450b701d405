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

#include "slidepatch/masking/polygon_mask.h"

#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "absl/status/status.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"
#include "slidepatch/utilities/opencv.h"

namespace slidepatch::masking {

absl::StatusOr<TissueMask> TissueMaskFromPolygons(
    const ImageDimensions& mask_dims, const Size<double, 2>& scale,
    const std::vector<Polygon>& polygons) {
  if (!(scale[0] > 0.0) || !(scale[1] > 0.0)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Polygon scale must be positive");
  }

  const bool empty = mask_dims[0] == 0 || mask_dims[1] == 0;
  cv::Mat canvas = cv::Mat::zeros(static_cast<int>(mask_dims[1]),
                                  static_cast<int>(mask_dims[0]), CV_8UC1);
  std::vector<cv::Point> points;
  for (size_t index = 0; index < polygons.size(); ++index) {
    const Polygon& polygon = polygons[index];
    if (polygon.size() < 3) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          slidepatch::fmt::format(
              "Polygon {} has {} vertices; at least 3 are required", index,
              polygon.size()));
    }
    if (empty) {
      continue;
    }

    points.clear();
    for (const PolygonVertex& vertex : polygon) {
      points.emplace_back(cvRound(vertex.x * scale[0]),
                          cvRound(vertex.y * scale[1]));
    }
    // One call per polygon: a single multi-contour call would treat
    // overlaps as holes
    const cv::Point* contour = points.data();
    const int count = static_cast<int>(points.size());
    cv::fillPoly(canvas, &contour, &count, 1, cv::Scalar(1), cv::LINE_8);
  }

  if (empty) {
    return TissueMask(mask_dims[0], mask_dims[1]);
  }
  return utilities::ToTissueMask(canvas);
}

}  // namespace slidepatch::masking
