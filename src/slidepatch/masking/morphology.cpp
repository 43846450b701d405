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

#include "slidepatch/masking/morphology.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "slidepatch/utilities/opencv.h"

namespace slidepatch::masking {

namespace {

cv::Mat SquareElement(uint32_t size) {
  const auto side = static_cast<int>(size);
  return cv::getStructuringElement(cv::MORPH_RECT, cv::Size(side, side));
}

}  // namespace

TissueMask BinaryDilate(const TissueMask& mask, uint32_t size) {
  if (size <= 1 || mask.Empty()) {
    return mask;
  }
  // OpenCV does not reflect the element, so the anchor is mirrored here to
  // make dilation and erosion adjoint for even sizes
  const auto s = static_cast<int>(size);
  const int anchor = s - 1 - s / 2;
  cv::Mat dilated;
  cv::dilate(utilities::AsMat(mask), dilated, SquareElement(size),
             cv::Point(anchor, anchor), 1, cv::BORDER_CONSTANT, cv::Scalar(0));
  return utilities::ToTissueMask(dilated);
}

TissueMask BinaryErode(const TissueMask& mask, uint32_t size) {
  if (size <= 1 || mask.Empty()) {
    return mask;
  }
  cv::Mat eroded;
  cv::erode(utilities::AsMat(mask), eroded, SquareElement(size),
            cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(1));
  return utilities::ToTissueMask(eroded);
}

TissueMask BinaryClose(const TissueMask& mask, uint32_t size) {
  return BinaryErode(BinaryDilate(mask, size), size);
}

TissueMask RemoveSmallObjects(const TissueMask& mask, double min_area) {
  if (mask.Empty() || min_area <= 1.0) {
    return mask;
  }

  cv::Mat labels;
  cv::Mat stats;
  cv::Mat centroids;
  const int count = cv::connectedComponentsWithStats(
      utilities::AsMat(mask), labels, stats, centroids, 4, CV_32S);

  // Label 0 is the background
  std::vector<uint8_t> keep(static_cast<size_t>(count), 0);
  for (int label = 1; label < count; ++label) {
    keep[static_cast<size_t>(label)] =
        stats.at<int>(label, cv::CC_STAT_AREA) >= min_area ? 1 : 0;
  }

  TissueMask result(mask.GetWidth(), mask.GetHeight());
  for (int y = 0; y < labels.rows; ++y) {
    const int* row = labels.ptr<int>(y);
    for (int x = 0; x < labels.cols; ++x) {
      if (keep[static_cast<size_t>(row[x])] != 0) {
        result.Set(static_cast<uint32_t>(x), static_cast<uint32_t>(y), true);
      }
    }
  }
  return result;
}

std::optional<PostProcessParams> ComputePostProcessParams(
    double overview_mpp, double element_size_um, double min_object_size_um2,
    uint32_t max_element_size) {
  if (!(overview_mpp > 0.0)) {
    return std::nullopt;
  }
  const double element =
      std::min(std::floor(element_size_um / overview_mpp),
               static_cast<double>(max_element_size));
  return PostProcessParams{
      .element_size = element > 0.0 ? static_cast<uint32_t>(element) : 0,
      .min_object_area = min_object_size_um2 / (overview_mpp * overview_mpp),
  };
}

TissueMask PostProcessMask(const TissueMask& mask, uint32_t element_size,
                           double min_object_area) {
  return RemoveSmallObjects(BinaryClose(mask, element_size), min_object_area);
}

}  // namespace slidepatch::masking
