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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MORPHOLOGY_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MORPHOLOGY_H_

#include <cstdint>
#include <optional>

#include "slidepatch/masking/tissue_mask.h"

/**
 * @file morphology.h
 * @brief Binary morphology used to clean up tissue masks
 *
 * Implemented with OpenCV's cv::dilate and cv::erode. The structuring
 * element is a square of side @p size. For even sizes the
 * element is anchored at size / 2, so erosion looks at offsets
 * [-(size / 2), size - 1 - size / 2] and dilation at the reflected window.
 * Pixels outside the mask count as background for dilation and as tissue for
 * erosion, so a closing never eats into tissue touching the border.
 */

namespace slidepatch::masking {

/// @brief Binary dilation with a square element
[[nodiscard]] TissueMask BinaryDilate(const TissueMask& mask, uint32_t size);

/// @brief Binary erosion with a square element
[[nodiscard]] TissueMask BinaryErode(const TissueMask& mask, uint32_t size);

/// @brief Dilation followed by erosion
[[nodiscard]] TissueMask BinaryClose(const TissueMask& mask, uint32_t size);

/// @brief Remove 4-connected tissue components smaller than @p min_area
///
/// Components are labelled with cv::connectedComponentsWithStats.
/// @param mask Input mask
/// @param min_area Minimum component size in pixels; components with fewer
///        pixels are cleared
[[nodiscard]] TissueMask RemoveSmallObjects(const TissueMask& mask,
                                            double min_area);

/// @brief Post-processing parameters in overview pixels
struct PostProcessParams {
  uint32_t element_size;    ///< Closing element side
  double min_object_area;   ///< Components below this size are removed
};

/// @brief Convert physical post-processing sizes to overview pixels
/// @param overview_mpp Microns per overview pixel
/// @param element_size_um Closing element side in microns
/// @param min_object_size_um2 Minimum object area in square microns
/// @param max_element_size Upper bound on the element side, normally the
///        longest side of the mask
/// @return Parameters, or nullopt when @p overview_mpp is not positive
[[nodiscard]] std::optional<PostProcessParams> ComputePostProcessParams(
    double overview_mpp, double element_size_um, double min_object_size_um2,
    uint32_t max_element_size);

/// @brief Closing followed by small object removal
/// @param element_size Closing element side in pixels (0 or 1 skips it)
/// @param min_object_area Minimum component size in pixels
[[nodiscard]] TissueMask PostProcessMask(const TissueMask& mask,
                                         uint32_t element_size,
                                         double min_object_area);

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MORPHOLOGY_H_
