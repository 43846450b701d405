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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_COLOR_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_COLOR_H_

#include <opencv2/core.hpp>

#include "absl/status/status.h"
#include "slidepatch/image.h"

/**
 * @file color.h
 * @brief Per-pixel color representations used by the masking methods
 *
 * All functions take interleaved RGB uint8 images and return a
 * single-channel matrix with the image's height and width.
 */

namespace slidepatch::masking {

absl::Status CheckRgb8(const Image& image);

/// @brief Rec. 709 luminance in [0, 1] (CV_64F)
cv::Mat ToLuminance(const Image& rgb);

/// @brief Rec. 709 luminance scaled and rounded to [0, 255] (CV_8U)
cv::Mat ToGray8(const Image& rgb);

/// @brief CIE-Lab L* in [0, 100] (CV_32F)
cv::Mat ToLabLightness(const Image& rgb);

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_COLOR_H_
