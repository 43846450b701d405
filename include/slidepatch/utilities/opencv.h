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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_OPENCV_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_OPENCV_H_

#include <opencv2/core.hpp>

#include "slidepatch/image.h"
#include "slidepatch/masking/tissue_mask.h"

/**
 * @file opencv.h
 * @brief Zero-copy cv::Mat views over slidepatch images and masks
 *
 * The returned matrices alias the source buffer: the source must outlive
 * the view, and OpenCV functions must write into a separate destination.
 */

namespace slidepatch::utilities {

/// @brief OpenCV type (depth and channels) of an image
[[nodiscard]] int GetOpenCvType(const Image& image);

/// @brief View an interleaved image as a rows x cols matrix
[[nodiscard]] cv::Mat AsMat(const Image& image);

/// @brief View a mask as a CV_8UC1 matrix of 0 / 1
[[nodiscard]] cv::Mat AsMat(const TissueMask& mask);

/// @brief Copy a single-channel matrix into a mask (non-zero = tissue)
[[nodiscard]] TissueMask ToTissueMask(const cv::Mat& mat);

/// @brief Copy a CV_8U matrix with 1, 3 or 4 channels into an image
[[nodiscard]] Image ToImage(const cv::Mat& mat);

}  // namespace slidepatch::utilities

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_OPENCV_H_
