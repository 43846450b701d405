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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_THRESHOLD_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_THRESHOLD_H_

#include <opencv2/core.hpp>

#include "absl/status/statusor.h"

namespace slidepatch::masking {

/// @brief Otsu threshold of a set of values
///
/// Values are binned by cv::calcHist into @p bins equal-width bins between
/// their minimum and maximum; the result is the center of the bin that
/// maximises the between-class variance. A constant input returns that
/// constant.
///
/// @param values Single-channel matrix of any shape and depth
/// @return Threshold, or kInvalidArgument for empty or multi-channel input
///         or bins < 2
absl::StatusOr<double> OtsuThreshold(const cv::Mat& values, int bins = 256);

/// @brief Percentile with linear interpolation between closest ranks
/// @param values Single-channel input values (need not be sorted)
/// @param percent Percentile in [0, 100]
absl::StatusOr<double> Percentile(const cv::Mat& values, double percent);

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_THRESHOLD_H_
