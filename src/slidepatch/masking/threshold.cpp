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

#include "slidepatch/masking/threshold.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "absl/status/status.h"
#include "slidepatch/status/status_macros.h"

namespace slidepatch::masking {

namespace {

absl::Status CheckSamples(const cv::Mat& values) {
  if (values.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot threshold an empty set of values");
  }
  if (values.channels() != 1) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Threshold input must have a single channel");
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<double> OtsuThreshold(const cv::Mat& values, int bins) {
  RETURN_IF_ERROR(CheckSamples(values));
  if (bins < 2) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Otsu threshold needs at least two bins");
  }

  cv::Mat samples;
  values.convertTo(samples, CV_32F);
  double lo = 0.0;
  double hi = 0.0;
  cv::minMaxLoc(samples, &lo, &hi);
  if (lo == hi) {
    return lo;
  }

  // calcHist ranges are half-open; nudge the top so the maximum is counted
  const float range[] = {
      static_cast<float>(lo),
      std::nextafter(static_cast<float>(hi),
                     std::numeric_limits<float>::infinity())};
  const float* ranges[] = {range};
  const int channels[] = {0};
  cv::Mat histogram;
  cv::calcHist(&samples, 1, channels, cv::Mat(), histogram, 1, &bins, ranges);

  const auto nbins = static_cast<size_t>(bins);
  const double bin_width = (hi - lo) / static_cast<double>(bins);
  std::vector<double> centers(nbins);
  for (size_t i = 0; i < nbins; ++i) {
    centers[i] = lo + (static_cast<double>(i) + 0.5) * bin_width;
  }

  // Class probabilities and means for every split point, from both ends
  std::vector<double> weight1(nbins);
  std::vector<double> mean1(nbins);
  double weight = 0.0;
  double moment = 0.0;
  for (size_t i = 0; i < nbins; ++i) {
    const double count = histogram.at<float>(static_cast<int>(i));
    weight += count;
    moment += count * centers[i];
    weight1[i] = weight;
    mean1[i] = weight > 0.0 ? moment / weight : 0.0;
  }

  std::vector<double> weight2(nbins);
  std::vector<double> mean2(nbins);
  weight = 0.0;
  moment = 0.0;
  for (size_t i = nbins; i-- > 0;) {
    const double count = histogram.at<float>(static_cast<int>(i));
    weight += count;
    moment += count * centers[i];
    weight2[i] = weight;
    mean2[i] = weight > 0.0 ? moment / weight : 0.0;
  }

  size_t best = 0;
  double best_variance = -1.0;
  for (size_t i = 0; i + 1 < nbins; ++i) {
    const double diff = mean1[i] - mean2[i + 1];
    const double variance = weight1[i] * weight2[i + 1] * diff * diff;
    if (variance > best_variance) {
      best_variance = variance;
      best = i;
    }
  }
  return centers[best];
}

absl::StatusOr<double> Percentile(const cv::Mat& values, double percent) {
  if (values.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot take the percentile of no values");
  }
  if (values.channels() != 1) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Percentile input must have a single channel");
  }
  if (percent < 0.0 || percent > 100.0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Percentile must be within [0, 100]");
  }

  cv::Mat samples;
  values.convertTo(samples, CV_64F);
  cv::Mat sorted;
  cv::sort(samples.reshape(1, 1), sorted,
           cv::SORT_EVERY_ROW | cv::SORT_ASCENDING);

  const auto count = static_cast<size_t>(sorted.cols);
  const double rank = percent / 100.0 * static_cast<double>(count - 1);
  const auto lower = static_cast<int>(std::floor(rank));
  const int upper = std::min(lower + 1, static_cast<int>(count) - 1);
  const double fraction = rank - static_cast<double>(lower);
  const double low_value = sorted.at<double>(0, lower);
  return low_value + (sorted.at<double>(0, upper) - low_value) * fraction;
}

}  // namespace slidepatch::masking
