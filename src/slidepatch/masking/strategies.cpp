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

#include "slidepatch/masking/strategies.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

#include "absl/status/status.h"
#include "slidepatch/masking/color.h"
#include "slidepatch/masking/threshold.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/opencv.h"

namespace slidepatch::masking {

namespace {

double CenterLuminance(const cv::Mat& centers, int row) {
  return 0.2125 * centers.at<float>(row, 0) +
         0.7154 * centers.at<float>(row, 1) +
         0.0721 * centers.at<float>(row, 2);
}

/// Restores the calling thread's OpenCV RNG on scope exit
class ScopedRngSeed {
 public:
  explicit ScopedRngSeed(uint64_t seed) : saved_(cv::theRNG()) {
    cv::theRNG() = cv::RNG(seed);
  }
  ~ScopedRngSeed() { cv::theRNG() = saved_; }

  ScopedRngSeed(const ScopedRngSeed&) = delete;
  ScopedRngSeed& operator=(const ScopedRngSeed&) = delete;

 private:
  cv::RNG saved_;
};

// x * log2(x) for integer counts, with 0 log 0 = 0
std::vector<double> CountLogTable(size_t max_count) {
  std::vector<double> table(max_count + 1, 0.0);
  for (size_t c = 1; c <= max_count; ++c) {
    const auto value = static_cast<double>(c);
    table[c] = value * std::log2(value);
  }
  return table;
}

/// Sliding-window histogram over an 8-bit image
class WindowHistogram {
 public:
  explicit WindowHistogram(const std::vector<double>* count_log)
      : counts_{}, total_(0), sum_count_log_(0.0), count_log_(count_log) {}

  void Add(uint8_t value) {
    uint32_t& count = counts_[value];
    sum_count_log_ += (*count_log_)[count + 1] - (*count_log_)[count];
    ++count;
    ++total_;
  }

  void Remove(uint8_t value) {
    uint32_t& count = counts_[value];
    sum_count_log_ += (*count_log_)[count - 1] - (*count_log_)[count];
    --count;
    --total_;
  }

  /// Shannon entropy in bits: log2(N) - sum(c log2 c) / N
  [[nodiscard]] double Entropy() const {
    if (total_ == 0) {
      return 0.0;
    }
    const auto n = static_cast<double>(total_);
    return std::max(0.0, std::log2(n) - sum_count_log_ / n);
  }

 private:
  std::array<uint32_t, 256> counts_;
  size_t total_;
  double sum_count_log_;
  const std::vector<double>* count_log_;
};

/// Local entropy of every pixel over a footprint x footprint window
cv::Mat LocalEntropy(const cv::Mat& gray, int64_t footprint) {
  const int64_t lo = -(footprint / 2);
  const int64_t hi = footprint - 1 + lo;
  const std::vector<double> count_log =
      CountLogTable(static_cast<size_t>(footprint * footprint));

  const int64_t w = gray.cols;
  const int64_t h = gray.rows;
  cv::Mat entropy(gray.rows, gray.cols, CV_64F);

  for (int64_t y = 0; y < h; ++y) {
    const int64_t y0 = std::max<int64_t>(0, y + lo);
    const int64_t y1 = std::min<int64_t>(h - 1, y + hi);
    auto add_column = [&](WindowHistogram& histogram, int64_t x, bool add) {
      if (x < 0 || x >= w) {
        return;
      }
      for (int64_t yy = y0; yy <= y1; ++yy) {
        const uint8_t value =
            gray.at<uint8_t>(static_cast<int>(yy), static_cast<int>(x));
        if (add) {
          histogram.Add(value);
        } else {
          histogram.Remove(value);
        }
      }
    };

    double* row = entropy.ptr<double>(static_cast<int>(y));
    WindowHistogram histogram(&count_log);
    for (int64_t x = lo; x <= hi; ++x) {
      add_column(histogram, x, true);
    }
    row[0] = histogram.Entropy();
    for (int64_t x = 1; x < w; ++x) {
      add_column(histogram, x - 1 + lo, false);
      add_column(histogram, x + hi, true);
      row[x] = histogram.Entropy();
    }
  }
  return entropy;
}

}  // namespace

absl::StatusOr<TissueMask> MaskWithOtsu(const Image& rgb,
                                        const MaskingOptions& /*options*/) {
  RETURN_IF_ERROR(CheckRgb8(rgb));
  if (rgb.GetPixelCount() == 0) {
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  const cv::Mat luminance = ToLuminance(rgb);
  DECLARE_ASSIGN_OR_RETURN(double, threshold, OtsuThreshold(luminance));
  return utilities::ToTissueMask(luminance < threshold);
}

absl::StatusOr<TissueMask> MaskWithKMeans(const Image& rgb,
                                          const MaskingOptions& options) {
  RETURN_IF_ERROR(CheckRgb8(rgb));
  const size_t count = rgb.GetPixelCount();
  if (count == 0) {
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  // One row of three float samples per pixel
  cv::Mat samples;
  utilities::AsMat(rgb)
      .reshape(1, static_cast<int>(count))
      .convertTo(samples, CV_32F);

  cv::Mat lowest;
  cv::Mat highest;
  cv::reduce(samples, lowest, 0, cv::REDUCE_MIN);
  cv::reduce(samples, highest, 0, cv::REDUCE_MAX);
  if (cv::countNonZero(lowest != highest) == 0) {
    // Single color: nothing to separate
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  cv::Mat labels;
  cv::Mat centers;
  {
    const ScopedRngSeed seed(options.kmeans_seed);
    cv::kmeans(samples, 2, labels,
               cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT,
                                static_cast<int>(options.kmeans_max_iterations),
                                1e-3),
               1, cv::KMEANS_PP_CENTERS, centers);
  }

  const bool first_is_darker =
      CenterLuminance(centers, 0) <= CenterLuminance(centers, 1);
  const int tissue_label =
      (options.kmeans_foreground == ForegroundPolarity::kDarker) ==
              first_is_darker
          ? 0
          : 1;
  return utilities::ToTissueMask(
      labels.reshape(1, static_cast<int>(rgb.GetHeight())) == tissue_label);
}

absl::StatusOr<TissueMask> MaskWithEntropy(const Image& rgb,
                                           const MaskingOptions& options) {
  RETURN_IF_ERROR(CheckRgb8(rgb));
  if (options.entropy_footprint == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Entropy footprint must be at least one pixel");
  }
  if (rgb.GetPixelCount() == 0) {
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  const cv::Mat entropy = LocalEntropy(
      ToGray8(rgb), static_cast<int64_t>(options.entropy_footprint));
  DECLARE_ASSIGN_OR_RETURN(double, threshold, OtsuThreshold(entropy));
  return utilities::ToTissueMask(entropy > threshold);
}

absl::StatusOr<TissueMask> MaskWithSchreiber(const Image& rgb,
                                             const MaskingOptions& /*options*/) {
  RETURN_IF_ERROR(CheckRgb8(rgb));
  if (rgb.GetPixelCount() == 0) {
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  cv::Mat samples;
  utilities::AsMat(rgb).convertTo(samples, CV_64F, 1.0 / 255.0);
  std::vector<cv::Mat> planes;
  cv::split(samples, planes);
  const cv::Mat red_minus_green = planes[0] - planes[1];
  const cv::Mat blue_minus_green = planes[2] - planes[1];
  const cv::Mat red_excess = cv::max(red_minus_green, 0.0);
  const cv::Mat blue_excess = cv::max(blue_minus_green, 0.0);
  const cv::Mat representation = red_excess.mul(blue_excess);

  DECLARE_ASSIGN_OR_RETURN(double, threshold, OtsuThreshold(representation));
  return utilities::ToTissueMask(representation > threshold);
}

absl::StatusOr<TissueMask> MaskWithOpticalDensity(
    const Image& rgb, const MaskingOptions& /*options*/) {
  RETURN_IF_ERROR(CheckRgb8(rgb));
  if (rgb.GetPixelCount() == 0) {
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  // -ln(c / 255) with c clipped to [1, 255]
  cv::Mat density(1, 256, CV_64F);
  for (int c = 0; c < 256; ++c) {
    density.at<double>(0, c) = -std::log(std::max(c, 1) / 255.0);
  }

  cv::Mat per_channel;
  cv::LUT(utilities::AsMat(rgb), density, per_channel);
  cv::Mat absorbance;
  cv::transform(per_channel, absorbance, cv::Matx13d(1.0, 1.0, 1.0));

  DECLARE_ASSIGN_OR_RETURN(double, low, Percentile(absorbance, 1.0));
  DECLARE_ASSIGN_OR_RETURN(double, high, Percentile(absorbance, 99.0));
  const cv::Mat floored = cv::max(absorbance, low);
  const cv::Mat clipped = cv::min(floored, high);

  DECLARE_ASSIGN_OR_RETURN(double, threshold, OtsuThreshold(clipped));
  return utilities::ToTissueMask(clipped > threshold);
}

absl::StatusOr<TissueMask> MaskWithLuminosity(
    const Image& rgb, const MaskingOptions& /*options*/) {
  RETURN_IF_ERROR(CheckRgb8(rgb));
  if (rgb.GetPixelCount() == 0) {
    return TissueMask(rgb.GetWidth(), rgb.GetHeight());
  }

  const cv::Mat lightness = ToLabLightness(rgb);
  DECLARE_ASSIGN_OR_RETURN(double, threshold, OtsuThreshold(lightness));
  return utilities::ToTissueMask(lightness < threshold);
}

}  // namespace slidepatch::masking
