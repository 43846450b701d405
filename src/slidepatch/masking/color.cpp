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

#include "slidepatch/masking/color.h"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"
#include "slidepatch/utilities/opencv.h"

namespace slidepatch::masking {

namespace {

const cv::Matx13d kLuminanceWeights(0.2125, 0.7154, 0.0721);

}  // namespace

absl::Status CheckRgb8(const Image& image) {
  if (!image.IsRGB8()) {
    return MAKE_ERROR(
        ErrorKind::kUnsupportedFormat,
        slidepatch::fmt::format(
            "Masking requires an RGB uint8 overview, got {} channel(s) of {}",
            image.GetChannels(), GetName(image.GetDataType())));
  }
  return absl::OkStatus();
}

cv::Mat ToLuminance(const Image& rgb) {
  cv::Mat samples;
  utilities::AsMat(rgb).convertTo(samples, CV_64F, 1.0 / 255.0);
  cv::Mat luminance;
  cv::transform(samples, luminance, kLuminanceWeights);
  return luminance;
}

cv::Mat ToGray8(const Image& rgb) {
  cv::Mat gray;
  cv::transform(utilities::AsMat(rgb), gray, kLuminanceWeights);
  return gray;
}

cv::Mat ToLabLightness(const Image& rgb) {
  // Float input keeps L* unquantized
  cv::Mat samples;
  utilities::AsMat(rgb).convertTo(samples, CV_32F, 1.0 / 255.0);
  cv::Mat lab;
  cv::cvtColor(samples, lab, cv::COLOR_RGB2Lab);
  cv::Mat lightness;
  cv::extractChannel(lab, lightness, 0);
  return lightness;
}

}  // namespace slidepatch::masking
