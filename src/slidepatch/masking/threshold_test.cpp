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

#include <gtest/gtest.h>

#include <vector>

#include <opencv2/core.hpp>

#include "absl/status/status.h"

namespace slidepatch::masking {
namespace {

TEST(OtsuThresholdTest, SeparatesTwoModes) {
  std::vector<double> values(50, 0.1);
  values.insert(values.end(), 50, 0.9);

  auto threshold = OtsuThreshold(cv::Mat(values));
  ASSERT_TRUE(threshold.ok()) << threshold.status();
  EXPECT_GT(*threshold, 0.1);
  EXPECT_LT(*threshold, 0.9);
}

TEST(OtsuThresholdTest, UnbalancedModesStillSplit) {
  std::vector<double> values(90, 10.0);
  values.insert(values.end(), 10, 200.0);

  auto threshold = OtsuThreshold(cv::Mat(values));
  ASSERT_TRUE(threshold.ok()) << threshold.status();
  EXPECT_GT(*threshold, 10.0);
  EXPECT_LT(*threshold, 200.0);
}

TEST(OtsuThresholdTest, ConstantInputReturnsValue) {
  const std::vector<double> values(10, 0.25);
  auto threshold = OtsuThreshold(cv::Mat(values));
  ASSERT_TRUE(threshold.ok());
  EXPECT_DOUBLE_EQ(*threshold, 0.25);
}

TEST(OtsuThresholdTest, RejectsBadInput) {
  EXPECT_EQ(OtsuThreshold(cv::Mat()).status().code(),
            absl::StatusCode::kInvalidArgument);
  const std::vector<double> pair = {0.0, 1.0};
  EXPECT_EQ(OtsuThreshold(cv::Mat(pair), 1).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(OtsuThreshold(cv::Mat(2, 2, CV_8UC3, cv::Scalar::all(7)))
                .status()
                .code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(OtsuThresholdTest, AcceptsImageShapedInput) {
  // Dark 4x8 block on a bright 8x8 image
  cv::Mat image(8, 8, CV_8UC1, cv::Scalar(200));
  image(cv::Rect(0, 0, 4, 8)).setTo(cv::Scalar(20));
  auto threshold = OtsuThreshold(image);
  ASSERT_TRUE(threshold.ok()) << threshold.status();
  EXPECT_GT(*threshold, 20.0);
  EXPECT_LT(*threshold, 200.0);
  EXPECT_EQ(cv::countNonZero(image < *threshold), 32);
}

TEST(PercentileTest, InterpolatesLinearly) {
  const std::vector<double> values = {5.0, 1.0, 4.0, 2.0, 3.0};
  const cv::Mat samples(values);
  EXPECT_DOUBLE_EQ(*Percentile(samples, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(*Percentile(samples, 25.0), 2.0);
  EXPECT_DOUBLE_EQ(*Percentile(samples, 50.0), 3.0);
  EXPECT_DOUBLE_EQ(*Percentile(samples, 100.0), 5.0);

  const std::vector<double> pair = {0.0, 10.0};
  EXPECT_DOUBLE_EQ(*Percentile(cv::Mat(pair), 10.0), 1.0);
}

TEST(PercentileTest, RejectsBadInput) {
  EXPECT_FALSE(Percentile(cv::Mat(), 50.0).ok());
  const std::vector<double> single = {1.0};
  EXPECT_EQ(Percentile(cv::Mat(single), 101.0).status().code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace slidepatch::masking
