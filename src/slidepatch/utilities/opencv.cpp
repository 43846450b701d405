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

#include "slidepatch/utilities/opencv.h"

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <opencv2/core.hpp>

namespace slidepatch::utilities {

int GetOpenCvType(const Image& image) {
  const auto channels = static_cast<int>(image.GetChannels());
  switch (image.GetDataType()) {
    case DataType::kUInt8:
      return CV_MAKETYPE(CV_8U, channels);
    case DataType::kUInt16:
      return CV_MAKETYPE(CV_16U, channels);
    case DataType::kFloat32:
      return CV_MAKETYPE(CV_32F, channels);
  }
  return CV_MAKETYPE(CV_8U, channels);
}

cv::Mat AsMat(const Image& image) {
  return cv::Mat(static_cast<int>(image.GetHeight()),
                 static_cast<int>(image.GetWidth()), GetOpenCvType(image),
                 const_cast<uint8_t*>(image.GetData()));
}

cv::Mat AsMat(const TissueMask& mask) {
  return cv::Mat(static_cast<int>(mask.GetHeight()),
                 static_cast<int>(mask.GetWidth()), CV_8UC1,
                 const_cast<uint8_t*>(mask.GetData().data()));
}

TissueMask ToTissueMask(const cv::Mat& mat) {
  TissueMask mask(static_cast<uint32_t>(mat.cols),
                  static_cast<uint32_t>(mat.rows));
  cv::Mat bytes;
  if (mat.depth() == CV_8U) {
    bytes = mat;
  } else {
    bytes = mat != 0.0;
  }
  for (int y = 0; y < bytes.rows; ++y) {
    const uint8_t* row = bytes.ptr<uint8_t>(y);
    for (int x = 0; x < bytes.cols; ++x) {
      mask.Set(static_cast<uint32_t>(x), static_cast<uint32_t>(y), row[x] != 0);
    }
  }
  return mask;
}

Image ToImage(const cv::Mat& mat) {
  Image image(ImageDimensions{static_cast<uint32_t>(mat.cols),
                              static_cast<uint32_t>(mat.rows)},
              static_cast<uint32_t>(mat.channels()), DataType::kUInt8);
  const size_t row_bytes = static_cast<size_t>(mat.cols) * mat.elemSize();
  for (int y = 0; y < mat.rows; ++y) {
    std::memcpy(image.GetData() + static_cast<size_t>(y) * row_bytes,
                mat.ptr<uint8_t>(y), row_bytes);
  }
  return image;
}

}  // namespace slidepatch::utilities
