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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_RESAMPLE_AVERAGE_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_RESAMPLE_AVERAGE_H_

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "slidepatch/image.h"

namespace slidepatch::resample {

namespace detail {

// Choose an accumulation type that is safe and fast.
template <typename T>
using AccumType =
    std::conditional_t<std::is_floating_point_v<T>, double, uint64_t>;

// Round and clamp an averaged value into the sample type.
template <typename T>
inline T ClampValue(double value) {
  if constexpr (std::is_floating_point_v<T>) {
    return static_cast<T>(value);
  } else {
    const double rounded = std::round(value);
    return static_cast<T>(
        std::clamp(rounded, 0.0,
                   static_cast<double>(std::numeric_limits<T>::max())));
  }
}

// Factor-2 box filter over an interleaved buffer; odd trailing rows and
// columns average the pixels that exist.
template <typename T>
inline void Downsample2xInterleaved(const T* in_data, T* out_data,
                                    uint32_t in_w, uint32_t in_h,
                                    uint32_t out_w, uint32_t out_h,
                                    uint32_t channels) {
  using A = AccumType<T>;
  for (uint32_t oy = 0; oy < out_h; ++oy) {
    const uint32_t y0 = oy * 2U;
    const uint32_t y_cnt = std::min(2U, in_h - y0);
    for (uint32_t ox = 0; ox < out_w; ++ox) {
      const uint32_t x0 = ox * 2U;
      const uint32_t x_cnt = std::min(2U, in_w - x0);
      const double inv = 1.0 / static_cast<double>(x_cnt * y_cnt);
      for (uint32_t c = 0; c < channels; ++c) {
        A sum = 0;
        for (uint32_t dy = 0; dy < y_cnt; ++dy) {
          const size_t row = (static_cast<size_t>(y0 + dy) * in_w) * channels;
          for (uint32_t dx = 0; dx < x_cnt; ++dx) {
            sum += static_cast<A>(
                in_data[row + static_cast<size_t>(x0 + dx) * channels + c]);
          }
        }
        out_data[(static_cast<size_t>(oy) * out_w + ox) * channels + c] =
            ClampValue<T>(static_cast<double>(sum) * inv);
      }
    }
  }
}

}  // namespace detail

/// @brief Halve an image in both dimensions by averaging 2x2 blocks
///
/// Output dimensions are ceil(w / 2) x ceil(h / 2); channel count and data
/// type are preserved.
inline Image Downsample2x(const Image& input) {
  const uint32_t in_w = input.GetWidth();
  const uint32_t in_h = input.GetHeight();
  const uint32_t out_w = std::max(1U, (in_w + 1U) / 2U);
  const uint32_t out_h = std::max(1U, (in_h + 1U) / 2U);
  Image output(ImageDimensions{out_w, out_h}, input.GetChannels(),
               input.GetDataType());
  if (input.Empty()) {
    return output;
  }

  switch (input.GetDataType()) {
    case DataType::kUInt8:
      detail::Downsample2xInterleaved(input.GetDataAs<uint8_t>(),
                                      output.GetDataAs<uint8_t>(), in_w, in_h,
                                      out_w, out_h, input.GetChannels());
      break;
    case DataType::kUInt16:
      detail::Downsample2xInterleaved(input.GetDataAs<uint16_t>(),
                                      output.GetDataAs<uint16_t>(), in_w,
                                      in_h, out_w, out_h, input.GetChannels());
      break;
    case DataType::kFloat32:
      detail::Downsample2xInterleaved(input.GetDataAs<float>(),
                                      output.GetDataAs<float>(), in_w, in_h,
                                      out_w, out_h, input.GetChannels());
      break;
  }
  return output;
}

}  // namespace slidepatch::resample

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_RESAMPLE_AVERAGE_H_
