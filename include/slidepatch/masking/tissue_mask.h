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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_TISSUE_MASK_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_TISSUE_MASK_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "absl/status/statusor.h"
#include "slidepatch/core/tile.h"
#include "slidepatch/image.h"

namespace slidepatch {

/// @brief Boolean tissue mask over an overview image
///
/// Row-major, one byte per pixel (0 = background, 1 = tissue). A mask always
/// has the dimensions of the overview it was computed from.
class TissueMask {
 public:
  TissueMask() : width_(0), height_(0) {}

  /// @brief Create a mask filled with @p value
  TissueMask(uint32_t width, uint32_t height, bool value = false)
      : width_(width),
        height_(height),
        data_(static_cast<size_t>(width) * height, value ? 1 : 0) {}

  /// @brief Build a mask from a single-channel uint8 image (non-zero = tissue)
  /// @return Mask, or an UnsupportedFormat error for other layouts
  static absl::StatusOr<TissueMask> FromImage(const Image& image);

  [[nodiscard]] uint32_t GetWidth() const noexcept { return width_; }

  [[nodiscard]] uint32_t GetHeight() const noexcept { return height_; }

  [[nodiscard]] ImageDimensions GetDimensions() const {
    return ImageDimensions{width_, height_};
  }

  [[nodiscard]] bool Empty() const noexcept { return data_.empty(); }

  [[nodiscard]] bool Get(uint32_t x, uint32_t y) const {
    return data_[static_cast<size_t>(y) * width_ + x] != 0;
  }

  void Set(uint32_t x, uint32_t y, bool value) {
    data_[static_cast<size_t>(y) * width_ + x] = value ? 1 : 0;
  }

  /// @brief Number of tissue pixels in the whole mask
  [[nodiscard]] size_t CountTissue() const;

  /// @brief Number of tissue pixels inside @p rect (clamped to the mask)
  [[nodiscard]] size_t CountTissue(const MaskRect& rect) const;

  /// @brief Render as a grayscale image (0 / 255)
  [[nodiscard]] Image ToImage() const;

  [[nodiscard]] const std::vector<uint8_t>& GetData() const noexcept {
    return data_;
  }

  bool operator==(const TissueMask& other) const = default;

 private:
  uint32_t width_;
  uint32_t height_;
  std::vector<uint8_t> data_;
};

/// @brief Black out the background of an RGB overview
/// @param rgb RGB uint8 overview
/// @param mask Mask with the overview's dimensions
/// @return Copy of @p rgb with every non-tissue pixel set to zero
absl::StatusOr<Image> ApplyMask(const Image& rgb, const TissueMask& mask);

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_TISSUE_MASK_H_
