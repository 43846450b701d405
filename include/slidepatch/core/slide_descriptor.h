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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_CORE_SLIDE_DESCRIPTOR_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_CORE_SLIDE_DESCRIPTOR_H_

#include <string>

#include "slidepatch/concepts/numeric.h"
#include "slidepatch/image.h"

/**
 * @file slide_descriptor.h
 * @brief Slide pyramid structure and physical properties
 *
 * Pure data types describing what a SlideReader exposes: the levels of the
 * pyramid, their downsample factors, and the physical calibration.
 */

namespace slidepatch {
namespace core {

/// @brief Pyramid level metadata
struct LevelInfo {
  ImageDimensions dimensions;  ///< Level dimensions in pixels
  double downsample_factor;    ///< Downsample factor relative to level 0

  LevelInfo() : downsample_factor(1.0) {}

  LevelInfo(ImageDimensions dims, double downsample)
      : dimensions(dims), downsample_factor(downsample) {}
};

/// @brief Physical slide properties
struct SlideProperties {
  Size<double, 2> mpp;             ///< Microns per pixel in X, Y (0 = unknown)
  double objective_magnification;  ///< Objective magnification (e.g., 20.0)
  std::string scanner_model;       ///< Scanner model/identifier

  SlideProperties() : mpp{0.0, 0.0}, objective_magnification(0.0) {}

  /// @brief Check whether the slide carries a usable calibration
  [[nodiscard]] bool HasMpp() const { return mpp[0] > 0.0 && mpp[1] > 0.0; }
};

/// @brief Region request in level coordinates
struct RegionSpec {
  ImageCoordinate top_left;  ///< Top-left coordinate (level coordinates)
  ImageDimensions size;      ///< Desired region size in pixels
  int level;                 ///< Pyramid level (0 = full resolution)

  /// @brief Check if region is valid
  [[nodiscard]] bool IsValid() const noexcept {
    return size[0] > 0 && size[1] > 0 && level >= 0;
  }
};

}  // namespace core

using core::LevelInfo;
using core::RegionSpec;
using core::SlideProperties;

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_CORE_SLIDE_DESCRIPTOR_H_
