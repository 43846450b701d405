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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_OVERVIEW_LOADER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_OVERVIEW_LOADER_H_

#include <cstdint>

#include "absl/status/statusor.h"
#include "slidepatch/image.h"
#include "slidepatch/slide_reader.h"

/**
 * @file overview_loader.h
 * @brief Low-resolution RGB overview used for masking
 *
 * The overview is a whole pyramid level, never an upsampled one: the coarsest
 * level whose longest side still reaches the target size is used, falling
 * back to level 0 for slides smaller than the target.
 */

namespace slidepatch::pipeline {

/// @brief Whole-slide overview image
struct Overview {
  Image image;                      ///< RGB uint8 pixels of the level
  int level;                        ///< Pyramid level the image was read from
  double downsample;                ///< Level downsample relative to level 0
  ImageDimensions full_dimensions;  ///< Level-0 dimensions
};

/// @brief Pick the overview level for @p target_size
/// @return Level index, InvalidArgument for a zero target, or a DecodeError
///         if the slide exposes no readable level
absl::StatusOr<int> SelectOverviewLevel(const SlideReader& reader,
                                        uint32_t target_size);

/// @brief Convert gray, RGB or RGBA pixels of any supported type to RGB uint8
///
/// Gray is replicated, alpha is dropped, uint16 is scaled by 1/257 and
/// float32 (expected in [0, 1]) by 255 with clamping.
///
/// @return RGB uint8 image, or an UnsupportedFormatError
absl::StatusOr<Image> ConvertToRGB8(const Image& image);

/// @brief Read the overview level and convert it to RGB uint8
/// @return Overview; a failed read is reported as a DecodeError
absl::StatusOr<Overview> LoadOverview(const SlideReader& reader,
                                      uint32_t target_size);

}  // namespace slidepatch::pipeline

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_OVERVIEW_LOADER_H_
