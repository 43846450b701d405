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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MASKING_OPTIONS_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MASKING_OPTIONS_H_

#include <cstdint>

namespace slidepatch::masking {

/// @brief Which k-means cluster is tissue
enum class ForegroundPolarity {
  kDarker,   ///< Brightfield: tissue is darker than the glass
  kLighter,  ///< Fluorescence / inverted contrast
};

/// @brief Tunables shared by all masking methods
///
/// Each method reads only the fields it needs, so every method has the same
/// signature and new methods can add fields here.
struct MaskingOptions {
  uint32_t kmeans_seed = 0;            ///< Seed of the k-means++ RNG
  uint32_t kmeans_max_iterations = 50;  ///< Upper bound on Lloyd iterations
  ForegroundPolarity kmeans_foreground = ForegroundPolarity::kDarker;
  /// Side of the square entropy window; replaced by the closing element
  /// (element_size_um in overview pixels) when the slide is calibrated
  uint32_t entropy_footprint = 9;
};

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MASKING_OPTIONS_H_
