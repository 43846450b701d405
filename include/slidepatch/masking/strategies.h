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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_STRATEGIES_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_STRATEGIES_H_

#include "absl/status/statusor.h"
#include "slidepatch/image.h"
#include "slidepatch/masking/masking_options.h"
#include "slidepatch/masking/tissue_mask.h"

/**
 * @file strategies.h
 * @brief Tissue masking methods
 *
 * Every method takes an RGB uint8 overview and returns a mask of the same
 * size; anything other than RGB uint8 fails with UnsupportedFormatError.
 * Methods are looked up by name through the masking registry.
 */

namespace slidepatch::masking {

/// @brief Luminance below its Otsu threshold
///
/// Assumes tissue is darker than the background.
absl::StatusOr<TissueMask> MaskWithOtsu(const Image& rgb,
                                        const MaskingOptions& options);

/// @brief Two-cluster k-means on RGB colors
///
/// cv::kmeans with k-means++ initialization, driven by an OpenCV RNG
/// seeded from options.kmeans_seed, so equal seeds give equal masks. The
/// cluster selected by options.kmeans_foreground is tissue. A single-color
/// overview yields an empty mask.
absl::StatusOr<TissueMask> MaskWithKMeans(const Image& rgb,
                                          const MaskingOptions& options);

/// @brief Local Shannon entropy above its Otsu threshold
///
/// Entropy (bits) of the 8-bit luminance over a square window of
/// options.entropy_footprint pixels; pixels outside the image are not
/// counted.
absl::StatusOr<TissueMask> MaskWithEntropy(const Image& rgb,
                                           const MaskingOptions& options);

/// @brief Schreiber representation max(r - g, 0) * max(b - g, 0) above Otsu
absl::StatusOr<TissueMask> MaskWithSchreiber(const Image& rgb,
                                             const MaskingOptions& options);

/// @brief Summed optical density above Otsu
///
/// Densities are clipped to their 1st..99th percentile before thresholding.
absl::StatusOr<TissueMask> MaskWithOpticalDensity(
    const Image& rgb, const MaskingOptions& options);

/// @brief CIE-Lab lightness below its Otsu threshold
absl::StatusOr<TissueMask> MaskWithLuminosity(const Image& rgb,
                                              const MaskingOptions& options);

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_STRATEGIES_H_
