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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_SLIDE_METADATA_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_SLIDE_METADATA_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "slidepatch/concepts/numeric.h"

/**
 * @file slide_metadata.h
 * @brief Physical calibration from TIFF metadata
 *
 * Aperio SVS files store their calibration in a pipe-separated image
 * description ("Aperio Image Library ...|AppMag = 20|MPP = 0.499|..."). Plain
 * pyramidal TIFFs only carry the resolution tags, from which the microns per
 * pixel can be derived when the unit is metric.
 */

namespace slidepatch {
namespace readers {

/// @brief Metadata extracted from an Aperio image description
struct AperioMetadata {
  Size<double, 2> mpp = {0.0, 0.0};  ///< Microns per pixel (x, y)
  double app_mag = 0.0;              ///< Apparent magnification
  std::string scanner_id;            ///< ScanScope ID
};

/// @brief Check whether an image description was written by Aperio
[[nodiscard]] bool IsAperioDescription(std::string_view description);

/// @brief Look up a `key = value` entry in a pipe-separated description
/// @return The trimmed value, or nullopt if the key is absent
[[nodiscard]] std::optional<std::string> FindDescriptionValue(
    std::string_view description, std::string_view key);

/// @brief Parse the calibration out of an Aperio image description
/// @return Metadata; kInvalidArgument if the description is not Aperio,
///         kNotFound if it carries none of MPP, AppMag or ScanScope ID
absl::StatusOr<AperioMetadata> ParseAperioDescription(
    std::string_view description);

/// @brief Check whether an Aperio directory holds a label or macro image
///
/// Such directories are stored next to the pyramid and must not be mistaken
/// for pyramid levels.
[[nodiscard]] bool IsAssociatedImageDescription(std::string_view description);

/// @brief Derive microns per pixel from the TIFF resolution tags
/// @param x_resolution Pixels per unit along x
/// @param y_resolution Pixels per unit along y
/// @param resolution_unit RESUNIT_* value (only centimeters are used)
/// @return Microns per pixel, or nullopt when the tags carry no calibration
[[nodiscard]] std::optional<Size<double, 2>> MppFromResolution(
    std::optional<float> x_resolution, std::optional<float> y_resolution,
    uint16_t resolution_unit);

}  // namespace readers
}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_SLIDE_METADATA_H_
