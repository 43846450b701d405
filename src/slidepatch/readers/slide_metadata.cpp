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

#include "slidepatch/readers/slide_metadata.h"

#include <tiffio.h>

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "slidepatch/status/status_macros.h"

namespace slidepatch {
namespace readers {

namespace {

constexpr double kMicronsPerCentimeter = 10000.0;

}  // namespace

bool IsAperioDescription(std::string_view description) {
  return absl::StrContains(description, "Aperio");
}

std::optional<std::string> FindDescriptionValue(std::string_view description,
                                                std::string_view key) {
  for (std::string_view part : absl::StrSplit(description, '|')) {
    const size_t eq_pos = part.find('=');
    if (eq_pos == std::string_view::npos) {
      continue;
    }
    if (absl::StripAsciiWhitespace(part.substr(0, eq_pos)) == key) {
      return std::string(absl::StripAsciiWhitespace(part.substr(eq_pos + 1)));
    }
  }
  return std::nullopt;
}

absl::StatusOr<AperioMetadata> ParseAperioDescription(
    std::string_view description) {
  if (!IsAperioDescription(description)) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Not an Aperio image description");
  }

  AperioMetadata metadata;
  bool found_any = false;

  if (auto mpp = FindDescriptionValue(description, "MPP")) {
    double value = 0.0;
    if (absl::SimpleAtod(*mpp, &value) && value > 0.0) {
      metadata.mpp = {value, value};
      found_any = true;
    }
  }

  if (auto app_mag = FindDescriptionValue(description, "AppMag")) {
    double value = 0.0;
    if (absl::SimpleAtod(*app_mag, &value) && value > 0.0) {
      metadata.app_mag = value;
      found_any = true;
    }
  }

  if (auto scanner = FindDescriptionValue(description, "ScanScope ID")) {
    metadata.scanner_id = *scanner;
    found_any = !metadata.scanner_id.empty() || found_any;
  }

  if (!found_any) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "No Aperio calibration found in description");
  }
  return metadata;
}

bool IsAssociatedImageDescription(std::string_view description) {
  // e.g. "Aperio Image Library v10.0.51\nlabel 415x422"
  const std::vector<std::string_view> lines =
      absl::StrSplit(description, '\n');
  if (lines.size() < 2) {
    return false;
  }
  const std::string_view second = absl::StripLeadingAsciiWhitespace(lines[1]);
  return absl::StartsWithIgnoreCase(second, "label") ||
         absl::StartsWithIgnoreCase(second, "macro");
}

std::optional<Size<double, 2>> MppFromResolution(
    std::optional<float> x_resolution, std::optional<float> y_resolution,
    uint16_t resolution_unit) {
  if (!x_resolution.has_value() || !y_resolution.has_value() ||
      *x_resolution <= 0.0F || *y_resolution <= 0.0F) {
    return std::nullopt;
  }

  // Only centimeter resolutions are trusted as a calibration
  if (resolution_unit != RESUNIT_CENTIMETER) {
    return std::nullopt;
  }

  return Size<double, 2>{kMicronsPerCentimeter / *x_resolution,
                         kMicronsPerCentimeter / *y_resolution};
}

}  // namespace readers
}  // namespace slidepatch
