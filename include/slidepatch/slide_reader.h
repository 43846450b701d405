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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_SLIDE_READER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_SLIDE_READER_H_

#include <string>

#include "absl/status/statusor.h"
#include "slidepatch/core/slide_descriptor.h"
#include "slidepatch/image.h"

namespace slidepatch {

/// @brief Abstract base class for slide readers
///
/// The extraction pipeline only needs the pyramid layout and region reads;
/// everything format specific lives in the concrete readers. Implementations
/// must allow concurrent ReadRegion() calls when the extractor runs with more
/// than one worker.
class SlideReader {
 public:
  SlideReader() = default;

  /// @brief Virtual destructor
  virtual ~SlideReader() = default;

  SlideReader(const SlideReader&) = delete;
  SlideReader& operator=(const SlideReader&) = delete;
  SlideReader(SlideReader&&) = delete;
  SlideReader& operator=(SlideReader&&) = delete;

  /// @brief Get number of pyramid levels
  /// @return Number of levels (level 0 is full resolution)
  [[nodiscard]] virtual int GetLevelCount() const = 0;

  /// @brief Get level information
  /// @param level Pyramid level
  /// @return Level information or error status
  [[nodiscard]] virtual absl::StatusOr<LevelInfo> GetLevelInfo(
      int level) const = 0;

  /// @brief Get slide physical properties
  [[nodiscard]] virtual const SlideProperties& GetProperties() const = 0;

  /// @brief Read a region from the slide
  /// @param region Region specification (coordinates at region.level)
  /// @return Interleaved image with the slide's native channels and type
  [[nodiscard]] virtual absl::StatusOr<Image> ReadRegion(
      const RegionSpec& region) const = 0;

  /// @brief Get file format name (e.g., "TIFF", "SVS", "PNG")
  [[nodiscard]] virtual std::string GetFormatName() const = 0;

  /// @brief Get level-0 dimensions
  /// @return Dimensions, or {0, 0} for a reader without levels
  [[nodiscard]] ImageDimensions GetDimensions() const;
};

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_SLIDE_READER_H_
