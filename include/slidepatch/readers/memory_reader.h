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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_MEMORY_READER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_MEMORY_READER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "slidepatch/slide_reader.h"

namespace slidepatch {

/// @brief Slide backed by an in-memory image
///
/// Coarser levels are synthesised by repeated 2x average downsampling until
/// the longest side drops to @p min_level_size. Used for flat image formats
/// (PNG) and by tests that need a slide with known pixel content.
///
/// @note Immutable after creation; concurrent ReadRegion() calls are safe.
class MemoryReader : public SlideReader {
 public:
  static constexpr uint32_t kDefaultMinLevelSize = 256;

  /// @brief Build a reader from a level-0 image
  /// @param level0 Full-resolution pixels (any channel count and data type)
  /// @param properties Physical calibration to report
  /// @param format_name Name reported by GetFormatName()
  /// @param min_level_size Stop building levels at this longest side
  /// @return Reader, or kInvalidArgument for an empty image
  static absl::StatusOr<std::unique_ptr<MemoryReader>> Create(
      Image level0, SlideProperties properties = {},
      std::string format_name = "MEMORY",
      uint32_t min_level_size = kDefaultMinLevelSize);

  [[nodiscard]] int GetLevelCount() const override {
    return static_cast<int>(levels_.size());
  }

  [[nodiscard]] absl::StatusOr<LevelInfo> GetLevelInfo(
      int level) const override;

  [[nodiscard]] const SlideProperties& GetProperties() const override {
    return properties_;
  }

  [[nodiscard]] absl::StatusOr<Image> ReadRegion(
      const RegionSpec& region) const override;

  [[nodiscard]] std::string GetFormatName() const override {
    return format_name_;
  }

 private:
  MemoryReader(SlideProperties properties, std::string format_name);

  std::vector<Image> levels_;
  std::vector<LevelInfo> level_info_;
  SlideProperties properties_;
  std::string format_name_;
};

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_MEMORY_READER_H_
