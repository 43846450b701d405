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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_TIFF_READER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_TIFF_READER_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "slidepatch/slide_reader.h"
#include "slidepatch/utilities/tiff/tiff_pool.h"

namespace slidepatch {

/// @brief Reader for pyramidal TIFF and Aperio SVS slides
///
/// Pyramid levels are the tiled directories of the file ordered from the
/// largest to the smallest image; SVS thumbnails (stripped) and label/macro
/// images are excluded. A single-directory TIFF is read as a one-level
/// pyramid regardless of its layout.
///
/// Region reads borrow a handle from an internal TIFFHandlePool, so
/// ReadRegion() may be called from several threads at once.
class TiffReader : public SlideReader {
 public:
  /// @brief Open a slide
  /// @param path Path to the .svs/.tif/.tiff file
  /// @param pool_size Maximum number of concurrently open handles
  ///        (0 = hardware concurrency)
  /// @return Reader, or a DecodeError if the file is missing or unreadable
  static absl::StatusOr<std::unique_ptr<TiffReader>> Create(
      const std::filesystem::path& path, unsigned pool_size = 0);

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
  /// @brief Pyramid level backed by one TIFF directory
  struct Level {
    uint16_t directory;
    LevelInfo info;
  };

  explicit TiffReader(std::unique_ptr<TIFFHandlePool> pool);

  absl::Status Initialize();

  std::unique_ptr<TIFFHandlePool> pool_;
  std::vector<Level> levels_;
  SlideProperties properties_;
  std::string format_name_;
};

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_TIFF_READER_H_
