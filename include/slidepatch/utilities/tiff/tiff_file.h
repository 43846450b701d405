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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TIFF_TIFF_FILE_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TIFF_TIFF_FILE_H_

#include <tiffio.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidepatch/image.h"
#include "slidepatch/utilities/tiff/tiff_pool.h"

namespace slidepatch {

/// @brief Metadata of one TIFF directory (IFD)
struct TiffDirectoryInfo {
  ImageDimensions image_dims;                 ///< Image width and height
  std::optional<ImageDimensions> tile_dims;   ///< Tile size (if tiled)
  uint32_t rows_per_strip;                    ///< Strip height (if stripped)
  uint16_t samples_per_pixel;                 ///< Number of samples per pixel
  uint16_t bits_per_sample;                   ///< Bits per sample
  uint16_t photometric;                       ///< PHOTOMETRIC_* value
  uint16_t compression;                       ///< COMPRESSION_* value
  uint16_t sample_format;                     ///< SAMPLEFORMAT_* value
  uint16_t planar_config;                     ///< PLANARCONFIG_* value
  uint32_t subfile_type;                      ///< FILETYPE_* flags
  std::string image_description;              ///< May be empty
  std::optional<float> x_resolution;          ///< Pixels per resolution unit
  std::optional<float> y_resolution;          ///< Pixels per resolution unit
  uint16_t resolution_unit;                   ///< RESUNIT_* value
  bool is_tiled;                              ///< Tiled or stripped layout

  /// @brief Bytes per interleaved pixel
  [[nodiscard]] size_t GetBytesPerPixel() const noexcept {
    return (static_cast<size_t>(samples_per_pixel) * bits_per_sample + 7) / 8;
  }

  /// @brief Pixel count, used to order pyramid levels
  [[nodiscard]] size_t Area() const noexcept { return image_dims.Volume(); }
};

/// @brief RAII wrapper around a pooled TIFF handle
///
/// Adds typed field access and region reads on top of libtiff. The handle is
/// returned to its pool when the TiffFile is destroyed.
///
/// @note Not thread-safe on its own; create one TiffFile per thread from a
/// shared TIFFHandlePool.
class TiffFile {
 public:
  /// @brief Borrow a handle from @p pool
  /// @return TiffFile, or kInternal if no handle could be acquired
  static absl::StatusOr<TiffFile> Create(TIFFHandlePool* pool);

  TiffFile(const TiffFile&) = delete;
  TiffFile& operator=(const TiffFile&) = delete;
  TiffFile(TiffFile&& other) noexcept = default;
  TiffFile& operator=(TiffFile&& other) noexcept = default;

  /// @brief Count directories in the file
  absl::StatusOr<uint16_t> GetDirectoryCount() const;

  /// @brief Select a directory
  ///
  /// JPEG-compressed YCbCr directories are switched to RGB output, so that
  /// reads always deliver interleaved RGB samples.
  absl::Status SetDirectory(uint16_t dir_index);

  /// @brief Metadata of the current directory
  absl::StatusOr<TiffDirectoryInfo> GetDirectoryInfo() const;

  /// @brief Pixel data type of the current directory
  /// @return DataType, or an UnsupportedFormat error for other layouts
  absl::StatusOr<DataType> GetDataType() const;

  /// @brief Read a region of the current directory
  ///
  /// Tiles (or strips) overlapping the region are decoded and the
  /// overlapping parts are copied into the output image. The region must lie
  /// within the directory's image.
  ///
  /// @param x Left edge in directory pixels
  /// @param y Top edge in directory pixels
  /// @param width Region width
  /// @param height Region height
  /// @return Interleaved image with the directory's channels and data type
  absl::StatusOr<Image> ReadRegion(uint32_t x, uint32_t y, uint32_t width,
                                   uint32_t height) const;

  [[nodiscard]] bool IsValid() const { return handle_guard_.Valid(); }

 private:
  explicit TiffFile(TIFFHandleGuard handle_guard);

  template <typename T>
  absl::StatusOr<T> GetRequiredField(ttag_t tag) const;

  template <typename T>
  std::optional<T> GetOptionalField(ttag_t tag) const;

  [[nodiscard]] std::string GetStringField(ttag_t tag) const;

  absl::Status ReadTiledRegion(const TiffDirectoryInfo& info, Image& out,
                               uint32_t x, uint32_t y) const;

  absl::Status ReadStrippedRegion(const TiffDirectoryInfo& info, Image& out,
                                  uint32_t x, uint32_t y) const;

  TIFFHandleGuard handle_guard_;  ///< RAII guard for TIFF handle
  uint16_t current_directory_;    ///< Current directory index
};

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TIFF_TIFF_FILE_H_
