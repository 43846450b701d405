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

#include "slidepatch/utilities/tiff/tiff_file.h"

#include <tiffio.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch {

absl::StatusOr<TiffFile> TiffFile::Create(TIFFHandlePool* pool) {
  if (pool == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "TIFFHandlePool cannot be null");
  }

  auto handle_guard = pool->Acquire();
  if (!handle_guard.Valid()) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to acquire TIFF handle from pool");
  }

  return TiffFile(std::move(handle_guard));
}

TiffFile::TiffFile(TIFFHandleGuard handle_guard)
    : handle_guard_(std::move(handle_guard)), current_directory_(0) {}

absl::StatusOr<uint16_t> TiffFile::GetDirectoryCount() const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }
  return static_cast<uint16_t>(TIFFNumberOfDirectories(handle_guard_.Get()));
}

absl::Status TiffFile::SetDirectory(uint16_t dir_index) {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  TIFF* tif = handle_guard_.Get();

  // Handles are reused across readers, never trust the current directory
  if (TIFFSetDirectory(tif, dir_index) == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Failed to set directory to {}", dir_index));
  }
  current_directory_ = dir_index;

  const uint16_t compression =
      GetOptionalField<uint16_t>(TIFFTAG_COMPRESSION).value_or(1);
  const uint16_t photometric =
      GetOptionalField<uint16_t>(TIFFTAG_PHOTOMETRIC).value_or(0);
  if (compression == COMPRESSION_JPEG && photometric == PHOTOMETRIC_YCBCR) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    TIFFSetField(tif, TIFFTAG_JPEGCOLORMODE, JPEGCOLORMODE_RGB);
  }

  return absl::OkStatus();
}

template <typename T>
absl::StatusOr<T> TiffFile::GetRequiredField(ttag_t tag) const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  T value;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_guard_.Get(), tag, &value) != 1) {
    return MAKE_STATUS(
        absl::StatusCode::kNotFound,
        slidepatch::fmt::format("Required field (tag {}) not found",
                                static_cast<uint32_t>(tag)));
  }
  return value;
}

template <typename T>
std::optional<T> TiffFile::GetOptionalField(ttag_t tag) const {
  if (!IsValid()) {
    return std::nullopt;
  }

  T value;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_guard_.Get(), tag, &value) == 1) {
    return value;
  }
  return std::nullopt;
}

std::string TiffFile::GetStringField(ttag_t tag) const {
  if (!IsValid()) {
    return "";
  }

  char* str_ptr = nullptr;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  if (TIFFGetField(handle_guard_.Get(), tag, &str_ptr) == 1 &&
      str_ptr != nullptr) {
    return std::string(str_ptr);
  }
  return "";
}

absl::StatusOr<TiffDirectoryInfo> TiffFile::GetDirectoryInfo() const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  TiffDirectoryInfo info;
  DECLARE_ASSIGN_OR_RETURN(uint32_t, width,
                           GetRequiredField<uint32_t>(TIFFTAG_IMAGEWIDTH));
  DECLARE_ASSIGN_OR_RETURN(uint32_t, height,
                           GetRequiredField<uint32_t>(TIFFTAG_IMAGELENGTH));
  info.image_dims = ImageDimensions{width, height};

  info.samples_per_pixel =
      GetOptionalField<uint16_t>(TIFFTAG_SAMPLESPERPIXEL).value_or(1);
  info.bits_per_sample =
      GetOptionalField<uint16_t>(TIFFTAG_BITSPERSAMPLE).value_or(1);
  ASSIGN_OR_RETURN(info.photometric,
                   GetRequiredField<uint16_t>(TIFFTAG_PHOTOMETRIC));
  info.compression = GetOptionalField<uint16_t>(TIFFTAG_COMPRESSION)
                         .value_or(COMPRESSION_NONE);
  info.sample_format = GetOptionalField<uint16_t>(TIFFTAG_SAMPLEFORMAT)
                           .value_or(SAMPLEFORMAT_UINT);
  info.planar_config = GetOptionalField<uint16_t>(TIFFTAG_PLANARCONFIG)
                           .value_or(PLANARCONFIG_CONTIG);
  info.subfile_type = GetOptionalField<uint32_t>(TIFFTAG_SUBFILETYPE)
                          .value_or(0);
  info.image_description = GetStringField(TIFFTAG_IMAGEDESCRIPTION);
  info.x_resolution = GetOptionalField<float>(TIFFTAG_XRESOLUTION);
  info.y_resolution = GetOptionalField<float>(TIFFTAG_YRESOLUTION);
  // Inch is the default if not set
  info.resolution_unit = GetOptionalField<uint16_t>(TIFFTAG_RESOLUTIONUNIT)
                             .value_or(RESUNIT_INCH);

  info.is_tiled = TIFFIsTiled(handle_guard_.Get()) != 0;
  if (info.is_tiled) {
    DECLARE_ASSIGN_OR_RETURN(uint32_t, tile_width,
                             GetRequiredField<uint32_t>(TIFFTAG_TILEWIDTH));
    DECLARE_ASSIGN_OR_RETURN(uint32_t, tile_height,
                             GetRequiredField<uint32_t>(TIFFTAG_TILELENGTH));
    info.tile_dims = ImageDimensions{tile_width, tile_height};
    info.rows_per_strip = 0;
  } else {
    info.rows_per_strip = std::min(
        GetOptionalField<uint32_t>(TIFFTAG_ROWSPERSTRIP).value_or(height),
        height);
  }

  return info;
}

absl::StatusOr<DataType> TiffFile::GetDataType() const {
  const uint16_t bits_per_sample =
      GetOptionalField<uint16_t>(TIFFTAG_BITSPERSAMPLE).value_or(1);
  const uint16_t sample_format =
      GetOptionalField<uint16_t>(TIFFTAG_SAMPLEFORMAT)
          .value_or(SAMPLEFORMAT_UINT);

  if (sample_format == SAMPLEFORMAT_UINT && bits_per_sample == 8) {
    return DataType::kUInt8;
  }
  if (sample_format == SAMPLEFORMAT_UINT && bits_per_sample == 16) {
    return DataType::kUInt16;
  }
  if (sample_format == SAMPLEFORMAT_IEEEFP && bits_per_sample == 32) {
    return DataType::kFloat32;
  }

  return MAKE_ERROR(
      ErrorKind::kUnsupportedFormat,
      slidepatch::fmt::format(
          "Unsupported TIFF sample layout: format {} with {} bits per sample",
          sample_format, bits_per_sample));
}

absl::StatusOr<Image> TiffFile::ReadRegion(uint32_t x, uint32_t y,
                                           uint32_t width,
                                           uint32_t height) const {
  if (!IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "TIFF handle is not valid");
  }

  DECLARE_ASSIGN_OR_RETURN(TiffDirectoryInfo, info, GetDirectoryInfo());
  DECLARE_ASSIGN_OR_RETURN(DataType, dtype, GetDataType());

  if (info.planar_config != PLANARCONFIG_CONTIG &&
      info.samples_per_pixel > 1) {
    return MAKE_ERROR(ErrorKind::kUnsupportedFormat,
                      "Planar-separate TIFF directories are not supported");
  }

  if (width == 0 || height == 0 ||
      static_cast<uint64_t>(x) + width > info.image_dims[0] ||
      static_cast<uint64_t>(y) + height > info.image_dims[1]) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidepatch::fmt::format(
            "Region ({}, {}) {}x{} outside directory {} of size {}", x, y,
            width, height, current_directory_, info.image_dims));
  }

  Image out(ImageDimensions{width, height}, info.samples_per_pixel, dtype);
  if (info.is_tiled) {
    RETURN_IF_ERROR(ReadTiledRegion(info, out, x, y));
  } else {
    RETURN_IF_ERROR(ReadStrippedRegion(info, out, x, y));
  }
  return out;
}

absl::Status TiffFile::ReadTiledRegion(const TiffDirectoryInfo& info,
                                       Image& out, uint32_t x,
                                       uint32_t y) const {
  TIFF* tif = handle_guard_.Get();
  const uint32_t tile_width = (*info.tile_dims)[0];
  const uint32_t tile_height = (*info.tile_dims)[1];
  const size_t bytes_per_pixel = info.GetBytesPerPixel();
  const uint32_t x_end = x + out.GetWidth();
  const uint32_t y_end = y + out.GetHeight();

  const tmsize_t tile_size = TIFFTileSize(tif);
  if (tile_size <= 0) {
    return MAKE_ERROR(ErrorKind::kDecode, "Failed to get tile size");
  }
  std::vector<uint8_t> tile_buffer(static_cast<size_t>(tile_size));

  for (uint32_t tile_y = (y / tile_height) * tile_height; tile_y < y_end;
       tile_y += tile_height) {
    for (uint32_t tile_x = (x / tile_width) * tile_width; tile_x < x_end;
         tile_x += tile_width) {
      if (TIFFReadTile(tif, tile_buffer.data(), tile_x, tile_y, 0, 0) < 0) {
        return MAKE_ERROR(
            ErrorKind::kDecode,
            slidepatch::fmt::format("Failed to read tile ({}, {})", tile_x,
                                    tile_y));
      }

      const uint32_t copy_x0 = std::max(x, tile_x);
      const uint32_t copy_x1 = std::min(x_end, tile_x + tile_width);
      const uint32_t copy_y0 = std::max(y, tile_y);
      const uint32_t copy_y1 = std::min(y_end, tile_y + tile_height);
      const size_t row_bytes =
          static_cast<size_t>(copy_x1 - copy_x0) * bytes_per_pixel;

      for (uint32_t row = copy_y0; row < copy_y1; ++row) {
        const size_t src_offset =
            (static_cast<size_t>(row - tile_y) * tile_width +
             (copy_x0 - tile_x)) *
            bytes_per_pixel;
        const size_t dst_offset =
            (static_cast<size_t>(row - y) * out.GetWidth() + (copy_x0 - x)) *
            bytes_per_pixel;
        std::memcpy(out.GetData() + dst_offset,
                    tile_buffer.data() + src_offset, row_bytes);
      }
    }
  }
  return absl::OkStatus();
}

absl::Status TiffFile::ReadStrippedRegion(const TiffDirectoryInfo& info,
                                          Image& out, uint32_t x,
                                          uint32_t y) const {
  TIFF* tif = handle_guard_.Get();
  const uint32_t image_width = info.image_dims[0];
  const uint32_t image_height = info.image_dims[1];
  const uint32_t rows_per_strip = std::max(info.rows_per_strip, 1U);
  const size_t bytes_per_pixel = info.GetBytesPerPixel();
  const uint32_t y_end = y + out.GetHeight();
  const size_t row_bytes = static_cast<size_t>(out.GetWidth()) * bytes_per_pixel;
  const size_t src_stride = static_cast<size_t>(image_width) * bytes_per_pixel;

  const tmsize_t strip_size = TIFFStripSize(tif);
  if (strip_size <= 0) {
    return MAKE_ERROR(ErrorKind::kDecode, "Failed to get strip size");
  }
  std::vector<uint8_t> strip_buffer(static_cast<size_t>(strip_size));

  for (uint32_t strip_y = (y / rows_per_strip) * rows_per_strip;
       strip_y < y_end; strip_y += rows_per_strip) {
    const tstrip_t strip = TIFFComputeStrip(tif, strip_y, 0);
    if (TIFFReadEncodedStrip(tif, strip, strip_buffer.data(), strip_size) <
        0) {
      return MAKE_ERROR(
          ErrorKind::kDecode,
          slidepatch::fmt::format("Failed to read strip {}", strip));
    }

    const uint32_t copy_y0 = std::max(y, strip_y);
    const uint32_t copy_y1 =
        std::min({y_end, strip_y + rows_per_strip, image_height});
    for (uint32_t row = copy_y0; row < copy_y1; ++row) {
      const size_t src_offset =
          static_cast<size_t>(row - strip_y) * src_stride +
          static_cast<size_t>(x) * bytes_per_pixel;
      const size_t dst_offset = static_cast<size_t>(row - y) * row_bytes;
      std::memcpy(out.GetData() + dst_offset,
                  strip_buffer.data() + src_offset, row_bytes);
    }
  }
  return absl::OkStatus();
}

template absl::StatusOr<uint16_t> TiffFile::GetRequiredField<uint16_t>(
    ttag_t tag) const;
template absl::StatusOr<uint32_t> TiffFile::GetRequiredField<uint32_t>(
    ttag_t tag) const;

template std::optional<uint16_t> TiffFile::GetOptionalField<uint16_t>(
    ttag_t tag) const;
template std::optional<uint32_t> TiffFile::GetOptionalField<uint32_t>(
    ttag_t tag) const;
template std::optional<float> TiffFile::GetOptionalField<float>(
    ttag_t tag) const;

}  // namespace slidepatch
