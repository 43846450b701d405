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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_IMAGE_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "slidepatch/concepts/numeric.h"

namespace slidepatch {

/// @brief Image dimensions
using ImageDimensions = Size<uint32_t, 2>;  // [width, height]

/// @brief Image coordinate
using ImageCoordinate = Size<uint32_t, 2>;  // [x, y]

/// @brief Image format enumeration
enum class ImageFormat {
  kGray = 1,  ///< Single channel grayscale
  kRGB = 3,   ///< 3 channels: Red, Green, Blue
  kRGBA = 4,  ///< 4 channels: Red, Green, Blue, Alpha
  kOther = 0  ///< Any other channel count (determined at runtime)
};

/// @brief Data type enumeration for pixel values
enum class DataType {
  kUInt8,    ///< 8-bit unsigned integer
  kUInt16,   ///< 16-bit unsigned integer
  kFloat32,  ///< 32-bit floating point
};

/// @brief Get size in bytes for a given data type
constexpr size_t GetDataTypeSize(DataType dtype) {
  switch (dtype) {
    case DataType::kUInt8:
      return sizeof(uint8_t);
    case DataType::kUInt16:
      return sizeof(uint16_t);
    case DataType::kFloat32:
      return sizeof(float);
  }
  return 0;
}

/// @brief Get string representation of data type
constexpr const char* GetName(DataType dtype) {
  switch (dtype) {
    case DataType::kUInt8:
      return "uint8";
    case DataType::kUInt16:
      return "uint16";
    case DataType::kFloat32:
      return "float32";
  }
  return "unknown";
}

/// @brief Get string representation of image format
constexpr const char* GetName(ImageFormat format) {
  switch (format) {
    case ImageFormat::kGray:
      return "Gray";
    case ImageFormat::kRGB:
      return "RGB";
    case ImageFormat::kRGBA:
      return "RGBA";
    case ImageFormat::kOther:
      return "Other";
  }
  return "unknown";
}

/// @brief Map a channel count onto the matching format
constexpr ImageFormat FormatForChannels(uint32_t channels) {
  switch (channels) {
    case 1:
      return ImageFormat::kGray;
    case 3:
      return ImageFormat::kRGB;
    case 4:
      return ImageFormat::kRGBA;
    default:
      return ImageFormat::kOther;
  }
}

/// @brief Interleaved pixel buffer
///
/// Pixels are stored row-major with channels interleaved (RGBRGB...), which
/// is the layout libtiff, lodepng and the masking code all work in.
class Image {
 public:
  /// @brief Default constructor for empty image
  Image()
      : dimensions_({0, 0}),
        format_(ImageFormat::kRGB),
        dtype_(DataType::kUInt8),
        channels_(0) {}

  /// @brief Constructor for a zero-filled image
  /// @param dimensions Image dimensions [width, height]
  /// @param channels Number of interleaved channels
  /// @param dtype Data type
  Image(const ImageDimensions& dimensions, uint32_t channels, DataType dtype)
      : dimensions_(dimensions),
        format_(FormatForChannels(channels)),
        dtype_(dtype),
        channels_(channels) {
    if (channels == 0) {
      throw std::invalid_argument("Image must have at least one channel");
    }
    data_.resize(dimensions_.Volume() * channels_ * GetDataTypeSize(dtype_),
                 0);
  }

  /// @brief Constructor for standard formats
  Image(const ImageDimensions& dimensions, ImageFormat format, DataType dtype)
      : Image(dimensions, static_cast<uint32_t>(format), dtype) {
    if (format == ImageFormat::kOther) {
      throw std::invalid_argument("Use the channel-count constructor");
    }
  }

  Image(const Image& other) = default;
  Image(Image&& other) noexcept = default;
  Image& operator=(const Image& other) = default;
  Image& operator=(Image&& other) noexcept = default;
  ~Image() = default;

  [[nodiscard]] const ImageDimensions& GetDimensions() const noexcept {
    return dimensions_;
  }

  [[nodiscard]] uint32_t GetWidth() const noexcept { return dimensions_[0]; }

  [[nodiscard]] uint32_t GetHeight() const noexcept { return dimensions_[1]; }

  [[nodiscard]] uint32_t GetChannels() const noexcept { return channels_; }

  [[nodiscard]] ImageFormat GetFormat() const noexcept { return format_; }

  [[nodiscard]] DataType GetDataType() const noexcept { return dtype_; }

  /// @brief Check if image has no pixels
  [[nodiscard]] bool Empty() const noexcept { return data_.empty(); }

  /// @brief Check for interleaved 8-bit RGB
  [[nodiscard]] bool IsRGB8() const noexcept {
    return channels_ == 3 && dtype_ == DataType::kUInt8;
  }

  /// @brief Get total number of pixels
  [[nodiscard]] size_t GetPixelCount() const noexcept {
    return dimensions_.Volume();
  }

  /// @brief Get total size in bytes
  [[nodiscard]] size_t SizeBytes() const noexcept { return data_.size(); }

  [[nodiscard]] const uint8_t* GetData() const noexcept { return data_.data(); }

  [[nodiscard]] uint8_t* GetData() noexcept { return data_.data(); }

  /// @brief Get typed data pointer
  /// @throws std::invalid_argument if T does not match the sample size
  template <typename T>
  [[nodiscard]] const T* GetDataAs() const {
    if (sizeof(T) != GetDataTypeSize(dtype_)) {
      throw std::invalid_argument("Type size mismatch");
    }
    return reinterpret_cast<const T*>(data_.data());
  }

  template <typename T>
  [[nodiscard]] T* GetDataAs() {
    if (sizeof(T) != GetDataTypeSize(dtype_)) {
      throw std::invalid_argument("Type size mismatch");
    }
    return reinterpret_cast<T*>(data_.data());
  }

  /// @brief Get pixel value (typed)
  /// @param y Row
  /// @param x Column
  /// @param channel Channel index
  template <typename T>
  [[nodiscard]] T& At(uint32_t y, uint32_t x, uint32_t channel) {
    return GetDataAs<T>()[GetSampleIndex(y, x, channel)];
  }

  template <typename T>
  [[nodiscard]] const T& At(uint32_t y, uint32_t x, uint32_t channel) const {
    return GetDataAs<T>()[GetSampleIndex(y, x, channel)];
  }

  /// @brief Index of a sample in the interleaved buffer
  [[nodiscard]] size_t GetSampleIndex(uint32_t y, uint32_t x,
                                      uint32_t channel) const noexcept {
    return (static_cast<size_t>(y) * dimensions_[0] + x) * channels_ + channel;
  }

 private:
  ImageDimensions dimensions_;
  ImageFormat format_;
  DataType dtype_;
  uint32_t channels_;
  std::vector<uint8_t> data_;
};

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_IMAGE_H_
