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

#include "slidepatch/utilities/png.h"

#include <cstdint>
#include <filesystem>
#include <vector>

#include "lodepng/lodepng.h"
#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::utilities {

absl::StatusOr<std::vector<uint8_t>> EncodePng(const Image& image) {
  if (image.GetDataType() != DataType::kUInt8) {
    return MAKE_ERROR(ErrorKind::kUnsupportedFormat,
                      slidepatch::fmt::format("Cannot encode {} pixels as PNG",
                                              GetName(image.GetDataType())));
  }

  LodePNGColorType color_type;
  switch (image.GetChannels()) {
    case 1:
      color_type = LCT_GREY;
      break;
    case 3:
      color_type = LCT_RGB;
      break;
    case 4:
      color_type = LCT_RGBA;
      break;
    default:
      return MAKE_ERROR(
          ErrorKind::kUnsupportedFormat,
          slidepatch::fmt::format("Cannot encode {} channel(s) as PNG",
                                  image.GetChannels()));
  }

  std::vector<unsigned char> encoded;
  const unsigned error =
      lodepng::encode(encoded, image.GetData(), image.GetWidth(),
                      image.GetHeight(), color_type, 8);
  if (error != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       slidepatch::fmt::format("PNG encoding failed: {}",
                                               lodepng_error_text(error)));
  }
  return encoded;
}

absl::Status WriteFile(const std::filesystem::path& path,
                       const std::vector<uint8_t>& data) {
  const unsigned error = lodepng::save_file(data, path.string());
  if (error != 0) {
    return MAKE_ERROR(ErrorKind::kWrite,
                      slidepatch::fmt::format("Cannot write {}: {}",
                                              path.string(),
                                              lodepng_error_text(error)));
  }
  return absl::OkStatus();
}

absl::Status WritePng(const std::filesystem::path& path, const Image& image) {
  DECLARE_ASSIGN_OR_RETURN(std::vector<uint8_t>, encoded, EncodePng(image));
  return WriteFile(path, encoded);
}

}  // namespace slidepatch::utilities
