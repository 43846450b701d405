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

#include "slidepatch/readers/png_reader.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "lodepng/lodepng.h"
#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch {

absl::StatusOr<std::unique_ptr<MemoryReader>> OpenPngSlide(
    const std::filesystem::path& path) {
  std::vector<unsigned char> pixels;
  unsigned width = 0;
  unsigned height = 0;
  const unsigned error =
      lodepng::decode(pixels, width, height, path.string(), LCT_RGB, 8);
  if (error != 0) {
    return MAKE_ERROR(
        ErrorKind::kDecode,
        slidepatch::fmt::format("Failed to decode PNG {}: {}", path.string(),
                                lodepng_error_text(error)));
  }

  Image image(ImageDimensions{width, height}, ImageFormat::kRGB,
              DataType::kUInt8);
  std::copy(pixels.begin(), pixels.end(), image.GetData());

  auto reader = MemoryReader::Create(std::move(image), SlideProperties(), "PNG");
  if (!reader.ok()) {
    return WithErrorKind(reader.status(), ErrorKind::kDecode);
  }
  return reader;
}

}  // namespace slidepatch
