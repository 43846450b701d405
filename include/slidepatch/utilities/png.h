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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_PNG_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_PNG_H_

#include <cstdint>
#include <filesystem>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidepatch/image.h"

namespace slidepatch::utilities {

/// @brief Encode a gray, RGB or RGBA uint8 image as PNG (lodepng)
/// @return PNG bytes, or an UnsupportedFormat error for other layouts
absl::StatusOr<std::vector<uint8_t>> EncodePng(const Image& image);

/// @brief Write bytes to a file, replacing it if it exists
/// @return OkStatus, or a WriteError
absl::Status WriteFile(const std::filesystem::path& path,
                       const std::vector<uint8_t>& data);

/// @brief Encode @p image and write it to @p path
absl::Status WritePng(const std::filesystem::path& path, const Image& image);

}  // namespace slidepatch::utilities

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_PNG_H_
