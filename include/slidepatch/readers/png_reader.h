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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_PNG_READER_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_PNG_READER_H_

#include <filesystem>
#include <memory>

#include "absl/status/statusor.h"
#include "slidepatch/readers/memory_reader.h"

namespace slidepatch {

/// @brief Open a PNG image as a slide
///
/// The image is decoded to 8-bit RGB with lodepng and wrapped in a
/// MemoryReader. PNG carries no calibration, so the slide reports an unknown
/// MPP.
///
/// @return Reader, or a DecodeError if the file cannot be decoded
absl::StatusOr<std::unique_ptr<MemoryReader>> OpenPngSlide(
    const std::filesystem::path& path);

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_READERS_PNG_READER_H_
