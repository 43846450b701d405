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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_RUNTIME_FORMAT_DESCRIPTOR_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_RUNTIME_FORMAT_DESCRIPTOR_H_

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"

namespace slidepatch {

class SlideReader;

namespace runtime {

/// @brief Factory creating a reader for a file path
using ReaderFactory =
    std::function<absl::StatusOr<std::unique_ptr<SlideReader>>(
        std::string_view filename)>;

/// @brief Describes a slide format and how to open it
struct FormatDescriptor {
  /// @brief Primary file extension (e.g., ".svs")
  std::string primary_extension;

  /// @brief Alternative extensions (e.g., {".tif", ".tiff"})
  std::vector<std::string> aliases;

  /// @brief Human-readable format name (e.g., "SVS")
  std::string format_name;

  /// @brief Creates a reader for a file of this format
  ReaderFactory factory;

  /// @brief Check if this descriptor handles a given extension
  /// @param extension File extension with leading dot
  [[nodiscard]] bool HandlesExtension(std::string_view extension) const {
    if (extension == primary_extension) {
      return true;
    }
    for (const auto& alias : aliases) {
      if (extension == alias) {
        return true;
      }
    }
    return false;
  }
};

/// @brief Descriptor for Aperio SVS and generic pyramidal TIFF
FormatDescriptor CreateTiffFormatDescriptor();

/// @brief Descriptor for flat PNG images
FormatDescriptor CreatePngFormatDescriptor();

}  // namespace runtime
}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_RUNTIME_FORMAT_DESCRIPTOR_H_
