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

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "slidepatch/readers/png_reader.h"
#include "slidepatch/readers/tiff_reader.h"
#include "slidepatch/runtime/format_descriptor.h"
#include "slidepatch/runtime/reader_registry.h"
#include "slidepatch/slide_reader.h"

namespace slidepatch::runtime {

FormatDescriptor CreateTiffFormatDescriptor() {
  FormatDescriptor descriptor;
  descriptor.primary_extension = ".svs";
  descriptor.aliases = {".tif", ".tiff"};
  descriptor.format_name = "TIFF";
  descriptor.factory = [](std::string_view filename)
      -> absl::StatusOr<std::unique_ptr<SlideReader>> {
    auto reader = TiffReader::Create(std::string(filename));
    if (!reader.ok()) {
      return reader.status();
    }
    return std::unique_ptr<SlideReader>(std::move(*reader));
  };
  return descriptor;
}

FormatDescriptor CreatePngFormatDescriptor() {
  FormatDescriptor descriptor;
  descriptor.primary_extension = ".png";
  descriptor.format_name = "PNG";
  descriptor.factory = [](std::string_view filename)
      -> absl::StatusOr<std::unique_ptr<SlideReader>> {
    auto reader = OpenPngSlide(std::string(filename));
    if (!reader.ok()) {
      return reader.status();
    }
    return std::unique_ptr<SlideReader>(std::move(*reader));
  };
  return descriptor;
}

void RegisterBuiltinFormats(ReaderRegistry& registry) {
  registry.RegisterFormat(CreateTiffFormatDescriptor());
  registry.RegisterFormat(CreatePngFormatDescriptor());
}

}  // namespace slidepatch::runtime
