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

#include "slidepatch/runtime/reader_registry.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "lodepng/lodepng.h"
#include "slidepatch/errors.h"
#include "slidepatch/runtime/format_descriptor.h"
#include "slidepatch/slide_reader.h"

namespace fs = std::filesystem;

namespace slidepatch {
namespace runtime {
namespace {

/// @brief Descriptor whose factory always fails with a plain status
FormatDescriptor CreateFailingDescriptor() {
  FormatDescriptor desc;
  desc.format_name = "FAKE";
  desc.primary_extension = ".fake";
  desc.aliases = {".FK"};
  desc.factory = [](std::string_view filename)
      -> absl::StatusOr<std::unique_ptr<SlideReader>> {
    return absl::UnimplementedError("Fake factory");
  };
  return desc;
}

TEST(ReaderRegistryTest, EmptyRegistry) {
  ReaderRegistry registry;

  EXPECT_TRUE(registry.ListFormats().empty());
  EXPECT_TRUE(registry.GetSupportedExtensions().empty());
  EXPECT_FALSE(registry.SupportsExtension(".svs"));
}

TEST(ReaderRegistryTest, RegistersPrimaryExtensionAndAliases) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateFailingDescriptor());

  EXPECT_TRUE(registry.SupportsExtension(".fake"));
  EXPECT_TRUE(registry.SupportsExtension("FAKE"));
  EXPECT_TRUE(registry.SupportsExtension(".fk"));
  EXPECT_EQ(registry.ListFormats(), std::vector<std::string>{"FAKE"});
  EXPECT_EQ(registry.GetSupportedExtensions(),
            (std::vector<std::string>{".fake", ".fk"}));
}

TEST(ReaderRegistryTest, NormalizesExtensions) {
  EXPECT_EQ(ReaderRegistry::NormalizeExtension("SVS"), ".svs");
  EXPECT_EQ(ReaderRegistry::NormalizeExtension(".Tiff"), ".tiff");
  EXPECT_EQ(ReaderRegistry::NormalizeExtension(""), "");
}

TEST(ReaderRegistryTest, UnknownExtensionIsDecodeError) {
  ReaderRegistry registry;
  auto reader = registry.CreateReader("slide.xyz");
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kDecode));

  auto no_extension = registry.CreateReader("slide");
  EXPECT_TRUE(IsErrorKind(no_extension.status(), ErrorKind::kDecode));
}

TEST(ReaderRegistryTest, FactoryFailureIsTaggedAsDecodeError) {
  ReaderRegistry registry;
  registry.RegisterFormat(CreateFailingDescriptor());

  auto reader = registry.CreateReader("/tmp/a.fake");
  ASSERT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kUnimplemented);
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kDecode));
}

TEST(ReaderRegistryTest, GlobalRegistryHasBuiltinFormats) {
  ReaderRegistry& registry = GetGlobalRegistry();
  for (const char* extension : {".svs", ".tif", ".tiff", ".png"}) {
    EXPECT_TRUE(registry.SupportsExtension(extension)) << extension;
  }
  EXPECT_EQ(&registry, &GetGlobalRegistry());
}

TEST(ReaderRegistryTest, OpensPngThroughGlobalRegistry) {
  const fs::path path =
      fs::temp_directory_path() / "slidepatch_registry_test.png";
  std::vector<unsigned char> pixels(40 * 30 * 3, 0);
  for (size_t i = 0; i < pixels.size(); i += 3) {
    pixels[i] = 255;
  }
  ASSERT_EQ(lodepng_encode24_file(path.string().c_str(), pixels.data(), 40, 30),
            0U);

  auto reader = GetGlobalRegistry().CreateReader(path.string());
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ((*reader)->GetFormatName(), "PNG");
  EXPECT_EQ((*reader)->GetDimensions(), (ImageDimensions{40, 30}));
  EXPECT_FALSE((*reader)->GetProperties().HasMpp());

  auto image = (*reader)->ReadRegion(
      RegionSpec{.top_left = {0, 0}, .size = {2, 2}, .level = 0});
  ASSERT_TRUE(image.ok()) << image.status();
  EXPECT_EQ(image->At<uint8_t>(1, 1, 0), 255);
  EXPECT_EQ(image->At<uint8_t>(1, 1, 1), 0);

  fs::remove(path);
}

TEST(ReaderRegistryTest, CorruptPngIsDecodeError) {
  const fs::path path =
      fs::temp_directory_path() / "slidepatch_registry_corrupt.png";
  {
    std::FILE* file = std::fopen(path.string().c_str(), "wb");
    ASSERT_NE(file, nullptr);
    std::fputs("not a png", file);
    std::fclose(file);
  }
  auto reader = GetGlobalRegistry().CreateReader(path.string());
  ASSERT_FALSE(reader.ok());
  EXPECT_TRUE(IsErrorKind(reader.status(), ErrorKind::kDecode));
  fs::remove(path);
}

}  // namespace
}  // namespace runtime
}  // namespace slidepatch
