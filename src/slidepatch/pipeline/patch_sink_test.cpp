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

#include "slidepatch/pipeline/patch_sink.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "slidepatch/errors.h"
#include "slidepatch/utilities/temporary.h"
#include "slidepatch/utilities/zip.h"

namespace slidepatch::pipeline {
namespace {

namespace fs = std::filesystem;

const std::vector<uint8_t> kPayload = {1, 2, 3, 4, 5};

TEST(DirectoryPatchSinkTest, WritesFiles) {
  utilities::TemporaryDirectory temp;
  auto sink = DirectoryPatchSink::Create(temp.Path() / "patches");
  ASSERT_TRUE(sink.ok()) << sink.status();

  auto location = (*sink)->Put("a---[x=0,y=0,w=1,h=1].png", kPayload);
  ASSERT_TRUE(location.ok()) << location.status();
  EXPECT_EQ(fs::path(*location),
            temp.Path() / "patches" / "a---[x=0,y=0,w=1,h=1].png");
  EXPECT_EQ(fs::file_size(*location), kPayload.size());
  EXPECT_TRUE((*sink)->Finalize().ok());
}

TEST(DirectoryPatchSinkTest, BlockedPathIsWriteError) {
  utilities::TemporaryDirectory temp;
  auto sink = DirectoryPatchSink::Create(temp.Path());
  ASSERT_TRUE(sink.ok()) << sink.status();
  fs::create_directory(temp.Path() / "taken.png");

  auto location = (*sink)->Put("taken.png", kPayload);
  ASSERT_FALSE(location.ok());
  EXPECT_TRUE(IsErrorKind(location.status(), ErrorKind::kWrite));
}

TEST(ZipPatchSinkTest, StoresEntriesUnderPatchesFolder) {
  utilities::TemporaryDirectory temp;
  const fs::path archive_path = temp.Path() / "out" / "patches.zip";
  {
    auto sink = ZipPatchSink::Create(archive_path);
    ASSERT_TRUE(sink.ok()) << sink.status();
    auto first = (*sink)->Put("b.png", kPayload);
    auto second = (*sink)->Put("a.png", {9});
    ASSERT_TRUE(first.ok()) << first.status();
    ASSERT_TRUE(second.ok()) << second.status();
    EXPECT_EQ(*first, archive_path.string() + "!/patches/b.png");
    ASSERT_TRUE((*sink)->Finalize().ok());
  }

  auto archive = utilities::ZipArchive::OpenForReading(archive_path);
  ASSERT_TRUE(archive.ok()) << archive.status();
  auto entries = archive->ListEntries();
  ASSERT_TRUE(entries.ok()) << entries.status();
  std::sort(entries->begin(), entries->end());
  EXPECT_EQ(*entries,
            (std::vector<std::string>{"patches/a.png", "patches/b.png"}));

  auto data = archive->ReadEntry("patches/b.png");
  ASSERT_TRUE(data.ok()) << data.status();
  EXPECT_EQ(*data, std::string("\x01\x02\x03\x04\x05"));
  EXPECT_FALSE(archive->ReadEntry("patches/c.png").ok());
}

}  // namespace
}  // namespace slidepatch::pipeline
