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

#include "slidepatch/pipeline/manifest.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "slidepatch/utilities/temporary.h"

namespace slidepatch::pipeline {
namespace {

TEST(ManifestTest, FormatsRowWithQuotedPath) {
  const AcceptedPatch patch{
      .index = 3,
      .tile = Tile{.x = 0, .y = 512, .width = 512, .height = 512},
      .coverage = 0.734375,
      .output_path = "out/patches/a.svs---[x=0,y=512,w=512,h=512].png"};
  EXPECT_EQ(FormatManifestRow(patch),
            "3,0,512,512,512,0.734375,"
            "\"out/patches/a.svs---[x=0,y=512,w=512,h=512].png\"");
}

TEST(ManifestTest, EscapesQuotesInPath) {
  const AcceptedPatch patch{.index = 0,
                            .tile = Tile{.x = 1, .y = 2, .width = 3, .height = 4},
                            .coverage = 1.0,
                            .output_path = "say \"hi\".png"};
  EXPECT_EQ(FormatManifestRow(patch), "0,1,2,3,4,1.000000,\"say \"\"hi\"\".png\"");
}

TEST(ManifestTest, ReadsBackWhatWasWritten) {
  utilities::TemporaryDirectory temp;
  const std::vector<AcceptedPatch> patches = {
      {.index = 0,
       .tile = Tile{.x = 0, .y = 0, .width = 256, .height = 256},
       .coverage = 0.5,
       .output_path = "p/s---[x=0,y=0,w=256,h=256].png"},
      {.index = 1,
       .tile = Tile{.x = 256, .y = 0, .width = 100, .height = 256},
       .coverage = 0.25,
       .output_path = "p/\"odd\", name.png"},
  };
  const auto path = temp.Path() / "manifest.csv";
  ASSERT_TRUE(WriteManifest(path, patches).ok());

  auto read = ReadManifest(path);
  ASSERT_TRUE(read.ok()) << read.status();
  ASSERT_EQ(read->size(), 2);
  EXPECT_EQ((*read)[1].index, 1);
  EXPECT_EQ((*read)[1].tile, patches[1].tile);
  EXPECT_DOUBLE_EQ((*read)[1].coverage, 0.25);
  EXPECT_EQ((*read)[1].output_path, patches[1].output_path);
  EXPECT_EQ((*read)[0].output_path, patches[0].output_path);
}

TEST(ManifestTest, EmptyManifestHasHeaderOnly) {
  utilities::TemporaryDirectory temp;
  const auto path = temp.Path() / "manifest.csv";
  ASSERT_TRUE(WriteManifest(path, {}).ok());

  std::ifstream in(path);
  std::string first;
  std::string second;
  ASSERT_TRUE(std::getline(in, first));
  EXPECT_EQ(first, kManifestHeader);
  EXPECT_FALSE(std::getline(in, second));

  auto read = ReadManifest(path);
  ASSERT_TRUE(read.ok()) << read.status();
  EXPECT_TRUE(read->empty());
}

TEST(ManifestTest, RejectsMalformedInput) {
  utilities::TemporaryDirectory temp;
  const auto path = temp.Path() / "manifest.csv";

  {
    std::ofstream out(path);
    out << "x,y\n";
  }
  EXPECT_EQ(ReadManifest(path).status().code(),
            absl::StatusCode::kInvalidArgument);

  {
    std::ofstream out(path);
    out << kManifestHeader << "\n0,1,2,3\n";
  }
  EXPECT_EQ(ReadManifest(path).status().code(),
            absl::StatusCode::kInvalidArgument);

  {
    std::ofstream out(path);
    out << kManifestHeader << "\n0,1,2,3,4,high,\"a.png\"\n";
  }
  EXPECT_EQ(ReadManifest(path).status().code(),
            absl::StatusCode::kInvalidArgument);

  EXPECT_EQ(ReadManifest(temp.Path() / "missing.csv").status().code(),
            absl::StatusCode::kNotFound);
}

TEST(ManifestTest, UnwritableLocationIsWriteError) {
  utilities::TemporaryDirectory temp;
  auto status = WriteManifest(temp.Path() / "no" / "such" / "manifest.csv", {});
  EXPECT_FALSE(status.ok());
}

}  // namespace
}  // namespace slidepatch::pipeline
