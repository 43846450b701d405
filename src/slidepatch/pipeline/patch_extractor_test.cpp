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

#include "slidepatch/pipeline/patch_extractor.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/synchronization/notification.h"
#include "lodepng/lodepng.h"
#include "slidepatch/errors.h"
#include "slidepatch/masking/polygon_mask.h"
#include "slidepatch/pipeline/manifest.h"
#include "slidepatch/readers/memory_reader.h"
#include "slidepatch/utilities/temporary.h"
#include "slidepatch/utilities/zip.h"

namespace slidepatch::pipeline {
namespace {

namespace fs = std::filesystem;

constexpr uint32_t kSlideSize = 1024;

void Fill(Image& image, uint32_t x0, uint32_t y0, uint32_t x1, uint32_t y1,
          uint8_t r, uint8_t g, uint8_t b) {
  for (uint32_t y = y0; y < y1; ++y) {
    for (uint32_t x = x0; x < x1; ++x) {
      image.At<uint8_t>(y, x, 0) = r;
      image.At<uint8_t>(y, x, 1) = g;
      image.At<uint8_t>(y, x, 2) = b;
    }
  }
}

// Stained tissue on the left half, glass on the right half, and an 8x8
// tissue-colored speck on the glass.
Image MakeSlide() {
  Image image(ImageDimensions{kSlideSize, kSlideSize}, ImageFormat::kRGB,
              DataType::kUInt8);
  Fill(image, 0, 0, kSlideSize / 2, kSlideSize, 180, 100, 160);
  Fill(image, kSlideSize / 2, 0, kSlideSize, kSlideSize, 240, 240, 240);
  Fill(image, 896, 896, 904, 904, 180, 100, 160);
  return image;
}

std::unique_ptr<MemoryReader> MakeReader(double mpp = 0.0) {
  SlideProperties properties;
  properties.mpp = Size<double, 2>{mpp, mpp};
  auto reader = MemoryReader::Create(MakeSlide(), properties);
  EXPECT_TRUE(reader.ok()) << reader.status();
  return std::move(*reader);
}

/// Fails level-0 reads of the tile at the origin
class FaultyReader : public SlideReader {
 public:
  explicit FaultyReader(std::unique_ptr<SlideReader> inner)
      : inner_(std::move(inner)) {}

  int GetLevelCount() const override { return inner_->GetLevelCount(); }

  absl::StatusOr<LevelInfo> GetLevelInfo(int level) const override {
    return inner_->GetLevelInfo(level);
  }

  const SlideProperties& GetProperties() const override {
    return inner_->GetProperties();
  }

  absl::StatusOr<Image> ReadRegion(const RegionSpec& region) const override {
    if (region.level == 0 && region.top_left[0] == 0 &&
        region.top_left[1] == 0) {
      return absl::DataLossError("corrupt tile");
    }
    return inner_->ReadRegion(region);
  }

  std::string GetFormatName() const override { return "FAULTY"; }

 private:
  std::unique_ptr<SlideReader> inner_;
};

ExtractionConfig MakeConfig() {
  ExtractionConfig config;
  config.patch_size = {128, 128};
  config.stride = {128, 128};
  config.overview_target_size = 256;
  config.post_process = false;
  return config;
}

PatchExtractor MakeExtractor(const ExtractionConfig& config) {
  auto extractor = PatchExtractor::Create(config);
  EXPECT_TRUE(extractor.ok()) << extractor.status();
  return *std::move(extractor);
}

std::string ReadText(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

TEST(PatchExtractorTest, WritesPatchesOverviewsAndManifest) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  const PatchExtractor extractor = MakeExtractor(MakeConfig());

  auto report = extractor.Run(*reader, "slide.png", temp.Path() / "out");
  ASSERT_TRUE(report.ok()) << report.status();

  // 8x8 grid, left four columns are tissue
  EXPECT_EQ(report->considered, 64);
  EXPECT_EQ(report->accepted, 32);
  EXPECT_EQ(report->written, 32);
  EXPECT_EQ(report->failed(), 0);
  EXPECT_FALSE(report->cancelled);
  EXPECT_EQ(report->overview_level, 2);

  const fs::path out = temp.Path() / "out";
  EXPECT_TRUE(fs::exists(out / "overview.png"));
  EXPECT_TRUE(fs::exists(out / "tissue-mask.png"));
  EXPECT_TRUE(fs::exists(out / "masked-overview.png"));
  EXPECT_TRUE(fs::exists(out / "patches" / "slide.png---[x=0,y=0,w=128,h=128].png"));
  EXPECT_FALSE(fs::exists(out / "patches" / "slide.png---[x=512,y=0,w=128,h=128].png"));

  auto manifest = ReadManifest(report->manifest_path);
  ASSERT_TRUE(manifest.ok()) << manifest.status();
  ASSERT_EQ(manifest->size(), 32);
  for (size_t i = 0; i < manifest->size(); ++i) {
    const AcceptedPatch& row = (*manifest)[i];
    EXPECT_EQ(row.index, i);
    EXPECT_LT(row.tile.x, 512);
    EXPECT_DOUBLE_EQ(row.coverage, 1.0);
    EXPECT_TRUE(fs::exists(row.output_path)) << row.output_path;
  }
  EXPECT_EQ((*manifest)[4].tile, (Tile{.x = 0, .y = 128, .width = 128, .height = 128}));
}

TEST(PatchExtractorTest, RerunProducesIdenticalManifest) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  const PatchExtractor extractor = MakeExtractor(MakeConfig());

  auto first = extractor.Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(first.ok()) << first.status();
  const std::string first_manifest = ReadText(first->manifest_path);

  auto second = extractor.Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(second.ok()) << second.status();
  EXPECT_EQ(ReadText(second->manifest_path), first_manifest);
}

TEST(PatchExtractorTest, WorkerCountDoesNotChangeManifest) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();

  ExtractionConfig config = MakeConfig();
  config.patch_size = {100, 100};
  config.stride = {75, 75};
  auto serial = MakeExtractor(config).Run(*reader, "s", temp.Path() / "serial");
  config.workers = 4;
  auto parallel =
      MakeExtractor(config).Run(*reader, "s", temp.Path() / "parallel");
  ASSERT_TRUE(serial.ok()) << serial.status();
  ASSERT_TRUE(parallel.ok()) << parallel.status();

  ASSERT_EQ(serial->patches.size(), parallel->patches.size());
  EXPECT_GT(serial->patches.size(), 0);
  for (size_t i = 0; i < serial->patches.size(); ++i) {
    const AcceptedPatch& a = serial->patches[i];
    const AcceptedPatch& b = parallel->patches[i];
    EXPECT_EQ(a.index, b.index);
    EXPECT_EQ(a.tile, b.tile);
    EXPECT_EQ(a.coverage, b.coverage);
    EXPECT_EQ(fs::path(a.output_path).filename(),
              fs::path(b.output_path).filename());
  }
}

TEST(PatchExtractorTest, UnknownMaskingMethodFailsAtCreation) {
  ExtractionConfig config = MakeConfig();
  config.masking_method = "watershed";
  auto extractor = PatchExtractor::Create(config);
  ASSERT_FALSE(extractor.ok());
  EXPECT_TRUE(
      IsErrorKind(extractor.status(), ErrorKind::kUnknownMaskingMethod));
}

TEST(PatchExtractorTest, InvalidConfigurationIsRejected) {
  ExtractionConfig config = MakeConfig();
  config.coverage_threshold = 1.5;
  EXPECT_EQ(PatchExtractor::Create(config).status().code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(PatchExtractorTest, ZeroThresholdAcceptsEveryTile) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  ExtractionConfig config = MakeConfig();
  config.coverage_threshold = 0.0;

  auto report = MakeExtractor(config).Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->accepted, report->considered);
  EXPECT_EQ(report->written, 64);
}

TEST(PatchExtractorTest, CancellationWritesPartialManifest) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  absl::Notification cancel;
  cancel.Notify();

  auto report =
      MakeExtractor(MakeConfig()).Run(*reader, "slide", temp.Path(), &cancel);
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_TRUE(report->cancelled);
  EXPECT_EQ(report->considered, 0);
  EXPECT_EQ(report->written, 0);

  auto manifest = ReadManifest(report->manifest_path);
  ASSERT_TRUE(manifest.ok()) << manifest.status();
  EXPECT_TRUE(manifest->empty());
}

TEST(PatchExtractorTest, UnreadableTilesAreCountedAndSkipped) {
  utilities::TemporaryDirectory temp;
  FaultyReader reader(MakeReader());

  auto report = MakeExtractor(MakeConfig()).Run(reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->accepted, 32);
  EXPECT_EQ(report->read_failures, 1);
  EXPECT_EQ(report->written, 31);
  EXPECT_EQ(report->failed(), 1);
  EXPECT_EQ(report->patches.front().tile.x, 128);
  EXPECT_EQ(report->patches.front().index, 0);
}

TEST(PatchExtractorTest, WriteFailuresFollowPolicy) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  const Tile blocked{.x = 128, .y = 0, .width = 128, .height = 128};

  // A directory where a patch file should go makes that write fail
  fs::create_directories(temp.Path() / "skip" / "patches" /
                         PatchExtractor::PatchFileName("slide", blocked));
  auto skipped =
      MakeExtractor(MakeConfig()).Run(*reader, "slide", temp.Path() / "skip");
  ASSERT_TRUE(skipped.ok()) << skipped.status();
  EXPECT_EQ(skipped->write_failures, 1);
  EXPECT_EQ(skipped->written, 31);

  ExtractionConfig config = MakeConfig();
  config.write_error_policy = WriteErrorPolicy::kAbort;
  fs::create_directories(temp.Path() / "abort" / "patches" /
                         PatchExtractor::PatchFileName("slide", blocked));
  auto aborted =
      MakeExtractor(config).Run(*reader, "slide", temp.Path() / "abort");
  ASSERT_FALSE(aborted.ok());
  EXPECT_TRUE(IsErrorKind(aborted.status(), ErrorKind::kWrite));
  EXPECT_TRUE(fs::exists(temp.Path() / "abort" / "manifest.csv"));
}

TEST(PatchExtractorTest, ZipSinkStoresPatchesInArchive) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  ExtractionConfig config = MakeConfig();
  config.zip_patches = true;
  config.workers = 3;

  auto report = MakeExtractor(config).Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_FALSE(fs::exists(temp.Path() / "patches"));

  auto archive =
      utilities::ZipArchive::OpenForReading(temp.Path() / "patches.zip");
  ASSERT_TRUE(archive.ok()) << archive.status();
  auto entries = archive->ListEntries();
  ASSERT_TRUE(entries.ok()) << entries.status();
  EXPECT_EQ(entries->size(), 32);

  const std::string name =
      "patches/" + PatchExtractor::PatchFileName("slide", report->patches[0].tile);
  auto data = archive->ReadEntry(name);
  ASSERT_TRUE(data.ok()) << data.status();
  // PNG signature
  EXPECT_EQ(data->substr(1, 3), "PNG");
  EXPECT_NE(report->patches[0].output_path.find("patches.zip!/patches/"),
            std::string::npos);
}

TEST(PatchExtractorTest, OverviewOnlyMode) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  ExtractionConfig config = MakeConfig();
  config.extract_patches = false;

  auto report = MakeExtractor(config).Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->considered, 0);
  EXPECT_TRUE(report->manifest_path.empty());
  EXPECT_TRUE(fs::exists(temp.Path() / "overview.png"));
  EXPECT_FALSE(fs::exists(temp.Path() / "manifest.csv"));
}

TEST(PatchExtractorTest, PostProcessingNeedsCalibration) {
  ExtractionConfig config = MakeConfig();
  config.post_process = true;
  const PatchExtractor extractor = MakeExtractor(config);

  // Speck at level-0 (896, 896) lands on overview pixel (224, 224)
  auto uncalibrated = MakeReader();
  auto overview = LoadOverview(*uncalibrated, 256);
  ASSERT_TRUE(overview.ok()) << overview.status();
  bool post_processed = true;
  auto raw = extractor.ComputeMask(*overview, uncalibrated->GetProperties(),
                                   &post_processed);
  ASSERT_TRUE(raw.ok()) << raw.status();
  EXPECT_FALSE(post_processed);
  EXPECT_TRUE(raw->Get(224, 224));

  // 0.5 um/px at level 0 is 2 um/px on the overview: a 50 px closing element
  // and a 625 px minimum object size
  auto calibrated = MakeReader(0.5);
  auto cleaned = extractor.ComputeMask(*overview, calibrated->GetProperties(),
                                       &post_processed);
  ASSERT_TRUE(cleaned.ok()) << cleaned.status();
  EXPECT_TRUE(post_processed);
  EXPECT_FALSE(cleaned->Get(224, 224));
  EXPECT_TRUE(cleaned->Get(0, 0));
  EXPECT_TRUE(cleaned->Get(127, 255));
  EXPECT_FALSE(cleaned->Get(128, 0));
}

TEST(PatchExtractorTest, ExtractWithPolygonMask) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader();
  // Maps onto mask pixels 0..15, the top-left 2x2 tiles
  const masking::Polygon region = {{0, 0}, {240, 0}, {240, 240}, {0, 240}};
  auto mask = masking::TissueMaskFromPolygons(
      ImageDimensions{64, 64}, Size<double, 2>{64.0 / kSlideSize, 64.0 / kSlideSize},
      {region});
  ASSERT_TRUE(mask.ok()) << mask.status();

  auto report = MakeExtractor(MakeConfig())
                    .ExtractWithMask(*reader, *mask, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->considered, 64);
  EXPECT_EQ(report->written, 4);
  EXPECT_FALSE(fs::exists(temp.Path() / "overview.png"));

  EXPECT_FALSE(MakeExtractor(MakeConfig())
                   .ExtractWithMask(*reader, TissueMask(), "slide", temp.Path())
                   .ok());
}

TEST(PatchExtractorTest, EntropyFootprintFollowsElementSize) {
  ExtractionConfig config = MakeConfig();
  config.masking_method = "entropy";
  const PatchExtractor extractor = MakeExtractor(config);

  auto uncalibrated = MakeReader();
  auto overview = LoadOverview(*uncalibrated, 256);
  ASSERT_TRUE(overview.ok()) << overview.status();
  EXPECT_EQ(extractor.GetMaskingOptions(*overview,
                                        uncalibrated->GetProperties())
                .entropy_footprint,
            9);

  // 0.5 um/px at level 0, downsample 4: 100 um is 50 overview pixels
  auto calibrated = MakeReader(0.5);
  EXPECT_EQ(extractor.GetMaskingOptions(*overview, calibrated->GetProperties())
                .entropy_footprint,
            50);

  // Never wider than the overview itself
  config.element_size_um = 1.0e6;
  EXPECT_EQ(MakeExtractor(config)
                .GetMaskingOptions(*overview, calibrated->GetProperties())
                .entropy_footprint,
            256);
}

TEST(PatchExtractorTest, ResamplesPatchesToRequestedResolution) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader(0.5);
  ExtractionConfig config = MakeConfig();
  config.patch_mpp = 1.0;

  auto report = MakeExtractor(config).Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();

  // 256 level-0 pixels per patch: a 4x4 grid, two tissue columns
  EXPECT_EQ(report->considered, 16);
  EXPECT_EQ(report->written, 8);
  ASSERT_FALSE(report->patches.empty());
  EXPECT_EQ(report->patches[0].tile,
            (Tile{.x = 0, .y = 0, .width = 256, .height = 256}));

  std::vector<unsigned char> pixels;
  unsigned width = 0;
  unsigned height = 0;
  ASSERT_EQ(lodepng::decode(pixels, width, height,
                            report->patches[0].output_path, LCT_RGB, 8),
            0U);
  EXPECT_EQ(width, 128U);
  EXPECT_EQ(height, 128U);
  EXPECT_EQ(pixels[0], 180);
  EXPECT_EQ(pixels[1], 100);
  EXPECT_EQ(pixels[2], 160);
}

TEST(PatchExtractorTest, ClippedTilesKeepTheirAspectWhenResampled) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader(0.5);
  ExtractionConfig config = MakeConfig();
  config.patch_mpp = 1.5;

  auto report = MakeExtractor(config).Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();

  // 384 px footprints at 0, 384 and 768; the last row is clipped to 256
  const Tile clipped{.x = 0, .y = 768, .width = 384, .height = 256};
  const AcceptedPatch* patch = nullptr;
  for (const AcceptedPatch& candidate : report->patches) {
    if (candidate.tile == clipped) {
      patch = &candidate;
    }
  }
  ASSERT_NE(patch, nullptr);

  std::vector<unsigned char> pixels;
  unsigned width = 0;
  unsigned height = 0;
  ASSERT_EQ(lodepng::decode(pixels, width, height, patch->output_path, LCT_RGB,
                            8),
            0U);
  EXPECT_EQ(width, 128U);
  EXPECT_EQ(height, 85U);
}

TEST(PatchExtractorTest, NativeResolutionMatchesUnsetPatchMpp) {
  utilities::TemporaryDirectory temp;
  auto reader = MakeReader(0.5);
  ExtractionConfig config = MakeConfig();
  config.patch_mpp = 0.5;

  auto report = MakeExtractor(config).Run(*reader, "slide", temp.Path());
  ASSERT_TRUE(report.ok()) << report.status();
  EXPECT_EQ(report->considered, 64);
  EXPECT_EQ(report->written, 32);
}

TEST(PatchExtractorTest, RejectsUnreachablePatchResolution) {
  utilities::TemporaryDirectory temp;
  ExtractionConfig config = MakeConfig();
  config.patch_mpp = 0.25;
  const PatchExtractor extractor = MakeExtractor(config);

  // Finer than the slide
  auto finer = extractor.Run(*MakeReader(0.5), "slide", temp.Path() / "a");
  EXPECT_EQ(finer.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_FALSE(fs::exists(temp.Path() / "a"));

  // No calibration to scale from
  auto uncalibrated = extractor.Run(*MakeReader(), "slide", temp.Path() / "b");
  EXPECT_EQ(uncalibrated.status().code(),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_FALSE(fs::exists(temp.Path() / "b"));

  EXPECT_FALSE(extractor
                   .ExtractWithMask(*MakeReader(), TissueMask(4, 4, true),
                                    "slide", temp.Path() / "c")
                   .ok());
}

TEST(PatchExtractorTest, PatchFileNameIsDeterministic) {
  EXPECT_EQ(PatchExtractor::PatchFileName(
                "a.svs", Tile{.x = 512, .y = 1024, .width = 256, .height = 100}),
            "a.svs---[x=512,y=1024,w=256,h=100].png");
}

}  // namespace
}  // namespace slidepatch::pipeline
