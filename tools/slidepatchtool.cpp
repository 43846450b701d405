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

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"
#include "slidepatch/slidepatch.h"

// Input / output
ABSL_FLAG(std::string, source, "",
          "Slide file, or directory of slides (non-recursive)");
ABSL_FLAG(std::string, dest, "",
          "Output directory; each slide gets <dest>/<slide file name>/");
ABSL_FLAG(std::string, file_types, "svs,tif,tiff,png",
          "Comma separated slide extensions to process in a directory");

// Masking
ABSL_FLAG(std::string, mask_method, "otsu",
          "Tissue masking method (otsu, kmeans, entropy, schreiber, "
          "optical-density, luminosity)");
ABSL_FLAG(uint32_t, overview_size, 2048,
          "Minimum longest side of the pyramid level used for masking");
ABSL_FLAG(uint32_t, kmeans_seed, 0, "Seed for k-means initialization");
ABSL_FLAG(std::string, kmeans_foreground, "darker",
          "Which k-means cluster is tissue (darker or lighter)");
ABSL_FLAG(uint32_t, entropy_footprint, 9,
          "Side of the square window for the entropy method");
ABSL_FLAG(bool, post_process, true,
          "Close gaps and remove specks in the mask (needs slide resolution)");
ABSL_FLAG(double, element_size, 100.0,
          "Closing element size in micrometers");
ABSL_FLAG(double, min_object_size, 2500.0,
          "Smallest tissue object kept, in square micrometers");

// Tiling
ABSL_FLAG(uint32_t, patch_size, 512,
          "Patch width and height in output pixels");
ABSL_FLAG(uint32_t, stride, 0, "Grid stride (0 = patch size)");
ABSL_FLAG(double, patch_mpp, 0.0,
          "Resolution of the written patches in microns per pixel "
          "(0 = the slide's level-0 resolution)");
ABSL_FLAG(double, coverage_threshold, 0.5,
          "Minimum tissue fraction of a patch, in [0, 1]");
ABSL_FLAG(std::string, edge_policy, "clip",
          "Tiles crossing the slide border: clip or drop");
ABSL_FLAG(double, min_edge_fraction, 0.5,
          "With --edge_policy=drop, keep edge tiles at least this full");

// Output
ABSL_FLAG(bool, patches, true, "Extract patches (false: overviews only)");
ABSL_FLAG(bool, overviews, true,
          "Save overview, tissue mask and masked overview PNGs");
ABSL_FLAG(bool, zip_patches, false, "Store patches in patches.zip");
ABSL_FLAG(uint32_t, workers, 4, "Patch worker threads");
ABSL_FLAG(std::string, write_error_policy, "skip",
          "On a failed patch write: skip or abort");
ABSL_FLAG(bool, print_time, false, "Print processing time per slide");

namespace {

absl::StatusOr<slidepatch::pipeline::ExtractionConfig> ConfigFromFlags() {
  using slidepatch::pipeline::ExtractionConfig;

  ExtractionConfig config;
  config.masking_method = absl::GetFlag(FLAGS_mask_method);
  config.overview_target_size = absl::GetFlag(FLAGS_overview_size);

  const uint32_t patch = absl::GetFlag(FLAGS_patch_size);
  const uint32_t stride =
      absl::GetFlag(FLAGS_stride) == 0 ? patch : absl::GetFlag(FLAGS_stride);
  config.patch_size = {patch, patch};
  config.stride = {stride, stride};
  if (absl::GetFlag(FLAGS_patch_mpp) != 0.0) {
    config.patch_mpp = absl::GetFlag(FLAGS_patch_mpp);
  }
  config.coverage_threshold = absl::GetFlag(FLAGS_coverage_threshold);
  config.min_edge_fraction = absl::GetFlag(FLAGS_min_edge_fraction);

  auto edge_policy =
      slidepatch::tiling::ParseEdgePolicy(absl::GetFlag(FLAGS_edge_policy));
  if (!edge_policy.ok()) {
    return edge_policy.status();
  }
  config.edge_policy = *edge_policy;

  config.masking.kmeans_seed = absl::GetFlag(FLAGS_kmeans_seed);
  config.masking.entropy_footprint = absl::GetFlag(FLAGS_entropy_footprint);
  const std::string foreground = absl::GetFlag(FLAGS_kmeans_foreground);
  if (foreground == "darker") {
    config.masking.kmeans_foreground =
        slidepatch::masking::ForegroundPolarity::kDarker;
  } else if (foreground == "lighter") {
    config.masking.kmeans_foreground =
        slidepatch::masking::ForegroundPolarity::kLighter;
  } else {
    return absl::InvalidArgumentError(
        "--kmeans_foreground must be darker or lighter, got '" + foreground +
        "'");
  }

  config.post_process = absl::GetFlag(FLAGS_post_process);
  config.element_size_um = absl::GetFlag(FLAGS_element_size);
  config.min_object_size_um2 = absl::GetFlag(FLAGS_min_object_size);

  config.workers = absl::GetFlag(FLAGS_workers);
  auto write_policy = slidepatch::pipeline::ParseWriteErrorPolicy(
      absl::GetFlag(FLAGS_write_error_policy));
  if (!write_policy.ok()) {
    return write_policy.status();
  }
  config.write_error_policy = *write_policy;

  config.zip_patches = absl::GetFlag(FLAGS_zip_patches);
  config.save_overview_images = absl::GetFlag(FLAGS_overviews);
  config.extract_patches = absl::GetFlag(FLAGS_patches);
  return config;
}

void PrintSummary(const slidepatch::pipeline::BatchReport& batch,
                  bool print_time) {
  for (const auto& slide : batch.slides) {
    if (!slide.status.ok()) {
      std::cout << std::left << std::setw(40) << slide.slide_name
                << " FAILED: " << slide.status.message() << '\n';
      continue;
    }
    const auto& report = slide.report;
    std::cout << std::left << std::setw(40) << slide.slide_name << " "
              << report.written << "/" << report.accepted << " patches ("
              << report.considered << " tiles, " << report.failed()
              << " failed)";
    if (report.cancelled) {
      std::cout << " [cancelled]";
    }
    if (print_time) {
      std::cout << " in " << absl::FormatDuration(report.elapsed);
    }
    std::cout << '\n';
  }

  std::cout << '\n'
            << batch.succeeded << " slide(s) processed, " << batch.failed
            << " failed, " << batch.written << " patches written";
  if (batch.tile_failures > 0) {
    std::cout << ", " << batch.tile_failures << " tile(s) skipped";
  }
  if (print_time) {
    std::cout << " in " << absl::FormatDuration(batch.elapsed);
  }
  std::cout << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage(
      "Extract tissue patches from whole-slide images.\n"
      "Usage: slidepatchtool --source=<slide|dir> --dest=<dir> [options]");
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  const std::string source = absl::GetFlag(FLAGS_source);
  const std::string dest = absl::GetFlag(FLAGS_dest);
  if (source.empty() || dest.empty()) {
    std::cerr << "Error: --source and --dest are required\n";
    return 1;
  }

  auto config = ConfigFromFlags();
  if (!config.ok()) {
    std::cerr << "Error: " << config.status() << '\n';
    return 1;
  }

  // Unknown masking methods and invalid settings fail here, before any slide
  // is opened
  auto extractor = slidepatch::pipeline::PatchExtractor::Create(*config);
  if (!extractor.ok()) {
    std::cerr << "Error: " << extractor.status() << '\n';
    if (slidepatch::IsErrorKind(extractor.status(),
                                slidepatch::ErrorKind::kUnknownMaskingMethod)) {
      std::cerr << "Available methods: "
                << absl::StrJoin(slidepatch::masking::ListMaskingMethods(),
                                 ", ")
                << '\n';
    }
    return 1;
  }

  const std::vector<std::string> extensions = absl::StrSplit(
      absl::GetFlag(FLAGS_file_types), ',', absl::SkipWhitespace());
  auto slides = slidepatch::pipeline::ListSlides(source, extensions);
  if (!slides.ok()) {
    std::cerr << "Error: " << slides.status() << '\n';
    return 1;
  }
  if (slides->empty()) {
    std::cerr << "No slides with extensions "
              << absl::GetFlag(FLAGS_file_types) << " found in " << source
              << '\n';
    return 0;
  }

  const slidepatch::pipeline::BatchReport batch =
      slidepatch::pipeline::RunBatch(*extractor, *slides, dest,
                                     slidepatch::GetGlobalRegistry());
  PrintSummary(batch, absl::GetFlag(FLAGS_print_time));
  return batch.ok() ? 0 : 1;
}
