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

#include <BS_thread_pool.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/time/clock.h"
#include "slidepatch/errors.h"
#include "slidepatch/masking/morphology.h"
#include "slidepatch/pipeline/manifest.h"
#include "slidepatch/pipeline/patch_sink.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/tiling/coordinate_mapper.h"
#include "slidepatch/tiling/coverage_filter.h"
#include "slidepatch/tiling/tile_grid.h"
#include "slidepatch/utilities/fmt.h"
#include "slidepatch/utilities/opencv.h"
#include "slidepatch/utilities/png.h"

namespace slidepatch::pipeline {

namespace {

constexpr char kOverviewFile[] = "overview.png";
constexpr char kTissueMaskFile[] = "tissue-mask.png";
constexpr char kMaskedOverviewFile[] = "masked-overview.png";
constexpr char kPatchDirectory[] = "patches";
constexpr char kPatchArchive[] = "patches.zip";
constexpr char kManifestFile[] = "manifest.csv";

// Accepted tiles buffered per worker before a batch is dispatched
constexpr size_t kBatchTilesPerWorker = 4;

/// Accepted tile waiting to be read and written
struct PendingPatch {
  Tile tile;
  double coverage;
};

absl::Status CreateOutputDirectory(const std::filesystem::path& output_dir) {
  std::error_code error;
  std::filesystem::create_directories(output_dir, error);
  if (error) {
    return MAKE_ERROR(ErrorKind::kWrite,
                      slidepatch::fmt::format("Cannot create {}: {}",
                                              output_dir.string(),
                                              error.message()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<PatchSink>> CreateSink(
    const ExtractionConfig& config, const std::filesystem::path& output_dir) {
  if (config.zip_patches) {
    DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<ZipPatchSink>, sink,
                             ZipPatchSink::Create(output_dir / kPatchArchive));
    return std::unique_ptr<PatchSink>(std::move(sink));
  }
  DECLARE_ASSIGN_OR_RETURN(
      std::unique_ptr<DirectoryPatchSink>, sink,
      DirectoryPatchSink::Create(output_dir / kPatchDirectory));
  return std::unique_ptr<PatchSink>(std::move(sink));
}

uint32_t LongestSide(const ImageDimensions& dims) {
  return std::max(dims[0], dims[1]);
}

uint32_t ScaleLength(uint32_t length, double scale) {
  const double scaled = std::round(static_cast<double>(length) * scale);
  return static_cast<uint32_t>(std::max(scaled, 1.0));
}

/// Level-0 extent of @p size output pixels
ImageDimensions ToLevel0(const ImageDimensions& size,
                         const Size<double, 2>& scale) {
  return ImageDimensions{ScaleLength(size[0], scale[0]),
                         ScaleLength(size[1], scale[1])};
}

/// Output size of a tile; full tiles map exactly onto the patch size
ImageDimensions OutputSize(const Tile& tile, const ImageDimensions& footprint,
                           const ImageDimensions& patch_size,
                           const Size<double, 2>& scale) {
  return ImageDimensions{
      tile.width == footprint[0] ? patch_size[0]
                                 : ScaleLength(tile.width, 1.0 / scale[0]),
      tile.height == footprint[1] ? patch_size[1]
                                  : ScaleLength(tile.height, 1.0 / scale[1])};
}

Image ResizeRGB8(const Image& rgb, const ImageDimensions& size) {
  cv::Mat resized;
  cv::resize(utilities::AsMat(rgb), resized,
             cv::Size(static_cast<int>(size[0]), static_cast<int>(size[1])), 0,
             0, cv::INTER_AREA);
  return utilities::ToImage(resized);
}

/// Read, resize, encode and persist one patch
absl::StatusOr<std::string> WritePatch(const SlideReader& reader,
                                       PatchSink& sink,
                                       std::string_view slide_name,
                                       const Tile& tile,
                                       const ImageDimensions& output_size) {
  auto region = reader.ReadRegion(tile.ToRegionSpec());
  if (!region.ok()) {
    return WithErrorKind(region.status(), ErrorKind::kTileRead);
  }
  auto rgb = ConvertToRGB8(*region);
  if (!rgb.ok()) {
    return WithErrorKind(rgb.status(), ErrorKind::kTileRead);
  }
  if (!(rgb->GetDimensions() == output_size)) {
    *rgb = ResizeRGB8(*rgb, output_size);
  }
  auto encoded = utilities::EncodePng(*rgb);
  if (!encoded.ok()) {
    return WithErrorKind(encoded.status(), ErrorKind::kWrite);
  }
  auto location = sink.Put(PatchExtractor::PatchFileName(slide_name, tile),
                           *encoded);
  if (!location.ok()) {
    return WithErrorKind(location.status(), ErrorKind::kWrite);
  }
  return location;
}

absl::Status SaveOverviewImages(const std::filesystem::path& output_dir,
                                const Image& overview,
                                const TissueMask& mask) {
  RETURN_IF_ERROR(utilities::WritePng(output_dir / kOverviewFile, overview));
  RETURN_IF_ERROR(
      utilities::WritePng(output_dir / kTissueMaskFile, mask.ToImage()));
  DECLARE_ASSIGN_OR_RETURN(Image, masked, ApplyMask(overview, mask));
  RETURN_IF_ERROR(utilities::WritePng(output_dir / kMaskedOverviewFile, masked));
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<PatchExtractor> PatchExtractor::Create(ExtractionConfig config) {
  RETURN_IF_ERROR(config.Validate());
  DECLARE_ASSIGN_OR_RETURN(const masking::MaskingStrategy*, strategy,
                           masking::FindMaskingStrategy(config.masking_method));
  return PatchExtractor(std::move(config), strategy);
}

std::string PatchExtractor::PatchFileName(std::string_view slide_name,
                                          const Tile& tile) {
  return slidepatch::fmt::format("{}---[x={},y={},w={},h={}].png", slide_name,
                                 tile.x, tile.y, tile.width, tile.height);
}

masking::MaskingOptions PatchExtractor::GetMaskingOptions(
    const Overview& overview, const SlideProperties& properties) const {
  masking::MaskingOptions options = config_.masking;
  if (!properties.HasMpp()) {
    return options;
  }
  const std::optional<masking::PostProcessParams> params =
      masking::ComputePostProcessParams(
          properties.mpp[0] * overview.downsample, config_.element_size_um,
          config_.min_object_size_um2,
          LongestSide(overview.image.GetDimensions()));
  if (params.has_value() && params->element_size > 0) {
    options.entropy_footprint = params->element_size;
  }
  return options;
}

absl::StatusOr<Size<double, 2>> PatchExtractor::GetPatchScale(
    const SlideProperties& properties) const {
  if (!config_.patch_mpp.has_value()) {
    return Size<double, 2>{1.0, 1.0};
  }
  const double target = *config_.patch_mpp;
  if (!properties.HasMpp()) {
    return MAKE_STATUS(
        absl::StatusCode::kFailedPrecondition,
        slidepatch::fmt::format(
            "Cannot extract patches at {} um/px: the slide has no "
            "microns-per-pixel calibration",
            target));
  }
  if (target < properties.mpp[0] || target < properties.mpp[1]) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format(
            "Requested {} um/px is finer than the slide's {} x {} um/px",
            target, properties.mpp[0], properties.mpp[1]));
  }
  return Size<double, 2>{target / properties.mpp[0],
                         target / properties.mpp[1]};
}

absl::StatusOr<TissueMask> PatchExtractor::ComputeMask(
    const Overview& overview, const SlideProperties& properties,
    bool* post_processed) const {
  if (post_processed != nullptr) {
    *post_processed = false;
  }
  DECLARE_ASSIGN_OR_RETURN(
      TissueMask, mask,
      strategy_->produce_mask(overview.image,
                              GetMaskingOptions(overview, properties)));

  if (!config_.post_process) {
    return mask;
  }
  if (!properties.HasMpp()) {
    LOG(WARNING) << "Slide has no microns-per-pixel calibration; "
                    "skipping mask post-processing";
    return mask;
  }

  const double overview_mpp = properties.mpp[0] * overview.downsample;
  const std::optional<masking::PostProcessParams> params =
      masking::ComputePostProcessParams(overview_mpp, config_.element_size_um,
                                        config_.min_object_size_um2,
                                        LongestSide(mask.GetDimensions()));
  if (!params.has_value()) {
    LOG(WARNING) << "Invalid overview resolution " << overview_mpp
                 << " um/px; skipping mask post-processing";
    return mask;
  }

  VLOG(1) << "Post-processing mask at " << overview_mpp
          << " um/px: element " << params->element_size
          << " px, minimum object " << params->min_object_area << " px";
  if (post_processed != nullptr) {
    *post_processed = true;
  }
  return masking::PostProcessMask(mask, params->element_size,
                                  params->min_object_area);
}

absl::StatusOr<ExtractionReport> PatchExtractor::Run(
    const SlideReader& reader, std::string_view slide_name,
    const std::filesystem::path& output_dir,
    const absl::Notification* cancel) const {
  const absl::Time start = absl::Now();
  ExtractionReport report;
  report.output_dir = output_dir;

  Size<double, 2> scale{1.0, 1.0};
  if (config_.extract_patches) {
    ASSIGN_OR_RETURN(scale, GetPatchScale(reader.GetProperties()));
  }
  RETURN_IF_ERROR(CreateOutputDirectory(output_dir));

  DECLARE_ASSIGN_OR_RETURN(
      Overview, overview, LoadOverview(reader, config_.overview_target_size));
  report.overview_level = overview.level;

  DECLARE_ASSIGN_OR_RETURN(
      TissueMask, mask,
      ComputeMask(overview, reader.GetProperties(),
                  &report.mask_post_processed));
  LOG(INFO) << slide_name << ": " << strategy_->name << " mask over "
            << mask.GetDimensions() << " overview (level "
            << overview.level << "), " << mask.CountTissue()
            << " tissue pixels";

  if (config_.save_overview_images) {
    RETURN_IF_ERROR(SaveOverviewImages(output_dir, overview.image, mask));
  }

  if (config_.extract_patches) {
    RETURN_IF_ERROR(
        ExtractTiles(reader, mask, scale, slide_name, cancel, report));
  }

  report.elapsed = absl::Now() - start;
  return report;
}

absl::StatusOr<ExtractionReport> PatchExtractor::ExtractWithMask(
    const SlideReader& reader, const TissueMask& mask,
    std::string_view slide_name, const std::filesystem::path& output_dir,
    const absl::Notification* cancel) const {
  const absl::Time start = absl::Now();
  if (mask.Empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Tissue mask must not be empty");
  }

  DECLARE_ASSIGN_OR_RETURN(Size<double, 2>, scale,
                           GetPatchScale(reader.GetProperties()));

  ExtractionReport report;
  report.output_dir = output_dir;
  RETURN_IF_ERROR(CreateOutputDirectory(output_dir));
  RETURN_IF_ERROR(
      ExtractTiles(reader, mask, scale, slide_name, cancel, report));
  report.elapsed = absl::Now() - start;
  return report;
}

absl::Status PatchExtractor::ExtractTiles(const SlideReader& reader,
                                          const TissueMask& mask,
                                          const Size<double, 2>& scale,
                                          std::string_view slide_name,
                                          const absl::Notification* cancel,
                                          ExtractionReport& report) const {
  const ImageDimensions full = reader.GetDimensions();
  auto mapper_result =
      tiling::CoordinateMapper::Create(full, mask.GetDimensions());
  RETURN_IF_ERROR(mapper_result.status());
  const tiling::CoordinateMapper& mapper = *mapper_result;

  const ImageDimensions footprint = ToLevel0(config_.patch_size, scale);
  const ImageDimensions step = ToLevel0(config_.stride, scale);
  if (config_.patch_mpp.has_value()) {
    VLOG(1) << slide_name << ": " << *config_.patch_mpp << " um/px patches cover "
            << footprint << " level-0 pixels, stride " << step;
  }

  auto grid_result = tiling::TileGrid::Create(
      full, footprint, step, config_.edge_policy, config_.min_edge_fraction);
  RETURN_IF_ERROR(grid_result.status());
  const tiling::TileGrid& grid = *grid_result;

  DECLARE_ASSIGN_OR_RETURN(std::unique_ptr<PatchSink>, sink,
                           CreateSink(config_, report.output_dir));

  std::unique_ptr<BS::light_thread_pool> pool;
  size_t batch_capacity = 1;
  if (config_.workers > 1) {
    pool = std::make_unique<BS::light_thread_pool>(config_.workers);
    batch_capacity = config_.workers * kBatchTilesPerWorker;
  }

  absl::Status abort_status;
  std::vector<PendingPatch> batch;
  std::vector<absl::StatusOr<std::string>> outcomes;
  batch.reserve(batch_capacity);

  auto process_batch = [&]() {
    outcomes.assign(batch.size(),
                    absl::StatusOr<std::string>(absl::UnknownError("pending")));
    if (pool != nullptr && batch.size() > 1) {
      pool->submit_sequence(size_t{0}, batch.size(),
                            [&](size_t i) {
                              const Tile& tile = batch[i].tile;
                              outcomes[i] = WritePatch(
                                  reader, *sink, slide_name, tile,
                                  OutputSize(tile, footprint,
                                             config_.patch_size, scale));
                            })
          .wait();
    } else {
      for (size_t i = 0; i < batch.size(); ++i) {
        const Tile& tile = batch[i].tile;
        outcomes[i] = WritePatch(
            reader, *sink, slide_name, tile,
            OutputSize(tile, footprint, config_.patch_size, scale));
      }
    }

    // Fold in tile order so the manifest is independent of scheduling
    for (size_t i = 0; i < batch.size(); ++i) {
      const Tile& tile = batch[i].tile;
      if (outcomes[i].ok()) {
        report.patches.push_back(AcceptedPatch{.index = report.written,
                                               .tile = tile,
                                               .coverage = batch[i].coverage,
                                               .output_path = *outcomes[i]});
        ++report.written;
        continue;
      }

      const absl::Status& status = outcomes[i].status();
      if (IsErrorKind(status, ErrorKind::kTileRead)) {
        ++report.read_failures;
        LOG(WARNING) << "Skipping unreadable tile "
                     << PatchFileName(slide_name, tile) << ": "
                     << status.message();
        continue;
      }

      ++report.write_failures;
      if (config_.write_error_policy == WriteErrorPolicy::kAbort) {
        LOG(ERROR) << "Failed to write " << PatchFileName(slide_name, tile)
                   << ", aborting: " << status.message();
        if (abort_status.ok()) {
          abort_status = status;
        }
      } else {
        LOG(WARNING) << "Skipping patch " << PatchFileName(slide_name, tile)
                     << ": " << status.message();
      }
    }
    batch.clear();
  };

  for (auto it = grid.begin(); it != grid.end(); ++it) {
    if (cancel != nullptr && cancel->HasBeenNotified()) {
      report.cancelled = true;
      break;
    }
    const Tile tile = *it;
    ++report.considered;

    const tiling::TileDecision decision = tiling::EvaluateTile(
        tile, mask, mapper, config_.coverage_threshold);
    if (!decision.accepted) {
      continue;
    }
    ++report.accepted;
    batch.push_back(PendingPatch{.tile = tile, .coverage = decision.coverage});

    if (batch.size() >= batch_capacity) {
      process_batch();
      if (!abort_status.ok()) {
        break;
      }
    }
  }
  if (!batch.empty()) {
    process_batch();
  }

  report.manifest_path = report.output_dir / kManifestFile;
  RETURN_IF_ERROR(WriteManifest(report.manifest_path, report.patches));
  RETURN_IF_ERROR(sink->Finalize());

  if (report.cancelled) {
    LOG(WARNING) << slide_name << ": cancelled after " << report.considered
                 << " of " << grid.Size() << " tiles";
  }
  LOG(INFO) << slide_name << ": considered " << report.considered
            << ", accepted " << report.accepted << ", written "
            << report.written << ", failed " << report.failed();
  return abort_status;
}

}  // namespace slidepatch::pipeline
