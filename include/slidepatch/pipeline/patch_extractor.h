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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_PATCH_EXTRACTOR_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_PATCH_EXTRACTOR_H_

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "slidepatch/core/tile.h"
#include "slidepatch/masking/masking_registry.h"
#include "slidepatch/masking/tissue_mask.h"
#include "slidepatch/pipeline/extraction_config.h"
#include "slidepatch/pipeline/overview_loader.h"
#include "slidepatch/slide_reader.h"

/**
 * @file patch_extractor.h
 * @brief Per-slide extraction pipeline
 *
 * Run() drives one slide through
 *
 *   overview -> tissue mask -> tile grid -> coverage filter -> patches
 *
 * and leaves this layout in the output directory:
 *
 *     overview.png  tissue-mask.png  masked-overview.png
 *     patches/ (or patches.zip)      manifest.csv
 *
 * Patch footprints are level-0 rectangles. With ExtractionConfig::patch_mpp
 * set they are scaled to that resolution and every patch is resized to
 * patch_size (cv::resize, INTER_AREA) before it is encoded.
 *
 * Failing to load the overview or to compute the mask aborts the slide. A
 * tile that cannot be read is logged, counted and skipped; a patch that
 * cannot be written is handled according to the WriteErrorPolicy.
 *
 * With more than one worker, accepted tiles are processed in batches on a
 * thread pool and folded back in tile order, so the manifest does not
 * depend on the worker count.
 */

namespace slidepatch::pipeline {

/// @brief Outcome of one extraction run
struct ExtractionReport {
  size_t considered = 0;      ///< Tiles enumerated
  size_t accepted = 0;        ///< Tiles that passed the coverage filter
  size_t written = 0;         ///< Patches persisted
  size_t read_failures = 0;   ///< Accepted tiles that could not be read
  size_t write_failures = 0;  ///< Patches that could not be persisted
  bool cancelled = false;     ///< Stopped early by the cancellation signal

  int overview_level = -1;       ///< Pyramid level used for masking
  bool mask_post_processed = false;

  std::vector<AcceptedPatch> patches;   ///< Manifest rows, in tile order
  std::filesystem::path output_dir;
  std::filesystem::path manifest_path;  ///< Empty when no patches were extracted
  absl::Duration elapsed;

  [[nodiscard]] size_t failed() const { return read_failures + write_failures; }
};

/// @brief Extracts tissue patches from slides with a fixed configuration
///
/// The extractor holds no per-run state; one instance can process many
/// slides, also concurrently.
class PatchExtractor {
 public:
  /// @brief Validate @p config and resolve its masking method
  /// @return Extractor, InvalidArgument for a bad configuration, or an
  ///         UnknownMaskingMethodError
  static absl::StatusOr<PatchExtractor> Create(ExtractionConfig config);

  /// @brief Extract patches from one slide
  /// @param reader Open slide
  /// @param slide_name Prefix of every patch file name
  /// @param output_dir Directory receiving all outputs (created if needed)
  /// @param cancel Optional signal; once notified no further tiles are
  ///        enumerated and a partial manifest is written
  /// @return Report, or the error that aborted the slide
  absl::StatusOr<ExtractionReport> Run(
      const SlideReader& reader, std::string_view slide_name,
      const std::filesystem::path& output_dir,
      const absl::Notification* cancel = nullptr) const;

  /// @brief Extract patches using a caller supplied mask
  ///
  /// Skips overview loading and masking; @p mask may have any non-empty
  /// dimensions and is mapped onto the slide like a computed one.
  absl::StatusOr<ExtractionReport> ExtractWithMask(
      const SlideReader& reader, const TissueMask& mask,
      std::string_view slide_name, const std::filesystem::path& output_dir,
      const absl::Notification* cancel = nullptr) const;

  /// @brief Compute the (post-processed) tissue mask of an overview
  /// @param overview Overview of the slide
  /// @param properties Slide properties; post-processing needs the mpp
  /// @param post_processed Set to whether post-processing ran (optional)
  absl::StatusOr<TissueMask> ComputeMask(const Overview& overview,
                                         const SlideProperties& properties,
                                         bool* post_processed = nullptr) const;

  /// @brief Masking options used for one slide
  ///
  /// On a calibrated slide the entropy footprint is the closing element,
  /// element_size_um expressed in overview pixels; otherwise the configured
  /// footprint is used.
  [[nodiscard]] masking::MaskingOptions GetMaskingOptions(
      const Overview& overview, const SlideProperties& properties) const;

  /// @brief Level-0 pixels per output patch pixel, per axis
  /// @return {1, 1} without patch_mpp; FailedPrecondition for a slide without
  ///         calibration; InvalidArgument when patch_mpp is finer than the
  ///         slide
  absl::StatusOr<Size<double, 2>> GetPatchScale(
      const SlideProperties& properties) const;

  /// @brief Deterministic patch file name
  /// @return "{slide_name}---[x={x},y={y},w={w},h={h}].png"
  [[nodiscard]] static std::string PatchFileName(std::string_view slide_name,
                                                 const Tile& tile);

  [[nodiscard]] const ExtractionConfig& GetConfig() const { return config_; }

  [[nodiscard]] const masking::MaskingStrategy& GetMaskingStrategy() const {
    return *strategy_;
  }

 private:
  PatchExtractor(ExtractionConfig config,
                 const masking::MaskingStrategy* strategy)
      : config_(std::move(config)), strategy_(strategy) {}

  absl::Status ExtractTiles(const SlideReader& reader, const TissueMask& mask,
                            const Size<double, 2>& scale,
                            std::string_view slide_name,
                            const absl::Notification* cancel,
                            ExtractionReport& report) const;

  ExtractionConfig config_;
  const masking::MaskingStrategy* strategy_;
};

}  // namespace slidepatch::pipeline

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_PATCH_EXTRACTOR_H_
