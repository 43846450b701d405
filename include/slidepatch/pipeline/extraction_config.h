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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_EXTRACTION_CONFIG_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_EXTRACTION_CONFIG_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidepatch/image.h"
#include "slidepatch/masking/masking_options.h"
#include "slidepatch/tiling/tile_grid.h"

namespace slidepatch::pipeline {

/// @brief What a failed patch write does to the run
enum class WriteErrorPolicy {
  kSkip,   ///< Log, count and continue
  kAbort,  ///< Stop after in-flight work and return the error
};

[[nodiscard]] std::string_view GetName(WriteErrorPolicy policy);

/// @brief Parse "skip" or "abort"
absl::StatusOr<WriteErrorPolicy> ParseWriteErrorPolicy(std::string_view name);

/// @brief Settings of one extraction run
///
/// A plain value; the extractor copies it at construction and never changes
/// it afterwards.
struct ExtractionConfig {
  /// Name of a registered masking method
  std::string masking_method = "otsu";
  /// Nominal patch size in output pixels (level-0 pixels without patch_mpp)
  ImageDimensions patch_size{512, 512};
  /// Distance between patch origins, in the same units as patch_size
  ImageDimensions stride{512, 512};
  /// Resolution of the written patches in microns per pixel. When set, each
  /// patch covers patch_size * patch_mpp / slide_mpp level-0 pixels and is
  /// resized to patch_size; the slide must be calibrated and no finer than
  /// this. Unset writes level-0 pixels.
  std::optional<double> patch_mpp;
  /// Minimum tissue fraction of an accepted patch, in [0, 1]
  double coverage_threshold = 0.5;
  /// Minimum longest side of the overview used for masking
  uint32_t overview_target_size = 2048;
  tiling::EdgePolicy edge_policy = tiling::EdgePolicy::kClip;
  /// Edge tiles below this fraction of the patch size are dropped (kDrop)
  double min_edge_fraction = 0.5;

  masking::MaskingOptions masking;

  /// Close holes and remove specks in the mask (needs the slide's mpp)
  bool post_process = true;
  double element_size_um = 100.0;
  double min_object_size_um2 = 2500.0;

  /// Patch reader/writer threads; 1 runs everything on the calling thread
  uint32_t workers = 1;
  WriteErrorPolicy write_error_policy = WriteErrorPolicy::kSkip;

  /// Store patches in <output>/patches.zip instead of <output>/patches/
  bool zip_patches = false;
  /// Write overview.png, tissue-mask.png and masked-overview.png
  bool save_overview_images = true;
  /// When false only the overview images are produced
  bool extract_patches = true;

  /// @brief Check ranges; does not resolve the masking method
  /// @return OkStatus, or InvalidArgument naming the offending field
  absl::Status Validate() const;
};

}  // namespace slidepatch::pipeline

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_EXTRACTION_CONFIG_H_
