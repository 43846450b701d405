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

#include "slidepatch/pipeline/extraction_config.h"

#include <cmath>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::pipeline {

namespace {

absl::Status InvalidField(std::string_view field, std::string_view message) {
  return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                     slidepatch::fmt::format("Invalid {}: {}", field, message));
}

}  // namespace

std::string_view GetName(WriteErrorPolicy policy) {
  switch (policy) {
    case WriteErrorPolicy::kSkip:
      return "skip";
    case WriteErrorPolicy::kAbort:
      return "abort";
  }
  return "unknown";
}

absl::StatusOr<WriteErrorPolicy> ParseWriteErrorPolicy(std::string_view name) {
  const std::string lowered = absl::AsciiStrToLower(name);
  if (lowered == "skip") {
    return WriteErrorPolicy::kSkip;
  }
  if (lowered == "abort") {
    return WriteErrorPolicy::kAbort;
  }
  return MAKE_STATUS(
      absl::StatusCode::kInvalidArgument,
      slidepatch::fmt::format(
          "Unknown write error policy '{}' (expected skip or abort)", name));
}

absl::Status ExtractionConfig::Validate() const {
  if (masking_method.empty()) {
    return InvalidField("masking_method", "must not be empty");
  }
  if (patch_size[0] == 0 || patch_size[1] == 0) {
    return InvalidField(
        "patch_size", slidepatch::fmt::format("{} must be positive", patch_size));
  }
  if (stride[0] == 0 || stride[1] == 0) {
    return InvalidField("stride",
                        slidepatch::fmt::format("{} must be positive", stride));
  }
  if (patch_mpp.has_value() &&
      !(*patch_mpp > 0.0 && std::isfinite(*patch_mpp))) {
    return InvalidField("patch_mpp", slidepatch::fmt::format(
                                         "{} must be positive", *patch_mpp));
  }
  if (!(coverage_threshold >= 0.0 && coverage_threshold <= 1.0)) {
    return InvalidField(
        "coverage_threshold",
        slidepatch::fmt::format("{} is outside [0, 1]", coverage_threshold));
  }
  if (overview_target_size == 0) {
    return InvalidField("overview_target_size", "must be positive");
  }
  if (!(min_edge_fraction > 0.0 && min_edge_fraction <= 1.0)) {
    return InvalidField(
        "min_edge_fraction",
        slidepatch::fmt::format("{} is outside (0, 1]", min_edge_fraction));
  }
  if (post_process && !(element_size_um >= 0.0 && min_object_size_um2 >= 0.0)) {
    return InvalidField("post-processing sizes", "must not be negative");
  }
  if (masking.entropy_footprint == 0) {
    return InvalidField("entropy_footprint", "must be positive");
  }
  if (masking.kmeans_max_iterations == 0) {
    return InvalidField("kmeans_max_iterations", "must be positive");
  }
  if (workers == 0) {
    return InvalidField("workers", "must be at least 1");
  }
  return absl::OkStatus();
}

}  // namespace slidepatch::pipeline
