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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_BATCH_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_BATCH_H_

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"
#include "absl/time/time.h"
#include "slidepatch/pipeline/patch_extractor.h"
#include "slidepatch/runtime/reader_registry.h"

namespace slidepatch::pipeline {

/// @brief Result of one slide in a batch
struct SlideOutcome {
  std::filesystem::path source;  ///< Slide file
  std::string slide_name;        ///< File name, also the output directory
  absl::Status status;           ///< Ok, or the error that aborted the slide
  ExtractionReport report;       ///< Meaningful only when status is ok
};

/// @brief Result of a batch run
struct BatchReport {
  std::vector<SlideOutcome> slides;  ///< In processing order
  size_t succeeded = 0;
  size_t failed = 0;
  size_t considered = 0;
  size_t accepted = 0;
  size_t written = 0;
  size_t tile_failures = 0;  ///< Read plus write failures over all slides
  bool cancelled = false;
  absl::Duration elapsed;

  [[nodiscard]] bool ok() const { return failed == 0; }
};

/// @brief Collect the slides to process
/// @param source A slide file or a directory (not searched recursively)
/// @param extensions Accepted extensions, e.g. {".svs", "tif"}
/// @return Paths sorted by name; NotFound if @p source does not exist,
///         InvalidArgument for a file with another extension
absl::StatusOr<std::vector<std::filesystem::path>> ListSlides(
    const std::filesystem::path& source,
    const std::vector<std::string>& extensions);

/// @brief Run @p extractor over every slide
///
/// Each slide writes to <destination>/<file name>/. A slide that fails is
/// recorded in its outcome and does not stop the batch. Once @p cancel is
/// notified, no further slides are started.
BatchReport RunBatch(const PatchExtractor& extractor,
                     const std::vector<std::filesystem::path>& slides,
                     const std::filesystem::path& destination,
                     const ReaderRegistry& registry,
                     const absl::Notification* cancel = nullptr);

}  // namespace slidepatch::pipeline

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_BATCH_H_
