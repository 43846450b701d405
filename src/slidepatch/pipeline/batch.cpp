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

#include "slidepatch/pipeline/batch.h"

#include <algorithm>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/str_join.h"
#include "absl/time/clock.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::pipeline {

absl::StatusOr<std::vector<std::filesystem::path>> ListSlides(
    const std::filesystem::path& source,
    const std::vector<std::string>& extensions) {
  std::set<std::string> accepted;
  for (const std::string& extension : extensions) {
    accepted.insert(ReaderRegistry::NormalizeExtension(extension));
  }
  auto matches = [&accepted](const std::filesystem::path& path) {
    return accepted.count(
               ReaderRegistry::NormalizeExtension(path.extension().string())) >
           0;
  };

  std::error_code error;
  if (std::filesystem::is_regular_file(source, error)) {
    if (!matches(source)) {
      return MAKE_STATUS(
          absl::StatusCode::kInvalidArgument,
          slidepatch::fmt::format("{} does not have one of the extensions {}",
                                  source.string(),
                                  absl::StrJoin(accepted, ", ")));
    }
    return std::vector<std::filesystem::path>{source};
  }
  if (!std::filesystem::is_directory(source, error)) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Source does not exist: " + source.string());
  }

  std::vector<std::filesystem::path> slides;
  for (const auto& entry :
       std::filesystem::directory_iterator(source, error)) {
    if (entry.is_regular_file() && matches(entry.path())) {
      slides.push_back(entry.path());
    }
  }
  if (error) {
    return MAKE_STATUS(absl::StatusCode::kUnavailable,
                       slidepatch::fmt::format("Cannot list {}: {}",
                                               source.string(),
                                               error.message()));
  }
  std::sort(slides.begin(), slides.end());
  return slides;
}

BatchReport RunBatch(const PatchExtractor& extractor,
                     const std::vector<std::filesystem::path>& slides,
                     const std::filesystem::path& destination,
                     const ReaderRegistry& registry,
                     const absl::Notification* cancel) {
  const absl::Time start = absl::Now();
  BatchReport batch;

  for (const std::filesystem::path& source : slides) {
    if (cancel != nullptr && cancel->HasBeenNotified()) {
      batch.cancelled = true;
      break;
    }

    SlideOutcome outcome;
    outcome.source = source;
    outcome.slide_name = source.filename().string();
    LOG(INFO) << "Processing " << source.string();

    auto reader = registry.CreateReader(source.string());
    if (!reader.ok()) {
      outcome.status = reader.status();
    } else {
      auto report = extractor.Run(**reader, outcome.slide_name,
                                  destination / outcome.slide_name, cancel);
      if (report.ok()) {
        outcome.report = *std::move(report);
      } else {
        outcome.status = report.status();
      }
    }

    if (outcome.status.ok()) {
      ++batch.succeeded;
      batch.considered += outcome.report.considered;
      batch.accepted += outcome.report.accepted;
      batch.written += outcome.report.written;
      batch.tile_failures += outcome.report.failed();
      batch.cancelled = batch.cancelled || outcome.report.cancelled;
    } else {
      ++batch.failed;
      LOG(WARNING) << "Failed to process " << source.string() << ": "
                   << outcome.status;
    }
    batch.slides.push_back(std::move(outcome));
  }

  batch.elapsed = absl::Now() - start;
  LOG(INFO) << "Processed " << batch.slides.size() << " slide(s): "
            << batch.succeeded << " succeeded, " << batch.failed
            << " failed, " << batch.written << " patches written";
  return batch;
}

}  // namespace slidepatch::pipeline
