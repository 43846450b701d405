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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_PATCH_SINK_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_PATCH_SINK_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "slidepatch/utilities/zip.h"

namespace slidepatch::pipeline {

/// @brief Destination of encoded patches
///
/// Put() may be called concurrently from patch workers.
class PatchSink {
 public:
  PatchSink() = default;
  virtual ~PatchSink() = default;

  PatchSink(const PatchSink&) = delete;
  PatchSink& operator=(const PatchSink&) = delete;

  /// @brief Store one encoded patch
  /// @param name File name of the patch
  /// @param data Encoded PNG bytes
  /// @return Location recorded in the manifest, or a WriteError
  virtual absl::StatusOr<std::string> Put(const std::string& name,
                                          const std::vector<uint8_t>& data) = 0;

  /// @brief Flush and close; no Put() is allowed afterwards
  virtual absl::Status Finalize() = 0;
};

/// @brief Writes every patch as a file in one directory
class DirectoryPatchSink : public PatchSink {
 public:
  /// @brief Create the sink, creating @p directory if needed
  static absl::StatusOr<std::unique_ptr<DirectoryPatchSink>> Create(
      const std::filesystem::path& directory);

  absl::StatusOr<std::string> Put(const std::string& name,
                                  const std::vector<uint8_t>& data) override;

  absl::Status Finalize() override;

  [[nodiscard]] const std::filesystem::path& GetDirectory() const {
    return directory_;
  }

 private:
  explicit DirectoryPatchSink(std::filesystem::path directory)
      : directory_(std::move(directory)) {}

  std::filesystem::path directory_;
};

/// @brief Stores every patch as an entry under "patches/" in a ZIP archive
///
/// Manifest locations have the form "<archive>!/patches/<name>".
class ZipPatchSink : public PatchSink {
 public:
  /// @brief Create (or truncate) the archive at @p archive_path
  static absl::StatusOr<std::unique_ptr<ZipPatchSink>> Create(
      const std::filesystem::path& archive_path);

  absl::StatusOr<std::string> Put(const std::string& name,
                                  const std::vector<uint8_t>& data) override;

  absl::Status Finalize() override;

  [[nodiscard]] const std::filesystem::path& GetArchivePath() const {
    return archive_path_;
  }

 private:
  ZipPatchSink(std::filesystem::path archive_path,
               utilities::ZipArchive archive)
      : archive_path_(std::move(archive_path)), archive_(std::move(archive)) {}

  std::filesystem::path archive_path_;
  absl::Mutex mutex_;
  utilities::ZipArchive archive_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace slidepatch::pipeline

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_PATCH_SINK_H_
