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

#include "slidepatch/pipeline/patch_sink.h"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"
#include "slidepatch/utilities/png.h"

namespace slidepatch::pipeline {

absl::StatusOr<std::unique_ptr<DirectoryPatchSink>> DirectoryPatchSink::Create(
    const std::filesystem::path& directory) {
  std::error_code error;
  std::filesystem::create_directories(directory, error);
  if (error) {
    return MAKE_ERROR(ErrorKind::kWrite,
                      slidepatch::fmt::format("Cannot create {}: {}",
                                              directory.string(),
                                              error.message()));
  }
  return std::unique_ptr<DirectoryPatchSink>(new DirectoryPatchSink(directory));
}

absl::StatusOr<std::string> DirectoryPatchSink::Put(
    const std::string& name, const std::vector<uint8_t>& data) {
  const std::filesystem::path path = directory_ / name;
  RETURN_IF_ERROR(utilities::WriteFile(path, data));
  return path.string();
}

absl::Status DirectoryPatchSink::Finalize() { return absl::OkStatus(); }

absl::StatusOr<std::unique_ptr<ZipPatchSink>> ZipPatchSink::Create(
    const std::filesystem::path& archive_path) {
  std::error_code error;
  if (archive_path.has_parent_path()) {
    std::filesystem::create_directories(archive_path.parent_path(), error);
  }
  if (error) {
    return MAKE_ERROR(ErrorKind::kWrite,
                      slidepatch::fmt::format("Cannot create {}: {}",
                                              archive_path.parent_path().string(),
                                              error.message()));
  }

  auto archive = utilities::ZipArchive::CreateForWriting(archive_path);
  if (!archive.ok()) {
    return WithErrorKind(archive.status(), ErrorKind::kWrite);
  }
  return std::unique_ptr<ZipPatchSink>(
      new ZipPatchSink(archive_path, std::move(*archive)));
}

absl::StatusOr<std::string> ZipPatchSink::Put(
    const std::string& name, const std::vector<uint8_t>& data) {
  const std::string entry = "patches/" + name;
  {
    absl::MutexLock lock(&mutex_);
    absl::Status status = archive_.AddEntry(entry, data);
    if (!status.ok()) {
      return WithErrorKind(std::move(status), ErrorKind::kWrite);
    }
  }
  return archive_path_.string() + "!/" + entry;
}

absl::Status ZipPatchSink::Finalize() {
  absl::MutexLock lock(&mutex_);
  return WithErrorKind(archive_.Close(), ErrorKind::kWrite);
}

}  // namespace slidepatch::pipeline
