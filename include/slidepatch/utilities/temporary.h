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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TEMPORARY_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TEMPORARY_H_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "absl/log/log.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::utilities {

/// @brief Uniquely named directory under the system temp path
///
/// The directory and its contents are removed on destruction unless
/// SetKeep(true) was called.
class TemporaryDirectory {
 public:
  TemporaryDirectory() : keep_files_(false) { InitializePath(); }

  explicit TemporaryDirectory(bool keep_files) : keep_files_(keep_files) {
    InitializePath();
  }

  ~TemporaryDirectory() {
    if (keep_files_ || path_.empty()) {
      return;
    }
    std::error_code error;
    std::filesystem::remove_all(path_, error);
    if (error) {
      LOG(WARNING) << "Failed to clean up temporary directory " << path_
                   << ": " << error.message();
    }
  }

  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

  TemporaryDirectory(TemporaryDirectory&& other) noexcept
      : path_(std::move(other.path_)), keep_files_(other.keep_files_) {
    other.path_.clear();
  }

  [[nodiscard]] const std::filesystem::path& Path() const { return path_; }

  [[nodiscard]] bool IsKept() const { return keep_files_; }

  void SetKeep(bool keep) { keep_files_ = keep; }

 private:
  void InitializePath() {
    std::random_device random_device;
    std::mt19937_64 gen(random_device());
    const uint64_t unique_id = gen();
    const auto timestamp =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count();

    path_ = std::filesystem::temp_directory_path() /
            slidepatch::fmt::format("slidepatch_{:016x}_{:016x}", timestamp,
                                    unique_id);
    if (!std::filesystem::create_directories(path_)) {
      throw std::runtime_error("Failed to create temporary directory: " +
                               path_.string());
    }
  }

  std::filesystem::path path_;
  bool keep_files_;
};

}  // namespace slidepatch::utilities

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TEMPORARY_H_
