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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_ZIP_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_ZIP_H_

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace slidepatch::utilities {

/// @brief ZIP archive opened for reading or writing (minizip-ng)
///
/// An archive is either read or written, never both. Entries written with
/// AddEntry() are stored without recompression, since patches are already
/// PNG-compressed. The archive is finalized by Close() or by the destructor.
///
/// @note Not thread-safe; callers serialize access.
class ZipArchive {
 public:
  /// @brief Open an existing archive for reading
  static absl::StatusOr<ZipArchive> OpenForReading(
      const std::filesystem::path& path);

  /// @brief Create (or truncate) an archive for writing
  static absl::StatusOr<ZipArchive> CreateForWriting(
      const std::filesystem::path& path);

  ~ZipArchive();

  ZipArchive(const ZipArchive&) = delete;
  ZipArchive& operator=(const ZipArchive&) = delete;

  ZipArchive(ZipArchive&& other) noexcept;
  ZipArchive& operator=(ZipArchive&& other) noexcept;

  /// @brief Read an entry
  /// @return Entry contents, or NotFound if the entry does not exist
  absl::StatusOr<std::string> ReadEntry(const std::string& name) const;

  /// @brief Names of all entries, in archive order
  absl::StatusOr<std::vector<std::string>> ListEntries() const;

  /// @brief Append an entry
  absl::Status AddEntry(const std::string& name,
                        const std::vector<uint8_t>& data);

  /// @brief Write the central directory and close the file
  absl::Status Close();

  [[nodiscard]] bool IsOpen() const { return handle_ != nullptr; }

 private:
  ZipArchive(void* handle, void* stream, bool writable)
      : handle_(handle), stream_(stream), writable_(writable) {}

  static absl::StatusOr<ZipArchive> Open(const std::filesystem::path& path,
                                         int32_t mode);

  void Reset();

  void* handle_ = nullptr;  // mz_zip handle
  void* stream_ = nullptr;  // mz_stream handle
  bool writable_ = false;
};

}  // namespace slidepatch::utilities

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_ZIP_H_
