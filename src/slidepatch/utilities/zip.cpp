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

#include "slidepatch/utilities/zip.h"

#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_os.h>
#include <mz_zip.h>

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::utilities {

absl::StatusOr<ZipArchive> ZipArchive::OpenForReading(
    const std::filesystem::path& path) {
  return Open(path, MZ_OPEN_MODE_READ);
}

absl::StatusOr<ZipArchive> ZipArchive::CreateForWriting(
    const std::filesystem::path& path) {
  return Open(path, MZ_OPEN_MODE_WRITE | MZ_OPEN_MODE_CREATE);
}

absl::StatusOr<ZipArchive> ZipArchive::Open(const std::filesystem::path& path,
                                            int32_t mode) {
  void* stream = mz_stream_os_create();
  if (stream == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to create zip stream");
  }

  if (mz_stream_os_open(stream, path.string().c_str(), mode) != MZ_OK) {
    mz_stream_os_delete(&stream);
    return MAKE_STATUS(absl::StatusCode::kUnavailable,
                       "Failed to open zip file: " + path.string());
  }

  void* handle = mz_zip_create();
  if (handle == nullptr) {
    mz_stream_os_close(stream);
    mz_stream_os_delete(&stream);
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to create zip handle");
  }

  const int32_t zip_mode =
      (mode & MZ_OPEN_MODE_WRITE) != 0 ? MZ_OPEN_MODE_WRITE : MZ_OPEN_MODE_READ;
  if (mz_zip_open(handle, stream, zip_mode) != MZ_OK) {
    mz_zip_delete(&handle);
    mz_stream_os_close(stream);
    mz_stream_os_delete(&stream);
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to open zip archive: " + path.string());
  }

  return ZipArchive(handle, stream, zip_mode == MZ_OPEN_MODE_WRITE);
}

ZipArchive::~ZipArchive() { Reset(); }

ZipArchive::ZipArchive(ZipArchive&& other) noexcept
    : handle_(other.handle_),
      stream_(other.stream_),
      writable_(other.writable_) {
  other.handle_ = nullptr;
  other.stream_ = nullptr;
}

ZipArchive& ZipArchive::operator=(ZipArchive&& other) noexcept {
  if (this != &other) {
    Reset();
    handle_ = other.handle_;
    stream_ = other.stream_;
    writable_ = other.writable_;
    other.handle_ = nullptr;
    other.stream_ = nullptr;
  }
  return *this;
}

void ZipArchive::Reset() {
  if (handle_ != nullptr) {
    mz_zip_close(handle_);
    mz_zip_delete(&handle_);
  }
  if (stream_ != nullptr) {
    mz_stream_os_close(stream_);
    mz_stream_os_delete(&stream_);
  }
}

absl::StatusOr<std::string> ZipArchive::ReadEntry(
    const std::string& name) const {
  if (handle_ == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Zip archive is closed");
  }
  if (mz_zip_locate_entry(handle_, name.c_str(), 0) != MZ_OK) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Failed to locate '" + name + "' in zip archive");
  }

  mz_zip_file* file_info = nullptr;
  if (mz_zip_entry_get_info(handle_, &file_info) != MZ_OK) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to get file info for '" + name + "'");
  }
  if (mz_zip_entry_read_open(handle_, 0, nullptr) != MZ_OK) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to open '" + name + "' for reading");
  }

  std::string content(static_cast<size_t>(file_info->uncompressed_size), '\0');
  const int32_t bytes_read = mz_zip_entry_read(
      handle_, content.data(), static_cast<int32_t>(content.size()));
  mz_zip_entry_close(handle_);

  if (bytes_read < 0 ||
      static_cast<int64_t>(bytes_read) != file_info->uncompressed_size) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to read complete file '" + name + "'");
  }
  return content;
}

absl::StatusOr<std::vector<std::string>> ZipArchive::ListEntries() const {
  if (handle_ == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Zip archive is closed");
  }

  std::vector<std::string> names;
  int32_t result = mz_zip_goto_first_entry(handle_);
  while (result == MZ_OK) {
    mz_zip_file* file_info = nullptr;
    if (mz_zip_entry_get_info(handle_, &file_info) != MZ_OK) {
      return MAKE_STATUS(absl::StatusCode::kDataLoss,
                         "Failed to read zip entry info");
    }
    names.emplace_back(file_info->filename);
    result = mz_zip_goto_next_entry(handle_);
  }
  if (result != MZ_END_OF_LIST) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to iterate zip entries");
  }
  return names;
}

absl::Status ZipArchive::AddEntry(const std::string& name,
                                  const std::vector<uint8_t>& data) {
  if (handle_ == nullptr || !writable_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Zip archive is not open for writing");
  }

  mz_zip_file file_info = {};
  file_info.version_madeby = MZ_VERSION_MADEBY;
  file_info.compression_method = MZ_COMPRESS_METHOD_STORE;
  file_info.filename = name.c_str();
  file_info.modified_date = std::time(nullptr);
  file_info.uncompressed_size = static_cast<int64_t>(data.size());
  file_info.flag = MZ_ZIP_FLAG_UTF8;

  if (mz_zip_entry_write_open(handle_, &file_info, MZ_COMPRESS_LEVEL_DEFAULT,
                              0, nullptr) != MZ_OK) {
    return MAKE_STATUS(absl::StatusCode::kUnavailable,
                       "Failed to open zip entry '" + name + "'");
  }

  const int32_t written = mz_zip_entry_write(
      handle_, data.data(), static_cast<int32_t>(data.size()));
  const int32_t closed = mz_zip_entry_close(handle_);
  if (written != static_cast<int32_t>(data.size()) || closed != MZ_OK) {
    return MAKE_STATUS(
        absl::StatusCode::kUnavailable,
        slidepatch::fmt::format("Failed to write zip entry '{}' ({} of {} bytes)",
                                name, written, data.size()));
  }
  return absl::OkStatus();
}

absl::Status ZipArchive::Close() {
  if (handle_ == nullptr) {
    return absl::OkStatus();
  }
  const int32_t result = mz_zip_close(handle_);
  mz_zip_delete(&handle_);
  mz_stream_os_close(stream_);
  mz_stream_os_delete(&stream_);
  if (result != MZ_OK) {
    return MAKE_STATUS(absl::StatusCode::kUnavailable,
                       slidepatch::fmt::format(
                           "Failed to finalize zip archive (error {})", result));
  }
  return absl::OkStatus();
}

}  // namespace slidepatch::utilities
