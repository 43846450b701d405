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

/**
 * @file tiff_pool.h
 * @brief Thread-safe pool of TIFF handles
 *
 * libtiff handles carry the current directory and decoder state, so they
 * cannot be shared between threads. Patch workers each borrow a handle from
 * this pool for the duration of one region read. Handles are opened lazily up
 * to the configured maximum and are reused afterwards.
 */

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TIFF_TIFF_POOL_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TIFF_TIFF_POOL_H_

#include <tiffio.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

namespace slidepatch {

class TIFFHandlePool;

/**
 * @brief RAII wrapper for a TIFF handle borrowed from a pool
 *
 * The handle is returned to the pool when the guard is destroyed.
 *
 * @note Movable but not copyable to ensure exclusive ownership
 */
class TIFFHandleGuard {
 public:
  TIFFHandleGuard(TIFF* handle, TIFFHandlePool* pool)
      : handle_(handle), pool_(pool) {}

  ~TIFFHandleGuard() noexcept { Release(); }

  TIFFHandleGuard(const TIFFHandleGuard&) = delete;
  TIFFHandleGuard& operator=(const TIFFHandleGuard&) = delete;

  TIFFHandleGuard(TIFFHandleGuard&& other) noexcept
      : handle_(other.handle_), pool_(other.pool_) {
    other.handle_ = nullptr;
    other.pool_ = nullptr;
  }

  TIFFHandleGuard& operator=(TIFFHandleGuard&& other) noexcept {
    if (this != &other) {
      Release();
      handle_ = other.handle_;
      pool_ = other.pool_;
      other.handle_ = nullptr;
      other.pool_ = nullptr;
    }
    return *this;
  }

  /// @brief Get the raw TIFF handle (nullptr if invalid)
  [[nodiscard]] TIFF* Get() const { return handle_; }

  /// @brief Check if handle is valid
  [[nodiscard]] bool Valid() const { return handle_ != nullptr; }

 private:
  void Release();

  TIFF* handle_;          ///< Raw TIFF handle (nullptr if invalid)
  TIFFHandlePool* pool_;  ///< Owning pool
};

/**
 * @brief Pool of read-only TIFF handles for one file
 *
 * @note All public methods are thread-safe
 * @note Handles are opened in read-only mode ("rm")
 */
class TIFFHandlePool {
 public:
  /**
   * @brief Factory method to create a pool
   *
   * Opens one handle eagerly so that an unreadable file is reported here
   * rather than on first use.
   *
   * @param path Path to the TIFF file
   * @param pool_size Maximum number of handles (0 = hardware concurrency)
   * @return Pool, or kInvalidArgument if the file cannot be opened
   */
  static absl::StatusOr<std::unique_ptr<TIFFHandlePool>> Create(
      const std::filesystem::path& path, unsigned pool_size = 0);

  /// @brief Closes all pooled handles
  /// @warning Do not destroy the pool while handles are still borrowed
  ~TIFFHandlePool();

  TIFFHandlePool(const TIFFHandlePool&) = delete;
  TIFFHandlePool& operator=(const TIFFHandlePool&) = delete;

  /**
   * @brief Borrow a handle, blocking until one is free
   *
   * @return Guard for the handle; invalid if a new handle could not be opened
   */
  TIFFHandleGuard Acquire();

  /// @brief Snapshot of the pool state
  struct Stats {
    size_t max_handles;        ///< Maximum handles allowed in the pool
    size_t total_opened;       ///< Handles opened so far
    size_t available_handles;  ///< Handles currently idle in the pool
  };

  [[nodiscard]] Stats GetStats() const;

  [[nodiscard]] const std::filesystem::path& GetPath() const { return path_; }

 private:
  friend class TIFFHandleGuard;

  TIFFHandlePool(std::filesystem::path path, size_t max_pool_size);

  void Release(TIFF* handle);

  bool CanAcquire() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  std::filesystem::path path_;
  size_t max_pool_size_;

  mutable absl::Mutex mutex_;
  std::vector<TIFF*> free_handles_ ABSL_GUARDED_BY(mutex_);
  size_t total_opened_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_TIFF_TIFF_POOL_H_
