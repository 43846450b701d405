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

#include "slidepatch/utilities/tiff/tiff_pool.h"

#include <tiffio.h>

#include <algorithm>
#include <memory>
#include <thread>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "slidepatch/status/status_macros.h"

namespace slidepatch {

void TIFFHandleGuard::Release() {
  if (handle_ != nullptr && pool_ != nullptr) {
    pool_->Release(handle_);
  }
  handle_ = nullptr;
  pool_ = nullptr;
}

absl::StatusOr<std::unique_ptr<TIFFHandlePool>> TIFFHandlePool::Create(
    const std::filesystem::path& path, unsigned pool_size) {
  TIFF* first = TIFFOpen(path.string().c_str(), "rm");
  if (first == nullptr) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot open TIFF file: " + path.string());
  }

  size_t max_size = pool_size;
  if (max_size == 0) {
    max_size = std::max(1U, std::thread::hardware_concurrency());
  }

  std::unique_ptr<TIFFHandlePool> pool(new TIFFHandlePool(path, max_size));
  {
    absl::MutexLock lock(&pool->mutex_);
    pool->free_handles_.push_back(first);
    pool->total_opened_ = 1;
  }
  return pool;
}

TIFFHandlePool::TIFFHandlePool(std::filesystem::path path,
                               size_t max_pool_size)
    : path_(std::move(path)), max_pool_size_(max_pool_size) {}

TIFFHandlePool::~TIFFHandlePool() {
  absl::MutexLock lock(&mutex_);
  if (free_handles_.size() != total_opened_) {
    LOG(WARNING) << "TIFF handle pool for " << path_.string()
                 << " destroyed with "
                 << (total_opened_ - free_handles_.size())
                 << " handle(s) still borrowed";
  }
  for (TIFF* handle : free_handles_) {
    TIFFClose(handle);
  }
  free_handles_.clear();
}

bool TIFFHandlePool::CanAcquire() const {
  return !free_handles_.empty() || total_opened_ < max_pool_size_;
}

TIFFHandleGuard TIFFHandlePool::Acquire() {
  absl::MutexLock lock(&mutex_);
  mutex_.Await(absl::Condition(this, &TIFFHandlePool::CanAcquire));

  if (!free_handles_.empty()) {
    TIFF* handle = free_handles_.back();
    free_handles_.pop_back();
    return TIFFHandleGuard(handle, this);
  }

  TIFF* handle = TIFFOpen(path_.string().c_str(), "rm");
  if (handle == nullptr) {
    LOG(WARNING) << "Failed to open additional TIFF handle for "
                 << path_.string();
    return TIFFHandleGuard(nullptr, nullptr);
  }
  ++total_opened_;
  return TIFFHandleGuard(handle, this);
}

void TIFFHandlePool::Release(TIFF* handle) {
  absl::MutexLock lock(&mutex_);
  free_handles_.push_back(handle);
}

TIFFHandlePool::Stats TIFFHandlePool::GetStats() const {
  absl::MutexLock lock(&mutex_);
  return Stats{.max_handles = max_pool_size_,
               .total_opened = total_opened_,
               .available_handles = free_handles_.size()};
}

}  // namespace slidepatch
