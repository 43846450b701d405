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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_RUNTIME_READER_REGISTRY_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_RUNTIME_READER_REGISTRY_H_

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "slidepatch/runtime/format_descriptor.h"

/**
 * @file reader_registry.h
 * @brief Extension-based slide reader lookup
 *
 * The registry is injectable for testing (tests register fake formats on a
 * local instance) while the global accessor provides the built-in formats.
 *
 * @code
 * auto reader = GetGlobalRegistry().CreateReader("slide.svs");
 * @endcode
 */

namespace slidepatch {
namespace runtime {

/// @brief Registry of slide formats keyed by file extension
///
/// @note All methods are thread-safe
class ReaderRegistry {
 public:
  ReaderRegistry() = default;

  ReaderRegistry(const ReaderRegistry&) = delete;
  ReaderRegistry& operator=(const ReaderRegistry&) = delete;

  /// @brief Register a format under its primary extension and aliases
  /// @note Replaces any format registered for the same extensions
  void RegisterFormat(FormatDescriptor descriptor);

  /// @brief Create a reader for the given file
  /// @param filename Path to slide file
  /// @return SlideReader, or a DecodeError when the extension is unknown or
  ///         the file cannot be opened
  [[nodiscard]] absl::StatusOr<std::unique_ptr<SlideReader>> CreateReader(
      std::string_view filename) const;

  /// @brief List registered format names (sorted, unique)
  [[nodiscard]] std::vector<std::string> ListFormats() const;

  /// @brief Check if an extension is registered (case-insensitive)
  [[nodiscard]] bool SupportsExtension(std::string_view extension) const;

  /// @brief All registered extensions, normalized and sorted
  [[nodiscard]] std::vector<std::string> GetSupportedExtensions() const;

  /// @brief Normalize extension (lowercase with leading dot)
  static std::string NormalizeExtension(std::string_view extension);

 private:
  std::map<std::string, FormatDescriptor> formats_ ABSL_GUARDED_BY(mutex_);
  mutable absl::Mutex mutex_;
};

/// @brief Register the built-in formats (TIFF/SVS and PNG)
void RegisterBuiltinFormats(ReaderRegistry& registry);

/// @brief Global registry with the built-in formats registered
///
/// Initialized lazily on first access.
ReaderRegistry& GetGlobalRegistry();

}  // namespace runtime

using runtime::GetGlobalRegistry;
using runtime::ReaderRegistry;

}  // namespace slidepatch

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_RUNTIME_READER_REGISTRY_H_
