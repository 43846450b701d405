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

#include "slidepatch/runtime/reader_registry.h"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "slidepatch/errors.h"
#include "slidepatch/slide_reader.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch {
namespace runtime {

std::string ReaderRegistry::NormalizeExtension(std::string_view extension) {
  std::string result = absl::AsciiStrToLower(extension);
  if (!result.empty() && result[0] != '.') {
    result = "." + result;
  }
  return result;
}

void ReaderRegistry::RegisterFormat(FormatDescriptor descriptor) {
  absl::MutexLock lock(&mutex_);

  for (const auto& alias : descriptor.aliases) {
    formats_[NormalizeExtension(alias)] = descriptor;
  }
  const std::string normalized =
      NormalizeExtension(descriptor.primary_extension);
  formats_[normalized] = std::move(descriptor);
}

absl::StatusOr<std::unique_ptr<SlideReader>> ReaderRegistry::CreateReader(
    std::string_view filename) const {
  const std::filesystem::path path(filename);
  const std::string extension = path.extension().string();
  if (extension.empty()) {
    return MAKE_ERROR(ErrorKind::kDecode,
                      slidepatch::fmt::format("File has no extension: {}",
                                              filename));
  }

  ReaderFactory factory;
  {
    absl::ReaderMutexLock lock(&mutex_);
    auto it = formats_.find(NormalizeExtension(extension));
    if (it == formats_.end()) {
      return MAKE_ERROR(
          ErrorKind::kDecode,
          slidepatch::fmt::format("No reader registered for extension: {}",
                                  extension));
    }
    factory = it->second.factory;
  }

  if (!factory) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        slidepatch::fmt::format("Format for {} has no factory function",
                                extension));
  }

  // Opening may be slow, so the factory runs outside the lock
  auto reader = factory(filename);
  if (!reader.ok() && IsErrorKind(reader.status(), ErrorKind::kNone)) {
    return WithErrorKind(reader.status(), ErrorKind::kDecode);
  }
  return reader;
}

std::vector<std::string> ReaderRegistry::ListFormats() const {
  absl::ReaderMutexLock lock(&mutex_);

  std::set<std::string> names;
  for (const auto& [ext, desc] : formats_) {
    names.insert(desc.format_name);
  }
  return {names.begin(), names.end()};
}

bool ReaderRegistry::SupportsExtension(std::string_view extension) const {
  absl::ReaderMutexLock lock(&mutex_);
  return formats_.contains(NormalizeExtension(extension));
}

std::vector<std::string> ReaderRegistry::GetSupportedExtensions() const {
  absl::ReaderMutexLock lock(&mutex_);

  std::vector<std::string> extensions;
  extensions.reserve(formats_.size());
  for (const auto& [ext, desc] : formats_) {
    extensions.push_back(ext);
  }
  return extensions;
}

ReaderRegistry& GetGlobalRegistry() {
  static ReaderRegistry* global_registry = []() {
    auto* registry = new ReaderRegistry();
    RegisterBuiltinFormats(*registry);
    return registry;
  }();
  return *global_registry;
}

}  // namespace runtime
}  // namespace slidepatch
