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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_MANIFEST_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_MANIFEST_H_

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidepatch/core/tile.h"

/**
 * @file manifest.h
 * @brief CSV record of the patches written for one slide
 *
 * One row per written patch, in tile enumeration order:
 *
 *     index,x,y,width,height,coverage,output_path
 *     0,0,512,512,512,0.734375,"out/patches/a.svs---[x=0,y=512,w=512,h=512].png"
 *
 * Coverage is printed with six decimals. Patch names contain commas, so the
 * path column is always quoted.
 */

namespace slidepatch::pipeline {

inline constexpr std::string_view kManifestHeader =
    "index,x,y,width,height,coverage,output_path";

/// @brief Format one manifest row (without line terminator)
[[nodiscard]] std::string FormatManifestRow(const AcceptedPatch& patch);

/// @brief Write header and rows to @p path
/// @return OkStatus, or a WriteError
absl::Status WriteManifest(const std::filesystem::path& path,
                           const std::vector<AcceptedPatch>& patches);

/// @brief Parse a manifest written by WriteManifest()
/// @return Rows, or InvalidArgument for malformed content
absl::StatusOr<std::vector<AcceptedPatch>> ReadManifest(
    const std::filesystem::path& path);

}  // namespace slidepatch::pipeline

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_PIPELINE_MANIFEST_H_
