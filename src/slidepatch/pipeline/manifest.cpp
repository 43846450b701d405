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

#include "slidepatch/pipeline/manifest.h"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "slidepatch/errors.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::pipeline {

namespace {

std::string QuoteField(std::string_view value) {
  return "\"" + absl::StrReplaceAll(value, {{"\"", "\"\""}}) + "\"";
}

absl::StatusOr<std::string> UnquoteField(std::string_view value) {
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Manifest path column is not quoted");
  }
  value.remove_prefix(1);
  value.remove_suffix(1);
  return absl::StrReplaceAll(value, {{"\"\"", "\""}});
}

absl::Status MalformedRow(size_t line_number, std::string_view reason) {
  return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                     slidepatch::fmt::format("Manifest line {}: {}",
                                             line_number, reason));
}

}  // namespace

std::string FormatManifestRow(const AcceptedPatch& patch) {
  return slidepatch::fmt::format("{},{},{},{},{},{:.6f},{}", patch.index,
                                 patch.tile.x, patch.tile.y, patch.tile.width,
                                 patch.tile.height, patch.coverage,
                                 QuoteField(patch.output_path));
}

absl::Status WriteManifest(const std::filesystem::path& path,
                           const std::vector<AcceptedPatch>& patches) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) {
    return MAKE_ERROR(ErrorKind::kWrite,
                      "Cannot open manifest for writing: " + path.string());
  }

  out << kManifestHeader << '\n';
  for (const AcceptedPatch& patch : patches) {
    out << FormatManifestRow(patch) << '\n';
  }
  out.flush();
  if (!out) {
    return MAKE_ERROR(ErrorKind::kWrite,
                      "Failed to write manifest: " + path.string());
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<AcceptedPatch>> ReadManifest(
    const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       "Cannot open manifest: " + path.string());
  }

  std::string line;
  if (!std::getline(in, line) ||
      absl::StripSuffix(line, "\r") != kManifestHeader) {
    return MalformedRow(1, "unexpected header");
  }

  std::vector<AcceptedPatch> patches;
  size_t line_number = 1;
  while (std::getline(in, line)) {
    ++line_number;
    const std::string_view row = absl::StripSuffix(line, "\r");
    if (row.empty()) {
      continue;
    }

    const std::vector<std::string_view> fields =
        absl::StrSplit(row, absl::MaxSplits(',', 6));
    if (fields.size() != 7) {
      return MalformedRow(line_number, "expected 7 columns");
    }

    AcceptedPatch patch{};
    uint32_t tile_values[4];
    for (size_t i = 0; i < 4; ++i) {
      if (!absl::SimpleAtoi(fields[i + 1], &tile_values[i])) {
        return MalformedRow(line_number, "bad tile coordinate");
      }
    }
    if (!absl::SimpleAtoi(fields[0], &patch.index) ||
        !absl::SimpleAtod(fields[5], &patch.coverage)) {
      return MalformedRow(line_number, "bad index or coverage");
    }
    patch.tile = Tile{.x = tile_values[0],
                      .y = tile_values[1],
                      .width = tile_values[2],
                      .height = tile_values[3]};
    ASSIGN_OR_RETURN(patch.output_path, UnquoteField(fields[6]));
    patches.push_back(std::move(patch));
  }
  return patches;
}

}  // namespace slidepatch::pipeline
