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

#include "slidepatch/readers/tiff_reader.h"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "slidepatch/errors.h"
#include "slidepatch/readers/slide_metadata.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"
#include "slidepatch/utilities/tiff/tiff_file.h"

namespace slidepatch {

absl::StatusOr<std::unique_ptr<TiffReader>> TiffReader::Create(
    const std::filesystem::path& path, unsigned pool_size) {
  if (!std::filesystem::exists(path)) {
    return MAKE_ERROR(ErrorKind::kDecode,
                      "Slide file does not exist: " + path.string());
  }

  auto pool = TIFFHandlePool::Create(path, pool_size);
  if (!pool.ok()) {
    return WithErrorKind(pool.status(), ErrorKind::kDecode);
  }

  std::unique_ptr<TiffReader> reader(new TiffReader(std::move(*pool)));
  const absl::Status status = reader->Initialize();
  if (!status.ok()) {
    // Anything wrong with the pyramid structure makes the slide undecodable
    return IsErrorKind(status, ErrorKind::kNone)
               ? WithErrorKind(status, ErrorKind::kDecode)
               : status;
  }
  return reader;
}

TiffReader::TiffReader(std::unique_ptr<TIFFHandlePool> pool)
    : pool_(std::move(pool)), format_name_("TIFF") {}

absl::Status TiffReader::Initialize() {
  auto tiff_result = TiffFile::Create(pool_.get());
  RETURN_IF_ERROR(tiff_result.status());
  TiffFile& tiff = *tiff_result;

  DECLARE_ASSIGN_OR_RETURN(uint16_t, dir_count, tiff.GetDirectoryCount());
  if (dir_count == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "TIFF file has no directories");
  }

  std::vector<std::pair<uint16_t, TiffDirectoryInfo>> candidates;
  std::string first_description;

  for (uint16_t dir = 0; dir < dir_count; ++dir) {
    RETURN_IF_ERROR(tiff.SetDirectory(dir));
    DECLARE_ASSIGN_OR_RETURN(TiffDirectoryInfo, info, tiff.GetDirectoryInfo());
    if (dir == 0) {
      first_description = info.image_description;
    }
    if (!info.is_tiled && dir_count > 1) {
      continue;
    }
    if (readers::IsAssociatedImageDescription(info.image_description)) {
      continue;
    }
    candidates.emplace_back(dir, std::move(info));
  }

  if (candidates.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "TIFF file contains no tiled pyramid directories");
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const auto& a, const auto& b) {
                     return a.second.Area() > b.second.Area();
                   });

  const ImageDimensions base = candidates.front().second.image_dims;
  for (const auto& [dir, info] : candidates) {
    if (!levels_.empty() &&
        levels_.back().info.dimensions == info.image_dims) {
      continue;
    }
    const double downsample =
        static_cast<double>(base[0]) / static_cast<double>(info.image_dims[0]);
    levels_.push_back(Level{.directory = dir,
                            .info = LevelInfo(info.image_dims, downsample)});
  }

  if (readers::IsAperioDescription(first_description)) {
    format_name_ = "SVS";
    auto aperio = readers::ParseAperioDescription(first_description);
    if (aperio.ok()) {
      properties_.mpp = aperio->mpp;
      properties_.objective_magnification = aperio->app_mag;
      properties_.scanner_model = aperio->scanner_id;
    } else {
      LOG(WARNING) << "Aperio description without calibration: "
                   << aperio.status().message();
    }
  } else {
    const TiffDirectoryInfo& base_info = candidates.front().second;
    if (auto mpp = readers::MppFromResolution(base_info.x_resolution,
                                              base_info.y_resolution,
                                              base_info.resolution_unit)) {
      properties_.mpp = *mpp;
    }
  }

  LOG(INFO) << "Opened " << format_name_ << " slide "
            << pool_->GetPath().string() << " with " << levels_.size()
            << " level(s), level 0 " << base;
  return absl::OkStatus();
}

absl::StatusOr<LevelInfo> TiffReader::GetLevelInfo(int level) const {
  if (level < 0 || level >= GetLevelCount()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        slidepatch::fmt::format("Invalid level {} (slide has {} levels)",
                                level, GetLevelCount()));
  }
  return levels_[static_cast<size_t>(level)].info;
}

absl::StatusOr<Image> TiffReader::ReadRegion(const RegionSpec& region) const {
  if (!region.IsValid()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Region must have a positive size");
  }
  DECLARE_ASSIGN_OR_RETURN(LevelInfo, level_info, GetLevelInfo(region.level));

  const ImageDimensions& dims = level_info.dimensions;
  if (static_cast<uint64_t>(region.top_left[0]) + region.size[0] > dims[0] ||
      static_cast<uint64_t>(region.top_left[1]) + region.size[1] > dims[1]) {
    return MAKE_STATUS(
        absl::StatusCode::kOutOfRange,
        slidepatch::fmt::format("Region at {} of size {} exceeds level {} {}",
                                region.top_left, region.size, region.level,
                                dims));
  }

  auto tiff_result = TiffFile::Create(pool_.get());
  RETURN_IF_ERROR(tiff_result.status());
  TiffFile& tiff = *tiff_result;
  RETURN_IF_ERROR(
      tiff.SetDirectory(levels_[static_cast<size_t>(region.level)].directory));
  return tiff.ReadRegion(region.top_left[0], region.top_left[1],
                         region.size[0], region.size[1]);
}

}  // namespace slidepatch
