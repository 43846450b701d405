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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_ERRORS_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_ERRORS_H_

#include "absl/status/status.h"
#include "slidepatch/status/status_macros.h"

/**
 * @file errors.h
 * @brief Error taxonomy of the extraction pipeline
 *
 * Every failure is an absl::Status. The pipeline-level kind (decode failure,
 * unsupported pixel layout, ...) is attached as a status payload so that it
 * survives RETURN_IF_ERROR / ASSIGN_OR_RETURN propagation, and so that the
 * orchestrator can decide whether a failure is fatal for the slide or only
 * for one tile.
 */

namespace slidepatch {

/// @brief Pipeline error kinds
enum class ErrorKind {
  kNone,                 ///< Not a pipeline error (ok, or a plain status)
  kDecode,               ///< Slide unreadable or corrupt; fatal for the slide
  kUnsupportedFormat,    ///< Pixel layout not convertible to RGB; fatal
  kUnknownMaskingMethod, ///< Bad configuration; fatal before any work
  kTileRead,             ///< One region failed to decode; tile is skipped
  kWrite,                ///< Persisting a patch failed; policy decides
};

/// @brief Payload type URL under which the kind is stored
inline constexpr char kErrorKindPayload[] = "type.slidepatch/ErrorKind";

/// @brief Get string representation of an error kind
constexpr const char* GetName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kDecode:
      return "DecodeError";
    case ErrorKind::kUnsupportedFormat:
      return "UnsupportedFormatError";
    case ErrorKind::kUnknownMaskingMethod:
      return "UnknownMaskingMethodError";
    case ErrorKind::kTileRead:
      return "TileReadError";
    case ErrorKind::kWrite:
      return "WriteError";
  }
  return "unknown";
}

/// @brief Status code used for each kind
constexpr absl::StatusCode GetStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kDecode:
    case ErrorKind::kTileRead:
      return absl::StatusCode::kDataLoss;
    case ErrorKind::kUnsupportedFormat:
      return absl::StatusCode::kUnimplemented;
    case ErrorKind::kUnknownMaskingMethod:
      return absl::StatusCode::kNotFound;
    case ErrorKind::kWrite:
      return absl::StatusCode::kUnavailable;
    case ErrorKind::kNone:
      break;
  }
  return absl::StatusCode::kUnknown;
}

/// @brief Attach @p kind to a non-ok status
/// @param status Status to tag (returned unchanged when ok)
/// @param kind Error kind
/// @return Tagged status; the code and message are preserved
absl::Status WithErrorKind(absl::Status status, ErrorKind kind);

/// @brief Recover the kind attached to a status
/// @return The attached kind, or ErrorKind::kNone
[[nodiscard]] ErrorKind GetErrorKind(const absl::Status& status);

/// @brief Check whether a status carries a given kind
[[nodiscard]] inline bool IsErrorKind(const absl::Status& status,
                                      ErrorKind kind) {
  return GetErrorKind(status) == kind;
}

}  // namespace slidepatch

/// @brief Create a traced status of the given ErrorKind
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_ERROR(kind, message)                                          \
  ::slidepatch::WithErrorKind(                                             \
      MAKE_STATUS(::slidepatch::GetStatusCode(kind), (message)), (kind))

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_ERRORS_H_
