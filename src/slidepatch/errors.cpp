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

#include "slidepatch/errors.h"

#include <string>
#include <utility>

#include "absl/strings/cord.h"

namespace slidepatch {

namespace {

constexpr ErrorKind kAllKinds[] = {
    ErrorKind::kDecode,   ErrorKind::kUnsupportedFormat,
    ErrorKind::kUnknownMaskingMethod, ErrorKind::kTileRead,
    ErrorKind::kWrite,
};

}  // namespace

absl::Status WithErrorKind(absl::Status status, ErrorKind kind) {
  if (status.ok() || kind == ErrorKind::kNone) {
    return status;
  }
  status.SetPayload(kErrorKindPayload, absl::Cord(GetName(kind)));
  return status;
}

ErrorKind GetErrorKind(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kNone;
  }

  const auto payload = status.GetPayload(kErrorKindPayload);
  if (!payload.has_value()) {
    return ErrorKind::kNone;
  }

  const std::string name(*payload);
  for (const ErrorKind kind : kAllKinds) {
    if (name == GetName(kind)) {
      return kind;
    }
  }
  return ErrorKind::kNone;
}

}  // namespace slidepatch
