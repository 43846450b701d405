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
#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_FMT_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_FMT_H_

// Manifest rows and patch names go through fmt on every toolchain so that
// floating point output is identical across platforms.
#include <fmt/core.h>
#include <fmt/format.h>

namespace slidepatch::fmt {
using ::fmt::format;
using ::fmt::format_to;
}  // namespace slidepatch::fmt

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_UTILITIES_FMT_H_
