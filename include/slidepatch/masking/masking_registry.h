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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MASKING_REGISTRY_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MASKING_REGISTRY_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "slidepatch/image.h"
#include "slidepatch/masking/masking_options.h"
#include "slidepatch/masking/tissue_mask.h"

/**
 * @file masking_registry.h
 * @brief Table of masking methods keyed by name
 *
 * The table is built once at startup. Adding a method means writing one
 * function with the MaskFunction signature and adding one entry to the
 * table; existing entries never change.
 *
 * @code
 * DECLARE_ASSIGN_OR_RETURN(const MaskingStrategy*, strategy,
 *                          FindMaskingStrategy("otsu"));
 * DECLARE_ASSIGN_OR_RETURN(TissueMask, mask,
 *                          strategy->produce_mask(overview, {}));
 * @endcode
 */

namespace slidepatch::masking {

/// @brief Masking method tag
enum class MaskingMethod {
  kOtsu,
  kKMeans,
  kEntropy,
  kSchreiber,
  kOpticalDensity,
  kLuminosity,
};

/// @brief Signature shared by every masking method
using MaskFunction = absl::StatusOr<TissueMask> (*)(const Image& rgb,
                                                   const MaskingOptions&);

/// @brief One entry of the masking table
struct MaskingStrategy {
  std::string_view name;      ///< Name used in configuration and on the CLI
  MaskingMethod method;       ///< Tag
  MaskFunction produce_mask;  ///< Implementation
};

/// @brief All registered strategies, in registration order
[[nodiscard]] const std::vector<MaskingStrategy>& GetMaskingStrategies();

/// @brief Look up a strategy by name
/// @return Strategy, or UnknownMaskingMethodError
absl::StatusOr<const MaskingStrategy*> FindMaskingStrategy(
    std::string_view name);

/// @brief Look up a strategy by tag
/// @return Table entry, or nullptr for a value outside the enumeration
[[nodiscard]] const MaskingStrategy* GetMaskingStrategy(MaskingMethod method);

/// @brief Names of all registered strategies, in registration order
[[nodiscard]] std::vector<std::string> ListMaskingMethods();

/// @brief Name of a masking method
[[nodiscard]] std::string_view GetName(MaskingMethod method);

}  // namespace slidepatch::masking

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_MASKING_MASKING_REGISTRY_H_
