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

#include "slidepatch/masking/masking_registry.h"

#include <string>
#include <string_view>
#include <vector>

#include "absl/strings/str_join.h"
#include "slidepatch/errors.h"
#include "slidepatch/masking/strategies.h"
#include "slidepatch/status/status_macros.h"
#include "slidepatch/utilities/fmt.h"

namespace slidepatch::masking {

const std::vector<MaskingStrategy>& GetMaskingStrategies() {
  static const std::vector<MaskingStrategy>* strategies =
      new std::vector<MaskingStrategy>{
          {"otsu", MaskingMethod::kOtsu, &MaskWithOtsu},
          {"kmeans", MaskingMethod::kKMeans, &MaskWithKMeans},
          {"entropy", MaskingMethod::kEntropy, &MaskWithEntropy},
          {"schreiber", MaskingMethod::kSchreiber, &MaskWithSchreiber},
          {"optical-density", MaskingMethod::kOpticalDensity,
           &MaskWithOpticalDensity},
          {"luminosity", MaskingMethod::kLuminosity, &MaskWithLuminosity},
      };
  return *strategies;
}

absl::StatusOr<const MaskingStrategy*> FindMaskingStrategy(
    std::string_view name) {
  for (const MaskingStrategy& strategy : GetMaskingStrategies()) {
    if (strategy.name == name) {
      return &strategy;
    }
  }
  return MAKE_ERROR(
      ErrorKind::kUnknownMaskingMethod,
      slidepatch::fmt::format("Unknown masking method '{}' (expected one of: {})",
                              name, absl::StrJoin(ListMaskingMethods(), ", ")));
}

const MaskingStrategy* GetMaskingStrategy(MaskingMethod method) {
  const std::vector<MaskingStrategy>& strategies = GetMaskingStrategies();
  switch (method) {
    case MaskingMethod::kOtsu:
      return &strategies[0];
    case MaskingMethod::kKMeans:
      return &strategies[1];
    case MaskingMethod::kEntropy:
      return &strategies[2];
    case MaskingMethod::kSchreiber:
      return &strategies[3];
    case MaskingMethod::kOpticalDensity:
      return &strategies[4];
    case MaskingMethod::kLuminosity:
      return &strategies[5];
  }
  return nullptr;
}

std::vector<std::string> ListMaskingMethods() {
  std::vector<std::string> names;
  for (const MaskingStrategy& strategy : GetMaskingStrategies()) {
    names.emplace_back(strategy.name);
  }
  return names;
}

std::string_view GetName(MaskingMethod method) {
  const MaskingStrategy* strategy = GetMaskingStrategy(method);
  return strategy != nullptr ? strategy->name : "unknown";
}

}  // namespace slidepatch::masking
