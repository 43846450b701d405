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
#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_CONCEPTS_NUMERIC_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_CONCEPTS_NUMERIC_H_

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <stdexcept>

namespace slidepatch {

// Integral or floating point number with the usual arithmetic
template <typename T>
concept GenericNumber = std::integral<T> || std::floating_point<T>;

/// @brief Fixed-size N-dimensional extent or coordinate
///
/// Used for image dimensions, coordinates and patch sizes; index 0 is x
/// (width), index 1 is y (height).
template <GenericNumber T, std::size_t N>
class Size {
 public:
  constexpr Size() : data_{} {}

  constexpr Size(std::initializer_list<T> init) : data_{} {
    if (init.size() != N) {
      throw std::invalid_argument("Initializer list must have size N.");
    }
    std::copy(init.begin(), init.end(), data_.begin());
  }

  constexpr T& operator[](std::size_t index) { return data_[index]; }

  constexpr const T& operator[](std::size_t index) const {
    return data_[index];
  }

  template <typename U>
  constexpr bool operator==(const Size<U, N>& other) const
      requires std::convertible_to<U, T> {
    for (std::size_t i = 0; i < N; ++i) {
      if (data_[i] != static_cast<T>(other[i])) {
        return false;
      }
    }
    return true;
  }

  /// @brief Product of all extents (pixel count for a 2-D size)
  [[nodiscard]] constexpr std::size_t Volume() const {
    std::size_t volume = 1;
    for (const T value : data_) {
      volume *= static_cast<std::size_t>(value);
    }
    return volume;
  }

  friend std::ostream& operator<<(std::ostream& os, const Size& size) {
    os << "{";
    for (std::size_t i = 0; i < N; ++i) {
      os << size[i];
      if (i < N - 1) {
        os << ", ";
      }
    }
    os << "}";
    return os;
  }

 private:
  std::array<T, N> data_;
};

}  // namespace slidepatch

namespace fmt {

// Formats Size<T, N> as "{a, b}"
template <typename T, std::size_t N>
struct formatter<slidepatch::Size<T, N>> {
  constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const slidepatch::Size<T, N>& size, FormatContext& ctx) const
      -> decltype(ctx.out()) {
    auto out = ctx.out();
    *out++ = '{';
    for (std::size_t i = 0; i < N; ++i) {
      out = fmt::format_to(out, "{}", size[i]);
      if (i < N - 1) {
        *out++ = ',';
        *out++ = ' ';
      }
    }
    *out++ = '}';
    return out;
  }
};

}  // namespace fmt

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_CONCEPTS_NUMERIC_H_
