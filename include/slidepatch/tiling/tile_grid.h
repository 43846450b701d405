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

#ifndef SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_TILE_GRID_H_
#define SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_TILE_GRID_H_

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>

#include "absl/status/statusor.h"
#include "slidepatch/core/tile.h"
#include "slidepatch/image.h"

/**
 * @file tile_grid.h
 * @brief Enumeration of candidate tiles over a slide
 *
 * Tile origins are (i * stride_x, j * stride_y) for every origin inside the
 * slide, in row-major order: y outermost, x innermost. The grid stores only
 * its parameters; tiles are computed from their index on demand, so a grid
 * can be iterated any number of times and always yields the same sequence.
 *
 * @code
 * auto grid = TileGrid::Create({10000, 8000}, {512, 512}, {512, 512});
 * RETURN_IF_ERROR(grid.status());
 * for (const Tile& tile : *grid) {
 *   ...
 * }
 * @endcode
 */

namespace slidepatch::tiling {

/// @brief What happens to tiles that extend past the slide
enum class EdgePolicy {
  kClip,  ///< Clip to the slide boundary (smaller last row / column)
  kDrop,  ///< Drop tiles smaller than a fraction of the patch size
};

[[nodiscard]] std::string_view GetName(EdgePolicy policy);

/// @brief Parse "clip" or "drop"
absl::StatusOr<EdgePolicy> ParseEdgePolicy(std::string_view name);

/// @brief Lazy row-major grid of tiles in level-0 pixels
class TileGrid {
 public:
  /// @brief Create a grid
  /// @param dimensions Level-0 slide dimensions
  /// @param patch_size Nominal tile size
  /// @param stride Distance between consecutive origins
  /// @param edge_policy Treatment of tiles crossing the slide boundary
  /// @param min_edge_fraction Minimum kept edge tile size as a fraction of
  ///        the patch size, per axis (kDrop only)
  /// @return Grid, or InvalidArgument for zero sizes or a fraction outside
  ///         (0, 1]
  static absl::StatusOr<TileGrid> Create(const ImageDimensions& dimensions,
                                         const ImageDimensions& patch_size,
                                         const ImageDimensions& stride,
                                         EdgePolicy edge_policy = EdgePolicy::kClip,
                                         double min_edge_fraction = 0.5);

  /// @brief Iterator computing tiles from their index
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Tile;
    using difference_type = std::ptrdiff_t;
    using pointer = const Tile*;
    using reference = Tile;

    Iterator() : grid_(nullptr), index_(0) {}

    Tile operator*() const { return grid_->At(index_); }

    Iterator& operator++() {
      ++index_;
      return *this;
    }

    Iterator operator++(int) {
      Iterator previous = *this;
      ++index_;
      return previous;
    }

    bool operator==(const Iterator& other) const {
      return grid_ == other.grid_ && index_ == other.index_;
    }

   private:
    friend class TileGrid;

    Iterator(const TileGrid* grid, size_t index)
        : grid_(grid), index_(index) {}

    const TileGrid* grid_;
    size_t index_;
  };

  [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }

  [[nodiscard]] Iterator end() const { return Iterator(this, Size()); }

  /// @brief Number of tiles
  [[nodiscard]] size_t Size() const {
    return static_cast<size_t>(columns_) * rows_;
  }

  [[nodiscard]] bool Empty() const { return Size() == 0; }

  /// @brief Tile at @p index (row-major); index must be below Size()
  [[nodiscard]] Tile At(size_t index) const;

  [[nodiscard]] uint32_t GetColumns() const { return columns_; }

  [[nodiscard]] uint32_t GetRows() const { return rows_; }

  [[nodiscard]] const ImageDimensions& GetDimensions() const {
    return dimensions_;
  }

  [[nodiscard]] const ImageDimensions& GetPatchSize() const {
    return patch_size_;
  }

  [[nodiscard]] const ImageDimensions& GetStride() const { return stride_; }

  [[nodiscard]] EdgePolicy GetEdgePolicy() const { return edge_policy_; }

 private:
  TileGrid(const ImageDimensions& dimensions, const ImageDimensions& patch_size,
           const ImageDimensions& stride, EdgePolicy edge_policy,
           uint32_t columns, uint32_t rows);

  ImageDimensions dimensions_;
  ImageDimensions patch_size_;
  ImageDimensions stride_;
  EdgePolicy edge_policy_;
  uint32_t columns_;
  uint32_t rows_;
};

}  // namespace slidepatch::tiling

#endif  // SLIDEPATCH_INCLUDE_SLIDEPATCH_TILING_TILE_GRID_H_
