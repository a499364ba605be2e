// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <vector>

#include "hyperdisk/combination.h"
#include "hyperdisk/vec_traits.h"

namespace hyperdisk {
namespace internal {

using IndexValueType = std::int64_t;

template <std::size_t N>
using IndexType = std::array<IndexValueType, N>;

// Returns the smallest k such that k * k >= n.
constexpr auto CeilSqrt(const std::size_t n, const std::size_t k = 0) noexcept
    -> std::size_t {
  return k * k >= n ? k : CeilSqrt(n, k + 1);
}

// Number of cells on each side of a cell that may hold a sample closer than
// the exclusion distance (twice the radius). The cell width is
// 2 * radius / sqrt(N), so ceil(sqrt(N)) cells span the exclusion distance.
// This is 2 for N in [2, 4].
template <std::size_t N>
struct Ring {
  static constexpr std::size_t kHalfWidth = CeilSqrt(N);
};

template <std::size_t N>
constexpr std::size_t Ring<N>::kHalfWidth;

// Floor division by 2^level, also for negative values.
// Assumes level < 63.
HYPERDISK_CONSTEXPR14 auto FloorDivPow2(const IndexValueType x,
                                        const std::uint32_t level) noexcept
    -> IndexValueType {
  const auto d = IndexValueType{1} << level;
  const auto q = x / d;
  return (x % d != 0 && x < 0) ? q - 1 : q;
}

// Returns true if i is in [0, side).
HYPERDISK_CONSTEXPR14 auto InsideSide(const IndexValueType i,
                                      const IndexValueType side) noexcept
    -> bool {
  return i >= 0 && i < side;
}

// True modulo, the result is in [0, side) also for negative i.
// Assumes side > 0.
HYPERDISK_CONSTEXPR14 auto Wrapped(const IndexValueType i,
                                   const IndexValueType side) noexcept
    -> IndexValueType {
  const auto r = i % side;
  return r < 0 ? r + side : r;
}

// Computes a linear index into an N-dimensional array with side cells along
// each axis. The first axis varies fastest.
//
// In periodic mode coordinates are wrapped into [0, side). Otherwise false
// is returned if any coordinate is outside [0, side), which is not an
// error but a signal that there is no cell there.
//
// Assumes side > 0 and that linear_index is non-null.
template <std::size_t N>
HYPERDISK_CONSTEXPR14 auto Encode(const IndexType<N>& index,
                                  const IndexValueType side,
                                  const bool periodic,
                                  std::size_t* const linear_index) noexcept
    -> bool {
  auto k = std::size_t{0};
  auto d = std::size_t{1};
  for (std::size_t i = 0; i < N; ++i) {
    auto xi = index[i];
    if (periodic) {
      xi = Wrapped(xi, side);
    } else if (!InsideSide(xi, side)) {
      return false;
    }
    // Note: Not checking for "overflow".
    k += static_cast<std::size_t>(xi) * d;
    d *= static_cast<std::size_t>(side);
  }
  *linear_index = k;
  return true;
}

// Inverse of Encode (for coordinates inside the grid). Returns false if
// linear_index is not less than side^N.
//
// Assumes side > 0 and that index is non-null.
template <std::size_t N>
HYPERDISK_CONSTEXPR14 auto Decode(const std::size_t linear_index,
                                  const IndexValueType side,
                                  IndexType<N>* const index) noexcept -> bool {
  const auto s = static_cast<std::size_t>(side);
  if (linear_index >= IntPow(s, N)) {
    return false;
  }
  auto rest = linear_index;
  for (std::size_t i = 0; i < N; ++i) {
    (*index)[i] = static_cast<IndexValueType>(rest % s);
    rest /= s;
  }
  return true;
}

// Maps a cell index at the given refinement level to the index of the
// top-level cell containing it. No range check is made, the parent of a
// cell outside the grid is simply the floor-divided index.
template <std::size_t N>
HYPERDISK_CONSTEXPR14 auto GetParent(const IndexType<N>& index,
                                     const std::uint32_t level) noexcept
    -> IndexType<N> {
  IndexType<N> parent = {};
  for (std::size_t i = 0; i < N; ++i) {
    parent[i] = FloorDivPow2(index[i], level);
  }
  return parent;
}

template <std::size_t N>
HYPERDISK_CONSTEXPR14 auto AddIndex(const IndexType<N>& a,
                                    const IndexType<N>& b) noexcept
    -> IndexType<N> {
  IndexType<N> r = {};
  for (std::size_t i = 0; i < N; ++i) {
    r[i] = a[i] + b[i];
  }
  return r;
}

// Returned by GetSide when more cells per axis would be needed than a
// 32-bit cell slot can address.
constexpr IndexValueType kSideOverflow = -1;

// Returns the number of top-level cells per axis for the given radius, zero
// if not even a single cell fits, or kSideOverflow if the cells are too
// small.
//
// A grid cell with side 2 * radius / sqrt(N) has a diagonal of 2 * radius,
// so each cell can contain at most one sample.
template <typename FloatT, std::size_t N>
auto GetSide(const FloatT cell_size) noexcept -> IndexValueType {
  // Tolerate rounding when 1 / cell_size is (mathematically) an integer.
  constexpr auto kTolerance = 8 * std::numeric_limits<FloatT>::epsilon();
  const auto inv = FloatT{1} / cell_size;
  const auto side = std::floor(inv * (FloatT{1} + kTolerance));
  if (!(side <= static_cast<FloatT>(
                    std::numeric_limits<std::int32_t>::max()))) {
    return kSideOverflow;
  }
  return static_cast<IndexValueType>(side);
}

template <typename FloatT, std::size_t N>
auto GetCellSize(const FloatT sample_radius) noexcept -> FloatT {
  return FloatT{2} * sample_radius / std::sqrt(static_cast<FloatT>(N));
}

template <typename FloatT, std::size_t N>
class Grid {
 public:
  using CellType = std::int32_t;
  using IndexType = internal::IndexType<N>;

  static constexpr auto kDims = N;
  static constexpr auto kEmptyCell = CellType{-1};

  static_assert(kDims >= 1, "grid dimensionality must be >= 1");
  static_assert(std::is_floating_point<FloatT>::value,
                "FloatT must be floating point");

  // Assumes the radius has been validated, i.e. that at least one cell fits
  // and that the total number of cells is reasonable.
  explicit Grid(const FloatT sample_radius, const bool periodic)
      : sample_radius_(sample_radius),
        cell_size_(GetCellSize<FloatT, N>(sample_radius_)),
        side_(GetSide<FloatT, N>(cell_size_)),
        periodic_(periodic),
        cells_(IntPow(static_cast<std::size_t>(side_), N),
               CellType{kEmptyCell}) {}

  auto sample_radius() const noexcept -> FloatT {  // NOLINT
    return sample_radius_;
  }

  // Width of a top-level cell.
  auto cell_size() const noexcept -> FloatT { return cell_size_; }  // NOLINT

  // Number of top-level cells per axis.
  auto side() const noexcept -> IndexValueType { return side_; }  // NOLINT

  auto periodic() const noexcept -> bool { return periodic_; }  // NOLINT

  auto cells() const noexcept -> const std::vector<CellType>& {  // NOLINT
    return cells_;
  }

  // Returns null if the index does not address a cell.
  auto FindCell(const IndexType& index) const noexcept -> const CellType* {
    auto k = std::size_t{0};
    return Encode(index, side_, periodic_, &k) ? &cells_[k] : nullptr;
  }

  // Returns null if the index does not address a cell.
  auto FindCell(const IndexType& index) noexcept -> CellType* {
    auto k = std::size_t{0};
    return Encode(index, side_, periodic_, &k) ? &cells_[k] : nullptr;
  }

  // Returns the top-level index of the cell containing the position. Note
  // that the returned index elements may be negative or outside the grid.
  template <typename VecTraitsT, typename VecT>
  // NOLINTNEXTLINE
  auto IndexFromPosition(const VecT& pos) const noexcept -> IndexType {
    static_assert(VecTraitsT::kSize == kDims, "dimensionality mismatch");

    IndexType index = {};
    for (std::size_t i = 0; i < kDims; ++i) {
      index[i] = static_cast<IndexValueType>(std::floor(
          static_cast<FloatT>(VecTraitsT::Get(pos, i)) / cell_size_));
    }
    return index;
  }

  // Width of a cell at the given refinement level.
  auto Spacing(const std::uint32_t level) const noexcept -> FloatT {
    return std::ldexp(cell_size_, -static_cast<int>(level));
  }

  // Offsets to all cells that may contain a sample within the exclusion
  // distance of any point inside a cell.
  static auto Neighborhood() noexcept
      -> CombinationRange<IndexValueType, N, 2 * Ring<N>::kHalfWidth + 1> {
    return EachCombination<N>(
        SymmetricChoices<IndexValueType, Ring<N>::kHalfWidth>());
  }

 private:
  FloatT sample_radius_;
  FloatT cell_size_;
  IndexValueType side_;
  bool periodic_;
  std::vector<CellType> cells_;
};

template <typename FloatT, std::size_t N>
constexpr std::size_t Grid<FloatT, N>::kDims;

template <typename FloatT, std::size_t N>
constexpr typename Grid<FloatT, N>::CellType Grid<FloatT, N>::kEmptyCell;

// Stores the position in its top-level cell. The position goes to the
// outside list instead if the cell is already taken, or if no top-level cell
// covers the position. A position in the band between the last cell and
// the domain boundary is never wrapped onto the first cell.
//
// Assumes that grid, positions and outside are non-null.
template <typename VecTraitsT, typename VecT, typename FloatT, std::size_t N>
void StoreSample(const VecT& position, Grid<FloatT, N>* const grid,
                 std::vector<VecT>* const positions,
                 std::vector<VecT>* const outside) {
  using GridType = Grid<FloatT, N>;

  const auto index = grid->template IndexFromPosition<VecTraitsT>(position);
  for (std::size_t i = 0; i < N; ++i) {
    if (!InsideSide(index[i], grid->side())) {
      outside->push_back(position);
      return;
    }
  }

  auto* const cell = grid->FindCell(index);
  if (cell != nullptr && *cell == GridType::kEmptyCell) {
    *cell = static_cast<typename GridType::CellType>(positions->size());
    positions->push_back(position);
  } else {
    outside->push_back(position);
  }
}

}  // namespace internal
}  // namespace hyperdisk
