// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "hyperdisk/combination.h"
#include "hyperdisk/grid.h"
#include "hyperdisk/vec_traits.h"

namespace hyperdisk {
namespace internal {

// Translations of the unit domain to all neighboring tiles (and itself).
template <std::size_t N>
auto PeriodicImages() noexcept -> CombinationRange<IndexValueType, N, 3> {
  return EachCombination<N>(SymmetricChoices<IndexValueType, 1>());
}

// Returns v + t, where t is an integer translation.
template <typename VecTraitsT, typename VecT, std::size_t N>
auto Translated(const VecT& v, const IndexType<N>& t) noexcept -> VecT {
  using ValueType = typename VecTraitsT::ValueType;
  static_assert(VecTraitsT::kSize == N, "dimensionality mismatch");

  VecT r = v;
  for (std::size_t i = 0; i < N; ++i) {
    VecTraitsT::Set(&r, i, VecTraitsT::Get(v, i) + static_cast<ValueType>(t[i]));
  }
  return r;
}

// Returns the squared distance between the vectors u and v.
template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto SquaredDistance(const VecT& u, const VecT& v) noexcept
    -> typename VecTraitsT::ValueType {
  static_assert(VecTraitsT::kSize >= 1, "dimensions must be >= 1");

  auto d = squared(VecTraitsT::Get(u, 0) - VecTraitsT::Get(v, 0));
  for (std::size_t i = 1; i < VecTraitsT::kSize; ++i) {
    d += squared(VecTraitsT::Get(u, i) - VecTraitsT::Get(v, i));
  }
  return d;
}

// Returns the squared distance between the vectors u and v. In periodic
// mode the domain is the unit hypercube with opposite sides identified, and
// the distance is the minimum over the 3^N translations of the difference.
template <typename VecTraitsT, typename VecT>
auto SquaredDistance(const VecT& u, const VecT& v, const bool periodic) noexcept
    -> typename VecTraitsT::ValueType {
  constexpr auto kDims = VecTraitsT::kSize;
  const auto diff = Subtract<VecTraitsT>(v, u);
  if (!periodic) {
    return SquaredMagnitude<VecTraitsT>(diff);
  }

  auto d = std::numeric_limits<typename VecTraitsT::ValueType>::max();
  for (const auto& t : PeriodicImages<kDims>()) {
    const auto m =
        SquaredMagnitude<VecTraitsT>(Translated<VecTraitsT>(diff, t));
    if (m < d) {
      d = m;
    }
  }
  return d;
}

// Returns the position of the minimum corner of the cell at the given
// refinement level.
template <typename VecTraitsT, typename VecT, typename FloatT, std::size_t N>
auto CellOrigin(const Grid<FloatT, N>& grid, const IndexType<N>& index,
                const std::uint32_t level) noexcept -> VecT {
  using ValueType = typename VecTraitsT::ValueType;

  const auto spacing = grid.Spacing(level);
  VecT p = {};
  for (std::size_t i = 0; i < N; ++i) {
    VecTraitsT::Set(
        &p, i, static_cast<ValueType>(static_cast<FloatT>(index[i]) * spacing));
  }
  return p;
}

// Returns the periodic image of v (translated by whole periods along each
// axis) that is nearest to target along every axis.
template <typename VecTraitsT, typename VecT>
auto NearestImage(const VecT& v, const VecT& target) noexcept -> VecT {
  VecT r = v;
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    const auto vi = VecTraitsT::Get(v, i);
    VecTraitsT::Set(&r, i, vi - std::round(vi - VecTraitsT::Get(target, i)));
  }
  return r;
}

// Returns true if every point inside the cell (at the given refinement
// level) is closer than the exclusion distance to the sample, i.e. no new
// sample can ever be placed inside the cell.
//
// A cell is a box and the exclusion zone is a ball, both convex, so it is
// enough to test the 2^N corners. In periodic mode the corners are tested
// against the image of the sample nearest to the cell center. The farthest
// corner distance is a sum of independent per-axis terms, each smallest for
// the nearest image, so no other image can cover the cell.
template <typename VecTraitsT, typename VecT, typename FloatT, std::size_t N>
auto IsCellCovered(const VecT& sample, const IndexType<N>& index,
                   const Grid<FloatT, N>& grid,
                   const std::uint32_t level) noexcept -> bool {
  using ValueType = typename VecTraitsT::ValueType;
  static_assert(VecTraitsT::kSize == N, "dimensionality mismatch");

  const auto r_squared = squared(FloatT{2} * grid.sample_radius());
  auto center = sample;
  if (grid.periodic()) {
    const auto half = static_cast<ValueType>(grid.Spacing(level) / 2);
    auto mid = CellOrigin<VecTraitsT, VecT>(grid, index, level);
    for (std::size_t i = 0; i < N; ++i) {
      VecTraitsT::Set(&mid, i, VecTraitsT::Get(mid, i) + half);
    }
    center = NearestImage<VecTraitsT>(sample, mid);
  }

  const auto corners =
      EachCombination<N>(std::array<IndexValueType, 2>{{0, 1}});
  for (const auto& t : corners) {
    const auto corner =
        CellOrigin<VecTraitsT, VecT>(grid, AddIndex(index, t), level);
    const auto d =
        static_cast<FloatT>(SquaredDistance<VecTraitsT>(corner, center));
    if (!(d < r_squared)) {
      return false;
    }
  }
  return true;
}

// Calls func for each sample stored in the neighborhood of the top-level
// parent of the cell, stopping early (and returning false) as soon as func
// returns false.
template <typename VecT, typename FloatT, std::size_t N, typename FuncT>
auto AllNeighborSamples(const Grid<FloatT, N>& grid,
                        const std::vector<VecT>& samples,
                        const IndexType<N>& index, const std::uint32_t level,
                        FuncT&& func) -> bool {
  const auto parent = GetParent(index, level);
  // NOTE: Also checks the outermost corner cells of the neighborhood even
  //       though they are never close enough. Skipping them would save
  //       only a small fraction of the lookups.
  for (const auto& offset : Grid<FloatT, N>::Neighborhood()) {
    const auto* const cell = grid.FindCell(AddIndex(parent, offset));
    if (cell != nullptr && *cell >= 0) {
      if (!func(samples[static_cast<std::size_t>(*cell)])) {
        return false;
      }
    }
  }
  return true;
}

// Returns true if the candidate position is at least the exclusion
// distance (twice the radius) away from all existing samples. Samples that
// could not be stored in the grid (outside) are checked exhaustively.
template <typename VecTraitsT, typename VecT, typename FloatT, std::size_t N>
auto IsDiskFree(const Grid<FloatT, N>& grid, const std::vector<VecT>& samples,
                const std::vector<VecT>& outside, const IndexType<N>& index,
                const std::uint32_t level, const VecT& candidate) noexcept
    -> bool {
  const auto r_squared = squared(FloatT{2} * grid.sample_radius());
  const auto periodic = grid.periodic();
  const auto far_enough = [&](const VecT& s) {
    return !(static_cast<FloatT>(SquaredDistance<VecTraitsT>(
                 s, candidate, periodic)) < r_squared);
  };

  if (!AllNeighborSamples(grid, samples, index, level, far_enough)) {
    return false;
  }
  for (const auto& s : outside) {
    if (!far_enough(s)) {
      return false;
    }
  }
  return true;
}

// Returns true if the cell (at the given refinement level) is covered by
// the exclusion zone of any existing sample.
template <typename VecTraitsT, typename VecT, typename FloatT, std::size_t N>
auto IsCovered(const Grid<FloatT, N>& grid, const std::vector<VecT>& samples,
               const std::vector<VecT>& outside, const IndexType<N>& index,
               const std::uint32_t level) noexcept -> bool {
  const auto not_covering = [&](const VecT& s) {
    return !IsCellCovered<VecTraitsT>(s, index, grid, level);
  };

  if (!AllNeighborSamples(grid, samples, index, level, not_covering)) {
    return true;
  }
  for (const auto& s : outside) {
    if (!not_covering(s)) {
      return true;
    }
  }
  return false;
}

}  // namespace internal
}  // namespace hyperdisk
