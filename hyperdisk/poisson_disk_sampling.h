// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "hyperdisk/combination.h"
#include "hyperdisk/distance.h"
#include "hyperdisk/grid.h"
#include "hyperdisk/rand.h"
#include "hyperdisk/vec_traits.h"

namespace hyperdisk {
namespace internal {

// Largest valid absolute radius. A disk with this radius centered in a
// corner of the unit square reaches the opposite corner.
template <typename FloatT>
auto MaxRadius() noexcept -> FloatT {
  return std::sqrt(FloatT{2}) / FloatT{2};
}

// Returns null if the radius is valid for the dimension, otherwise a
// description of the problem.
template <typename FloatT, std::size_t N>
auto RadiusError(const FloatT radius) noexcept -> const char* {
  static_assert(std::is_floating_point<FloatT>::value,
                "FloatT must be floating point");

  if (!(radius > FloatT{0} && radius <= MaxRadius<FloatT>())) {
    return "radius must be in (0, sqrt(2)/2]";
  }

  const auto side = GetSide<FloatT, N>(GetCellSize<FloatT, N>(radius));
  if (side == kSideOverflow) {
    return "radius too small for dimension";
  }
  if (side < 1) {
    return "radius too large for dimension";
  }

  // Cells store sample indices as 32-bit integers.
  constexpr auto kMaxCells =
      static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());
  auto cell_count = std::size_t{1};
  for (std::size_t i = 0; i < N; ++i) {
    if (cell_count > kMaxCells / static_cast<std::size_t>(side)) {
      return "radius too small for dimension";
    }
    cell_count *= static_cast<std::size_t>(side);
  }
  return nullptr;
}

template <typename FloatT, std::size_t N>
void ThrowIfInvalidRadius(const FloatT radius) {
  const auto* const error = RadiusError<FloatT, N>(radius);
  if (error != nullptr) {
    throw std::invalid_argument(error);
  }
}

// Refinement stops at the precision bound of the floating point type, since
// finer cells can no longer be told apart. It is lowered if needed so that
// cell indices at the finest level fit in IndexValueType.
template <typename FloatT>
auto MaxLevel(const IndexValueType side) noexcept -> std::uint32_t {
  auto bits = std::uint32_t{0};
  for (auto s = side; s > 0; s >>= 1) {
    ++bits;
  }
  const auto index_bound =
      static_cast<std::uint32_t>(std::numeric_limits<IndexValueType>::digits) -
      1 - bits;
  const auto precision_bound =
      static_cast<std::uint32_t>(std::numeric_limits<FloatT>::digits);
  return precision_bound < index_bound ? precision_bound : index_bound;
}

}  // namespace internal

// Position of an accepted sample and the radius of the disk around it.
template <typename VecT, typename VecTraitsT = VecTraits<VecT>>
class Sample {
 public:
  using ValueType = typename VecTraitsT::ValueType;

  Sample(const VecT& position, const ValueType radius)
      : position_(position), radius_(radius) {}

  auto position() const noexcept -> const VecT& {  // NOLINT
    return position_;
  }

  auto radius() const noexcept -> ValueType { return radius_; }  // NOLINT

 private:
  VecT position_;
  ValueType radius_;
};

struct GenerationStats {
  // Number of refinement levels visited.
  std::uint32_t level_count;

  // Number of samples added by the run, not counting pre-existing samples.
  std::size_t sample_count;

  // True if refinement was stopped by the precision bound rather than by
  // running out of candidate cells.
  bool precision_limited;
};

// Generates Poisson-disk distributions in the unit hypercube [0, 1)^N with
// O(n log n) time and space complexity relative to the number of samples
// generated.
//
// Based on Gamito, Manuel N., and Steve C. Maddock. "Accurate
// multidimensional Poisson-disk sampling." ACM Transactions on Graphics
// (TOG) 29.1 (2009): 8.
//
// Each top-level grid cell can hold at most one sample. Candidate cells
// are refined level by level: at each level a fraction of the candidates
// are tried with a random dart, and the remaining candidates are split
// into 2^N children, discarding children that are already covered by the
// exclusion zone of an existing sample.
template <typename VecT, typename VecTraitsT = VecTraits<VecT>,
          typename RandT = HashRandom>
class PoissonGenerator {
 public:
  using ValueType = typename VecTraitsT::ValueType;
  using SampleType = Sample<VecT, VecTraitsT>;

  static constexpr auto kDims = VecTraitsT::kSize;

  // Fraction of the current candidate cells that get a dart per level.
  static constexpr double kThrowFraction = 0.3;

  static_assert(std::is_floating_point<ValueType>::value,
                "ValueType must be floating point");
  static_assert(kDims >= 1, "dimensions must be >= 1");

  // Throws std::invalid_argument if the radius is invalid, see
  // internal::RadiusError.
  PoissonGenerator(RandT rand, const ValueType radius, const bool periodic)
      : rand_(std::move(rand)), radius_(radius), periodic_(periodic) {
    internal::ThrowIfInvalidRadius<ValueType, kDims>(radius_);
  }

  auto radius() const noexcept -> ValueType { return radius_; }  // NOLINT

  auto periodic() const noexcept -> bool { return periodic_; }  // NOLINT

  auto rand() noexcept -> RandT& { return rand_; }  // NOLINT

  // Throws std::invalid_argument if the radius is invalid, in which case the
  // current radius is kept.
  void SetRadius(const ValueType radius) {
    internal::ThrowIfInvalidRadius<ValueType, kDims>(radius);
    radius_ = radius;
  }

  // Appends new samples to the given vector.
  //
  // Samples already in the vector are treated as fixed: no new sample is
  // placed closer than twice the radius to any of them. The result is a
  // Poisson-disk distribution if the given samples already were one, and a
  // maximal one if they also share the radius of this generator.
  //
  // Assumes that samples is non-null.
  auto Generate(std::vector<SampleType>* const samples) -> GenerationStats {
    auto grid = GridType(radius_, periodic_);
    auto positions = std::vector<VecT>{};
    auto outside = std::vector<VecT>{};
    LoadExisting(*samples, &grid, &positions, &outside);
    const auto first_new = positions.size();

    // All top-level cells are candidates to begin with.
    auto indices = std::vector<IndexType>{};
    indices.reserve(grid.cells().size());
    for (std::size_t k = 0; k < grid.cells().size(); ++k) {
      auto index = IndexType{};
      if (internal::Decode(k, grid.side(), &index)) {
        indices.push_back(index);
      }
    }

    GenerationStats stats = {};
    const auto max_level = internal::MaxLevel<ValueType>(grid.side());
    auto level = std::uint32_t{0};
    while (!indices.empty() && level < max_level) {
      ++stats.level_count;
      if (ThrowSamples(&grid, &positions, outside, &indices, level)) {
        Subdivide(grid, positions, outside, &indices, level);
        ++level;
      }
    }
    stats.precision_limited = !indices.empty();

    // Cells holding an index below first_new contain pre-existing samples.
    for (const auto cell : grid.cells()) {
      if (cell != GridType::kEmptyCell &&
          static_cast<std::size_t>(cell) >= first_new) {
        samples->emplace_back(positions[static_cast<std::size_t>(cell)],
                              radius_);
        ++stats.sample_count;
      }
    }
    return stats;
  }

 private:
  using GridType = internal::Grid<ValueType, kDims>;
  using IndexType = typename GridType::IndexType;

  RandT rand_;
  ValueType radius_;
  bool periodic_;

  // Stores pre-existing samples in the grid. Samples whose top-level cell is
  // outside the grid, or already taken, are kept in a separate list. In
  // periodic mode positions are first wrapped into the unit domain.
  void LoadExisting(const std::vector<SampleType>& samples,
                    GridType* const grid, std::vector<VecT>* const positions,
                    std::vector<VecT>* const outside) const {
    for (const auto& sample : samples) {
      auto wrapped = sample.position();
      if (periodic_) {
        for (std::size_t i = 0; i < kDims; ++i) {
          const auto xi = VecTraitsT::Get(wrapped, i);
          VecTraitsT::Set(&wrapped, i, xi - std::floor(xi));
        }
      }
      internal::StoreSample<VecTraitsT>(wrapped, grid, positions, outside);
    }
  }

  // Returns a uniformly distributed position inside the cell at the given
  // refinement level. The position is kept inside [0, 1)^N.
  auto RandomPositionInCell(const GridType& grid, const IndexType& index,
                            const std::uint32_t level) -> VecT {
    const auto spacing = grid.Spacing(level);
    const auto upper = std::nextafter(ValueType{1}, ValueType{0});
    VecT p = {};
    for (std::size_t i = 0; i < kDims; ++i) {
      auto xi = static_cast<ValueType>(index[i]) * spacing +
                rand_.template NextUnit<ValueType>() * spacing;
      if (xi >= ValueType{1}) {
        xi = periodic_ ? xi - ValueType{1} : upper;
      }
      VecTraitsT::Set(&p, i, xi);
    }
    return p;
  }

  // Throws darts into randomly chosen candidate cells. Candidates whose
  // top-level cell already holds a sample are removed, as are candidates
  // where a dart was accepted.
  //
  // Returns false if the candidates ran out.
  auto ThrowSamples(GridType* const grid, std::vector<VecT>* const positions,
                    const std::vector<VecT>& outside,
                    std::vector<IndexType>* const indices,
                    const std::uint32_t level) -> bool {
    const auto throws = static_cast<std::size_t>(
        std::ceil(kThrowFraction * static_cast<double>(indices->size())));
    for (std::size_t n = 0; n < throws; ++n) {
      const auto k = rand_.NextIndex(indices->size());
      const auto cur = (*indices)[k];
      auto* const cell = grid->FindCell(internal::GetParent(cur, level));
      if (cell == nullptr || *cell != GridType::kEmptyCell) {
        // Nothing more can be placed in this cell.
        internal::EraseUnordered(indices, k);
      } else {
        const auto p = RandomPositionInCell(*grid, cur, level);
        if (!internal::IsDiskFree<VecTraitsT>(*grid, *positions, outside, cur,
                                              level, p)) {
          // Keep the candidate, it may be tried again.
          continue;
        }
        *cell = static_cast<typename GridType::CellType>(positions->size());
        positions->push_back(p);
        internal::EraseUnordered(indices, k);
      }
      if (indices->empty()) {
        return false;
      }
    }
    return true;
  }

  // Replaces each candidate with its 2^N children at the next level, except
  // those children that are covered by an existing sample.
  void Subdivide(const GridType& grid, const std::vector<VecT>& positions,
                 const std::vector<VecT>& outside,
                 std::vector<IndexType>* const indices,
                 const std::uint32_t level) const {
    const auto children =
        internal::EachCombination<kDims>(
            std::array<internal::IndexValueType, 2>{{0, 1}});
    internal::FlatMapUnordered(
        indices, [&](IndexType&& cur, std::vector<IndexType>* const out) {
          for (const auto& t : children) {
            IndexType child = {};
            for (std::size_t i = 0; i < kDims; ++i) {
              child[i] = 2 * cur[i] + t[i];
            }
            if (!internal::IsCovered<VecTraitsT>(grid, positions, outside,
                                                 child, level + 1)) {
              out->push_back(child);
            }
          }
        });
  }
};

template <typename VecT, typename VecTraitsT, typename RandT>
constexpr double PoissonGenerator<VecT, VecTraitsT, RandT>::kThrowFraction;

// Builder for generators. The domain is the unit hypercube, which is
// toroidal (opposite sides identified) if Periodic() is called.
template <typename RandT = HashRandom>
class PoissonDisk {
 public:
  explicit PoissonDisk(RandT rand) : rand_(std::move(rand)) {}

  auto Periodic() noexcept -> PoissonDisk& {
    periodic_ = true;
    return *this;
  }

  // Radius should be in (0, sqrt(2)/2]. Throws std::invalid_argument
  // otherwise.
  template <typename VecT, typename VecTraitsT = VecTraits<VecT>>
  auto BuildRadius(const typename VecTraitsT::ValueType radius) const
      -> PoissonGenerator<VecT, VecTraitsT, RandT> {
    return PoissonGenerator<VecT, VecTraitsT, RandT>(rand_, radius, periodic_);
  }

  // Relative radius should be in (0, 1] and is scaled to an absolute radius
  // in (0, sqrt(2)/2]. Throws std::invalid_argument otherwise.
  template <typename VecT, typename VecTraitsT = VecTraits<VecT>>
  auto BuildRelativeRadius(
      const typename VecTraitsT::ValueType relative_radius) const
      -> PoissonGenerator<VecT, VecTraitsT, RandT> {
    using ValueType = typename VecTraitsT::ValueType;
    if (!(relative_radius > ValueType{0} && relative_radius <= ValueType{1})) {
      throw std::invalid_argument("relative radius must be in (0, 1]");
    }
    return BuildRadius<VecT, VecTraitsT>(
        relative_radius * internal::MaxRadius<ValueType>());
  }

 private:
  RandT rand_;
  bool periodic_ = false;
};

// Named constructor to help with type deduction.
template <typename RandT>
auto MakePoissonDisk(RandT rand) -> PoissonDisk<RandT> {
  return PoissonDisk<RandT>(std::move(rand));
}

// Returns a list of samples with the guarantees:
// - No two samples are closer to each other than twice the radius (in
//   periodic mode, measured across the identified sides).
// - No sample is outside the region [0, 1)^N.
//
// The algorithm fills the region until no more samples can be added
// without violating the above requirements.
//
// If the arguments are invalid an empty vector is returned.
// The arguments are invalid if:
// - Radius is not in (0, sqrt(2)/2], or
// - Radius is too large or too small for the dimension N.
template <typename FloatT, std::size_t N, typename VecT = std::array<FloatT, N>,
          typename VecTraitsT = VecTraits<VecT>>
auto PoissonDiskSampling(const FloatT radius, const bool periodic = false,
                         const std::uint32_t seed = 0) noexcept
    -> std::vector<VecT> {
  static_assert(VecTraitsT::kSize == N, "dimensionality mismatch");
  using ValueType = typename VecTraitsT::ValueType;

  // Validate input.
  if (internal::RadiusError<ValueType, N>(static_cast<ValueType>(radius)) !=
      nullptr) {
    // Returning an empty list of samples indicates an error,
    // since for any valid input there is always at least one sample.
    return std::vector<VecT>{};
  }

  auto generator = PoissonGenerator<VecT, VecTraitsT, HashRandom>(
      HashRandom(seed), static_cast<ValueType>(radius), periodic);
  auto samples = std::vector<Sample<VecT, VecTraitsT>>{};
  generator.Generate(&samples);

  auto positions = std::vector<VecT>{};
  positions.reserve(samples.size());
  for (const auto& sample : samples) {
    positions.push_back(sample.position());
  }
  return positions;
}

}  // namespace hyperdisk
