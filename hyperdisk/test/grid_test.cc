// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#include "hyperdisk/grid.h"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

#include "catch2/catch.hpp"

namespace hyperdisk {
namespace {

using Index2 = internal::IndexType<2>;
using Index3 = internal::IndexType<3>;

TEST_CASE("Encode/Decode", "[grid]") {
  SECTION("Round trip") {
    constexpr auto kSide = internal::IndexValueType{15};
    for (const auto& index : {Index2{{10, 7}}, Index2{{14, 14}},
                              Index2{{0, 0}}, Index2{{3, 0}}}) {
      auto k = std::size_t{0};
      REQUIRE(internal::Encode(index, kSide, false, &k));
      auto decoded = Index2{};
      REQUIRE(internal::Decode(k, kSide, &decoded));
      REQUIRE(decoded == index);
    }
  }

  SECTION("First axis varies fastest") {
    auto k = std::size_t{0};
    REQUIRE(internal::Encode(Index2{{10, 7}}, 15, false, &k));
    REQUIRE(k == 10U + 7U * 15U);
    REQUIRE(internal::Encode(Index3{{1, 2, 3}}, 4, false, &k));
    REQUIRE(k == 1U + 2U * 4U + 3U * 16U);
  }

  SECTION("Outside rejected") {
    auto k = std::size_t{0};
    REQUIRE_FALSE(internal::Encode(Index2{{9, 7}}, 9, false, &k));
    REQUIRE_FALSE(internal::Encode(Index2{{7, 9}}, 9, false, &k));
    REQUIRE_FALSE(internal::Encode(Index2{{-1, 0}}, 9, false, &k));
  }

  SECTION("Periodic wraps") {
    auto k = std::size_t{0};
    REQUIRE(internal::Encode(Index2{{9, 7}}, 9, true, &k));
    REQUIRE(k == 0U + 7U * 9U);
    REQUIRE(internal::Encode(Index2{{-1, -10}}, 9, true, &k));
    REQUIRE(k == 8U + 8U * 9U);
  }

  SECTION("Decode out of range") {
    auto index = Index2{};
    REQUIRE_FALSE(internal::Decode(100, 10, &index));
    REQUIRE(internal::Decode(99, 10, &index));
    REQUIRE(index == Index2{{9, 9}});
  }
}

TEST_CASE("GetParent", "[grid]") {
  SECTION("Finer cells map to their top-level cell") {
    REQUIRE(internal::GetParent(Index2{{1 * 16 + 0, 2 * 16 + 15}}, 4) ==
            Index2{{1, 2}});
    REQUIRE(internal::GetParent(Index2{{5, 6}}, 0) == Index2{{5, 6}});
  }

  SECTION("Idempotent at level zero") {
    const auto parent = internal::GetParent(Index3{{37, 2, 99}}, 3);
    REQUIRE(internal::GetParent(parent, 0) == parent);
  }

  SECTION("Levels compose") {
    const auto index = Index3{{-37, 0, 1023}};
    const std::array<std::array<std::uint32_t, 2>, 3> levels = {
        {{{1, 2}}, {{3, 4}}, {{5, 0}}}};
    for (const auto& k : levels) {
      REQUIRE(internal::GetParent(internal::GetParent(index, k[0]), k[1]) ==
              internal::GetParent(index, k[0] + k[1]));
    }
    REQUIRE(internal::GetParent(index, 3) == Index3{{-5, 0, 127}});
    REQUIRE(internal::GetParent(index, 7) == Index3{{-1, 0, 7}});
  }

  SECTION("Negative indices round down") {
    REQUIRE(internal::GetParent(Index2{{-1, -17}}, 4) == Index2{{-1, -2}});
    REQUIRE(internal::FloorDivPow2(-2, 1) == -1);
    REQUIRE(internal::FloorDivPow2(-3, 1) == -2);
    REQUIRE(internal::FloorDivPow2(5, 1) == 2);
  }
}

TEST_CASE("Wrapped", "[grid]") {
  REQUIRE(internal::Wrapped(-1, 7) == 6);
  REQUIRE(internal::Wrapped(7, 7) == 0);
  REQUIRE(internal::Wrapped(-15, 7) == 6);
  REQUIRE(internal::Wrapped(3, 7) == 3);
}

TEST_CASE("Ring", "[grid]") {
  REQUIRE(internal::CeilSqrt(1) == 1U);
  REQUIRE(internal::CeilSqrt(2) == 2U);
  REQUIRE(internal::CeilSqrt(4) == 2U);
  REQUIRE(internal::CeilSqrt(5) == 3U);
  REQUIRE(internal::CeilSqrt(9) == 3U);

  static_assert(internal::Ring<1>::kHalfWidth == 1U, "");
  static_assert(internal::Ring<2>::kHalfWidth == 2U, "");
  static_assert(internal::Ring<3>::kHalfWidth == 2U, "");
  static_assert(internal::Ring<4>::kHalfWidth == 2U, "");
  static_assert(internal::Ring<5>::kHalfWidth == 3U, "");

  REQUIRE(internal::Grid<double, 2>::Neighborhood().size() == 25U);
  REQUIRE(internal::Grid<double, 3>::Neighborhood().size() == 125U);
}

TEST_CASE("GetSide", "[grid]") {
  REQUIRE(internal::GetSide<double, 2>(0.25) == 4);
  REQUIRE(internal::GetSide<double, 2>(1.0 / 3.0) == 3);
  REQUIRE(internal::GetSide<float, 2>(0.3F) == 3);
  REQUIRE(internal::GetSide<double, 1>(1.5) == 0);
  REQUIRE(internal::GetSide<double, 1>(0.001) == 1000);

  // More cells per axis than a 32-bit slot can address.
  REQUIRE(internal::GetSide<double, 1>(2e-10) == internal::kSideOverflow);
  REQUIRE(internal::GetSide<float, 1>(1e-12F) == internal::kSideOverflow);
}

TEST_CASE("Grid", "[grid]") {
  auto grid = internal::Grid<double, 2>(0.1, false);

  SECTION("Geometry") {
    REQUIRE(grid.cell_size() == Approx(0.2 / std::sqrt(2.0)));
    REQUIRE(grid.side() == 7);
    REQUIRE(grid.cells().size() == 49U);
    for (const auto cell : grid.cells()) {
      REQUIRE(cell == internal::Grid<double, 2>::kEmptyCell);
    }
    REQUIRE(grid.Spacing(0) == grid.cell_size());
    REQUIRE(grid.Spacing(2) == Approx(grid.cell_size() / 4));
  }

  SECTION("IndexFromPosition") {
    using VecType = std::array<double, 2>;
    REQUIRE(grid.IndexFromPosition<VecTraits<VecType>>(
                VecType{{0.5, 0.05}}) == Index2{{3, 0}});
    REQUIRE(grid.IndexFromPosition<VecTraits<VecType>>(
                VecType{{-0.01, 0.99}}) == Index2{{-1, 7}});
  }

  SECTION("FindCell") {
    REQUIRE(grid.FindCell(Index2{{-1, 0}}) == nullptr);
    REQUIRE(grid.FindCell(Index2{{0, 7}}) == nullptr);

    auto* const cell = grid.FindCell(Index2{{6, 6}});
    REQUIRE(cell != nullptr);
    *cell = 3;
    REQUIRE(grid.cells().back() == 3);
  }

  SECTION("FindCell periodic") {
    const auto periodic_grid = internal::Grid<double, 2>(0.1, true);
    const auto* const a = periodic_grid.FindCell(Index2{{-1, 0}});
    const auto* const b = periodic_grid.FindCell(Index2{{6, 7}});
    REQUIRE(a != nullptr);
    REQUIRE(a == periodic_grid.FindCell(Index2{{6, 0}}));
    REQUIRE(b == periodic_grid.FindCell(Index2{{6, 0}}));
  }
}

TEST_CASE("StoreSample", "[grid]") {
  using VecType = std::array<double, 2>;
  using VecTraitsType = VecTraits<VecType>;

  auto positions = std::vector<VecType>{};
  auto outside = std::vector<VecType>{};

  SECTION("Periodic") {
    auto grid = internal::Grid<double, 2>(0.1, true);
    REQUIRE(grid.side() * grid.cell_size() < 0.99);

    // Past the last top-level cell, not wrapped onto the first one.
    internal::StoreSample<VecTraitsType>(VecType{{0.995, 0.3}}, &grid,
                                         &positions, &outside);
    REQUIRE(positions.empty());
    REQUIRE(outside.size() == 1U);
    for (const auto cell : grid.cells()) {
      REQUIRE(cell == internal::Grid<double, 2>::kEmptyCell);
    }

    internal::StoreSample<VecTraitsType>(VecType{{0.05, 0.35}}, &grid,
                                         &positions, &outside);
    REQUIRE(positions.size() == 1U);
    REQUIRE(*grid.FindCell(Index2{{0, 2}}) == 0);

    // Same top-level cell.
    internal::StoreSample<VecTraitsType>(VecType{{0.06, 0.36}}, &grid,
                                         &positions, &outside);
    REQUIRE(positions.size() == 1U);
    REQUIRE(outside.size() == 2U);
  }

  SECTION("Open") {
    auto grid = internal::Grid<double, 2>(0.1, false);
    internal::StoreSample<VecTraitsType>(VecType{{-0.01, 0.5}}, &grid,
                                         &positions, &outside);
    internal::StoreSample<VecTraitsType>(VecType{{0.5, 0.995}}, &grid,
                                         &positions, &outside);
    REQUIRE(positions.empty());
    REQUIRE(outside.size() == 2U);

    internal::StoreSample<VecTraitsType>(VecType{{0.5, 0.5}}, &grid,
                                         &positions, &outside);
    REQUIRE(positions.size() == 1U);
    REQUIRE(*grid.FindCell(Index2{{3, 3}}) == 0);
  }
}

}  // namespace
}  // namespace hyperdisk
