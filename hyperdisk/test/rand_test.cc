// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#include "hyperdisk/rand.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>

#include "catch2/catch.hpp"

namespace hyperdisk {
namespace {

constexpr auto kDrawCount = std::size_t{10000};

template <typename RandT, typename FloatT>
auto AllUnitInRange(RandT* const rand) -> bool {
  for (std::size_t i = 0; i < kDrawCount; ++i) {
    const auto u = rand->template NextUnit<FloatT>();
    if (!(FloatT{0} <= u && u < FloatT{1})) {
      return false;
    }
  }
  return true;
}

template <typename RandT>
auto AllIndexInRange(RandT* const rand, const std::size_t size) -> bool {
  for (std::size_t i = 0; i < kDrawCount; ++i) {
    if (!(rand->NextIndex(size) < size)) {
      return false;
    }
  }
  return true;
}

TEST_CASE("UnitFromBits", "[rand]") {
  REQUIRE(internal::UnitFromBits<float>(0U) == 0.F);
  REQUIRE(internal::UnitFromBits<double>(0U) == 0.0);
  REQUIRE(internal::UnitFromBits<float>(0xFFFFFFFFU) < 1.F);
  REQUIRE(internal::UnitFromBits<double>(0xFFFFFFFFU) < 1.0);
  REQUIRE(internal::UnitFromBits<double>(0x80000000U) == 0.5);
}

TEST_CASE("HashRandom", "[rand]") {
  SECTION("Repeatable") {
    auto a = HashRandom(42);
    auto b = HashRandom(42);
    for (std::size_t i = 0; i < 100; ++i) {
      REQUIRE(a.Next() == b.Next());
    }
    REQUIRE(internal::Hash(42) == internal::Hash(42));
  }

  SECTION("Seed dependent") {
    auto a = HashRandom(1);
    auto b = HashRandom(2);
    auto equal_count = std::size_t{0};
    for (std::size_t i = 0; i < 100; ++i) {
      if (a.Next() == b.Next()) {
        ++equal_count;
      }
    }
    REQUIRE(equal_count < 100U);
  }

  SECTION("Seed advances") {
    auto rand = HashRandom(5);
    REQUIRE(rand.seed() == 5U);
    rand.Next();
    REQUIRE(rand.seed() == 6U);
  }

  SECTION("NextIndex") {
    auto rand = HashRandom();
    REQUIRE(AllIndexInRange(&rand, 1));
    REQUIRE(AllIndexInRange(&rand, 2));
    REQUIRE(AllIndexInRange(&rand, 7));
    REQUIRE(AllIndexInRange(&rand, 1000));

    // Every bucket is hit roughly equally often.
    auto counts = std::array<std::size_t, 4>{};
    for (std::size_t i = 0; i < 4000; ++i) {
      ++counts[rand.NextIndex(4)];
    }
    for (const auto c : counts) {
      REQUIRE(c > 800U);
      REQUIRE(c < 1200U);
    }
  }

  SECTION("NextUnit") {
    auto rand = HashRandom(7);
    REQUIRE(AllUnitInRange<HashRandom, float>(&rand));
    REQUIRE(AllUnitInRange<HashRandom, double>(&rand));
  }
}

TEST_CASE("EngineRandom", "[rand]") {
  SECTION("Repeatable") {
    auto a = MakeEngineRandom(std::mt19937(42));
    auto b = MakeEngineRandom(std::mt19937(42));
    for (std::size_t i = 0; i < 100; ++i) {
      REQUIRE(a.NextIndex(1000) == b.NextIndex(1000));
      REQUIRE(a.NextUnit<double>() == b.NextUnit<double>());
    }
  }

  SECTION("Ranges") {
    auto rand = MakeEngineRandom(std::mt19937_64(3));
    REQUIRE(AllIndexInRange(&rand, 1));
    REQUIRE(AllIndexInRange(&rand, 13));
    REQUIRE(AllUnitInRange<EngineRandom<std::mt19937_64>, float>(&rand));
    REQUIRE(AllUnitInRange<EngineRandom<std::mt19937_64>, double>(&rand));
  }
}

}  // namespace
}  // namespace hyperdisk
