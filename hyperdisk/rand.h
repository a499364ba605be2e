// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <type_traits>
#include <utility>

#include "hyperdisk/vec_traits.h"

namespace hyperdisk {
namespace internal {

// Stateless and repeatable function that returns a
// pseduo-random number in the range [0, 0xFFFFFFFF].
HYPERDISK_CONSTEXPR14 auto Hash(const std::uint32_t seed) noexcept
    -> std::uint32_t {
  // So that we can use unsigned int literals, e.g. 42u.
  static_assert(sizeof(unsigned int) == sizeof(std::uint32_t),
                "integer size mismatch");

  auto i = std::uint32_t{(seed ^ 12345391U) * 2654435769U};  // NOLINT
  i ^= (i << 6U) ^ (i >> 26U);                               // NOLINT
  i *= 2654435769U;                                          // NOLINT
  i += (i << 5U) ^ (i >> 12U);                               // NOLINT
  return i;
}

// Maps 32 random bits to [0, 1). Only as many high bits as the mantissa
// can hold exactly are used, so the result never rounds up to 1.
template <typename FloatT>
inline auto UnitFromBits(const std::uint32_t bits) noexcept -> FloatT {
  static_assert(std::is_floating_point<FloatT>::value,
                "FloatT must be floating point");
  constexpr auto kBits = std::numeric_limits<FloatT>::digits < 32
                             ? std::numeric_limits<FloatT>::digits
                             : 32;
  return std::ldexp(static_cast<FloatT>(bits >> (32 - kBits)), -kBits);
}

}  // namespace internal

// A random source offers two primitives:
//
//   std::size_t NextIndex(std::size_t size); // Uniform in [0, size).
//   template <typename FloatT> FloatT NextUnit(); // Uniform in [0, 1).
//
// Drawing numbers mutates the source, so a single source must not be shared
// between concurrent generation runs.

// Default random source. A counter is fed through a stateless hash, which
// makes the sequence identical on every platform for a given seed.
class HashRandom {
 public:
  explicit HashRandom(const std::uint32_t seed = 0) noexcept : seed_(seed) {}

  // Returns a pseduo-random number in the range [0, 0xFFFFFFFF].
  // Note that the seed is incremented for each invokation.
  auto Next() noexcept -> std::uint32_t {
    // Not worrying about seed "overflow" since it is unsigned.
    return internal::Hash(seed_++);
  }

  // Returns a pseudo-random index in the range [0, size - 1].
  // Assumes size > 0.
  auto NextIndex(const std::size_t size) noexcept -> std::size_t {
    constexpr auto kMax32 =
        static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max());
    if (static_cast<std::uint64_t>(size) <= kMax32 + 1) {
      // Multiply-shift keeps the mapping uniform enough without a division.
      return static_cast<std::size_t>(
          (static_cast<std::uint64_t>(Next()) * size) >> 32U);
    }
    const auto hi = static_cast<std::uint64_t>(Next());
    const auto lo = static_cast<std::uint64_t>(Next());
    return static_cast<std::size_t>(((hi << 32U) | lo) %
                                    static_cast<std::uint64_t>(size));
  }

  // Returns a pseduo-random number in the range [0, 1).
  template <typename FloatT>
  auto NextUnit() noexcept -> FloatT {
    return internal::UnitFromBits<FloatT>(Next());
  }

  auto seed() const noexcept -> std::uint32_t { return seed_; }  // NOLINT

 private:
  std::uint32_t seed_;
};

// Adapts a standard uniform random bit engine, e.g. std::mt19937, to the
// random source interface. The engine is owned by the adapter.
template <typename EngineT>
class EngineRandom {
 public:
  explicit EngineRandom(EngineT engine) : engine_(std::move(engine)) {}

  // Assumes size > 0.
  auto NextIndex(const std::size_t size) -> std::size_t {
    std::uniform_int_distribution<std::size_t> dist(0, size - 1);
    return dist(engine_);
  }

  template <typename FloatT>
  auto NextUnit() -> FloatT {
    std::uniform_real_distribution<FloatT> dist(FloatT{0}, FloatT{1});
    // Some standard library implementations may return the upper bound.
    return std::min(dist(engine_),
                    std::nextafter(FloatT{1}, FloatT{0}));
  }

  auto engine() noexcept -> EngineT& { return engine_; }  // NOLINT

 private:
  EngineT engine_;
};

// Named constructor to help with type deduction.
template <typename EngineT>
auto MakeEngineRandom(EngineT engine) -> EngineRandom<EngineT> {
  return EngineRandom<EngineT>(std::move(engine));
}

}  // namespace hyperdisk
