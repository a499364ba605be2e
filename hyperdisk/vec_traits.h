// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

#if __cplusplus >= 201402L  // C++14 or later.
#define HYPERDISK_CONSTEXPR14 constexpr
#else
#define HYPERDISK_CONSTEXPR14 inline
#endif

namespace hyperdisk {

// Generic template for vector traits. Users may specialize this template
// for their own classes.
//
// Specializations must have the following static interface, here using
// an example type 'MyVec'.
//
// struct VecTraits<MyVec>
// {
//   using ValueType =  ...
//   static constexpr std::size_t kSize = ...
//
//   static ValueType Get(const MyVec&, std::size_t)
//   static void Set(MyVec* const, std::size_t, ValueType)
// }
//
// The vector type must be default constructible and cheap to copy.
// Everything else the sampler needs (arithmetic, norms, equality) is
// built on top of Get and Set below.
//
// See specialization for std::array below as an example.
template <typename VecT>
struct VecTraits;

// Specialization of vector traits for std::array.
template <typename FloatT, std::size_t N>
struct VecTraits<std::array<FloatT, N>> {
  using ValueType = typename std::array<FloatT, N>::value_type;
  static_assert(std::is_floating_point<ValueType>::value,
                "ValueType must be floating point");

  static constexpr auto kSize = std::tuple_size<std::array<FloatT, N>>::value;
  static_assert(kSize >= 1, "kSize must be >= 1");

  // No bounds checking.
  static HYPERDISK_CONSTEXPR14 auto Get(const std::array<FloatT, N>& vec,
                                        const std::size_t i) noexcept
      -> ValueType {
    return vec[i];
  }

  // No bounds checking.
  static HYPERDISK_CONSTEXPR14 void Set(std::array<FloatT, N>* const vec,
                                        const std::size_t i,
                                        const ValueType value) noexcept {
    (*vec)[i] = value;
  }
};

namespace internal {

// Returns x squared (not checking for overflow).
template <typename ArithT>
// NOLINTNEXTLINE
HYPERDISK_CONSTEXPR14 auto squared(const ArithT x) noexcept -> ArithT {
  static_assert(std::is_arithmetic<ArithT>::value, "ArithT must be arithmetic");
  return x * x;
}

}  // namespace internal

// Returns a vector with all elements set to value.
template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Filled(
    const typename VecTraitsT::ValueType value) noexcept -> VecT {
  VecT v = {};
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    VecTraitsT::Set(&v, i, value);
  }
  return v;
}

template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Zero() noexcept -> VecT {
  return Filled<VecTraitsT, VecT>(typename VecTraitsT::ValueType{0});
}

template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Add(const VecT& u, const VecT& v) noexcept -> VecT {
  VecT r = {};
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    VecTraitsT::Set(&r, i, VecTraitsT::Get(u, i) + VecTraitsT::Get(v, i));
  }
  return r;
}

template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Subtract(const VecT& u, const VecT& v) noexcept
    -> VecT {
  VecT r = {};
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    VecTraitsT::Set(&r, i, VecTraitsT::Get(u, i) - VecTraitsT::Get(v, i));
  }
  return r;
}

template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Scaled(
    const VecT& v, const typename VecTraitsT::ValueType s) noexcept -> VecT {
  VecT r = {};
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    VecTraitsT::Set(&r, i, VecTraitsT::Get(v, i) * s);
  }
  return r;
}

// Assumes s != 0.
template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Divided(
    const VecT& v, const typename VecTraitsT::ValueType s) noexcept -> VecT {
  VecT r = {};
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    VecTraitsT::Set(&r, i, VecTraitsT::Get(v, i) / s);
  }
  return r;
}

// Returns the squared magnitude of v (not checking for overflow).
template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto SquaredMagnitude(const VecT& v) noexcept ->
    typename VecTraitsT::ValueType {
  static_assert(VecTraitsT::kSize >= 1, "dimensions must be >= 1");

  auto m = internal::squared(VecTraitsT::Get(v, 0));
  for (std::size_t i = 1; i < VecTraitsT::kSize; ++i) {
    m += internal::squared(VecTraitsT::Get(v, i));
  }
  return m;
}

// Element-wise exact comparison.
template <typename VecTraitsT, typename VecT>
HYPERDISK_CONSTEXPR14 auto Equal(const VecT& u, const VecT& v) noexcept
    -> bool {
  for (std::size_t i = 0; i < VecTraitsT::kSize; ++i) {
    if (!(VecTraitsT::Get(u, i) == VecTraitsT::Get(v, i))) {
      return false;
    }
  }
  return true;
}

}  // namespace hyperdisk
