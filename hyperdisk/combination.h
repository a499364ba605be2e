// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#pragma once

#include <array>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

namespace hyperdisk {
namespace internal {

// Returns base raised to a non-negative integer power (not checking for
// overflow).
inline auto IntPow(const std::size_t base, const std::size_t exp) noexcept
    -> std::size_t {
  auto r = std::size_t{1};
  for (std::size_t i = 0; i < exp; ++i) {
    r *= base;
  }
  return r;
}

// Erase the value at given index in the vector. The vector is
// guaranteed to decrease in size by one. Note that the ordering of elements
// may change as a result of calling this function.
//
// Assumes that the vector argument is non-null and that the index is valid.
// (Cannot be called on an empty vector since no valid indices exist)
template <typename T>
void EraseUnordered(std::vector<T>* const v, const std::size_t index) noexcept {
  // Element at index gets same value as last element.
  // Last element is removed, resulting in a vector that
  // has one fewer elements with the value that was previously
  // at index.
  (*v)[index] = std::move(v->back());
  v->pop_back();  // O(1).
}

// Replaces every element of the vector with zero or more elements produced
// by func, without preserving order and without copying the whole vector.
// The signature of func is void(T&& element, std::vector<T>* out), where
// new elements are appended to out (which is the vector itself).
//
// Elements are visited back to front. Each visited element is removed with
// EraseUnordered, and anything appended lands beyond the visited range, so
// it is never passed to func.
template <typename T, typename FuncT>
void FlatMapUnordered(std::vector<T>* const v, FuncT&& func) {
  for (auto i = v->size(); i > 0; --i) {
    T element = std::move((*v)[i - 1]);
    EraseUnordered(v, i - 1);
    func(std::move(element), v);
  }
}

// Lazy sequence of all N-dimensional vectors whose elements are drawn (with
// repetition) from a small set of choices. The k'th combination is given by
// the digits of k written in base L, where L is the number of choices,
// least significant digit first. There are L^N combinations in total.
//
// The choices are copied, so the range does not dangle when constructed
// from a braced list.
template <typename IntT, std::size_t N, std::size_t L>
class CombinationRange {
 public:
  using ValueType = std::array<IntT, N>;

  static_assert(std::is_integral<IntT>::value, "IntT must be integral");
  static_assert(N >= 1, "dimensions must be >= 1");
  static_assert(L >= 1, "must have at least one choice");

  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ValueType;
    using difference_type = std::ptrdiff_t;
    using pointer = const ValueType*;
    using reference = const ValueType&;

    Iterator(const std::array<IntT, L>* const choices,
             const std::size_t cur) noexcept
        : choices_(choices), cur_(cur) {}

    auto operator*() const noexcept -> ValueType {
      ValueType v = {};
      auto div = cur_;
      for (std::size_t i = 0; i < N; ++i) {
        v[i] = (*choices_)[div % L];
        div /= L;
      }
      return v;
    }

    auto operator++() noexcept -> Iterator& {
      ++cur_;
      return *this;
    }

    auto operator==(const Iterator& rhs) const noexcept -> bool {
      return cur_ == rhs.cur_;
    }

    auto operator!=(const Iterator& rhs) const noexcept -> bool {
      return cur_ != rhs.cur_;
    }

   private:
    const std::array<IntT, L>* choices_;
    std::size_t cur_;
  };

  explicit CombinationRange(const std::array<IntT, L>& choices) noexcept
      : choices_(choices) {}

  auto begin() const noexcept -> Iterator { return Iterator(&choices_, 0); }

  auto end() const noexcept -> Iterator {
    return Iterator(&choices_, size());
  }

  // NOLINTNEXTLINE
  static auto size() noexcept -> std::size_t { return IntPow(L, N); }

 private:
  std::array<IntT, L> choices_;
};

// Named constructor to help with type deduction.
template <std::size_t N, typename IntT, std::size_t L>
auto EachCombination(const std::array<IntT, L>& choices) noexcept
    -> CombinationRange<IntT, N, L> {
  return CombinationRange<IntT, N, L>(choices);
}

// Returns the choices {-k, ..., 0, ..., k}.
template <typename IntT, std::size_t K>
auto SymmetricChoices() noexcept -> std::array<IntT, 2 * K + 1> {
  std::array<IntT, 2 * K + 1> a = {};
  for (std::size_t i = 0; i < a.size(); ++i) {
    a[i] = static_cast<IntT>(i) - static_cast<IntT>(K);
  }
  return a;
}

}  // namespace internal
}  // namespace hyperdisk
