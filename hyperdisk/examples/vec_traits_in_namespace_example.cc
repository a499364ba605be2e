// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "hyperdisk/poisson_disk_sampling.h"

namespace {

struct Vec3 {
  float x;
  float y;
  float z;
};

}  // namespace

namespace hyperdisk {

template <>
struct VecTraits<Vec3> {
  using ValueType = float;

  static constexpr auto kSize = std::size_t{3};

  static auto Get(const Vec3& v, const std::size_t i) -> ValueType {
    return i == 0 ? v.x : (i == 1 ? v.y : v.z);
  }

  static void Set(Vec3* const v, const std::size_t i, const ValueType val) {
    switch (i) {
      case 0:
        v->x = val;
        break;
      case 1:
        v->y = val;
        break;
      default:
        v->z = val;
        break;
    }
  }
};

}  // namespace hyperdisk

int main(int /*argc*/, char* /*argv*/[]) {  // NOLINT
  constexpr auto kRadius = 0.05F;

  const auto samples =
      hyperdisk::PoissonDiskSampling<float, 3, Vec3>(kRadius);
  if (samples.empty()) {
    std::cerr << "invalid radius: " << kRadius << '\n';
    return EXIT_FAILURE;
  }

  std::ofstream ofs{"./vec_traits_in_namespace_example.txt"};
  if (!ofs) {
    std::cerr << "failed to open ./vec_traits_in_namespace_example.txt\n";
    return EXIT_FAILURE;
  }
  for (const auto& sample : samples) {
    ofs << sample.x << ", " << sample.y << ", " << sample.z << '\n';
  }
  ofs.close();

  return EXIT_SUCCESS;
}
