// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "hyperdisk/poisson_disk_sampling.h"

namespace {

struct Vec2 {
  double x;
  double y;
};

struct Vec2Traits {
  using ValueType = double;

  static constexpr auto kSize = std::size_t{2};

  static auto Get(const Vec2& v, const std::size_t i) -> ValueType {
    return i == 0 ? v.x : v.y;
  }

  static void Set(Vec2* const v, const std::size_t i, const ValueType val) {
    if (i == 0) {
      v->x = val;
    } else {
      v->y = val;
    }
  }
};

using SampleType = hyperdisk::Sample<Vec2, Vec2Traits>;

}  // namespace

int main(int /*argc*/, char* /*argv*/[]) {  // NOLINT
  constexpr auto kCoarseRadius = 0.1;
  constexpr auto kFineRadius = 0.025;

  // A coarse distribution is generated first and then used as the seed set
  // for a finer one, giving two nested layers of samples.
  auto samples = std::vector<SampleType>{};
  auto coarse_count = std::size_t{0};
  auto fine_count = std::size_t{0};
  try {
    auto disk = hyperdisk::PoissonDisk<>(hyperdisk::HashRandom(1));
    auto generator = disk.BuildRadius<Vec2, Vec2Traits>(kCoarseRadius);
    coarse_count = generator.Generate(&samples).sample_count;

    generator.SetRadius(kFineRadius);
    fine_count = generator.Generate(&samples).sample_count;
  } catch (const std::invalid_argument& e) {
    std::cerr << "vec_traits_passed_in_example: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  std::ofstream ofs{"./vec_traits_passed_in_example.txt"};
  if (!ofs) {
    std::cerr << "failed to open ./vec_traits_passed_in_example.txt\n";
    return EXIT_FAILURE;
  }
  for (const auto& sample : samples) {
    ofs << sample.position().x << ", " << sample.position().y << ", "
        << sample.radius() << '\n';
  }
  ofs.close();

  std::cout << coarse_count << " coarse and " << fine_count
            << " fine samples\n";
  return EXIT_SUCCESS;
}
