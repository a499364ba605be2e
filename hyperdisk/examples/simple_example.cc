// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "hyperdisk/poisson_disk_sampling.h"

int main(int /*argc*/, char* /*argv*/[]) {  // NOLINT
  constexpr auto kRadius = 0.02F;

  // Minimal parameter set passed to sampling function.
  const auto samples = hyperdisk::PoissonDiskSampling<float, 2>(kRadius);
  if (samples.empty()) {
    std::cerr << "invalid radius: " << kRadius << '\n';
    return EXIT_FAILURE;
  }

  std::ofstream ofs{"./simple_example.txt"};
  if (!ofs) {
    std::cerr << "failed to open ./simple_example.txt\n";
    return EXIT_FAILURE;
  }
  for (const auto& sample : samples) {
    ofs << sample[0] << ", " << sample[1] << '\n';
  }
  ofs.close();

  return EXIT_SUCCESS;
}
