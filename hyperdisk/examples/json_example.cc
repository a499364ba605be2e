// Copyright(C) Tommy Hinks <tommy.hinks@gmail.com>
// This file is subject to the license terms in the LICENSE file
// found in the top-level directory of this distribution.

#include <array>
#include <cstdint>  // std::uint32_t, etc.
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>

#include "hyperdisk/poisson_disk_sampling.h"

int main(int /*argc*/, char* /*argv*/[]) {  // NOLINT
  using VecType = std::array<double, 2>;

  constexpr auto kRelativeRadius = 0.05;
  constexpr auto kSeed = std::uint32_t{0};

  auto samples = std::vector<hyperdisk::Sample<VecType>>{};
  auto stats = hyperdisk::GenerationStats{};
  auto radius = 0.0;
  try {
    auto generator = hyperdisk::PoissonDisk<>(hyperdisk::HashRandom(kSeed))
                         .Periodic()
                         .BuildRelativeRadius<VecType>(kRelativeRadius);
    radius = generator.radius();
    stats = generator.Generate(&samples);
  } catch (const std::invalid_argument& e) {
    std::cerr << "json_example: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  std::vector<VecType> positions;
  positions.reserve(samples.size());
  for (const auto& sample : samples) {
    positions.push_back(sample.position());
  }

  nlohmann::json json;
  json["periodic"] = true;
  json["radius"] = radius;
  json["seed"] = kSeed;
  json["levels"] = stats.level_count;
  json["precision_limited"] = stats.precision_limited;
  json["samples"] = positions;

  std::ofstream ofs{"./json_example.json"};
  if (!ofs) {
    std::cerr << "failed to open ./json_example.json\n";
    return EXIT_FAILURE;
  }
  ofs << json.dump(/*indent=*/2);
  ofs.close();

  return EXIT_SUCCESS;
}
