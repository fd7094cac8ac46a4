#pragma once
#include <cstdint>
#include <random>

namespace nestbench::math {

/// @brief Seed for stream `stream` of a run seeded with `base`.
/// Gives independent, reproducible generators when several samplers share one
/// run seed, e.g. `Rng rng(mix_seed(seed, problem_index))`.
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t stream);

struct Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> uni{0.0, 1.0};

  explicit Rng(std::uint64_t seed = std::random_device{}()) : gen(seed) {}

  double uniform();
  double uniform(const double low, const double high);
  double normal(const double mean, const double stddev);
};

} // namespace nestbench::math
