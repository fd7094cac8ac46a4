#include <nestbench/math/rng.hpp>
#include <cmath>
#include <numbers>

namespace nestbench::math {

// SplitMix64 finalizer over base + golden-ratio stride.
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t stream) {
  std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (stream + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

double Rng::uniform() {
  return uni(gen);
}

double Rng::uniform(const double low, const double high) {
  return low + (high - low) * uniform();
}

double Rng::normal(const double mean, const double stddev) {
  // 1 - u keeps the log argument in (0, 1]
  const double u1 = 1.0 - uniform();
  const double u2 = uniform();
  const double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
  return z0 * stddev + mean;
}

} // namespace nestbench::math
