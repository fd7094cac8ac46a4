#pragma once
#include <cstddef>
#include <utility>
#include <nestbench/likelihood/likelihood.hpp>
#include <nestbench/math/rng.hpp>
#include <nestbench/math/vec.hpp>

namespace nestbench::sample {

using math::Matrix;
using math::Rng;

struct RejectionConfig {
  std::size_t batch_size = 1000;    ///< Candidates proposed per batch
  std::size_t max_batches = 1000000; ///< Batches allowed before giving up
};

/// @brief Accepted points plus proposal bookkeeping
struct RejectionResult {
  Matrix samples;                     ///< n_samples x x_dim accepted points
  std::size_t n_batches{0};           ///< Batches proposed
  std::size_t n_proposed{0};          ///< Candidates evaluated
  std::size_t n_accepted{0};          ///< Candidates accepted, may exceed samples.rows
  std::size_t n_bound_violations{0};  ///< Candidates scoring above max_loglike

  explicit RejectionResult(Matrix samples) : samples(std::move(samples)) {}

  double acceptance_rate() const;
};

/// @brief Rejection sampling with a uniform proposal over the sample range
///
/// Each batch draws config.batch_size candidates uniformly from
/// lik.sample_range(), evaluates them in one loglike() call and accepts a
/// candidate when exp(loglike - max_loglike) exceeds a fresh uniform draw.
/// Batches repeat until n_samples candidates are accepted; the first
/// n_samples are returned. Row order is unspecified.
///
/// @throws std::invalid_argument if config.batch_size is 0
/// @throws std::runtime_error if config.max_batches is reached first
RejectionResult rejection_sample(const likelihood::Likelihood &lik,
                                 std::size_t n_samples, Rng &rng,
                                 const RejectionConfig &config = {});

} // namespace nestbench::sample
