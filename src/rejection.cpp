#include <nestbench/log/logger.hpp>
#include <nestbench/sample/rejection.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace nestbench::sample {

double RejectionResult::acceptance_rate() const {
  if (n_proposed == 0)
    return 0.0;
  return static_cast<double>(n_accepted) / static_cast<double>(n_proposed);
}

RejectionResult rejection_sample(const likelihood::Likelihood &lik,
                                 std::size_t n_samples, Rng &rng,
                                 const RejectionConfig &config) {
  if (config.batch_size == 0) {
    NBLOG_ERROR("rejection_sample: batch_size must be greater than 0");
    throw std::invalid_argument("rejection_sample: batch_size must be greater than 0");
  }

  const std::size_t dim = lik.x_dim();
  if (n_samples == 0)
    return RejectionResult(Matrix(0, dim));

  const double max_loglike = lik.max_loglike();
  const likelihood::Bounds range = lik.sample_range();
  const double slack = 1e-9 * std::max(1.0, std::abs(max_loglike));

  std::size_t n_batches = 0;
  std::size_t n_accepted = 0;
  std::size_t n_bound_violations = 0;

  std::vector<double> accepted;
  accepted.reserve(n_samples * dim);

  Matrix batch(config.batch_size, dim);
  std::vector<double> r(config.batch_size);

  while (accepted.size() < n_samples * dim) {
    if (n_batches >= config.max_batches) {
      NBLOG_ERROR("rejection_sample: failed to converge, {} of {} samples accepted after {} batches",
                  accepted.size() / dim, n_samples, n_batches);
      throw std::runtime_error("rejection_sample: failed to converge within max_batches");
    }

    for (std::size_t i = 0; i < config.batch_size; ++i) {
      for (std::size_t j = 0; j < dim; ++j) {
        batch.data[i * dim + j] = rng.uniform(range.low[j], range.high[j]);
      }
    }
    const std::vector<double> loglike = lik.loglike(batch);
    for (std::size_t i = 0; i < config.batch_size; ++i) {
      r[i] = rng.uniform();
    }

    for (std::size_t i = 0; i < config.batch_size; ++i) {
      if (loglike[i] > max_loglike + slack) {
        if (n_bound_violations == 0) {
          NBLOG_WARN("rejection_sample: log-density {} exceeds declared max_loglike {}; samples will be biased",
                     loglike[i], max_loglike);
        }
        ++n_bound_violations;
      }

      const double ratio = std::exp(loglike[i] - max_loglike);
      if (ratio > r[i]) {
        ++n_accepted;
        const auto first = batch.data.begin() + static_cast<std::ptrdiff_t>(i * dim);
        accepted.insert(accepted.end(), first, first + static_cast<std::ptrdiff_t>(dim));
      }
    }

    ++n_batches;
  }

  accepted.resize(n_samples * dim);
  Matrix samples(n_samples, dim);
  samples.data.swap(accepted);

  RejectionResult result(std::move(samples));
  result.n_batches = n_batches;
  result.n_proposed = n_batches * config.batch_size;
  result.n_accepted = n_accepted;
  result.n_bound_violations = n_bound_violations;

  NBLOG_INFO("Rejection sampling: {} samples from {} batches, acceptance rate {:.4f}",
             n_samples, n_batches, result.acceptance_rate());
  return result;
}

} // namespace nestbench::sample
