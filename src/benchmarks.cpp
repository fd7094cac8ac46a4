#include <nestbench/likelihood/benchmarks.hpp>
#include <nestbench/log/logger.hpp>
#include <nestbench/math/utils.hpp>
#include <nestbench/math/vec.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

namespace nestbench::likelihood {

namespace {

constexpr int kMaxModeIterations = 500;
constexpr double kModeTolerance = 1e-12;

std::string format_values(const std::vector<double> &values) {
  std::string s = "(";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0)
      s += ", ";
    s += std::format("{}", values[i]);
  }
  return s + ")";
}

Bounds uniform_box(std::size_t x_dim, double low, double high) {
  return {Point(x_dim, low), Point(x_dim, high)};
}

} // namespace



Rosenbrock::Rosenbrock(std::size_t x_dim) : Likelihood(x_dim) {
  NBLOG_DEBUG("Creating Rosenbrock with x_dim: {}", x_dim);
}
LikelihoodKind Rosenbrock::kind() const {
  return LikelihoodKind::Rosenbrock;
}
double Rosenbrock::log_density(const Point &x) const {
  double s = 0.0;
  for (std::size_t i = 0; i + 1 < x.size(); ++i) {
    const double a = x[i + 1] - x[i] * x[i];
    const double b = 1.0 - x[i];
    s += 100.0 * a * a + b * b;
  }
  return -s;
}
Point Rosenbrock::max_location() const {
  return Point(x_dim(), 1.0);
}
Bounds Rosenbrock::sample_range() const {
  return uniform_box(x_dim(), -2.0, 12.0);
}



Himmelblau::Himmelblau() : Likelihood(2) {
  NBLOG_DEBUG("Creating Himmelblau");
}
LikelihoodKind Himmelblau::kind() const {
  return LikelihoodKind::Himmelblau;
}
double Himmelblau::log_density(const Point &x) const {
  const double a = x[0] * x[0] + x[1] - 11.0;
  const double b = x[0] + x[1] * x[1] - 7.0;
  return -a * a - b * b;
}
Point Himmelblau::max_location() const {
  return {3.0, 2.0};
}
Bounds Himmelblau::sample_range() const {
  return uniform_box(x_dim(), -5.0, 5.0);
}



Gaussian::Gaussian(std::size_t x_dim, double corr) : Likelihood(x_dim), corr_(corr) {
  NBLOG_DEBUG("Creating Gaussian with x_dim: {}, corr: {}", x_dim, corr);

  if (!std::isfinite(corr)) {
    NBLOG_ERROR("Gaussian: corr must be finite, got {}", corr);
    throw std::invalid_argument("Gaussian: corr must be finite");
  }

  const double d = static_cast<double>(x_dim);
  // a single axis has no off-diagonal entries
  const double c = x_dim > 1 ? corr : 0.0;

  // Eigenvalues of (1 - c) I + c 1 1^T
  const double lambda_rest = 1.0 - c;
  const double lambda_ones = 1.0 + (d - 1.0) * c;
  if (!(lambda_rest > 0.0) || !(lambda_ones > 0.0)) {
    NBLOG_ERROR("Gaussian: corr must lie in ({}, 1) for x_dim {}, got {}", -1.0 / (d - 1.0), x_dim, corr);
    throw std::invalid_argument("Gaussian: covariance is not positive definite");
  }

  const double log_det = (d - 1.0) * std::log(lambda_rest) + std::log(lambda_ones);
  log_norm_ = -0.5 * d * std::log(2.0 * std::numbers::pi) - 0.5 * log_det;
  a_ = 1.0 / lambda_rest;
  b_ = c / (lambda_rest * lambda_ones);
}
LikelihoodKind Gaussian::kind() const {
  return LikelihoodKind::Gaussian;
}
double Gaussian::log_density(const Point &x) const {
  const double sq = math::norm2(x);
  const double sum = std::accumulate(x.begin(), x.end(), 0.0);
  return log_norm_ - 0.5 * (a_ * sq - b_ * sum * sum);
}
Point Gaussian::max_location() const {
  return Point(x_dim(), 0.0);
}
Bounds Gaussian::sample_range() const {
  return uniform_box(x_dim(), -5.0, 5.0);
}



Eggbox::Eggbox() : Likelihood(2) {
  NBLOG_DEBUG("Creating Eggbox");
}
LikelihoodKind Eggbox::kind() const {
  return LikelihoodKind::Eggbox;
}
double Eggbox::log_density(const Point &x) const {
  const double chi = std::cos(x[0] / 2.0) * std::cos(x[1] / 2.0);
  return std::pow(2.0 + chi, 5);
}
Point Eggbox::max_location() const {
  return Point(x_dim(), 0.0);
}
Bounds Eggbox::sample_range() const {
  return uniform_box(x_dim(), -15.0, 15.0);
}



GaussianShell::GaussianShell(std::size_t x_dim, double sigma, double rshell)
    : Likelihood(x_dim), sigma_(sigma), rshell_(rshell) {
  NBLOG_DEBUG("Creating GaussianShell with x_dim: {}, sigma: {}, rshell: {}", x_dim, sigma, rshell);
  if (!(sigma > 0.0) || !std::isfinite(sigma)) {
    NBLOG_ERROR("GaussianShell: sigma must be positive and finite, got {}", sigma);
    throw std::invalid_argument("GaussianShell: sigma must be positive and finite");
  }
  if (!(rshell >= 0.0) || !std::isfinite(rshell)) {
    NBLOG_ERROR("GaussianShell: rshell must be non-negative and finite, got {}", rshell);
    throw std::invalid_argument("GaussianShell: rshell must be non-negative and finite");
  }
}
LikelihoodKind GaussianShell::kind() const {
  return LikelihoodKind::GaussianShell;
}
double GaussianShell::log_density(const Point &x) const {
  const double rad = math::norm(x);
  return -((rad - rshell_) * (rad - rshell_)) / (2.0 * sigma_ * sigma_);
}
Point GaussianShell::max_location() const {
  Point p(x_dim(), 0.0);
  p[0] = rshell_;
  return p;
}
Bounds GaussianShell::sample_range() const {
  return uniform_box(x_dim(), -rshell_ - 5.0 * sigma_, rshell_ + 5.0 * sigma_);
}



GaussianMix::GaussianMix(std::size_t x_dim, double sep, std::vector<double> weights, double sigma)
    : GaussianMix(x_dim, sep, weights, std::vector<double>(weights.size(), sigma)) {}

GaussianMix::GaussianMix(std::size_t x_dim, double sep, std::vector<double> weights,
                         std::vector<double> sigmas)
    : Likelihood(x_dim), sep_(sep), weights_(std::move(weights)), sigmas_(std::move(sigmas)) {
  NBLOG_DEBUG("Creating GaussianMix with x_dim: {}, sep: {}, weights: {}", x_dim, sep_, format_values(weights_));

  if (x_dim < 2) {
    NBLOG_ERROR("GaussianMix: x_dim must be at least 2, got {}", x_dim);
    throw std::invalid_argument("GaussianMix: x_dim must be at least 2");
  }
  if (weights_.size() < 2 || weights_.size() > 4) {
    const std::string msg = "Weights must have 2, 3 or 4 components. Weights=" + format_values(weights_);
    NBLOG_ERROR("GaussianMix: {}", msg);
    throw std::invalid_argument(msg);
  }
  for (const double w : weights_) {
    if (!(w > 0.0)) {
      const std::string msg = "Weights must be positive. Weights=" + format_values(weights_);
      NBLOG_ERROR("GaussianMix: {}", msg);
      throw std::invalid_argument(msg);
    }
  }
  // absolute 1e-8 plus relative 1e-5
  const double total = std::accumulate(weights_.begin(), weights_.end(), 0.0);
  if (std::abs(total - 1.0) > 1e-8 + 1e-5) {
    const std::string msg = "Weights must sum to 1! Weights=" + format_values(weights_);
    NBLOG_ERROR("GaussianMix: {}", msg);
    throw std::invalid_argument(msg);
  }
  if (sigmas_.size() != weights_.size()) {
    NBLOG_ERROR("GaussianMix: got {} sigmas for {} weights", sigmas_.size(), weights_.size());
    throw std::invalid_argument("GaussianMix: need one sigma per component");
  }
  for (const double s : sigmas_) {
    if (!(s > 0.0) || !std::isfinite(s)) {
      NBLOG_ERROR("GaussianMix: sigmas must be positive and finite, got {}", format_values(sigmas_));
      throw std::invalid_argument("GaussianMix: sigmas must be positive and finite");
    }
  }
  if (!(sep >= 0.0) || !std::isfinite(sep)) {
    NBLOG_ERROR("GaussianMix: sep must be non-negative and finite, got {}", sep);
    throw std::invalid_argument("GaussianMix: sep must be non-negative and finite");
  }

  const std::array<std::array<double, 2>, 4> all_positions{{
      {0.0, sep}, {0.0, -sep}, {sep, 0.0}, {-sep, 0.0}}};
  positions_.assign(all_positions.begin(), all_positions.begin() + static_cast<std::ptrdiff_t>(weights_.size()));

  max_location_ = find_max_location();
}
LikelihoodKind GaussianMix::kind() const {
  return LikelihoodKind::GaussianMix;
}
double GaussianMix::log_density(const Point &x) const {
  return mixture_logpdf(x);
}
double GaussianMix::mixture_logpdf(const Point &x) const {
  std::vector<double> logls(weights_.size());
  Point shifted = x;
  for (std::size_t i = 0; i < weights_.size(); ++i) {
    shifted[0] = x[0] - positions_[i][0];
    shifted[1] = x[1] - positions_[i][1];
    logls[i] = math::log_gaussian_pdf(shifted, sigmas_[i]) + std::log(weights_[i]);
  }
  return math::logsumexp(logls);
}

// Fixed-point mode search started from every centre, dominant weight first.
// A stationary point satisfies x = sum r_i mu_i / sigma_i^2 / sum r_i / sigma_i^2
// with r_i the component responsibilities. Only the first two coordinates move.
Point GaussianMix::find_max_location() const {
  const std::size_t n = weights_.size();
  std::vector<std::size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [this](std::size_t a, std::size_t b) { return weights_[a] > weights_[b]; });

  Point best(x_dim(), 0.0);
  double best_val = -std::numeric_limits<double>::infinity();
  Point x(x_dim(), 0.0);
  std::vector<double> logr(n);

  for (const std::size_t k : order) {
    x[0] = positions_[k][0];
    x[1] = positions_[k][1];

    for (int it = 0; it < kMaxModeIterations; ++it) {
      Point shifted = x;
      for (std::size_t i = 0; i < n; ++i) {
        shifted[0] = x[0] - positions_[i][0];
        shifted[1] = x[1] - positions_[i][1];
        logr[i] = math::log_gaussian_pdf(shifted, sigmas_[i]) + std::log(weights_[i]);
      }
      const double val = math::logsumexp(logr);
      if (val > best_val) {
        best_val = val;
        best = x;
      }

      double num0 = 0.0, num1 = 0.0, den = 0.0;
      for (std::size_t i = 0; i < n; ++i) {
        const double r = std::exp(logr[i] - val) / (sigmas_[i] * sigmas_[i]);
        num0 += r * positions_[i][0];
        num1 += r * positions_[i][1];
        den += r;
      }
      if (!(den > 0.0))
        break;

      const double next0 = num0 / den;
      const double next1 = num1 / den;
      const double step = std::abs(next0 - x[0]) + std::abs(next1 - x[1]);
      x[0] = next0;
      x[1] = next1;
      if (step < kModeTolerance) {
        const double last = mixture_logpdf(x);
        if (last > best_val) {
          best_val = last;
          best = x;
        }
        break;
      }
    }
  }

  NBLOG_DEBUG("GaussianMix: max_loglike {} at ({}, {})", best_val, best[0], best[1]);
  return best;
}
Point GaussianMix::max_location() const {
  return max_location_;
}
Bounds GaussianMix::sample_range() const {
  const double sigma_max = *std::max_element(sigmas_.begin(), sigmas_.end());
  return uniform_box(x_dim(), -sep_ - 5.0 * sigma_max, sep_ + 5.0 * sigma_max);
}

} // namespace nestbench::likelihood
