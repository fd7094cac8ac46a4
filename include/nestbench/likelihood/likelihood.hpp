#pragma once
#include <cstddef>
#include <vector>
#include <nestbench/math/rng.hpp>
#include <nestbench/math/vec.hpp>

namespace nestbench::sample {
struct RejectionConfig;
}

namespace nestbench::likelihood {

using math::Matrix;
using math::Point;
using math::Rng;

/// @brief Closed set of benchmark problems
enum class LikelihoodKind {
  Rosenbrock,
  Himmelblau,
  Gaussian,
  Eggbox,
  GaussianShell,
  GaussianMix
};

/// @brief Axis-aligned box, low[i] <= high[i]
struct Bounds {
  Point low;
  Point high;
};

/// @brief Log-density test problem over a fixed-dimensional real vector
///
/// Instances are immutable after construction. Every variant supplies the
/// log-density formula, the location of its global maximum inside the
/// sample range, and the sample range itself. Evaluation is a pure map and
/// may be called concurrently on the same instance.
class Likelihood {
public:
  virtual ~Likelihood() = default;

  std::size_t x_dim() const { return x_dim_; }

  /// @brief Number of derived parameters carried alongside each point
  int n_derived() const { return 0; }

  virtual LikelihoodKind kind() const = 0;

  /// @brief Log-density at a single point
  /// @param x Point of length x_dim()
  /// @throws std::invalid_argument if x.size() != x_dim()
  double evaluate(const Point &x) const;

  /// @brief Log-density of every row
  /// @param points N x x_dim() matrix, N may be 0
  /// @return N values, each identical to evaluate() on that row
  std::vector<double> loglike(const Matrix &points) const;

  /// @brief Same values as loglike(), rows split across worker threads
  /// @param n_threads Worker count, 0 means hardware concurrency
  std::vector<double> loglike_parallel(const Matrix &points, std::size_t n_threads = 0) const;

  /// @brief Point attaining max_loglike() inside sample_range()
  virtual Point max_location() const = 0;

  /// @brief Global maximum of the log-density over sample_range()
  double max_loglike() const;

  virtual Bounds sample_range() const = 0;

  /// @brief Draw n points by rejection sampling from sample_range()
  Matrix sample(std::size_t n, Rng &rng) const;
  Matrix sample(std::size_t n, Rng &rng, const sample::RejectionConfig &config) const;

protected:
  explicit Likelihood(std::size_t x_dim);

  // Called with x.size() == x_dim() already checked.
  virtual double log_density(const Point &x) const = 0;

private:
  std::size_t x_dim_;

  void check_columns(const Matrix &points) const;
};

} // namespace nestbench::likelihood
