#pragma once
#include <array>
#include <cstddef>
#include <vector>
#include <nestbench/likelihood/likelihood.hpp>

namespace nestbench::likelihood {

/// @brief -sum_i [100 (x[i+1] - x[i]^2)^2 + (1 - x[i])^2], maximum 0 at (1, ..., 1)
class Rosenbrock : public Likelihood {
public:
  explicit Rosenbrock(std::size_t x_dim);

  LikelihoodKind kind() const override;
  Point max_location() const override;
  Bounds sample_range() const override;

protected:
  double log_density(const Point &x) const override;
};

/// @brief -(x0^2 + x1 - 11)^2 - (x0 + x1^2 - 7)^2, two dimensional, four maxima of 0
class Himmelblau : public Likelihood {
public:
  Himmelblau();

  LikelihoodKind kind() const override;
  Point max_location() const override;
  Bounds sample_range() const override;

protected:
  double log_density(const Point &x) const override;
};

/// @brief Zero mean normal with unit variances and a common correlation
class Gaussian : public Likelihood {
public:
  /// @param corr Off-diagonal covariance, -1/(x_dim-1) < corr < 1
  Gaussian(std::size_t x_dim, double corr);

  double corr() const { return corr_; }

  LikelihoodKind kind() const override;
  Point max_location() const override;
  Bounds sample_range() const override;

protected:
  double log_density(const Point &x) const override;

private:
  double corr_;
  // log N(x) = log_norm_ - 0.5 * (a_ |x|^2 - b_ (sum x)^2)
  double log_norm_;
  double a_;
  double b_;
};

/// @brief (2 + cos(x0/2) cos(x1/2))^5, two dimensional
class Eggbox : public Likelihood {
public:
  Eggbox();

  LikelihoodKind kind() const override;
  Point max_location() const override;
  Bounds sample_range() const override;

protected:
  double log_density(const Point &x) const override;
};

/// @brief -(|x| - rshell)^2 / (2 sigma^2), a thin spherical shell
class GaussianShell : public Likelihood {
public:
  GaussianShell(std::size_t x_dim, double sigma = 0.1, double rshell = 2.0);

  double sigma() const { return sigma_; }
  double rshell() const { return rshell_; }

  LikelihoodKind kind() const override;
  Point max_location() const override;
  Bounds sample_range() const override;

protected:
  double log_density(const Point &x) const override;

private:
  double sigma_;
  double rshell_;
};

/// @brief Weighted mixture of 2 to 4 isotropic Gaussians
///
/// Component centres sit at (0, sep), (0, -sep), (sep, 0), (-sep, 0) in the
/// first two coordinates, in that order, and at 0 in any further coordinate.
/// The density is the log-sum-exp of log(w_i) + log N(x; centre_i, sigma_i).
class GaussianMix : public Likelihood {
public:
  GaussianMix(std::size_t x_dim, double sep = 4.0,
              std::vector<double> weights = {0.4, 0.3, 0.2, 0.1},
              double sigma = 1.0);

  /// @param sigmas One standard deviation per component
  GaussianMix(std::size_t x_dim, double sep, std::vector<double> weights,
              std::vector<double> sigmas);

  double sep() const { return sep_; }
  const std::vector<double> &weights() const { return weights_; }
  const std::vector<double> &sigmas() const { return sigmas_; }
  const std::vector<std::array<double, 2>> &positions() const { return positions_; }

  LikelihoodKind kind() const override;
  Point max_location() const override;
  Bounds sample_range() const override;

protected:
  double log_density(const Point &x) const override;

private:
  double sep_;
  std::vector<double> weights_;
  std::vector<double> sigmas_;
  std::vector<std::array<double, 2>> positions_;
  Point max_location_;

  double mixture_logpdf(const Point &x) const;
  Point find_max_location() const;
};

} // namespace nestbench::likelihood
