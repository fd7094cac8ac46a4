#pragma once
#include <cstddef>
#include <vector>
#include <nestbench/math/vec.hpp>

namespace nestbench::math
{
  // Normalized isotropic Gaussian log-density
  //   -|theta - mu|^2 / (2 sigma^2) - ndim/2 * log(2 pi sigma^2)
  // mu is applied to every component.
  double log_gaussian_pdf(const Point &theta, double sigma = 1.0, double mu = 0.0);

  double log_gaussian_pdf(const Point &theta, double sigma, double mu, std::size_t ndim);

  // Scalar theta, ndim = 1.
  double log_gaussian_pdf(double theta, double sigma = 1.0, double mu = 0.0);

  // log(sum(exp(values))) without overflow. -inf for an empty or all -inf input.
  double logsumexp(const std::vector<double> &values);
}
