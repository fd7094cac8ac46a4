#include <nestbench/math/utils.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>

namespace nestbench::math
{
  double log_gaussian_pdf(const Point &theta, double sigma, double mu)
  {
    return log_gaussian_pdf(theta, sigma, mu, theta.size());
  }

  double log_gaussian_pdf(const Point &theta, double sigma, double mu, std::size_t ndim)
  {
    double sq = 0.0;
    for (const double t : theta)
    {
      sq += (t - mu) * (t - mu);
    }
    double logl = -(sq / (2.0 * sigma * sigma));
    logl -= std::log(2.0 * std::numbers::pi * (sigma * sigma)) * static_cast<double>(ndim) / 2.0;
    return logl;
  }

  double log_gaussian_pdf(double theta, double sigma, double mu)
  {
    return log_gaussian_pdf(Point{theta}, sigma, mu, 1);
  }

  double logsumexp(const std::vector<double> &values)
  {
    if (values.empty())
      return -std::numeric_limits<double>::infinity();

    const double vmax = *std::max_element(values.begin(), values.end());
    if (!std::isfinite(vmax))
      return vmax; // all -inf, or a +inf term

    double s = 0.0;
    for (const double v : values)
    {
      s += std::exp(v - vmax);
    }
    return vmax + std::log(s);
  }
}
