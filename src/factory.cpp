#include <nestbench/likelihood/benchmarks.hpp>
#include <nestbench/likelihood/factory.hpp>
#include <nestbench/log/logger.hpp>
#include <nestbench/util/string.hpp>
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace nestbench::likelihood {

namespace {

constexpr std::array<std::pair<LikelihoodKind, std::string_view>, 6> kKindNames{{
    {LikelihoodKind::Rosenbrock, "rosenbrock"},
    {LikelihoodKind::Himmelblau, "himmelblau"},
    {LikelihoodKind::Gaussian, "gaussian"},
    {LikelihoodKind::Eggbox, "eggbox"},
    {LikelihoodKind::GaussianShell, "gaussian_shell"},
    {LikelihoodKind::GaussianMix, "gaussian_mix"},
}};

void require_fixed_dim(const LikelihoodConfig &config) {
  if (config.x_dim != 2) {
    NBLOG_ERROR("make_likelihood: {} is two dimensional, got x_dim {}", to_string(config.kind), config.x_dim);
    throw std::invalid_argument("make_likelihood: this variant requires x_dim == 2");
  }
}

} // namespace

LikelihoodConfig::LikelihoodConfig(LikelihoodKind k, std::size_t dim) : kind(k), x_dim(dim) {}

std::string_view to_string(LikelihoodKind kind) {
  for (const auto &[k, name] : kKindNames) {
    if (k == kind)
      return name;
  }
  return "unknown";
}

LikelihoodKind parse_likelihood_kind(std::string_view name) {
  const std::string lowered = util::to_lower(name);
  for (const auto &[k, n] : kKindNames) {
    if (n == lowered)
      return k;
  }
  NBLOG_ERROR("parse_likelihood_kind: unknown likelihood \"{}\"", name);
  throw std::invalid_argument("parse_likelihood_kind: unknown likelihood name");
}

std::unique_ptr<Likelihood> make_likelihood(const LikelihoodConfig &config) {
  NBLOG_DEBUG("make_likelihood: {} with x_dim {}", to_string(config.kind), config.x_dim);

  switch (config.kind) {
  case LikelihoodKind::Rosenbrock:
    return std::make_unique<Rosenbrock>(config.x_dim);
  case LikelihoodKind::Himmelblau:
    require_fixed_dim(config);
    return std::make_unique<Himmelblau>();
  case LikelihoodKind::Gaussian:
    return std::make_unique<Gaussian>(config.x_dim, config.corr);
  case LikelihoodKind::Eggbox:
    require_fixed_dim(config);
    return std::make_unique<Eggbox>();
  case LikelihoodKind::GaussianShell:
    return std::make_unique<GaussianShell>(config.x_dim, config.sigma.value_or(0.1), config.rshell);
  case LikelihoodKind::GaussianMix:
    if (!config.sigmas.empty())
      return std::make_unique<GaussianMix>(config.x_dim, config.sep, config.weights, config.sigmas);
    return std::make_unique<GaussianMix>(config.x_dim, config.sep, config.weights, config.sigma.value_or(1.0));
  }

  NBLOG_ERROR("make_likelihood: unhandled likelihood kind {}", static_cast<int>(config.kind));
  throw std::invalid_argument("make_likelihood: unhandled likelihood kind");
}

} // namespace nestbench::likelihood
