#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include <nestbench/likelihood/likelihood.hpp>

namespace nestbench::likelihood {

/// @brief Construction parameters for any benchmark variant
///
/// Fields a variant does not use are ignored. Unset sigma takes the variant
/// default: 0.1 for GaussianShell, 1.0 for GaussianMix. A non-empty sigmas
/// gives GaussianMix one sigma per component and overrides sigma.
struct LikelihoodConfig {
  LikelihoodKind kind;
  std::size_t x_dim = 2;

  double corr = 0.0;                 ///< Gaussian
  std::optional<double> sigma;       ///< GaussianShell, GaussianMix
  double rshell = 2.0;               ///< GaussianShell
  double sep = 4.0;                  ///< GaussianMix
  std::vector<double> weights{0.4, 0.3, 0.2, 0.1}; ///< GaussianMix
  std::vector<double> sigmas{};      ///< GaussianMix

  explicit LikelihoodConfig(LikelihoodKind k, std::size_t dim = 2);
};

std::string_view to_string(LikelihoodKind kind);

/// @brief Inverse of to_string, case-insensitive
/// @throws std::invalid_argument for an unknown name
LikelihoodKind parse_likelihood_kind(std::string_view name);

/// @brief Build the variant named by config.kind
/// @throws std::invalid_argument when the parameters are invalid for that variant
std::unique_ptr<Likelihood> make_likelihood(const LikelihoodConfig &config);

} // namespace nestbench::likelihood
