#include <gtest/gtest.h>

#include <nestbench/likelihood/benchmarks.hpp>
#include <nestbench/math/rng.hpp>
#include <nestbench/sample/rejection.hpp>

#include <cmath>
#include <numbers>
#include <stdexcept>

using namespace nestbench::likelihood;
using namespace nestbench::sample;
using nestbench::math::Rng;

namespace {

// -x^2 on [-1, 1] whose declared maximum (at x = 1) understates the true one.
class Understated : public Likelihood {
public:
  Understated() : Likelihood(1) {}
  LikelihoodKind kind() const override { return LikelihoodKind::Gaussian; }
  Point max_location() const override { return {1.0}; }
  Bounds sample_range() const override { return {{-1.0}, {1.0}}; }

protected:
  double log_density(const Point &x) const override { return -x[0] * x[0]; }
};

void expect_within_range(const Likelihood &lik, const Matrix &samples) {
  const Bounds b = lik.sample_range();
  for (std::size_t i = 0; i < samples.rows; ++i) {
    for (std::size_t j = 0; j < samples.cols; ++j) {
      ASSERT_GE(samples(i, j), b.low[j]);
      ASSERT_LE(samples(i, j), b.high[j]);
    }
  }
}

} // namespace

TEST(RejectionSample, ReturnsRequestedCount) {
  Himmelblau h;
  Rng rng(1);
  for (std::size_t n : {0u, 1u, 1000u, 5000u}) {
    const Matrix s = h.sample(n, rng);
    EXPECT_EQ(s.rows, n);
    EXPECT_EQ(s.cols, 2u);
    expect_within_range(h, s);
  }
}

TEST(RejectionSample, ZeroSamplesDrawsNothing) {
  GaussianShell shell(3);
  Rng rng(8);
  const RejectionResult r = rejection_sample(shell, 0, rng);
  EXPECT_EQ(r.samples.rows, 0u);
  EXPECT_EQ(r.samples.cols, 3u);
  EXPECT_EQ(r.n_batches, 0u);
  EXPECT_EQ(r.n_proposed, 0u);
  EXPECT_EQ(r.acceptance_rate(), 0.0);
}

TEST(RejectionSample, Bookkeeping) {
  Gaussian g(2, 0.0);
  Rng rng(3);
  RejectionConfig cfg;
  cfg.batch_size = 250;
  const RejectionResult r = rejection_sample(g, 700, rng, cfg);
  EXPECT_EQ(r.samples.rows, 700u);
  EXPECT_EQ(r.n_proposed, r.n_batches * 250u);
  EXPECT_GE(r.n_accepted, 700u);
  EXPECT_EQ(r.n_bound_violations, 0u);
  // area under exp(ll - max) over the box is 2 pi out of 100
  EXPECT_NEAR(r.acceptance_rate(), 2.0 * std::numbers::pi / 100.0, 0.015);
}

TEST(RejectionSample, SameSeedSameSamples) {
  GaussianMix mix(2);
  Rng a(77), b(77);
  const Matrix sa = mix.sample(300, a);
  const Matrix sb = mix.sample(300, b);
  EXPECT_EQ(sa.data, sb.data);
}

TEST(RejectionSample, StreamSeedsGiveIndependentReproducibleRuns) {
  GaussianMix mix(2);
  Rng first(nestbench::math::mix_seed(77, 0));
  Rng second(nestbench::math::mix_seed(77, 1));
  Rng first_again(nestbench::math::mix_seed(77, 0));
  const Matrix s0 = mix.sample(300, first);
  const Matrix s1 = mix.sample(300, second);
  const Matrix s0_again = mix.sample(300, first_again);
  EXPECT_EQ(s0.data, s0_again.data);
  EXPECT_NE(s0.data, s1.data);
}

TEST(RejectionSample, GaussianMoments) {
  Gaussian g(2, 0.5);
  Rng rng(2025);
  const Matrix s = g.sample(5000, rng);
  double m0 = 0.0, m1 = 0.0, c01 = 0.0, v0 = 0.0;
  for (std::size_t i = 0; i < s.rows; ++i) {
    m0 += s(i, 0);
    m1 += s(i, 1);
    c01 += s(i, 0) * s(i, 1);
    v0 += s(i, 0) * s(i, 0);
  }
  const double n = static_cast<double>(s.rows);
  EXPECT_NEAR(m0 / n, 0.0, 0.1);
  EXPECT_NEAR(m1 / n, 0.0, 0.1);
  EXPECT_NEAR(v0 / n, 1.0, 0.1);
  EXPECT_NEAR(c01 / n, 0.5, 0.1);
}

TEST(RejectionSample, ShellSamplesConcentrateOnRadius) {
  GaussianShell shell(2);
  Rng rng(4);
  const Matrix s = shell.sample(2000, rng);
  double mean_r = 0.0;
  for (std::size_t i = 0; i < s.rows; ++i) {
    mean_r += std::hypot(s(i, 0), s(i, 1));
  }
  EXPECT_NEAR(mean_r / static_cast<double>(s.rows), 2.0, 0.02);
}

TEST(RejectionSample, BatchCapRaises) {
  Eggbox e;
  Rng rng(6);
  RejectionConfig cfg;
  cfg.batch_size = 10;
  cfg.max_batches = 1;
  EXPECT_THROW(rejection_sample(e, 1000, rng, cfg), std::runtime_error);
}

TEST(RejectionSample, ZeroBatchSizeIsInvalid) {
  Himmelblau h;
  Rng rng(6);
  RejectionConfig cfg;
  cfg.batch_size = 0;
  EXPECT_THROW(rejection_sample(h, 10, rng, cfg), std::invalid_argument);
}

TEST(RejectionSample, CountsUnderstatedMaximum) {
  Understated lik;
  Rng rng(10);
  const RejectionResult r = rejection_sample(lik, 100, rng);
  EXPECT_EQ(r.samples.rows, 100u);
  EXPECT_GT(r.n_bound_violations, 0u);
  expect_within_range(lik, r.samples);
}
