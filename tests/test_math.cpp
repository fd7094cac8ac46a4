#include <gtest/gtest.h>

#include <nestbench/math/rng.hpp>
#include <nestbench/math/utils.hpp>
#include <nestbench/math/vec.hpp>

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>

using namespace nestbench::math;

TEST(LogGaussianPdf, ZeroVectorIsNormalisationConstant) {
  for (std::size_t d : {1u, 2u, 3u, 7u, 20u}) {
    const Point zero(d, 0.0);
    const double expected = -static_cast<double>(d) / 2.0 * std::log(2.0 * std::numbers::pi);
    EXPECT_DOUBLE_EQ(log_gaussian_pdf(zero, 1.0, 0.0), expected) << "d = " << d;
  }
}

TEST(LogGaussianPdf, ScalarInfersOneDimension) {
  EXPECT_DOUBLE_EQ(log_gaussian_pdf(0.0), -0.5 * std::log(2.0 * std::numbers::pi));
  EXPECT_DOUBLE_EQ(log_gaussian_pdf(1.5), log_gaussian_pdf(Point{1.5}));
  EXPECT_DOUBLE_EQ(log_gaussian_pdf(2.0, 0.5, 1.0), log_gaussian_pdf(Point{2.0}, 0.5, 1.0));
}

TEST(LogGaussianPdf, SigmaAndMean) {
  // one dimension, theta - mu = 1, sigma = 2
  const double expected = -1.0 / 8.0 - 0.5 * std::log(2.0 * std::numbers::pi * 4.0);
  EXPECT_NEAR(log_gaussian_pdf(3.0, 2.0, 2.0), expected, 1e-14);
}

TEST(LogGaussianPdf, ExplicitDimensionOverridesLength) {
  const Point theta{0.0, 0.0};
  EXPECT_DOUBLE_EQ(log_gaussian_pdf(theta, 1.0, 0.0, 4),
                   -2.0 * std::log(2.0 * std::numbers::pi));
}

TEST(LogSumExp, EdgeCases) {
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_EQ(logsumexp({}), -inf);
  EXPECT_EQ(logsumexp({-inf, -inf}), -inf);
  EXPECT_DOUBLE_EQ(logsumexp({0.0}), 0.0);
  EXPECT_DOUBLE_EQ(logsumexp({-inf, 2.5}), 2.5);
}

TEST(LogSumExp, LargeValuesDoNotOverflow) {
  EXPECT_NEAR(logsumexp({1000.0, 1000.0}), 1000.0 + std::log(2.0), 1e-12);
  EXPECT_NEAR(logsumexp({-1000.0, -1000.0, -1000.0}), -1000.0 + std::log(3.0), 1e-12);
}

TEST(Matrix, IndexingAndRows) {
  Matrix m(2, 3);
  m(1, 2) = 4.0;
  m(0, 0) = -1.0;
  EXPECT_EQ(m.data[5], 4.0);
  EXPECT_EQ(m.row(1), (Point{0.0, 0.0, 4.0}));
  EXPECT_EQ(m.row(0), (Point{-1.0, 0.0, 0.0}));
  EXPECT_THROW(m(2, 0), std::out_of_range);
  EXPECT_THROW(m(0, 3), std::out_of_range);
  EXPECT_THROW(m.row(2), std::out_of_range);
}

TEST(Matrix, FromRows) {
  const Matrix m = Matrix::from_rows({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
  EXPECT_EQ(m.rows, 3u);
  EXPECT_EQ(m.cols, 2u);
  EXPECT_EQ(m(2, 1), 6.0);

  const Matrix empty = Matrix::from_rows({}, 4);
  EXPECT_EQ(empty.rows, 0u);
  EXPECT_EQ(empty.cols, 4u);

  EXPECT_THROW(Matrix::from_rows({{1.0, 2.0}, {3.0}}), std::invalid_argument);
}

TEST(Vec, Norms) {
  EXPECT_DOUBLE_EQ(norm2({3.0, 4.0}), 25.0);
  EXPECT_DOUBLE_EQ(norm({3.0, 4.0}), 5.0);
  EXPECT_DOUBLE_EQ(dot({1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}), 32.0);
}

TEST(Rng, SeedReproducesSequence) {
  Rng a(42), b(42);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(a.uniform(), b.uniform());
  }
}

TEST(Rng, UniformRange) {
  Rng rng(7);
  for (int i = 0; i < 10000; ++i) {
    const double u = rng.uniform();
    ASSERT_GE(u, 0.0);
    ASSERT_LT(u, 1.0);
    const double v = rng.uniform(-3.0, 5.0);
    ASSERT_GE(v, -3.0);
    ASSERT_LE(v, 5.0);
  }
}

TEST(Rng, NormalMoments) {
  Rng rng(31425);
  const int n = 20000;
  double sum = 0.0, sumsq = 0.0;
  for (int i = 0; i < n; ++i) {
    const double x = rng.normal(2.0, 0.5);
    ASSERT_TRUE(std::isfinite(x));
    sum += x;
    sumsq += x * x;
  }
  const double mean = sum / n;
  const double var = sumsq / n - mean * mean;
  EXPECT_NEAR(mean, 2.0, 0.02);
  EXPECT_NEAR(var, 0.25, 0.02);
}

TEST(Rng, MixSeedSeparatesStreams) {
  EXPECT_NE(mix_seed(1, 0), mix_seed(1, 1));
  EXPECT_NE(mix_seed(1, 0), mix_seed(2, 0));
  EXPECT_EQ(mix_seed(9, 3), mix_seed(9, 3));
}
