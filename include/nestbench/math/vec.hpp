#pragma once
#include <cstddef>
#include <vector>

namespace nestbench::math {

/// A single point in parameter space; its length is the problem dimension.
using Point = std::vector<double>;

/// @brief Row-major dense matrix, one point per row
struct Matrix {
  const std::size_t rows;
  const std::size_t cols;
  std::vector<double> data;

  Matrix(std::size_t rows, std::size_t cols) : rows(rows), cols(cols) {
    data.resize(rows * cols, 0.0);
  }

  /// @brief Build a matrix from a list of equally sized rows
  /// @param points Rows to copy; an empty list gives a 0 x cols matrix
  /// @param cols Column count used when points is empty
  static Matrix from_rows(const std::vector<Point> &points, std::size_t cols = 0);

  double &operator()(std::size_t i, std::size_t j);
  const double &operator()(std::size_t i, std::size_t j) const;

  /// @brief Copy row i out as a Point
  Point row(std::size_t i) const;
};

double dot(const Point &a, const Point &b);
double norm2(const Point &v);
double norm(const Point &v);

} // namespace nestbench::math
