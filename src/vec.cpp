#include <nestbench/log/logger.hpp>
#include <nestbench/math/vec.hpp>
#include <cmath>
#include <stdexcept>

namespace nestbench::math {

Matrix Matrix::from_rows(const std::vector<Point> &points, std::size_t cols) {
  const std::size_t n_cols = points.empty() ? cols : points.front().size();
  Matrix m(points.size(), n_cols);
  for (std::size_t i = 0; i < points.size(); ++i) {
    if (points[i].size() != n_cols) {
      NBLOG_ERROR("Matrix::from_rows: row {} has {} entries, expected {}", i, points[i].size(), n_cols);
      throw std::invalid_argument("Matrix::from_rows: ragged rows");
    }
    for (std::size_t j = 0; j < n_cols; ++j) {
      m.data[i * n_cols + j] = points[i][j];
    }
  }
  return m;
}

double &Matrix::operator()(std::size_t i, std::size_t j) {
  if (i >= rows || j >= cols) {
    NBLOG_ERROR("Matrix index ({}, {}) out of range for {} x {}", i, j, rows, cols);
    throw std::out_of_range("Matrix index out of range");
  }
  return data[i * cols + j];
}

const double &Matrix::operator()(std::size_t i, std::size_t j) const {
  if (i >= rows || j >= cols) {
    NBLOG_ERROR("Matrix index ({}, {}) out of range for {} x {}", i, j, rows, cols);
    throw std::out_of_range("Matrix index out of range");
  }
  return data[i * cols + j];
}

Point Matrix::row(std::size_t i) const {
  if (i >= rows) {
    NBLOG_ERROR("Matrix row {} out of range for {} rows", i, rows);
    throw std::out_of_range("Matrix row out of range");
  }
  const auto first = data.begin() + static_cast<std::ptrdiff_t>(i * cols);
  return Point(first, first + static_cast<std::ptrdiff_t>(cols));
}

double dot(const Point &a, const Point &b) {
  double s = 0.0;
  for (std::size_t i = 0; i < a.size() && i < b.size(); ++i) {
    s += a[i] * b[i];
  }
  return s;
}

double norm2(const Point &v) {
  return dot(v, v);
}

double norm(const Point &v) {
  return std::sqrt(norm2(v));
}

} // namespace nestbench::math
