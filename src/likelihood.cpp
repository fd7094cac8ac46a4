#include <nestbench/likelihood/likelihood.hpp>
#include <nestbench/log/logger.hpp>
#include <nestbench/sample/rejection.hpp>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace nestbench::likelihood {

Likelihood::Likelihood(std::size_t x_dim) : x_dim_(x_dim) {
  if (x_dim == 0) {
    NBLOG_ERROR("Likelihood: x_dim must be at least 1");
    throw std::invalid_argument("Likelihood: x_dim must be at least 1");
  }
}

void Likelihood::check_columns(const Matrix &points) const {
  if (points.cols != x_dim_) {
    NBLOG_ERROR("Likelihood::loglike: batch has {} columns, expected x_dim = {}", points.cols, x_dim_);
    throw std::invalid_argument("Likelihood::loglike: batch column count does not match x_dim");
  }
}

double Likelihood::evaluate(const Point &x) const {
  if (x.size() != x_dim_) {
    NBLOG_ERROR("Likelihood::evaluate: point has {} components, expected x_dim = {}", x.size(), x_dim_);
    throw std::invalid_argument("Likelihood::evaluate: point dimension does not match x_dim");
  }
  return log_density(x);
}

std::vector<double> Likelihood::loglike(const Matrix &points) const {
  check_columns(points);

  std::vector<double> out(points.rows);
  for (std::size_t i = 0; i < points.rows; ++i) {
    out[i] = log_density(points.row(i));
  }
  return out;
}

std::vector<double> Likelihood::loglike_parallel(const Matrix &points, std::size_t n_threads) const {
  check_columns(points);

  std::vector<double> out(points.rows);
  if (points.rows == 0)
    return out;

  if (n_threads == 0)
    n_threads = std::thread::hardware_concurrency();
  if (n_threads == 0)
    n_threads = 1;
  if (n_threads > points.rows)
    n_threads = points.rows;

  const std::size_t base = points.rows / n_threads;
  const std::size_t rem  = points.rows % n_threads;

  NBLOG_DEBUG("Evaluating {} points on {} threads", points.rows, n_threads);

  std::vector<std::thread> workers;
  workers.reserve(n_threads);

  std::mutex error_mu;
  std::exception_ptr thread_exception = nullptr;

  std::size_t begin = 0;
  for (std::size_t t = 0; t < n_threads; ++t) {
    const std::size_t my_count = base + (t < rem ? 1u : 0u);
    const std::size_t my_begin = begin;
    begin += my_count;

    workers.emplace_back([&, my_begin, my_count]() {
      try {
        for (std::size_t i = my_begin; i < my_begin + my_count; ++i) {
          out[i] = log_density(points.row(i));
        }
      } catch (...) {
        std::scoped_lock lk(error_mu);
        if (!thread_exception)
          thread_exception = std::current_exception();
      }
    });
  }

  for (auto &th : workers) th.join();
  if (thread_exception) {
    std::rethrow_exception(thread_exception);
  }
  return out;
}

double Likelihood::max_loglike() const {
  return log_density(max_location());
}

Matrix Likelihood::sample(std::size_t n, Rng &rng) const {
  return ::nestbench::sample::rejection_sample(*this, n, rng).samples;
}

Matrix Likelihood::sample(std::size_t n, Rng &rng, const sample::RejectionConfig &config) const {
  return ::nestbench::sample::rejection_sample(*this, n, rng, config).samples;
}

} // namespace nestbench::likelihood
