#include <nestbench/likelihood/benchmarks.hpp>
#include <nestbench/likelihood/factory.hpp>
#include <nestbench/likelihood/likelihood.hpp>
#include <nestbench/log/logger.hpp>
#include <nestbench/math/rng.hpp>
#include <nestbench/math/utils.hpp>
#include <nestbench/sample/rejection.hpp>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace nestbench::likelihood;
using namespace nestbench::sample;
using namespace nestbench::log;
using nestbench::math::Matrix;
using nestbench::math::Point;
using nestbench::math::Rng;

namespace {

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

Matrix to_matrix(const DoubleArray &arr) {
  if (arr.ndim() != 2) {
    throw std::invalid_argument("expected a 2-D array of points");
  }
  Matrix m(static_cast<std::size_t>(arr.shape(0)), static_cast<std::size_t>(arr.shape(1)));
  std::copy(arr.data(), arr.data() + arr.size(), m.data.begin());
  return m;
}

// The array takes ownership of the matrix storage through the capsule.
py::array_t<double> to_numpy(Matrix &&m) {
  auto holder = std::make_unique<Matrix>(std::move(m));
  const std::vector<py::ssize_t> shape{static_cast<py::ssize_t>(holder->rows),
                                       static_cast<py::ssize_t>(holder->cols)};
  const std::vector<py::ssize_t> strides{static_cast<py::ssize_t>(holder->cols * sizeof(double)),
                                         static_cast<py::ssize_t>(sizeof(double))};
  double *data = holder->data.data();
  py::capsule owner(holder.get(), [](void *p) { std::unique_ptr<Matrix> owned(static_cast<Matrix *>(p)); });
  holder.release();
  return py::array_t<double>(shape, strides, data, owner);
}

// 1-D input gives a float, 2-D input gives one value per row.
py::object loglike(const Likelihood &lik, const DoubleArray &x) {
  if (x.ndim() == 1) {
    Point p(x.data(), x.data() + x.size());
    return py::float_(lik.evaluate(p));
  }
  const Matrix m = to_matrix(x);
  std::vector<double> values;
  {
    py::gil_scoped_release release;
    values = lik.loglike(m);
  }
  return py::array_t<double>(static_cast<py::ssize_t>(values.size()), values.data());
}

} // namespace

PYBIND11_MODULE(_nestbench, m) {
  m.doc() = "Python bindings for the nestbench likelihood test problems";

  // Rng bindings
  py::class_<Rng>(m, "Rng")
      .def(py::init<std::uint64_t>(), py::arg("seed") = std::random_device{}(),
           "Initialize the RNG with an optional seed")
      .def("uniform", py::overload_cast<>(&Rng::uniform),
           "Generate a uniform random number in [0, 1)")
      .def("normal", &Rng::normal, py::arg("mean"), py::arg("stddev"),
           "Generate a normally distributed random number with given mean and "
           "stddev");
  m.def("mix_seed", &nestbench::math::mix_seed, py::arg("base"), py::arg("stream"),
        "Seed for an independent Rng stream derived from a run seed");

  py::enum_<LikelihoodKind>(m, "LikelihoodKind")
      .value("Rosenbrock", LikelihoodKind::Rosenbrock)
      .value("Himmelblau", LikelihoodKind::Himmelblau)
      .value("Gaussian", LikelihoodKind::Gaussian)
      .value("Eggbox", LikelihoodKind::Eggbox)
      .value("GaussianShell", LikelihoodKind::GaussianShell)
      .value("GaussianMix", LikelihoodKind::GaussianMix)
      .export_values();

  py::class_<RejectionConfig>(m, "RejectionConfig")
      .def(py::init<>())
      .def_readwrite("batch_size", &RejectionConfig::batch_size)
      .def_readwrite("max_batches", &RejectionConfig::max_batches);

  // Likelihood bindings
  py::class_<Likelihood>(m, "Likelihood")
      .def_property_readonly("x_dim", &Likelihood::x_dim)
      .def_property_readonly("nderived", &Likelihood::n_derived)
      .def_property_readonly("kind", &Likelihood::kind)
      .def_property_readonly("max_loglike", &Likelihood::max_loglike,
                             "Global maximum of the log-density over sample_range")
      .def_property_readonly("max_location", &Likelihood::max_location)
      .def_property_readonly(
          "sample_range",
          [](const Likelihood &lik) {
            Bounds b = lik.sample_range();
            return py::make_tuple(b.low, b.high);
          },
          "(low, high) bounds of the uniform proposal box")
      .def("loglike", &loglike, py::arg("x"),
           "Log-density of a point (1-D array) or of every row of a 2-D array")
      .def("__call__", &loglike, py::arg("x"))
      .def(
          "loglike_parallel",
          [](const Likelihood &lik, const DoubleArray &x, std::size_t n_threads) {
            const Matrix pts = to_matrix(x);
            std::vector<double> values;
            {
              py::gil_scoped_release release;
              values = lik.loglike_parallel(pts, n_threads);
            }
            return py::array_t<double>(static_cast<py::ssize_t>(values.size()), values.data());
          },
          py::arg("x"), py::arg("n_threads") = 0,
          "Row-wise log-density evaluated on worker threads")
      .def(
          "sample",
          [](const Likelihood &lik, std::size_t n, Rng &rng, const RejectionConfig &cfg) {
            RejectionResult result = [&]() {
              py::gil_scoped_release release;
              return rejection_sample(lik, n, rng, cfg);
            }();
            return to_numpy(std::move(result.samples));
          },
          py::arg("num_samples"), py::arg("rng"), py::arg("config") = RejectionConfig{},
          "Draw num_samples points by rejection sampling from sample_range");

  py::class_<Rosenbrock, Likelihood>(m, "Rosenbrock")
      .def(py::init<std::size_t>(), py::arg("x_dim"));

  py::class_<Himmelblau, Likelihood>(m, "Himmelblau")
      .def(py::init<>());

  py::class_<Gaussian, Likelihood>(m, "Gaussian")
      .def(py::init<std::size_t, double>(), py::arg("x_dim"), py::arg("corr"))
      .def_property_readonly("corr", &Gaussian::corr);

  py::class_<Eggbox, Likelihood>(m, "Eggbox")
      .def(py::init<>());

  py::class_<GaussianShell, Likelihood>(m, "GaussianShell")
      .def(py::init<std::size_t, double, double>(), py::arg("x_dim"),
           py::arg("sigma") = 0.1, py::arg("rshell") = 2.0)
      .def_property_readonly("sigma", &GaussianShell::sigma)
      .def_property_readonly("rshell", &GaussianShell::rshell);

  py::class_<GaussianMix, Likelihood>(m, "GaussianMix")
      .def(py::init<std::size_t, double, std::vector<double>, double>(),
           py::arg("x_dim"), py::arg("sep") = 4.0,
           py::arg("weights") = std::vector<double>{0.4, 0.3, 0.2, 0.1},
           py::arg("sigma") = 1.0)
      .def(py::init<std::size_t, double, std::vector<double>, std::vector<double>>(),
           py::arg("x_dim"), py::arg("sep"), py::arg("weights"), py::arg("sigmas"))
      .def_property_readonly("sep", &GaussianMix::sep)
      .def_property_readonly("weights", &GaussianMix::weights)
      .def_property_readonly("sigmas", &GaussianMix::sigmas)
      .def_property_readonly("positions", &GaussianMix::positions);

  // Factory bindings
  py::class_<LikelihoodConfig>(m, "LikelihoodConfig")
      .def(py::init<LikelihoodKind, std::size_t>(), py::arg("kind"), py::arg("x_dim") = 2)
      .def_readwrite("kind", &LikelihoodConfig::kind)
      .def_readwrite("x_dim", &LikelihoodConfig::x_dim)
      .def_readwrite("corr", &LikelihoodConfig::corr)
      .def_readwrite("sigma", &LikelihoodConfig::sigma)
      .def_readwrite("rshell", &LikelihoodConfig::rshell)
      .def_readwrite("sep", &LikelihoodConfig::sep)
      .def_readwrite("weights", &LikelihoodConfig::weights)
      .def_readwrite("sigmas", &LikelihoodConfig::sigmas);

  m.def("make_likelihood", &make_likelihood, py::arg("config"),
        "Build the benchmark named by config.kind");
  m.def("parse_likelihood_kind", &parse_likelihood_kind, py::arg("name"));

  m.def(
      "log_gaussian_pdf",
      [](double theta, double sigma, double mu) {
        return nestbench::math::log_gaussian_pdf(theta, sigma, mu);
      },
      py::arg("theta"), py::arg("sigma") = 1.0, py::arg("mu") = 0.0);
  m.def(
      "log_gaussian_pdf",
      [](const DoubleArray &theta, double sigma, double mu, std::optional<std::size_t> ndim) {
        Point p(theta.data(), theta.data() + theta.size());
        return nestbench::math::log_gaussian_pdf(p, sigma, mu, ndim.value_or(p.size()));
      },
      py::arg("theta"), py::arg("sigma") = 1.0, py::arg("mu") = 0.0, py::arg("ndim") = py::none(),
      "Normalized isotropic Gaussian log-density of a float or an array");

  // Logger bindings
  py::enum_<Level>(m, "LogLevel")
      .value("debug", Level::debug)
      .value("info", Level::info)
      .value("warn", Level::warn)
      .value("error", Level::error)
      .value("off", Level::off)
      .export_values();

  m.def(
      "set_log_level", [](Level level) { Logger::instance().set_level(level); },
      py::arg("level"), "Set the logging level for the nestbench module");
}
