#include <cmath>
#include <limits>
#include <numbers>
#include <markov/core/errors.hpp>
#include <markov/log/logger.hpp>
#include <markov/sample/targets.hpp>

namespace markov::sample {

using markov::math::Vector;

constexpr double kInf = std::numeric_limits<double>::infinity();

DensityFn uniform_pdf(double a, double b) {
  if (!(a < b))
    throw ConfigurationError("uniform_pdf: requires a < b");
  const double height = 1.0 / (b - a);
  return [a, b, height](double x) { return (x < a || x > b) ? 0.0 : height; };
}

DensityFn normal_pdf(double mu, double sigma) {
  if (!(sigma > 0.0))
    throw ConfigurationError("normal_pdf: sigma must be > 0");
  const double norm = 1.0 / (sigma * std::sqrt(2.0 * std::numbers::pi));
  return [mu, sigma, norm](double x) {
    const double z = (x - mu) / sigma;
    return norm * std::exp(-0.5 * z * z);
  };
}

DensityFn gamma_pdf(double shape, double loc, double scale) {
  if (!(shape > 0.0) || !(scale > 0.0)) {
    MLOG_ERROR("gamma_pdf: invalid shape={} scale={}", shape, scale);
    throw ConfigurationError("gamma_pdf: shape and scale must be > 0");
  }
  const double log_norm = -std::lgamma(shape) - shape * std::log(scale);
  return [shape, loc, scale, log_norm](double x) {
    const double y = x - loc;
    if (y < 0.0)
      return 0.0;
    if (y == 0.0)
      return shape < 1.0 ? kInf : (shape == 1.0 ? 1.0 / scale : 0.0);
    return std::exp(log_norm + (shape - 1.0) * std::log(y) - y / scale);
  };
}

DensityFn beta_pdf(double a, double b) {
  if (!(a > 0.0) || !(b > 0.0)) {
    MLOG_ERROR("beta_pdf: invalid a={} b={}", a, b);
    throw ConfigurationError("beta_pdf: a and b must be > 0");
  }
  const double log_norm = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b);
  return [a, b, log_norm](double x) {
    if (x < 0.0 || x > 1.0)
      return 0.0;
    if (x == 0.0 || x == 1.0) {
      const double e = (x == 0.0) ? a : b;
      if (e < 1.0)
        return kInf;
      if (e > 1.0)
        return 0.0;
      return std::exp(log_norm);
    }
    return std::exp(log_norm + (a - 1.0) * std::log(x) + (b - 1.0) * std::log1p(-x));
  };
}

static void check_gaussian(const Vector &mean, const Vector &precision) {
  if (mean.size() != precision.size())
    throw DimensionError("gaussian_potential: mean and precision differ in dimension");
  for (double p : precision) {
    if (!(p > 0.0))
      throw ConfigurationError("gaussian_potential: precision must be > 0");
  }
}

math::PotentialFn gaussian_potential(Vector mean, Vector precision) {
  check_gaussian(mean, precision);
  return [mean = std::move(mean), precision = std::move(precision)](const Vector &q) {
    if (q.size() != mean.size())
      throw DimensionError("gaussian_potential: position has wrong dimension");
    double u = 0.0;
    for (std::size_t i = 0; i < q.size(); ++i) {
      const double d = q[i] - mean[i];
      u += precision[i] * d * d;
    }
    return 0.5 * u;
  };
}

math::GradientFn gaussian_gradient(Vector mean, Vector precision) {
  check_gaussian(mean, precision);
  return [mean = std::move(mean), precision = std::move(precision)](const Vector &q) {
    if (q.size() != mean.size())
      throw DimensionError("gaussian_gradient: position has wrong dimension");
    Vector g(q.size());
    for (std::size_t i = 0; i < q.size(); ++i)
      g[i] = precision[i] * (q[i] - mean[i]);
    return g;
  };
}

} // namespace markov::sample
