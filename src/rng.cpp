#include <cmath>
#include <numbers>
#include <markov/core/errors.hpp>
#include <markov/math/rng.hpp>

namespace markov::math {

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t stream) {
  std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (stream + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

Rng Rng::from(std::optional<std::uint64_t> seed) {
  if (seed)
    return Rng(*seed);
  return Rng();
}

double Rng::uniform() {
  return uni(gen);
}

double Rng::normal(const double mean, const double stddev) {
  return standard_normal() * stddev + mean;
}

double Rng::standard_normal() {
  // 1 - u keeps the log argument in (0, 1]
  const double u1 = 1.0 - uniform();
  const double u2 = uniform();
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
}

Vector Rng::standard_normal_vector(std::size_t dim) {
  Vector z(dim);
  for (auto &x : z)
    x = standard_normal();
  return z;
}

Vector Rng::multivariate_normal(const Vector &mean, const Matrix &cov) {
  if (cov.rows != mean.size() || cov.cols != mean.size())
    throw DimensionError("multivariate_normal: covariance does not match mean dimension");

  const Matrix L = cholesky(cov);
  const Vector z = standard_normal_vector(mean.size());

  Vector x = mean;
  for (std::size_t i = 0; i < mean.size(); ++i) {
    for (std::size_t k = 0; k <= i; ++k)
      x[i] += L(i, k) * z[k];
  }
  return x;
}

} // namespace markov::math
