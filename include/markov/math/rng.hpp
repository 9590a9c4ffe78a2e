#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <markov/math/vec.hpp>

namespace markov::math {

// SplitMix64 finaliser over (base, stream). Distinct streams of one base seed
// give statistically independent generators.
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t stream);

// Seeded pseudo-random source. Two instances built from the same seed yield
// identical sequences for identical call sequences.
struct Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> uni{0.0, 1.0};

  explicit Rng(std::uint64_t seed = std::random_device{}()) : gen(seed) {}

  // Entropy-seeded when seed is empty.
  static Rng from(std::optional<std::uint64_t> seed);

  double uniform();
  double normal(const double mean, const double stddev);
  double standard_normal();

  Vector standard_normal_vector(std::size_t dim);
  Vector multivariate_normal(const Vector &mean, const Matrix &cov);
};

} // namespace markov::math
