#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include <markov/math/gradient.hpp>
#include <markov/math/rng.hpp>

namespace markov::sample {

using markov::math::GradientFn;
using markov::math::PotentialFn;
using markov::math::Vector;

// How the momentum and acceptance generators are derived from the seed of
// one transition.
enum class SeedPolicy {
  split,  // mix_seed(seed, 0) for momentum, mix_seed(seed, 1) for acceptance
  shared, // both generators seeded with seed itself (correlated draws)
};

struct HmcConfig {
  PotentialFn potential;
  GradientFn gradient;
  double eps = 0.1;
  std::size_t leapfrog_steps = 10;
  SeedPolicy seed_policy = SeedPolicy::split;

  HmcConfig() = default;
  HmcConfig(PotentialFn U, GradientFn grad, double eps, std::size_t L)
      : potential(std::move(U)), gradient(std::move(grad)), eps(eps), leapfrog_steps(L) {}
};

void validate(const HmcConfig &config);

struct PhasePoint {
  Vector q;
  Vector p;
};

// L leapfrog steps of size eps from (q, p). A negative eps integrates
// backwards in time.
PhasePoint leapfrog(const GradientFn &gradient, Vector q, Vector p, double eps,
                    std::size_t L);

struct HmcTransition {
  Vector position;
  bool accepted{false};
  double acceptance_probability{0.0};
  double current_hamiltonian{0.0};
  double proposed_hamiltonian{0.0};
};

// One HMC transition from current_position. The returned position is either
// the end of the trajectory or current_position unchanged.
HmcTransition transition(const HmcConfig &config, const Vector &current_position,
                         std::uint64_t seed);

Vector step(const HmcConfig &config, const Vector &current_position, std::uint64_t seed);

Vector step(const PotentialFn &potential, const GradientFn &gradient, double eps,
            std::size_t leapfrog_steps, const Vector &current_position,
            std::uint64_t seed);

struct HmcChain {
  std::vector<Vector> positions;
  double acceptance_rate{0.0};
};

// n transitions from initial; transition i uses mix_seed(seed, i).
HmcChain sample_chain(const HmcConfig &config, const Vector &initial, std::size_t n,
                      std::uint64_t seed);

// Independent chains on worker threads, chain k seeded with mix_seed(seed, k).
// n_threads == 0 uses the hardware concurrency.
std::vector<HmcChain> sample_chains_parallel(const HmcConfig &config,
                                             const std::vector<Vector> &initials,
                                             std::size_t n, std::uint64_t seed,
                                             std::size_t n_threads = 0);

} // namespace markov::sample
