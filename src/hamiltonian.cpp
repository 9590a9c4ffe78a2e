#include <algorithm>
#include <cmath>
#include <thread>
#include <markov/core/errors.hpp>
#include <markov/core/workers.hpp>
#include <markov/log/logger.hpp>
#include <markov/sample/hamiltonian.hpp>

namespace markov::sample {

using markov::math::mix_seed;
using markov::math::Rng;

namespace {

[[noreturn]] void config_error(const char *msg) {
  MLOG_ERROR("{}", msg);
  throw ConfigurationError(msg);
}

Vector checked_gradient(const GradientFn &gradient, const Vector &q) {
  Vector g = gradient(q);
  if (g.size() != q.size()) {
    MLOG_ERROR("gradient returned dimension {} for a position of dimension {}",
               g.size(), q.size());
    throw DimensionError("gradient dimension does not match position");
  }
  return g;
}

double kinetic(const Vector &p) {
  return 0.5 * math::norm2(p);
}

} // namespace

void validate(const HmcConfig &config) {
  if (!config.potential)
    config_error("potential energy must be a function");
  if (!config.gradient)
    config_error("gradient must be a function");
  if (!(config.eps > 0.0) || !std::isfinite(config.eps))
    config_error("eps must be finite and > 0");
  if (config.leapfrog_steps < 1)
    config_error("leapfrog_steps must be at least 1");
}

PhasePoint leapfrog(const GradientFn &gradient, Vector q, Vector p, double eps,
                    std::size_t L) {
  if (q.size() != p.size())
    throw DimensionError("leapfrog: position and momentum differ in dimension");

  // half step for momentum at the start
  math::axpy(-eps / 2.0, checked_gradient(gradient, q), p);

  for (std::size_t l = 1; l < L; ++l) {
    math::axpy(eps, p, q);
    math::axpy(-eps, checked_gradient(gradient, q), p);
  }

  // last full position step and closing half step for momentum
  math::axpy(eps, p, q);
  math::axpy(-eps / 2.0, checked_gradient(gradient, q), p);

  return {std::move(q), std::move(p)};
}

HmcTransition transition(const HmcConfig &config, const Vector &current_position,
                         std::uint64_t seed) {
  validate(config);
  if (current_position.empty())
    config_error("current position must not be empty");

  const bool split = config.seed_policy == SeedPolicy::split;
  Rng momentum_rng(split ? mix_seed(seed, 0) : seed);
  Rng accept_rng(split ? mix_seed(seed, 1) : seed);

  const Vector current_p = momentum_rng.standard_normal_vector(current_position.size());

  PhasePoint end = leapfrog(config.gradient, current_position, current_p,
                            config.eps, config.leapfrog_steps);

  // negated so the proposal is its own inverse
  for (auto &x : end.p)
    x = -x;

  HmcTransition out;
  out.current_hamiltonian = config.potential(current_position) + kinetic(current_p);
  out.proposed_hamiltonian = config.potential(end.q) + kinetic(end.p);

  const double log_ratio = out.current_hamiltonian - out.proposed_hamiltonian;
  if (!std::isfinite(out.proposed_hamiltonian) || std::isnan(log_ratio))
    out.acceptance_probability = 0.0;
  else
    out.acceptance_probability = (log_ratio >= 0.0) ? 1.0 : std::exp(log_ratio);

  const double u = accept_rng.uniform();
  out.accepted = u < out.acceptance_probability;
  out.position = out.accepted ? std::move(end.q) : current_position;

  MLOG_DEBUG("HMC: H0={} H1={} alpha={} {}", out.current_hamiltonian,
             out.proposed_hamiltonian, out.acceptance_probability,
             out.accepted ? "accepted" : "rejected");

  return out;
}

Vector step(const HmcConfig &config, const Vector &current_position, std::uint64_t seed) {
  return transition(config, current_position, seed).position;
}

Vector step(const PotentialFn &potential, const GradientFn &gradient, double eps,
            std::size_t leapfrog_steps, const Vector &current_position,
            std::uint64_t seed) {
  return step(HmcConfig(potential, gradient, eps, leapfrog_steps), current_position, seed);
}

HmcChain sample_chain(const HmcConfig &config, const Vector &initial, std::size_t n,
                      std::uint64_t seed) {
  HmcChain chain;
  chain.positions.reserve(n);

  Vector q = initial;
  std::size_t n_accept = 0;
  for (std::size_t i = 0; i < n; ++i) {
    HmcTransition t = transition(config, q, mix_seed(seed, static_cast<std::uint64_t>(i)));
    if (t.accepted)
      ++n_accept;
    q = std::move(t.position);
    chain.positions.push_back(q);
  }

  chain.acceptance_rate = (n == 0) ? 0.0 : static_cast<double>(n_accept) / static_cast<double>(n);
  return chain;
}

std::vector<HmcChain> sample_chains_parallel(const HmcConfig &config,
                                             const std::vector<Vector> &initials,
                                             std::size_t n, std::uint64_t seed,
                                             std::size_t n_threads) {
  validate(config);

  const std::size_t n_chains = initials.size();
  std::vector<HmcChain> chains(n_chains);
  if (n_chains == 0)
    return chains;

  if (n_threads == 0)
    n_threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  if (n_threads > n_chains)
    n_threads = n_chains;

  MLOG_INFO("Running {} HMC chains of length {} on {} threads", n_chains, n, n_threads);

  run_workers(n_threads, [&](std::size_t t) {
    for (std::size_t k = t; k < n_chains; k += n_threads) {
      const std::uint64_t chain_seed = mix_seed(seed, static_cast<std::uint64_t>(k));
      MLOG_DEBUG("Thread {} running chain {} with seed {}", t, k, chain_seed);
      chains[k] = sample_chain(config, initials[k], n, chain_seed);
    }
  });

  return chains;
}

} // namespace markov::sample
