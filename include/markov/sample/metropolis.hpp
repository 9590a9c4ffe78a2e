#pragma once
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <markov/sample/proposal.hpp>
#include <markov/sample/targets.hpp>

namespace markov::sample {

// Closed interval of admissible states.
struct Space {
  double lo = -std::numeric_limits<double>::infinity();
  double hi = std::numeric_limits<double>::infinity();

  bool contains(double x) const { return x >= lo && x <= hi; }
};

using JumpPtr = std::shared_ptr<const JumpDistribution>;

struct MetropolisConfig {
  DensityFn density;
  std::size_t chain = 5000;
  double theta_init = 0.5;
  JumpPtr jump = default_jump();
  Space space{};
  std::size_t burnin = 0;
  std::optional<std::uint64_t> seed;

  MetropolisConfig() = default;
  explicit MetropolisConfig(DensityFn d) : density(std::move(d)) {}
};

// Value of one keyword update. An optional seed covers the full unsigned
// range; an empty one clears the seed.
using SeedValue = std::optional<std::uint64_t>;
using ConfigValue =
    std::variant<std::int64_t, double, Space, JumpPtr, DensityFn, SeedValue>;
using ConfigUpdates = std::vector<std::pair<std::string, ConfigValue>>;

// Copy of base with the updates applied in order. Recognised keys are
// density, chain, theta_init, jumpdist, space, burnin and seed.
MetropolisConfig updated(MetropolisConfig base, const ConfigUpdates &updates);

// Throws ConfigurationError when the configuration cannot produce a chain.
void validate(const MetropolisConfig &config);

struct MetropolisResult {
  std::vector<double> chain;
  double acceptance_rate{0.0};
};

// Random-walk Metropolis chain of config.chain states starting at
// config.theta_init, with the first config.burnin states dropped.
std::vector<double> run(const MetropolisConfig &config);

MetropolisResult run_with_stats(const MetropolisConfig &config);

} // namespace markov::sample
