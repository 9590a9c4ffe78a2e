#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <markov/core/errors.hpp>
#include <markov/log/logger.hpp>
#include <markov/sample/metropolis.hpp>

namespace markov::sample {

namespace {

[[noreturn]] void config_error(const std::string &msg) {
  MLOG_ERROR("{}", msg);
  throw ConfigurationError(msg);
}

std::size_t as_count(const std::string &key, const ConfigValue &value) {
  const auto *n = std::get_if<std::int64_t>(&value);
  if (!n)
    config_error("keyword argument \"" + key + "\" must be an integer");
  if (*n < 0)
    config_error("keyword argument \"" + key + "\" must be non-negative");
  return static_cast<std::size_t>(*n);
}

double as_real(const std::string &key, const ConfigValue &value) {
  if (const auto *d = std::get_if<double>(&value))
    return *d;
  if (const auto *n = std::get_if<std::int64_t>(&value))
    return static_cast<double>(*n);
  config_error("keyword argument \"" + key + "\" must be a number");
}

template <class T>
const T &as(const std::string &key, const ConfigValue &value, const char *what) {
  const auto *v = std::get_if<T>(&value);
  if (!v)
    config_error("keyword argument \"" + key + "\" must be " + what);
  return *v;
}

double evaluate_density(const DensityFn &density, double theta) {
  const double d = density(theta);
  if (std::isnan(d) || d < 0.0) {
    MLOG_ERROR("density returned {} at theta={}", d, theta);
    throw ConfigurationError("density must return a non-negative real");
  }
  return d;
}

} // namespace

MetropolisConfig updated(MetropolisConfig base, const ConfigUpdates &updates) {
  for (const auto &[key, value] : updates) {
    if (key == "density") {
      base.density = as<DensityFn>(key, value, "a function");
    } else if (key == "chain") {
      base.chain = as_count(key, value);
    } else if (key == "theta_init") {
      base.theta_init = as_real(key, value);
    } else if (key == "jumpdist") {
      base.jump = as<JumpPtr>(key, value, "a jump distribution");
    } else if (key == "space") {
      base.space = as<Space>(key, value, "a [lo, hi] interval");
    } else if (key == "burnin") {
      base.burnin = as_count(key, value);
    } else if (key == "seed") {
      if (const auto *seed = std::get_if<SeedValue>(&value))
        base.seed = *seed;
      else
        base.seed = static_cast<std::uint64_t>(as_count(key, value));
    } else {
      config_error("keyword argument \"" + key + "\" not supported");
    }
  }
  return base;
}

void validate(const MetropolisConfig &config) {
  if (!config.density)
    config_error("density must be a function");
  if (!config.jump)
    config_error("jump distribution must be set");
  if (config.chain < 1)
    config_error("chain length must be at least 1");
  if (config.burnin >= config.chain)
    config_error("burnin must be smaller than the chain length");
  if (std::isnan(config.space.lo) || std::isnan(config.space.hi) ||
      config.space.lo > config.space.hi)
    config_error("space must satisfy lo <= hi");
  if (!config.space.contains(config.theta_init))
    config_error("theta_init must lie inside space");
}

MetropolisResult run_with_stats(const MetropolisConfig &config) {
  validate(config);

  MLOG_DEBUG("Metropolis: chain={} burnin={} theta_init={} space=[{}, {}]",
             config.chain, config.burnin, config.theta_init, config.space.lo,
             config.space.hi);

  Rng rng = Rng::from(config.seed);

  std::vector<double> chain(config.chain);
  double theta_cur = config.theta_init;
  // empty after a forced move out of a zero-density state
  std::optional<double> density_cur = evaluate_density(config.density, theta_cur);
  chain[0] = theta_cur;

  std::size_t n_accept = 0;

  for (std::size_t i = 1; i < config.chain; ++i) {
    const double theta_pro = theta_cur + config.jump->sample(rng);

    double p_move = 0.0;
    std::optional<double> density_pro;
    if (config.space.contains(theta_pro)) {
      if (!density_cur)
        density_cur = evaluate_density(config.density, theta_cur);

      if (*density_cur == 0.0) {
        // leave a zero-density state unconditionally
        p_move = 1.0;
      } else {
        density_pro = evaluate_density(config.density, theta_pro);
        p_move = std::min(1.0, *density_pro / *density_cur);
      }
    }

    // drawn for rejected proposals too, so the stream layout never depends
    // on the domain
    const double u = rng.uniform();

    if (p_move > 0.0 && u <= p_move) {
      theta_cur = theta_pro;
      density_cur = density_pro;
      ++n_accept;
    }
    chain[i] = theta_cur;
  }

  MetropolisResult result;
  result.acceptance_rate =
      (config.chain > 1) ? static_cast<double>(n_accept) / static_cast<double>(config.chain - 1) : 0.0;

  MLOG_DEBUG("Metropolis: acceptance rate {:.4f}", result.acceptance_rate);

  chain.erase(chain.begin(), chain.begin() + static_cast<std::ptrdiff_t>(config.burnin));
  result.chain = std::move(chain);
  return result;
}

std::vector<double> run(const MetropolisConfig &config) {
  return run_with_stats(config).chain;
}

} // namespace markov::sample
