#include <cstdio>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <limits>
#include <memory>
#include <numeric>
#include <string>
#include <vector>

#include <markov/log/logger.hpp>
#include <markov/sample/hamiltonian.hpp>
#include <markov/sample/metropolis.hpp>
#include <markov/sample/targets.hpp>

using namespace markov::sample;

static double mean_of(const std::vector<double> &xs) {
  if (xs.empty())
    return 0.0;
  return std::accumulate(xs.begin(), xs.end(), 0.0) / static_cast<double>(xs.size());
}

int main(int argc, char **argv) {
  try {
    if (const char *lv = std::getenv("MARKOV_LOG_LEVEL"))
      markov::log::Logger::instance().set_level(markov::log::parse_level(lv));

    const std::uint64_t seed = (argc > 1) ? std::stoull(argv[1]) : 42;
    const std::size_t chain = (argc > 2) ? std::stoull(argv[2]) : 10000;

    // Gamma(2, loc=4, scale=5) restricted to [0, inf), mean 14
    MetropolisConfig mh(gamma_pdf(2.0, 4.0, 5.0));
    mh = updated(mh, {{"chain", static_cast<std::int64_t>(chain)},
                      {"jumpdist", JumpPtr(std::make_shared<NormalJump>(0.0, 2.0))},
                      {"space", Space{0.0, std::numeric_limits<double>::infinity()}},
                      {"theta_init", 5.0},
                      {"burnin", static_cast<std::int64_t>(chain / 10)},
                      {"seed", static_cast<std::int64_t>(seed)}});

    MetropolisResult res = run_with_stats(mh);
    printf("Metropolis  gamma(2, 4, 5): %zu draws, mean %.4f (exact 14), acceptance %.3f\n",
           res.chain.size(), mean_of(res.chain), res.acceptance_rate);

    // 2-D standard normal
    HmcConfig hmc(gaussian_potential({0.0, 0.0}, {1.0, 1.0}),
                  gaussian_gradient({0.0, 0.0}, {1.0, 1.0}), 0.1, 10);
    HmcChain hc = sample_chain(hmc, {1.0, -1.0}, chain, seed);

    std::vector<double> xs, ys;
    xs.reserve(hc.positions.size());
    ys.reserve(hc.positions.size());
    for (const auto &q : hc.positions) {
      xs.push_back(q[0]);
      ys.push_back(q[1]);
    }
    printf("HMC         N(0, I_2):      %zu draws, mean (%.4f, %.4f), acceptance %.3f\n",
           hc.positions.size(), mean_of(xs), mean_of(ys), hc.acceptance_rate);

  } catch (const std::exception &e) {
    MLOG_ERROR("{}", e.what());
    return 1;
  }

  return 0;
}
