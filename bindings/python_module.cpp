#include <markov/core/errors.hpp>
#include <markov/log/logger.hpp>
#include <markov/math/gradient.hpp>
#include <markov/math/rng.hpp>
#include <markov/sample/hamiltonian.hpp>
#include <markov/sample/metropolis.hpp>
#include <markov/sample/proposal.hpp>

#include <limits>

#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace markov::sample;
using markov::math::Rng;

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Python-facing chain object: keeps its configuration between calls, so a
// bare metropolis() reruns the previous setup.
struct PyMCMC {
  MetropolisConfig config;
};

DensityFn to_density(const py::object &f) {
  if (!PyCallable_Check(f.ptr())) {
    MLOG_ERROR("dfunc is not callable");
    throw markov::ConfigurationError(
        "dfunc must be a function. recreate the object with a valid density function");
  }
  return f.cast<DensityFn>();
}

const char *expected_type(const std::string &key) {
  if (key == "chain" || key == "burnin")
    return "an integer";
  if (key == "theta_init")
    return "a number";
  if (key == "jumpdist")
    return "a jump distribution";
  if (key == "space")
    return "a [lo, hi] interval";
  return "None or a non-negative integer";
}

ConfigValue convert_value(const std::string &key, const py::handle &value) {
  if (key == "density")
    return to_density(py::reinterpret_borrow<py::object>(value));
  if (key == "chain" || key == "burnin")
    return value.cast<std::int64_t>();
  if (key == "theta_init")
    return value.cast<double>();
  if (key == "jumpdist")
    return JumpPtr(value.cast<std::shared_ptr<JumpDistribution>>());
  if (key == "space") {
    auto [lo, hi] = value.cast<std::pair<double, double>>();
    return Space{lo, hi};
  }
  if (key == "seed") {
    if (value.is_none())
      return SeedValue{};
    return SeedValue{value.cast<std::uint64_t>()};
  }
  // rejected by updated()
  return SeedValue{};
}

// Python value of one keyword update; conversion failures for known keys
// surface as ConfigurationError like the ones raised by updated().
ConfigValue to_config_value(const std::string &key, const py::handle &value) {
  try {
    return convert_value(key, value);
  } catch (const py::cast_error &) {
    const std::string msg =
        "keyword argument \"" + key + "\" must be " + expected_type(key);
    MLOG_ERROR("{}", msg);
    throw markov::ConfigurationError(msg);
  }
}

} // namespace

PYBIND11_MODULE(markov_mc, m) {
  m.doc() = "Python bindings for the markov-mc Metropolis and HMC samplers";

  py::register_exception<markov::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
  py::register_exception<markov::DimensionError>(m, "DimensionError", PyExc_ValueError);

  m.def("set_log_level", [](const std::string &name) {
    markov::log::Logger::instance().set_level(markov::log::parse_level(name));
  }, py::arg("level"), "Set the library log level (debug, info, warn, error, off)");

  // Rng bindings
  py::class_<Rng>(m, "Rng")
      .def(py::init<uint64_t>(), py::arg("seed") = std::random_device{}(),
           "Initialize the RNG with an optional seed")
      .def("uniform", &Rng::uniform,
           "Generate a uniform random number in [0, 1)")
      .def("normal", &Rng::normal, py::arg("mean"), py::arg("stddev"),
           "Generate a normally distributed random number with given mean and "
           "stddev");

  // Jump distributions
  py::class_<JumpDistribution, std::shared_ptr<JumpDistribution>>(m, "JumpDistribution")
      .def("rvs", &JumpDistribution::sample, py::arg("rng"),
           "Draw one increment using the given Rng")
      .def("pdf", &JumpDistribution::pdf, py::arg("x"));

  py::class_<NormalJump, JumpDistribution, std::shared_ptr<NormalJump>>(m, "NormalJump")
      .def(py::init<double, double>(), py::arg("loc") = 0.0, py::arg("scale") = 0.2);

  py::class_<UniformJump, JumpDistribution, std::shared_ptr<UniformJump>>(m, "UniformJump")
      .def(py::init<double, double>(), py::arg("lo"), py::arg("hi"));

  // Metropolis
  py::class_<PyMCMC>(m, "MCMC")
      .def(py::init([](const py::object &dfunc, const py::object &chain,
                       const py::object &theta_init, const py::object &jumpdist,
                       const py::object &space, const py::object &burnin,
                       const py::object &seed) {
             ConfigUpdates u{{"chain", to_config_value("chain", chain)},
                             {"theta_init", to_config_value("theta_init", theta_init)},
                             {"space", to_config_value("space", space)},
                             {"burnin", to_config_value("burnin", burnin)},
                             {"seed", to_config_value("seed", seed)}};
             if (!jumpdist.is_none())
               u.emplace_back("jumpdist", to_config_value("jumpdist", jumpdist));

             PyMCMC self;
             self.config = updated(MetropolisConfig(to_density(dfunc)), u);
             return self;
           }),
           py::arg("dfunc"), py::arg("chain") = 5000, py::arg("theta_init") = 0.5,
           py::arg("jumpdist") = py::none(),
           py::arg("space") = py::make_tuple(-kInf, kInf),
           py::arg("burnin") = 0, py::arg("seed") = py::none())
      .def("metropolis", [](PyMCMC &self, py::args args, py::kwargs kwargs) {
             ConfigUpdates u;
             for (const auto &a : args)
               u.emplace_back("density", to_density(py::reinterpret_borrow<py::object>(a)));
             for (const auto &[k, v] : kwargs) {
               const std::string key = py::str(k);
               u.emplace_back(key, to_config_value(key, v));
             }
             self.config = updated(self.config, u);
             return run(self.config);
           },
           "Run the Metropolis chain, first applying any positional density or "
           "keyword updates to the stored configuration")
      .def_property_readonly("chain", [](const PyMCMC &s) { return s.config.chain; })
      .def_property_readonly("theta_init", [](const PyMCMC &s) { return s.config.theta_init; })
      .def_property_readonly("burnin", [](const PyMCMC &s) { return s.config.burnin; })
      .def_property_readonly("space", [](const PyMCMC &s) {
        return std::make_pair(s.config.space.lo, s.config.space.hi);
      })
      .def_property_readonly("seed", [](const PyMCMC &s) { return s.config.seed; });

  // Hamiltonian Monte Carlo
  py::enum_<SeedPolicy>(m, "SeedPolicy")
      .value("split", SeedPolicy::split)
      .value("shared", SeedPolicy::shared)
      .export_values();

  py::class_<HmcTransition>(m, "HmcTransition")
      .def_readonly("position", &HmcTransition::position)
      .def_readonly("accepted", &HmcTransition::accepted)
      .def_readonly("acceptance_probability", &HmcTransition::acceptance_probability)
      .def_readonly("current_hamiltonian", &HmcTransition::current_hamiltonian)
      .def_readonly("proposed_hamiltonian", &HmcTransition::proposed_hamiltonian);

  py::class_<HmcChain>(m, "HmcChain")
      .def_readonly("positions", &HmcChain::positions)
      .def_readonly("acceptance_rate", &HmcChain::acceptance_rate);

  auto make_config = [](const PotentialFn &U, const std::optional<GradientFn> &grad,
                        double eps, std::size_t L, SeedPolicy policy) {
    HmcConfig cfg(U, grad ? *grad : markov::math::central_difference(U), eps, L);
    cfg.seed_policy = policy;
    return cfg;
  };

  m.def("hmc_transition",
        [make_config](const PotentialFn &U, double eps, std::size_t L, const Vector &q,
                      std::uint64_t seed, const std::optional<GradientFn> &grad,
                      SeedPolicy policy) {
          return transition(make_config(U, grad, eps, L, policy), q, seed);
        },
        py::arg("U"), py::arg("eps"), py::arg("L"), py::arg("current_q"), py::arg("seed"),
        py::arg("grad") = py::none(), py::arg("seed_policy") = SeedPolicy::split);

  m.def("HMC",
        [make_config](const PotentialFn &U, double eps, std::size_t L, const Vector &q,
                      std::uint64_t seed, const std::optional<GradientFn> &grad,
                      SeedPolicy policy) {
          return step(make_config(U, grad, eps, L, policy), q, seed);
        },
        py::arg("U"), py::arg("eps"), py::arg("L"), py::arg("current_q"), py::arg("seed"),
        py::arg("grad") = py::none(), py::arg("seed_policy") = SeedPolicy::split,
        "One HMC transition; the gradient defaults to central differences of U");

  m.def("hmc_chain",
        [make_config](const PotentialFn &U, double eps, std::size_t L, const Vector &q,
                      std::size_t n, std::uint64_t seed,
                      const std::optional<GradientFn> &grad) {
          return sample_chain(make_config(U, grad, eps, L, SeedPolicy::split), q, n, seed);
        },
        py::arg("U"), py::arg("eps"), py::arg("L"), py::arg("initial_q"), py::arg("n"),
        py::arg("seed"), py::arg("grad") = py::none());

  m.def("hmc_chains_parallel",
        [make_config](const PotentialFn &U, double eps, std::size_t L,
                      const std::vector<Vector> &initials, std::size_t n,
                      std::uint64_t seed, const std::optional<GradientFn> &grad,
                      std::size_t n_threads) {
          return sample_chains_parallel(make_config(U, grad, eps, L, SeedPolicy::split),
                                        initials, n, seed, n_threads);
        },
        py::arg("U"), py::arg("eps"), py::arg("L"), py::arg("initials"), py::arg("n"),
        py::arg("seed"), py::arg("grad") = py::none(), py::arg("n_threads") = 0,
        py::call_guard<py::gil_scoped_release>());
}
