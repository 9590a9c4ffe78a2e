#pragma once
#include <stdexcept>
#include <string>

namespace markov {

// Invalid sampler or distribution setup. Raised before any chain iteration
// starts, except for a density that turns negative mid-chain.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Vectors or matrices whose dimensions do not agree.
class DimensionError : public std::invalid_argument {
public:
  explicit DimensionError(const std::string &what)
      : std::invalid_argument(what) {}
};

} // namespace markov
