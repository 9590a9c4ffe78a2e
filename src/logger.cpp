#include <markov/core/errors.hpp>
#include <markov/log/logger.hpp>

namespace markov::log {

Level parse_level(std::string_view name) {
  if (name == "debug")
    return Level::debug;
  if (name == "info")
    return Level::info;
  if (name == "warn")
    return Level::warn;
  if (name == "error")
    return Level::error;
  if (name == "off")
    return Level::off;
  throw ConfigurationError(std::format("unknown log level \"{}\"", name));
}

} // namespace markov::log
