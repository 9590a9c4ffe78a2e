#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <mutex>
#include <string>
#include <string_view>

namespace markov::log {

enum class Level : int { debug = 1, info = 2, warn = 3, error = 4, off = 6 };

inline std::string_view to_string(Level lv) {
  switch (lv) {
  case Level::debug:
    return "D";
  case Level::info:
    return "I";
  case Level::warn:
    return "W";
  case Level::error:
    return "E";
  default:
    return "O";
  }
}

// Accepts "debug", "info", "warn", "error" or "off"; throws ConfigurationError
// for anything else.
Level parse_level(std::string_view name);

class Logger {
public:
  static Logger &instance() {
    static Logger L;
    return L;
  }

  void set_level(Level lv) {
    level_.store(lv, std::memory_order_relaxed);
  }

  Level level() const {
    return level_.load(std::memory_order_relaxed);
  }

  // true when a message at lv would be written
  bool enabled(Level lv) const {
    return lv >= level();
  }

  template <class... Args>
  void log(Level lv, std::string_view fmt, Args &&...args) {
    log_impl(lv, fmt, std::forward<Args>(args)...);
  }

private:
  std::atomic<Level> level_{Level::info}; // default INFO
  std::mutex mu_;

  template <class... Args>
  void log_impl(Level lv, std::string_view fmt, Args &&...args) {
    if (!enabled(lv))
      return;

    // timestamp (HH:MM:SS)
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char tbuf[9];
    std::strftime(tbuf, sizeof(tbuf), "%H:%M:%S", &tm);

    std::string body = std::vformat(fmt, std::make_format_args(args...));
    std::string line = std::format("[{} {}] {}\n", tbuf, to_string(lv), body);

    std::scoped_lock lk(mu_);
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
};

// convenience macros
#define MLOG_DEBUG(...)                                                        \
  ::markov::log::Logger::instance().log(::markov::log::Level::debug,           \
                                        __VA_ARGS__)
#define MLOG_INFO(...)                                                         \
  ::markov::log::Logger::instance().log(::markov::log::Level::info,            \
                                        __VA_ARGS__)
#define MLOG_WARN(...)                                                         \
  ::markov::log::Logger::instance().log(::markov::log::Level::warn,            \
                                        __VA_ARGS__)
#define MLOG_ERROR(...)                                                        \
  ::markov::log::Logger::instance().log(::markov::log::Level::error,           \
                                        __VA_ARGS__)

} // namespace markov::log
