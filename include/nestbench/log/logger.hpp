#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nestbench/util/string.hpp>

namespace nestbench::log {

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

// Accepts debug|info|warn|error|off in any case.
inline std::optional<Level> parse_level(std::string_view name) {
  const std::string s = util::to_lower(name);
  if (s == "debug")
    return Level::debug;
  if (s == "info")
    return Level::info;
  if (s == "warn" || s == "warning")
    return Level::warn;
  if (s == "error")
    return Level::error;
  if (s == "off")
    return Level::off;
  return std::nullopt;
}

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

  template <class... Args>
  void log(Level lv, std::string_view fmt, Args &&...args) {
    log_impl(lv, fmt, std::forward<Args>(args)...);
  }

private:
  std::atomic<Level> level_{Level::info}; // default INFO
  std::mutex mu_;

  Logger() {
    if (const char *env = std::getenv("NESTBENCH_LOG_LEVEL")) {
      if (auto lv = parse_level(env))
        level_.store(*lv, std::memory_order_relaxed);
    }
  }

  template <class... Args>
  void log_impl(Level lv, std::string_view fmt, Args &&...args) {
    if (lv < level())
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
#define NBLOG_DEBUG(...)                                                       \
  ::nestbench::log::Logger::instance().log(::nestbench::log::Level::debug,     \
                                           __VA_ARGS__)
#define NBLOG_INFO(...)                                                        \
  ::nestbench::log::Logger::instance().log(::nestbench::log::Level::info,      \
                                           __VA_ARGS__)
#define NBLOG_WARN(...)                                                        \
  ::nestbench::log::Logger::instance().log(::nestbench::log::Level::warn,      \
                                           __VA_ARGS__)
#define NBLOG_ERROR(...)                                                       \
  ::nestbench::log::Logger::instance().log(::nestbench::log::Level::error,     \
                                           __VA_ARGS__)

} // namespace nestbench::log
