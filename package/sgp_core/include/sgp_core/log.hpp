#pragma once

#include <atomic>
#include <cstdio>
#include <utility>

#include <fmt/format.h>

namespace sgp_core {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Process-wide; sessions on other threads read it while logging.
inline std::atomic<LogLevel> &log_threshold() {
  static std::atomic<LogLevel> level{LogLevel::Info};
  return level;
}

inline void set_log_level(LogLevel level) {
  log_threshold().store(level, std::memory_order_relaxed);
}

inline LogLevel log_level() {
  return log_threshold().load(std::memory_order_relaxed);
}

inline bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && level >= log_level();
}

// "[Level] message" on stdout, or stderr for Warn and above.
template <typename... Args>
void log(LogLevel level, fmt::format_string<Args...> f, Args &&...args) {
  if (!log_enabled(level))
    return;
  static const char *const names[] = {"Debug", "Info", "Warn", "Error"};
  std::FILE *out = level >= LogLevel::Warn ? stderr : stdout;
  fmt::print(out, "[{}] {}\n", names[static_cast<int>(level)],
             fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args &&...args) {
  log(LogLevel::Debug, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args &&...args) {
  log(LogLevel::Info, f, std::forward<Args>(args)...);
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args &&...args) {
  log(LogLevel::Warn, f, std::forward<Args>(args)...);
}

} // namespace sgp_core
