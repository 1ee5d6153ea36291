#pragma once

#include <string>
#include <utility>

#include <fmt/format.h>

namespace admit_core {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

LogLevel log_level();
void set_log_level(LogLevel level);

// Accepts "debug", "info", "warn", "error", "off" (case-insensitive).
LogLevel parse_log_level(const std::string &name);
const char *to_string(LogLevel level);

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(log_level()) &&
         level != LogLevel::Off;
}

namespace detail {
void write_line(LogLevel level, const std::string &msg);
} // namespace detail

template <typename... Args>
void log_debug(fmt::format_string<Args...> fmt_str, Args &&...args) {
  if (log_enabled(LogLevel::Debug))
    detail::write_line(LogLevel::Debug,
                       fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> fmt_str, Args &&...args) {
  if (log_enabled(LogLevel::Info))
    detail::write_line(LogLevel::Info,
                       fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> fmt_str, Args &&...args) {
  if (log_enabled(LogLevel::Warn))
    detail::write_line(LogLevel::Warn,
                       fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> fmt_str, Args &&...args) {
  if (log_enabled(LogLevel::Error))
    detail::write_line(LogLevel::Error,
                       fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace admit_core
