#include "admit_core/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace admit_core {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
} // namespace

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel parse_log_level(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "debug")
    return LogLevel::Debug;
  if (s == "info")
    return LogLevel::Info;
  if (s == "warn" || s == "warning")
    return LogLevel::Warn;
  if (s == "error")
    return LogLevel::Error;
  if (s == "off" || s == "none")
    return LogLevel::Off;
  throw std::invalid_argument("Unknown log level: " + name);
}

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "Debug";
  case LogLevel::Info:
    return "Info";
  case LogLevel::Warn:
    return "Warn";
  case LogLevel::Error:
    return "Error";
  case LogLevel::Off:
    return "Off";
  }
  return "?";
}

namespace detail {

void write_line(LogLevel level, const std::string &msg) {
  std::FILE *out = (level >= LogLevel::Warn) ? stderr : stdout;
  fmt::print(out, "[{}] {}\n", to_string(level), msg);
}

} // namespace detail

} // namespace admit_core
