#include "admit_core/config.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace admit_core {

namespace {

[[noreturn]] void bad_value(const char *name, const std::string &value,
                            const char *expected) {
  throw std::invalid_argument(
      fmt::format("{}='{}' is not {}", name, value, expected));
}

long long parse_integer(const char *name, const std::string &value) {
  std::size_t used = 0;
  long long out = 0;
  try {
    out = std::stoll(value, &used);
  } catch (const std::logic_error &) {
    bad_value(name, value, "an integer");
  }
  if (used != value.size())
    bad_value(name, value, "an integer");
  return out;
}

double parse_number(const char *name, const std::string &value) {
  std::size_t used = 0;
  double out = 0.0;
  try {
    out = std::stod(value, &used);
  } catch (const std::logic_error &) {
    bad_value(name, value, "a number");
  }
  if (used != value.size() || !std::isfinite(out))
    bad_value(name, value, "a number");
  return out;
}

} // namespace

AppConfig load_app_config(const EnvLookup &lookup) {
  AppConfig app;
  auto get = [&](const char *name) -> std::optional<std::string> {
    const char *v = lookup ? lookup(name) : nullptr;
    if (v == nullptr || *v == '\0')
      return std::nullopt;
    return std::string(v);
  };

  if (auto v = get("ADMIT_SCENARIO")) {
    const long long s = parse_integer("ADMIT_SCENARIO", *v);
    if (s < 1 || s > 1000)
      bad_value("ADMIT_SCENARIO", *v, "a scenario id");
    app.scenario = static_cast<int>(s);
  }
  if (auto v = get("ADMIT_STRATEGY")) {
    try {
      app.strategy = parse_strategy_kind(*v);
    } catch (const std::invalid_argument &) {
      bad_value("ADMIT_STRATEGY", *v, "a known strategy");
    }
  }
  if (auto v = get("ADMIT_RUNS")) {
    const long long runs = parse_integer("ADMIT_RUNS", *v);
    if (runs < 1 || runs > 100000)
      bad_value("ADMIT_RUNS", *v, "a run count in [1, 100000]");
    app.runs = static_cast<int>(runs);
  }
  if (auto v = get("ADMIT_SEED")) {
    const long long seed = parse_integer("ADMIT_SEED", *v);
    if (seed < 0)
      bad_value("ADMIT_SEED", *v, "a non-negative integer");
    app.seed = static_cast<std::uint64_t>(seed);
  }
  if (auto v = get("ADMIT_EXPECTED_TOTAL")) {
    const double total = parse_number("ADMIT_EXPECTED_TOTAL", *v);
    if (total <= 0.0)
      bad_value("ADMIT_EXPECTED_TOTAL", *v, "a positive number");
    app.expected_total = total;
  }
  if (auto v = get("ADMIT_LOG_LEVEL")) {
    try {
      app.log_level = parse_log_level(*v);
    } catch (const std::invalid_argument &) {
      bad_value("ADMIT_LOG_LEVEL", *v, "a log level");
    }
  }
  return app;
}

AppConfig load_app_config() {
  return load_app_config([](const char *name) { return std::getenv(name); });
}

StrategyConfig strategy_config(const AppConfig &app) {
  StrategyConfig cfg = StrategyConfig::defaults_for(app.strategy);
  if (app.expected_total)
    cfg.lp.expected_total_arrivals = *app.expected_total;
  cfg.primal.seed = app.seed;
  return cfg;
}

} // namespace admit_core
