#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "admit_core/log.hpp"
#include "admit_core/strategy.hpp"

namespace admit_core {

// Settings of the admit_sim front end. Each field has an environment
// variable; unset variables keep the default.
//
//   ADMIT_SCENARIO        scenario id (1)
//   ADMIT_STRATEGY        strategy name (paced-feasible)
//   ADMIT_RUNS            games to play (1)
//   ADMIT_SEED            simulator / rounding seed (42)
//   ADMIT_EXPECTED_TOTAL  expected arrivals for the scaled LP (8000)
//   ADMIT_LOG_LEVEL       debug | info | warn | error | off (info)
struct AppConfig {
  int scenario{1};
  StrategyKind strategy{StrategyKind::PacedFeasible};
  int runs{1};
  std::uint64_t seed{42};
  std::optional<double> expected_total;
  LogLevel log_level{LogLevel::Info};
};

using EnvLookup = std::function<const char *(const char *)>;

// Throws std::invalid_argument naming the variable on a malformed value.
AppConfig load_app_config(const EnvLookup &lookup);
AppConfig load_app_config();

// Preset of the chosen strategy with the app-level overrides applied.
StrategyConfig strategy_config(const AppConfig &app);

} // namespace admit_core
