#include <cstdint>
#include <exception>
#include <stdexcept>

#include <fmt/format.h>

#include "admit_core/client.hpp"
#include "admit_core/config.hpp"
#include "admit_core/diagnostics.hpp"
#include "admit_core/driver.hpp"
#include "admit_core/log.hpp"
#include "admit_core/simulator.hpp"
#include "admit_core/strategy.hpp"

using namespace admit_core;

int main() {
  AppConfig app;
  try {
    app = load_app_config();
  } catch (const std::invalid_argument &e) {
    fmt::print(stderr, "[Error] {}\n", e.what());
    return 2;
  }
  set_log_level(app.log_level);

  if (!GameSimulator(app.seed).has_scenario(app.scenario)) {
    log_error("scenario {} is not available in the simulator", app.scenario);
    return 2;
  }

  const StrategyConfig base_cfg = strategy_config(app);
  log_info("admit_sim: scenario {} strategy {} runs {} seed {}", app.scenario,
           to_string(app.strategy), app.runs, app.seed);

  LoggingSink sink;
  int successes = 0;
  long long total_rejected = 0;
  for (int run = 0; run < app.runs; ++run) {
    const std::uint64_t run_seed =
        mix_seed(app.seed, static_cast<std::uint64_t>(run));
    StrategyConfig cfg = base_cfg;
    cfg.primal.seed = run_seed;

    try {
      SimulatedGameClient sim(run_seed);
      RetryingGameClient client(sim);
      auto strategy = make_strategy(app.strategy, cfg);

      RunConfig rc;
      rc.scenario = app.scenario;
      rc.log_summary = app.runs == 1 || log_enabled(LogLevel::Debug);
      rc.safety = cfg.safety;
      const GameResult result = run_game(client, *strategy, rc, &sink);

      total_rejected += result.rejected;
      if (result.success())
        ++successes;
      log_info("run {}/{}: {} admitted={} rejected={} minima {}", run + 1,
               app.runs, to_string(result.status), result.admitted,
               result.rejected, result.all_minima_met ? "met" : "NOT met");
    } catch (const std::exception &e) {
      log_error("run {}/{} aborted: {}", run + 1, app.runs, e.what());
      return 1;
    }
  }

  log_info("{}/{} runs met every minimum, mean rejections {:.1f}", successes,
           app.runs, static_cast<double>(total_rejected) / app.runs);
  return successes == app.runs ? 0 : 1;
}
