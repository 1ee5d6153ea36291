#pragma once

#include <string>

#include "admit_core/client.hpp"
#include "admit_core/diagnostics.hpp"
#include "admit_core/state.hpp"
#include "admit_core/strategy.hpp"

namespace admit_core {

struct RunConfig {
  int scenario{1};
  bool log_summary{true}; // scenario intro and final summary at Info
  // Schedule for the state updates sent to the sink; keep it equal to the
  // strategy's StrategyConfig::safety.
  SafetySchedule safety{};
};

enum class RunStatus {
  Completed,    // venue filled
  Failed,       // rejection ceiling hit on the server
  Finished,     // server refused a decision for an ended game
  LimitReached  // local counts hit capacity or the ceiling first
};

const char *to_string(RunStatus status);

struct GameResult {
  RunStatus status{RunStatus::Completed};
  std::string game_id;
  std::string reason;
  int admitted{0};
  int rejected{0};
  bool all_minima_met{false};
  int decisions{0};
  CurrentState final_state;

  // Venue full with every minimum met.
  bool success() const {
    return all_minima_met && status != RunStatus::Failed &&
           admitted >= final_state.venue_capacity;
  }
};

// Plays one game: asks the strategy about each candidate and reports the
// decision with the next request. Totals come from the server on every
// reply; attribute tallies for an admitted candidate are added once the
// server has acknowledged the decision.
GameResult run_game(GameClient &client, AdmissionStrategy &strategy,
                    const RunConfig &cfg = {}, DiagnosticsSink *sink = nullptr);

} // namespace admit_core
