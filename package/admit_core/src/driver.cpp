#include "admit_core/driver.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "admit_core/feasibility.hpp"
#include "admit_core/log.hpp"
#include "admit_core/reporter.hpp"

namespace admit_core {

const char *to_string(RunStatus status) {
  switch (status) {
  case RunStatus::Completed:
    return "completed";
  case RunStatus::Failed:
    return "failed";
  case RunStatus::Finished:
    return "finished";
  case RunStatus::LimitReached:
    return "limit-reached";
  }
  return "?";
}

GameResult run_game(GameClient &client, AdmissionStrategy &strategy,
                    const RunConfig &cfg, DiagnosticsSink *sink) {
  const NewGame game = client.start_new_game(cfg.scenario);
  CurrentState state =
      init_state(game.constraints, game.statistics, game.venue_capacity);
  strategy.set_diagnostics(sink);

  if (cfg.log_summary)
    log_scenario_intro(game.constraints, game.statistics);
  if (sink) {
    GameStartedEvent ev;
    ev.game_id = game.game_id;
    ev.scenario = cfg.scenario;
    ev.strategy = strategy.name();
    ev.constraints = game.constraints;
    ev.statistics = game.statistics;
    sink->on_game_started(ev);
  }

  GameResult result;
  result.game_id = game.game_id;

  std::int64_t person_index = 0;
  std::optional<bool> decision;
  std::optional<Person> pending;

  while (true) {
    DecideAndNextResponse res;
    try {
      res = client.decide_and_next(game.game_id, person_index, decision);
    } catch (const GameFinished &e) {
      log_info("server reports game {} finished", game.game_id);
      result.status = RunStatus::Finished;
      result.reason = e.what();
      break;
    }

    // The server has applied the previous decision.
    if (pending && decision.value_or(false))
      record_local_admission(state, *pending);
    pending.reset();
    decision.reset();
    sync_counts(state, res.admitted_count, res.rejected_count);

    if (res.status == GameStatus::Completed) {
      result.status = RunStatus::Completed;
      break;
    }
    if (res.status == GameStatus::Failed) {
      result.status = RunStatus::Failed;
      result.reason = res.reason;
      break;
    }
    if (state.admitted_count >= game.venue_capacity ||
        state.rejected_count >= game.max_rejections) {
      log_info("limit reached: admitted={} rejected={}", state.admitted_count,
               state.rejected_count);
      result.status = RunStatus::LimitReached;
      break;
    }
    if (!res.next_person) {
      throw std::runtime_error("run_game: running game " + game.game_id +
                               " returned no candidate");
    }

    const Person &person = *res.next_person;
    if (sink) {
      const FeasibilityResult feas = evaluate_decision_feasibility(
          state, state.statistics, nullptr, false, cfg.safety);
      sink->on_state_update(StateUpdateEvent{state, feas});
    }

    const Decision d = strategy.decide(state, person);
    ++result.decisions;
    if (sink)
      sink->on_decision(
          DecisionEvent{person, d, state.admitted_count, state.rejected_count});

    decision = d.accept;
    person_index = person.index;
    pending = person;
  }

  result.admitted = state.admitted_count;
  result.rejected = state.rejected_count;
  result.all_minima_met = all_minima_met(compute_deficits(state));
  result.final_state = std::move(state);

  if (sink) {
    GameCompletedEvent ev;
    ev.game_id = result.game_id;
    ev.status = to_string(result.status);
    ev.reason = result.reason;
    ev.admitted_count = result.admitted;
    ev.rejected_count = result.rejected;
    ev.success = result.success();
    sink->on_game_completed(ev);
  }
  if (cfg.log_summary)
    log_final_summary(result);
  strategy.set_diagnostics(nullptr);
  return result;
}

} // namespace admit_core
