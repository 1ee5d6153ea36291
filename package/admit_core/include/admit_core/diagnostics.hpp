#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "admit_core/decision.hpp"
#include "admit_core/feasibility.hpp"
#include "admit_core/state.hpp"

namespace admit_core {

struct GameStartedEvent {
  std::string game_id;
  int scenario{0};
  std::string strategy;
  std::vector<Constraint> constraints;
  AttributeStatistics statistics;
};

struct DecisionEvent {
  const Person &person;
  const Decision &decision;
  int admitted_count{0};
  int rejected_count{0};
};

struct StateUpdateEvent {
  const CurrentState &state;
  const FeasibilityResult &feasibility; // reject hypothesis for the state
};

struct ShadowPriceEvent {
  int processed{0};
  std::map<std::string, double> prices;
  std::map<std::string, double> slacks;
};

struct GameCompletedEvent {
  std::string game_id;
  std::string status;
  std::string reason;
  int admitted_count{0};
  int rejected_count{0};
  bool success{false};
};

// Observer for per-decision scoring and game progress. Handlers default to
// no-ops; a sink belongs to one game session at a time.
class DiagnosticsSink {
public:
  virtual ~DiagnosticsSink() = default;

  virtual void on_game_started(const GameStartedEvent &) {}
  virtual void on_decision(const DecisionEvent &) {}
  virtual void on_state_update(const StateUpdateEvent &) {}
  virtual void on_shadow_prices(const ShadowPriceEvent &) {}
  virtual void on_game_completed(const GameCompletedEvent &) {}
};

// Writes events through the logging layer. Decisions and prices go to Debug,
// progress every `progress_every` arrivals to Info.
class LoggingSink final : public DiagnosticsSink {
public:
  explicit LoggingSink(int progress_every = 1000) : progress_every_(progress_every) {}

  void on_game_started(const GameStartedEvent &ev) override;
  void on_decision(const DecisionEvent &ev) override;
  void on_state_update(const StateUpdateEvent &ev) override;
  void on_shadow_prices(const ShadowPriceEvent &ev) override;
  void on_game_completed(const GameCompletedEvent &ev) override;

private:
  int progress_every_{1000};
};

struct DecisionRecord {
  std::int64_t person_index{0};
  bool accept{false};
  std::string reason;
  Scoring scoring;
};

struct StateRecord {
  int admitted_count{0};
  int rejected_count{0};
  std::unordered_map<std::string, int> admitted_attributes;
  bool feasible{true};
  double min_slack{0.0};
  std::string bottleneck;
};

// Keeps every event in memory.
class RecordingSink final : public DiagnosticsSink {
public:
  void on_game_started(const GameStartedEvent &ev) override { started.push_back(ev); }
  void on_decision(const DecisionEvent &ev) override;
  void on_state_update(const StateUpdateEvent &ev) override;
  void on_shadow_prices(const ShadowPriceEvent &ev) override { prices.push_back(ev); }
  void on_game_completed(const GameCompletedEvent &ev) override { completed.push_back(ev); }

  void clear();

  std::vector<GameStartedEvent> started;
  std::vector<DecisionRecord> decisions;
  std::vector<StateRecord> states;
  std::vector<ShadowPriceEvent> prices;
  std::vector<GameCompletedEvent> completed;
};

} // namespace admit_core
