#include "admit_core/diagnostics.hpp"

#include <algorithm>
#include <utility>

#include <fmt/ranges.h>

#include "admit_core/log.hpp"

namespace admit_core {

void LoggingSink::on_game_started(const GameStartedEvent &ev) {
  log_info("game {} started: scenario {} strategy {} ({} constraints)",
           ev.game_id, ev.scenario, ev.strategy, ev.constraints.size());
}

void LoggingSink::on_decision(const DecisionEvent &ev) {
  if (!log_enabled(LogLevel::Debug))
    return;
  log_debug("person {}: {} ({}) admitted={} rejected={}", ev.person.index,
            ev.decision.accept ? "ACCEPT" : "REJECT", ev.decision.reason,
            ev.admitted_count, ev.rejected_count);
}

void LoggingSink::on_state_update(const StateUpdateEvent &ev) {
  const int processed = ev.state.processed();
  if (progress_every_ <= 0 || processed == 0 || processed % progress_every_ != 0)
    return;
  log_info("progress: admitted={} rejected={} feasible={} bottleneck={} "
           "slack={:.2f}",
           ev.state.admitted_count, ev.state.rejected_count,
           ev.feasibility.feasible, ev.feasibility.min_slack_attr,
           ev.feasibility.min_slack);
}

void LoggingSink::on_shadow_prices(const ShadowPriceEvent &ev) {
  if (!log_enabled(LogLevel::Debug))
    return;
  std::vector<std::pair<std::string, double>> ranked(ev.prices.begin(),
                                                     ev.prices.end());
  std::sort(ranked.begin(), ranked.end(),
            [](const auto &a, const auto &b) { return a.second > b.second; });
  std::vector<std::string> parts;
  parts.reserve(ranked.size());
  for (const auto &kv : ranked)
    parts.push_back(fmt::format("{}:{:.2f}", kv.first, kv.second));
  log_debug("shadow prices after {} arrivals: {}", ev.processed,
            fmt::join(parts, ", "));
}

void LoggingSink::on_game_completed(const GameCompletedEvent &ev) {
  log_info("game {} {}: admitted={} rejected={} success={}{}", ev.game_id,
           ev.status, ev.admitted_count, ev.rejected_count, ev.success,
           ev.reason.empty() ? "" : " (" + ev.reason + ")");
}

void RecordingSink::on_decision(const DecisionEvent &ev) {
  DecisionRecord rec;
  rec.person_index = ev.person.index;
  rec.accept = ev.decision.accept;
  rec.reason = ev.decision.reason;
  rec.scoring = ev.decision.scoring;
  decisions.push_back(std::move(rec));
}

void RecordingSink::on_state_update(const StateUpdateEvent &ev) {
  StateRecord rec;
  rec.admitted_count = ev.state.admitted_count;
  rec.rejected_count = ev.state.rejected_count;
  rec.admitted_attributes = ev.state.admitted_attributes;
  rec.feasible = ev.feasibility.feasible;
  rec.min_slack = ev.feasibility.min_slack;
  rec.bottleneck = ev.feasibility.min_slack_attr;
  states.push_back(std::move(rec));
}

void RecordingSink::clear() {
  started.clear();
  decisions.clear();
  states.clear();
  prices.clear();
  completed.clear();
}

} // namespace admit_core
