#include "admit_core/slack.hpp"

#include <algorithm>
#include <cmath>

#include "admit_core/log.hpp"

namespace admit_core {

SlackDetail calculate_constraint_slack(const CurrentState &state,
                                       const std::string &attribute,
                                       int seats_remaining,
                                       const SafetySchedule &safety) {
  const Constraint &c = find_constraint(state, attribute);
  const int seats = std::max(0, seats_remaining);
  const double s = static_cast<double>(seats);

  SlackDetail d;
  d.attribute = attribute;
  d.probability = state.statistics.probability(attribute);
  d.remaining_need = std::max(0, c.min_count - state.admitted_with(attribute));
  d.expected = d.probability * s;
  const double var = std::max(0.0, d.probability * (1.0 - d.probability)) * s;
  d.safety_buffer = safety.z_for(seats) * std::sqrt(var);
  d.slack = d.expected - d.safety_buffer - static_cast<double>(d.remaining_need);
  return d;
}

SlackReport calculate_all_slacks(const CurrentState &state,
                                 const SafetySchedule &safety) {
  SlackReport report;
  const int seats = state.venue_capacity - state.admitted_count;
  report.details.reserve(state.constraints.size());
  for (const auto &c : state.constraints) {
    SlackDetail d = calculate_constraint_slack(state, c.attribute, seats, safety);
    report.slacks[c.attribute] = d.slack;
    log_debug("slack {}: expected={:.2f} buffer={:.2f} need={} slack={:.2f}",
              d.attribute, d.expected, d.safety_buffer, d.remaining_need,
              d.slack);
    report.details.push_back(std::move(d));
  }
  return report;
}

} // namespace admit_core
