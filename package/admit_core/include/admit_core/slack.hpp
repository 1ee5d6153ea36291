#pragma once

#include <map>
#include <string>
#include <vector>

#include "admit_core/feasibility.hpp"
#include "admit_core/state.hpp"

namespace admit_core {

struct SlackDetail {
  std::string attribute;
  double slack{0.0};
  double expected{0.0};
  double safety_buffer{0.0};
  int remaining_need{0};
  double probability{0.0};
};

struct SlackReport {
  std::map<std::string, double> slacks;
  std::vector<SlackDetail> details; // constraint declaration order
};

// slack = p * seats - Z * sqrt(p * (1 - p) * seats) - deficit, for the
// current state. Throws UnknownConstraint if no constraint declares the
// attribute.
SlackDetail calculate_constraint_slack(const CurrentState &state,
                                       const std::string &attribute,
                                       int seats_remaining,
                                       const SafetySchedule &safety = {});

// Training signal for the dual prices; no candidate is involved.
SlackReport calculate_all_slacks(const CurrentState &state,
                                 const SafetySchedule &safety = {});

} // namespace admit_core
