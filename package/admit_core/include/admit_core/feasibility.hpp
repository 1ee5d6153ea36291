#pragma once

#include <string>
#include <vector>

#include "admit_core/state.hpp"

namespace admit_core {

// Filler candidates must leave at least this much bottleneck slack.
constexpr double kFillerMinSlack = 0.5;

// Safety multiplier Z applied to the standard deviation of future supply.
// Piecewise by seats remaining unless `scheduled` is off.
struct SafetySchedule {
  bool scheduled{true};
  double fixed_z{1.0};
  double early_z{0.90}; // seats >= early_seats
  double mid_z{1.15};   // seats >= mid_seats
  double late_z{1.35};
  int early_seats{600};
  int mid_seats{250};

  double z_for(int seats_remaining) const {
    if (!scheduled)
      return fixed_z;
    if (seats_remaining >= early_seats)
      return early_z;
    if (seats_remaining >= mid_seats)
      return mid_z;
    return late_z;
  }

  static SafetySchedule fixed(double z) {
    SafetySchedule s;
    s.scheduled = false;
    s.fixed_z = z;
    return s;
  }
};

struct FeasibilityPerAttr {
  std::string attribute;
  int need{0};            // deficit after the hypothetical decision
  double probability{0.0};
  double expected{0.0};   // p * seats
  double sd{0.0};         // sqrt(p * (1 - p) * seats)
  double slack{0.0};      // expected - Z * sd - need
  bool feasible{true};    // slack >= 0
};

struct FeasibilityResult {
  bool feasible{true};
  int seats_remaining{0};
  double z{0.0};
  std::vector<FeasibilityPerAttr> per_attr; // constraint declaration order
  std::string min_slack_attr;               // empty when there are no constraints
  double min_slack{0.0};

  const FeasibilityPerAttr *find(const std::string &attribute) const;
};

int remaining_seats(const CurrentState &state, bool accept_seat);

// expected - z * sd - need for one constraint, with p(1-p) and seats floored
// at zero.
double statistical_slack(double probability, int seats, int need, double z);

// Projects whether every minimum can still be met after a hypothetical
// decision. With accept_seat and a person, each constraint attribute the
// person carries has its deficit reduced by one (floored at zero). The
// bottleneck is the first constraint, in declaration order, holding the
// minimum slack.
FeasibilityResult
evaluate_decision_feasibility(const CurrentState &state,
                              const AttributeStatistics &stats,
                              const Person *person, bool accept_seat,
                              const SafetySchedule &safety = {});

} // namespace admit_core
