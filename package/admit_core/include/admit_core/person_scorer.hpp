#pragma once

#include <string>
#include <vector>

#include "admit_core/dual_tracker.hpp"
#include "admit_core/state.hpp"

namespace admit_core {

struct SeatCostConfig {
  double alpha{3.0}; // cost multiplier
  double beta{3.0};  // scarcity exponent
};

struct PersonScore {
  double total_value{0.0};
  double shadow_price_sum{0.0};
  double seat_cost{0.0};
  std::vector<std::string> helped_attributes;
};

// alpha * utilization^beta with utilization = 1 - seats_left / capacity.
double seat_cost_risk(const CurrentState &state, const SeatCostConfig &cfg = {});

// total_value = sum of prices over unmet constraints the person helps, minus
// the seat cost. Constraints already met contribute nothing.
PersonScore score_person(const Person &person, const DualPriceTracker &duals,
                         const CurrentState &state,
                         const SeatCostConfig &cfg = {});

} // namespace admit_core
