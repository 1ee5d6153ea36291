#include "admit_core/person_scorer.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/ranges.h>

#include "admit_core/log.hpp"

namespace admit_core {

double seat_cost_risk(const CurrentState &state, const SeatCostConfig &cfg) {
  const double capacity = static_cast<double>(state.venue_capacity);
  const double seats = static_cast<double>(std::max(0, state.seats_left()));
  const double utilization = std::max(0.0, std::min(1.0, 1.0 - seats / capacity));
  return cfg.alpha * std::pow(utilization, cfg.beta);
}

PersonScore score_person(const Person &person, const DualPriceTracker &duals,
                         const CurrentState &state, const SeatCostConfig &cfg) {
  PersonScore score;
  const Eigen::ArrayXi deficits = compute_deficits(state);
  score.helped_attributes = helped_attributes(state, deficits, person);
  for (const auto &attr : score.helped_attributes)
    score.shadow_price_sum += duals.get(attr);
  score.seat_cost = seat_cost_risk(state, cfg);
  score.total_value = score.shadow_price_sum - score.seat_cost;

  log_debug("score person {}: sum_price={:.3f} - seat_cost={:.3f} = {:.3f} "
            "(helps {})",
            person.index, score.shadow_price_sum, score.seat_cost,
            score.total_value, fmt::join(score.helped_attributes, ","));
  return score;
}

} // namespace admit_core
