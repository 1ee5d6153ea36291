#include "admit_core/feasibility.hpp"

#include <algorithm>
#include <cmath>

#include "admit_core/log.hpp"

namespace admit_core {

const FeasibilityPerAttr *
FeasibilityResult::find(const std::string &attribute) const {
  for (const auto &pa : per_attr) {
    if (pa.attribute == attribute)
      return &pa;
  }
  return nullptr;
}

int remaining_seats(const CurrentState &state, bool accept_seat) {
  const int current = state.venue_capacity - state.admitted_count;
  return accept_seat ? current - 1 : current;
}

double statistical_slack(double probability, int seats, int need, double z) {
  const double s = static_cast<double>(std::max(0, seats));
  const double var = std::max(0.0, probability * (1.0 - probability)) * s;
  return probability * s - z * std::sqrt(var) - static_cast<double>(need);
}

FeasibilityResult
evaluate_decision_feasibility(const CurrentState &state,
                              const AttributeStatistics &stats,
                              const Person *person, bool accept_seat,
                              const SafetySchedule &safety) {
  FeasibilityResult res;
  const int seats = std::max(0, remaining_seats(state, accept_seat));
  const double z = safety.z_for(seats);
  res.seats_remaining = seats;
  res.z = z;

  Eigen::ArrayXi deficits = compute_deficits(state);
  const int n = static_cast<int>(deficits.size());
  if (n == 0)
    return res;

  Eigen::ArrayXd p(n);
  for (int i = 0; i < n; ++i) {
    const std::string &attr =
        state.constraints[static_cast<std::size_t>(i)].attribute;
    p[i] = stats.probability(attr);
    if (accept_seat && person && person->has(attr))
      deficits[i] = std::max(0, deficits[i] - 1);
  }

  const double s = static_cast<double>(seats);
  const Eigen::ArrayXd expected = p * s;
  const Eigen::ArrayXd sd = ((p * (1.0 - p)).max(0.0) * s).sqrt();
  const Eigen::ArrayXd slack = expected - z * sd - deficits.cast<double>();

  res.per_attr.reserve(static_cast<std::size_t>(n));
  int bottleneck = -1;
  for (int i = 0; i < n; ++i) {
    FeasibilityPerAttr pa;
    pa.attribute = state.constraints[static_cast<std::size_t>(i)].attribute;
    pa.need = deficits[i];
    pa.probability = p[i];
    pa.expected = expected[i];
    pa.sd = sd[i];
    pa.slack = slack[i];
    pa.feasible = slack[i] >= 0.0;
    if (!pa.feasible)
      res.feasible = false;
    if (bottleneck < 0 || slack[i] < slack[bottleneck])
      bottleneck = i;
    res.per_attr.push_back(std::move(pa));
  }
  res.min_slack = slack[bottleneck];
  res.min_slack_attr = res.per_attr[static_cast<std::size_t>(bottleneck)].attribute;

  log_debug("feasibility({}): seats={} z={:.2f} feasible={} bottleneck={} "
            "slack={:.2f}",
            accept_seat ? "accept" : "reject", seats, z, res.feasible,
            res.min_slack_attr, res.min_slack);
  return res;
}

} // namespace admit_core
