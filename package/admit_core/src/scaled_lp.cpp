#include "admit_core/scaled_lp.hpp"

#include <algorithm>
#include <stdexcept>

#include "admit_core/log.hpp"

namespace admit_core {

ScaledLPProblem formulate_scaled_lp(const CurrentState &state,
                                    const Person &candidate,
                                    const ScaledLPConfig &cfg) {
  if (!(cfg.expected_total_arrivals > 0.0)) {
    throw std::invalid_argument(
        "formulate_scaled_lp: expected total arrivals must be positive");
  }
  ScaledLPProblem lp;
  const int n = static_cast<int>(state.constraints.size());
  lp.person_index = candidate.index;
  lp.people_processed = state.processed();
  lp.expected_total = cfg.expected_total_arrivals;
  lp.progress_ratio =
      std::min(1.0, static_cast<double>(lp.people_processed) / lp.expected_total);

  lp.attributes.reserve(static_cast<std::size_t>(n));
  lp.current_admitted.resize(n);
  lp.contribution.resize(n);
  Eigen::ArrayXd min_count(n);
  for (int i = 0; i < n; ++i) {
    const Constraint &c = state.constraints[static_cast<std::size_t>(i)];
    lp.attributes.push_back(c.attribute);
    lp.current_admitted[i] = static_cast<double>(state.admitted_with(c.attribute));
    lp.contribution[i] = candidate.has(c.attribute) ? 1.0 : 0.0;
    min_count[i] = static_cast<double>(c.min_count);
  }
  lp.scaled_capacity = lp.progress_ratio * min_count;
  lp.tolerance = cfg.tolerance_factor * min_count;
  lp.deficit_weight = (lp.scaled_capacity - lp.current_admitted).max(0.0);
  lp.objective_coefficient = (lp.deficit_weight * lp.contribution).sum();

  log_debug("scaled lp person {}: {}/{} processed ({:.1f}% progress), "
            "weighted value {:.2f}",
            lp.person_index, lp.people_processed, lp.expected_total,
            100.0 * lp.progress_ratio, lp.objective_coefficient);
  return lp;
}

bool is_within_tolerance(const ScaledLPProblem &problem) {
  const Eigen::ArrayXd used = problem.current_admitted + problem.contribution;
  return (used <= problem.scaled_capacity + problem.tolerance).all();
}

double max_feasible_probability(const ScaledLPProblem &problem) {
  double x = 1.0;
  for (Eigen::Index i = 0; i < problem.rows(); ++i) {
    const double a = problem.contribution[i];
    if (a <= 0.0)
      continue;
    const double ceiling =
        std::max(0.0, (problem.scaled_capacity[i] - problem.current_admitted[i]) / a);
    if (ceiling < x) {
      log_debug("constraint {} limits x to {:.3f}",
                problem.attributes[static_cast<std::size_t>(i)], ceiling);
      x = ceiling;
    }
  }
  return std::max(0.0, std::min(1.0, x));
}

} // namespace admit_core
