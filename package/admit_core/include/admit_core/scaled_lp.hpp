#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "admit_core/state.hpp"

namespace admit_core {

struct ScaledLPConfig {
  // Arrivals expected before the venue fills (1000 seats at ~12.5% admits).
  double expected_total_arrivals{8000.0};
  // Rows may run ahead of schedule by this fraction of their minimum.
  double tolerance_factor{0.10};
};

// Single-variable relaxation for one candidate:
//
//   max x  s.t.  current[c] + x * contribution[c] <= scaled_capacity[c]
//                0 <= x <= 1
//
// with scaled_capacity[c] = progress_ratio * min_count[c]. Rows are aligned
// to the state's constraint order.
struct ScaledLPProblem {
  std::int64_t person_index{0};
  double objective_coefficient{0.0}; // sum of deficit weights of helped rows

  std::vector<std::string> attributes;
  Eigen::ArrayXd current_admitted;
  Eigen::ArrayXd scaled_capacity;
  Eigen::ArrayXd tolerance;
  Eigen::ArrayXd contribution; // 1 if the candidate has the attribute
  Eigen::ArrayXd deficit_weight; // max(0, scaled_capacity - current)

  double progress_ratio{0.0};
  int people_processed{0};
  double expected_total{0.0};

  Eigen::Index rows() const { return current_admitted.size(); }
};

ScaledLPProblem formulate_scaled_lp(const CurrentState &state,
                                    const Person &candidate,
                                    const ScaledLPConfig &cfg = {});

// True when x = 1 stays within scaled_capacity + tolerance on every row.
bool is_within_tolerance(const ScaledLPProblem &problem);

// min(1, (scaled_capacity - current) / contribution over contributing rows),
// clamped to [0,1].
double max_feasible_probability(const ScaledLPProblem &problem);

} // namespace admit_core
