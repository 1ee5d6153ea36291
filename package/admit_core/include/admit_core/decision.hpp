#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace admit_core {

struct DualScoring {
  double total_value{0.0};
  double shadow_price_sum{0.0};
  double seat_cost{0.0};
  double threshold{0.0};
  std::vector<std::string> helped_attributes;
  std::map<std::string, double> shadow_prices;
};

struct LPScoring {
  bool feasible{false};
  double admission_probability{0.0};
  double optimal_value{0.0};
  double draw{0.0}; // uniform draw used for rounding, -1 when none was made
  std::vector<std::string> active_constraints;
  std::map<std::string, double> constraint_slacks;
};

struct FeasibilityScoring {
  bool reject_feasible{true};
  bool accept_feasible{true};
  double reject_slack{0.0};
  double accept_slack{0.0};
  std::string reject_bottleneck;
  std::string accept_bottleneck;
  int unmet_constraints{0};
};

struct Scoring {
  std::optional<DualScoring> dual;
  std::optional<LPScoring> lp;
  std::optional<FeasibilityScoring> feasibility;
};

struct Decision {
  bool accept{false};
  std::string reason;
  Scoring scoring;
};

} // namespace admit_core
