#include "admit_core/state.hpp"

#include <algorithm>
#include <cmath>

#include "admit_core/log.hpp"

namespace admit_core {

double AttributeStatistics::probability(const std::string &attribute) const {
  auto it = relative_frequencies.find(attribute);
  if (it == relative_frequencies.end())
    return 0.0;
  const double p = it->second;
  if (std::isnan(p) || p < 0.0)
    return 0.0;
  return std::min(1.0, p);
}

double AttributeStatistics::correlation(const std::string &a,
                                        const std::string &b) const {
  if (a == b)
    return 1.0;
  auto row = correlations.find(a);
  if (row == correlations.end())
    return 0.0;
  auto it = row->second.find(b);
  if (it == row->second.end() || std::isnan(it->second))
    return 0.0;
  return std::max(-1.0, std::min(1.0, it->second));
}

CurrentState init_state(std::vector<Constraint> constraints,
                        AttributeStatistics statistics, int venue_capacity) {
  if (venue_capacity <= 0) {
    throw std::invalid_argument("init_state: venue capacity must be positive");
  }
  CurrentState st;
  st.venue_capacity = venue_capacity;
  for (const auto &c : constraints) {
    if (c.min_count < 0) {
      throw std::invalid_argument("init_state: negative minimum for " +
                                  c.attribute);
    }
    st.admitted_attributes[c.attribute] = 0;
  }
  st.constraints = std::move(constraints);
  st.statistics = std::move(statistics);
  log_debug("init_state: {} constraints, capacity {}", st.constraints.size(),
            st.venue_capacity);
  return st;
}

void record_decision(CurrentState &state, const Person &person, bool accepted) {
  if (accepted) {
    state.admitted_count += 1;
    record_local_admission(state, person);
  } else {
    state.rejected_count += 1;
  }
}

void record_local_admission(CurrentState &state, const Person &person) {
  for (auto &kv : state.admitted_attributes) {
    if (person.has(kv.first))
      kv.second += 1;
  }
}

void sync_counts(CurrentState &state, int admitted, int rejected) {
  if (admitted < state.admitted_count || rejected < state.rejected_count) {
    throw std::invalid_argument(
        "sync_counts: server counts went backwards (admitted " +
        std::to_string(state.admitted_count) + " -> " +
        std::to_string(admitted) + ", rejected " +
        std::to_string(state.rejected_count) + " -> " +
        std::to_string(rejected) + ")");
  }
  state.admitted_count = admitted;
  state.rejected_count = rejected;
}

const Constraint &find_constraint(const CurrentState &state,
                                  const std::string &attribute) {
  auto it = std::find_if(
      state.constraints.begin(), state.constraints.end(),
      [&](const Constraint &c) { return c.attribute == attribute; });
  if (it == state.constraints.end()) {
    throw UnknownConstraint(attribute);
  }
  return *it;
}

Eigen::ArrayXi compute_deficits(const CurrentState &state) {
  const int n = static_cast<int>(state.constraints.size());
  Eigen::ArrayXi deficits(n);
  for (int i = 0; i < n; ++i) {
    const Constraint &c = state.constraints[static_cast<std::size_t>(i)];
    deficits[i] = std::max(0, c.min_count - state.admitted_with(c.attribute));
  }
  return deficits;
}

bool all_minima_met(const Eigen::ArrayXi &deficits) {
  return deficits.size() == 0 || (deficits <= 0).all();
}

int unmet_count(const Eigen::ArrayXi &deficits) {
  return static_cast<int>((deficits > 0).count());
}

std::vector<std::string> helped_attributes(const CurrentState &state,
                                           const Eigen::ArrayXi &deficits,
                                           const Person &person) {
  std::vector<std::string> out;
  for (int i = 0; i < deficits.size(); ++i) {
    const std::string &attr =
        state.constraints[static_cast<std::size_t>(i)].attribute;
    if (deficits[i] > 0 && person.has(attr))
      out.push_back(attr);
  }
  return out;
}

} // namespace admit_core
