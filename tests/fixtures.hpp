#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "admit_core/state.hpp"

namespace admit_core::testing {

inline AttributeStatistics
stats_of(std::initializer_list<std::pair<const std::string, double>> freqs) {
  AttributeStatistics s;
  s.relative_frequencies = freqs;
  return s;
}

inline Person person_with(std::int64_t index,
                          std::initializer_list<std::string> attrs) {
  Person p;
  p.index = index;
  for (const auto &a : attrs)
    p.attributes[a] = true;
  return p;
}

// State with the given totals and per-attribute tallies.
inline CurrentState
state_at(std::vector<Constraint> constraints, AttributeStatistics stats,
         int admitted, int rejected,
         std::initializer_list<std::pair<const std::string, int>> tallies = {},
         int capacity = kVenueCapacity) {
  CurrentState st = init_state(std::move(constraints), std::move(stats), capacity);
  st.admitted_count = admitted;
  st.rejected_count = rejected;
  for (const auto &t : tallies)
    st.admitted_attributes[t.first] = t.second;
  return st;
}

} // namespace admit_core::testing
