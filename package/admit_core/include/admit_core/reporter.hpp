#pragma once

#include <vector>

#include "admit_core/state.hpp"

namespace admit_core {

struct GameResult;

// Constraints, frequencies (top 20) and strongest correlations (top 10 by
// |r|) at Info.
void log_scenario_intro(const std::vector<Constraint> &constraints,
                        const AttributeStatistics &stats);

// Headline counts, admit rate and per-constraint status at Info.
void log_final_summary(const GameResult &result);

} // namespace admit_core
