#include "admit_core/reporter.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>
#include <utility>

#include <fmt/ranges.h>

#include "admit_core/driver.hpp"
#include "admit_core/log.hpp"

namespace admit_core {

namespace {

constexpr std::size_t kTopFrequencies = 20;
constexpr std::size_t kTopCorrelations = 10;

struct CorrelationPair {
  std::string a;
  std::string b;
  double r{0.0};
};

std::vector<std::pair<std::string, double>>
sorted_frequencies(const AttributeStatistics &stats) {
  std::vector<std::pair<std::string, double>> freqs(
      stats.relative_frequencies.begin(), stats.relative_frequencies.end());
  std::sort(freqs.begin(), freqs.end(), [](const auto &x, const auto &y) {
    return x.second != y.second ? x.second > y.second : x.first < y.first;
  });
  return freqs;
}

} // namespace

void log_scenario_intro(const std::vector<Constraint> &constraints,
                        const AttributeStatistics &stats) {
  log_info("--- SCENARIO DETAILS ---");
  log_info("constraints (attribute -> min_count):");
  for (const auto &c : constraints)
    log_info("  {} -> {}", c.attribute, c.min_count);

  const auto freqs = sorted_frequencies(stats);
  log_info("relative frequencies (top {}):", kTopFrequencies);
  for (std::size_t i = 0; i < freqs.size() && i < kTopFrequencies; ++i)
    log_info("  {}: {:.1f}%", freqs[i].first, freqs[i].second * 100.0);
  if (freqs.size() > kTopFrequencies)
    log_info("  (+{} more)", freqs.size() - kTopFrequencies);

  std::vector<CorrelationPair> pairs;
  for (const auto &row : stats.correlations) {
    for (const auto &cell : row.second) {
      if (row.first < cell.first)
        pairs.push_back({row.first, cell.first, cell.second});
    }
  }
  std::sort(pairs.begin(), pairs.end(),
            [](const CorrelationPair &x, const CorrelationPair &y) {
              if (std::abs(x.r) != std::abs(y.r))
                return std::abs(x.r) > std::abs(y.r);
              return x.a != y.a ? x.a < y.a : x.b < y.b;
            });
  log_info("strongest correlations (top {} by |r|):", kTopCorrelations);
  for (std::size_t i = 0; i < pairs.size() && i < kTopCorrelations; ++i)
    log_info("  {} x {}: r={:.3f}", pairs[i].a, pairs[i].b, pairs[i].r);
  if (pairs.size() > kTopCorrelations)
    log_info("  (+{} more)", pairs.size() - kTopCorrelations);
}

void log_final_summary(const GameResult &result) {
  const CurrentState &state = result.final_state;
  const int seen = state.processed();
  const double admit_rate =
      seen > 0 ? static_cast<double>(state.admitted_count) / seen : 0.0;

  log_info("--- FINAL SUMMARY ({}) ---", to_string(result.status));
  if (!result.reason.empty())
    log_info("reason: {}", result.reason);
  log_info("admitted={} rejected={} (admit rate={:.1f}% of {} seen)",
           state.admitted_count, state.rejected_count, admit_rate * 100.0, seen);

  log_info("constraint status:");
  std::unordered_set<std::string> constrained;
  for (const auto &c : state.constraints) {
    constrained.insert(c.attribute);
    const int have = state.admitted_with(c.attribute);
    const double share =
        state.admitted_count > 0 ? 100.0 * have / state.admitted_count : 0.0;
    log_info("  {}: have={} ({:.1f}% of admits)  min={}  deficit={}",
             c.attribute, have, share, c.min_count,
             std::max(0, c.min_count - have));
  }
  log_info("all minima satisfied? {}", result.all_minima_met ? "YES" : "NO");

  std::vector<std::string> others;
  for (const auto &kv : sorted_frequencies(state.statistics)) {
    if (!constrained.count(kv.first))
      others.push_back(fmt::format("{} {:.1f}%", kv.first, kv.second * 100.0));
  }
  if (!others.empty())
    log_info("unconstrained attributes: {}", fmt::join(others, ", "));
}

} // namespace admit_core
