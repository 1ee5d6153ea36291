#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <string>

#include "admit_core/decision.hpp"
#include "admit_core/dual_tracker.hpp"
#include "admit_core/feasibility.hpp"
#include "admit_core/lp_solver.hpp"
#include "admit_core/person_scorer.hpp"
#include "admit_core/scaled_lp.hpp"
#include "admit_core/state.hpp"

namespace admit_core {

class DiagnosticsSink;

enum class StrategyKind {
  DeficitGreedy,
  PacedFeasible,
  PacedFeasibleDuals,
  DualPricing,
  PrimalLP
};

const char *to_string(StrategyKind kind);
// Accepts the to_string() names ("deficit-greedy", "paced-feasible", ...).
StrategyKind parse_strategy_kind(const std::string &name);

struct PacedConfig {
  double helper_eps{0.0};     // helpers accepted on a tie or better
  double filler_margin{0.3};  // filler must beat the reject slack by this
  double filler_min_slack{kFillerMinSlack};
  bool end_game_rule{true};   // single unmet constraint: track the old bottleneck
  // Dual gate (feasibility-paced with duals).
  bool dual_gate{false};
  double value_threshold{0.5};
  double filler_value_threshold{0.0};
  // With this many unmet constraints or fewer (but more than one), helpers
  // are always taken. 0 disables.
  int aggressive_unmet{0};
};

struct DualPricingConfig {
  double helper_threshold{0.0};
  double filler_threshold{-0.5};
  // Only consulted when fill_when_satisfied is off.
  double satisfied_threshold{0.8};
};

struct PrimalConfig {
  double min_probability{0.001};
  std::uint64_t seed{42};
};

// One configuration for the whole policy family. Variants differ only in
// these constants; defaults_for() gives the tuned preset of each kind.
struct StrategyConfig {
  SafetySchedule safety{};
  DualTrackerConfig duals{};
  int dual_update_every{10}; // arrivals between price refreshes
  SeatCostConfig seat_cost{};
  ScaledLPConfig lp{};
  PacedConfig paced{};
  DualPricingConfig pricing{};
  PrimalConfig primal{};
  // Every policy fills the remaining seats once all minima are met.
  bool fill_when_satisfied{true};

  static StrategyConfig defaults_for(StrategyKind kind);
};

class AdmissionStrategy {
public:
  virtual ~AdmissionStrategy() = default;

  virtual Decision decide(const CurrentState &state, const Person &person) = 0;
  virtual std::string name() const = 0;

  void set_diagnostics(DiagnosticsSink *sink) { sink_ = sink; }

protected:
  DiagnosticsSink *sink_{nullptr};
};

// Accept anyone who helps an unmet minimum; fill freely once all are met.
class DeficitGreedyStrategy final : public AdmissionStrategy {
public:
  DeficitGreedyStrategy() = default;

  Decision decide(const CurrentState &state, const Person &person) override;
  std::string name() const override { return to_string(StrategyKind::DeficitGreedy); }
};

// Base for policies that keep shadow prices. Prices are seeded on the first
// decision and refreshed from the current slacks every dual_update_every
// arrivals.
class PricedStrategy : public AdmissionStrategy {
public:
  explicit PricedStrategy(StrategyConfig cfg);

  const DualPriceTracker &duals() const { return duals_; }
  const StrategyConfig &config() const { return cfg_; }

protected:
  void refresh_prices(const CurrentState &state);
  DualScoring dual_scoring(const PersonScore &score, double threshold) const;

  StrategyConfig cfg_;
  DualPriceTracker duals_;
  int last_update_{0};
};

// Compares the reject and accept hypotheses of the feasibility evaluator.
// With paced.dual_gate the shadow-price score gates helper and filler
// admissions as well.
class PacedFeasibleStrategy final : public PricedStrategy {
public:
  explicit PacedFeasibleStrategy(StrategyConfig cfg = StrategyConfig::defaults_for(
                                     StrategyKind::PacedFeasible));

  Decision decide(const CurrentState &state, const Person &person) override;
  std::string name() const override;
};

// Accept when the shadow-price value clears the helper / filler threshold.
class DualPricingStrategy final : public PricedStrategy {
public:
  explicit DualPricingStrategy(StrategyConfig cfg = StrategyConfig::defaults_for(
                                   StrategyKind::DualPricing));

  Decision decide(const CurrentState &state, const Person &person) override;
  std::string name() const override { return to_string(StrategyKind::DualPricing); }
};

struct PrimalStats {
  int total_solves{0};
  double mean_solve_time_ms{0.0};
  double mean_probability{0.0};
  double min_probability{0.0};
  double max_probability{0.0};
  double expected_admissions{0.0};
  int actual_admissions{0};
};

// Solves the scaled relaxation per arrival and rounds x* at random.
class PrimalLPStrategy final : public AdmissionStrategy {
public:
  explicit PrimalLPStrategy(StrategyConfig cfg = StrategyConfig::defaults_for(
                                StrategyKind::PrimalLP),
                            std::unique_ptr<LinearProgramSolver> solver = nullptr);

  Decision decide(const CurrentState &state, const Person &person) override;
  std::string name() const override { return to_string(StrategyKind::PrimalLP); }

  PrimalStats stats() const;
  void reset();

private:
  StrategyConfig cfg_;
  std::unique_ptr<LinearProgramSolver> solver_;
  std::mt19937_64 rng_;
  std::uniform_real_distribution<double> unif_{0.0, 1.0};

  int total_solves_{0};
  double total_solve_ms_{0.0};
  int rounded_{0};
  double prob_sum_{0.0};
  double prob_min_{1.0};
  double prob_max_{0.0};
  int admitted_{0};
};

std::unique_ptr<AdmissionStrategy> make_strategy(StrategyKind kind,
                                                 const StrategyConfig &cfg);
std::unique_ptr<AdmissionStrategy> make_strategy(StrategyKind kind);

} // namespace admit_core
