#include "admit_core/strategy.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "admit_core/diagnostics.hpp"
#include "admit_core/log.hpp"
#include "admit_core/slack.hpp"

namespace admit_core {

namespace {

FeasibilityScoring feasibility_scoring(const FeasibilityResult &rej,
                                       const FeasibilityResult &acc, int unmet) {
  FeasibilityScoring fs;
  fs.reject_feasible = rej.feasible;
  fs.accept_feasible = acc.feasible;
  fs.reject_slack = rej.min_slack;
  fs.accept_slack = acc.min_slack;
  fs.reject_bottleneck = rej.min_slack_attr;
  fs.accept_bottleneck = acc.min_slack_attr;
  fs.unmet_constraints = unmet;
  return fs;
}

Decision fill_decision() {
  Decision d;
  d.accept = true;
  d.reason = "all minima met, filling seats";
  return d;
}

} // namespace

const char *to_string(StrategyKind kind) {
  switch (kind) {
  case StrategyKind::DeficitGreedy:
    return "deficit-greedy";
  case StrategyKind::PacedFeasible:
    return "paced-feasible";
  case StrategyKind::PacedFeasibleDuals:
    return "paced-feasible-duals";
  case StrategyKind::DualPricing:
    return "dual-pricing";
  case StrategyKind::PrimalLP:
    return "primal-lp";
  }
  return "?";
}

StrategyKind parse_strategy_kind(const std::string &name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return c == '_' ? '-' : static_cast<char>(std::tolower(c));
  });
  for (StrategyKind k :
       {StrategyKind::DeficitGreedy, StrategyKind::PacedFeasible,
        StrategyKind::PacedFeasibleDuals, StrategyKind::DualPricing,
        StrategyKind::PrimalLP}) {
    if (s == to_string(k))
      return k;
  }
  throw std::invalid_argument("Unknown strategy: " + name);
}

StrategyConfig StrategyConfig::defaults_for(StrategyKind kind) {
  StrategyConfig c;
  switch (kind) {
  case StrategyKind::PacedFeasibleDuals:
    c.duals.learning_rate = 0.1;
    c.duals.max_dual = 10.0;
    c.duals.seeding = DualSeeding::Zero;
    c.dual_update_every = 25;
    c.paced.dual_gate = true;
    c.paced.aggressive_unmet = 2;
    break;
  case StrategyKind::DualPricing:
    c.duals.learning_rate = 0.15;
    c.duals.max_dual = 20.0;
    c.duals.seeding = DualSeeding::Rarity;
    c.dual_update_every = 10;
    break;
  case StrategyKind::DeficitGreedy:
  case StrategyKind::PacedFeasible:
  case StrategyKind::PrimalLP:
    break;
  }
  return c;
}

// ---------------------------------------------------------------------------

Decision DeficitGreedyStrategy::decide(const CurrentState &state,
                                       const Person &person) {
  const Eigen::ArrayXi deficits = compute_deficits(state);
  if (all_minima_met(deficits))
    return fill_decision();

  Decision d;
  for (std::size_t i = 0; i < state.constraints.size(); ++i) {
    const Constraint &c = state.constraints[i];
    const int need = deficits[static_cast<Eigen::Index>(i)];
    if (need > 0 && person.has(c.attribute)) {
      d.accept = true;
      d.reason = fmt::format("helps {} ({} still needed)", c.attribute, need);
      break;
    }
  }
  if (!d.accept) {
    d.reason = "helps no unmet constraint";
  }
  log_debug("deficit-greedy person {}: {} ({})", person.index,
            d.accept ? "ACCEPT" : "REJECT", d.reason);
  return d;
}

// ---------------------------------------------------------------------------

PricedStrategy::PricedStrategy(StrategyConfig cfg)
    : cfg_(std::move(cfg)), duals_(cfg_.duals) {
  if (cfg_.dual_update_every <= 0) {
    throw std::invalid_argument("PricedStrategy: dual_update_every must be positive");
  }
}

void PricedStrategy::refresh_prices(const CurrentState &state) {
  const int processed = state.processed();
  if (!duals_.initialized()) {
    duals_.init(state.constraints, state.statistics);
    last_update_ = processed;
    return;
  }
  if (processed - last_update_ < cfg_.dual_update_every)
    return;

  const SlackReport report = calculate_all_slacks(state, cfg_.safety);
  duals_.update(report.slacks);
  last_update_ = processed;
  if (sink_) {
    ShadowPriceEvent ev;
    ev.processed = processed;
    ev.prices = duals_.get_all();
    ev.slacks = report.slacks;
    sink_->on_shadow_prices(ev);
  }
}

DualScoring PricedStrategy::dual_scoring(const PersonScore &score,
                                         double threshold) const {
  DualScoring ds;
  ds.total_value = score.total_value;
  ds.shadow_price_sum = score.shadow_price_sum;
  ds.seat_cost = score.seat_cost;
  ds.threshold = threshold;
  ds.helped_attributes = score.helped_attributes;
  ds.shadow_prices = duals_.get_all();
  return ds;
}

// ---------------------------------------------------------------------------

PacedFeasibleStrategy::PacedFeasibleStrategy(StrategyConfig cfg)
    : PricedStrategy(std::move(cfg)) {}

std::string PacedFeasibleStrategy::name() const {
  return to_string(cfg_.paced.dual_gate ? StrategyKind::PacedFeasibleDuals
                                        : StrategyKind::PacedFeasible);
}

Decision PacedFeasibleStrategy::decide(const CurrentState &state,
                                       const Person &person) {
  const PacedConfig &pc = cfg_.paced;
  if (pc.dual_gate)
    refresh_prices(state);

  const Eigen::ArrayXi deficits = compute_deficits(state);
  if (cfg_.fill_when_satisfied && all_minima_met(deficits))
    return fill_decision();

  std::optional<PersonScore> score;
  if (pc.dual_gate)
    score = score_person(person, duals_, state, cfg_.seat_cost);

  const bool helps = !helped_attributes(state, deficits, person).empty();
  const int unmet = unmet_count(deficits);
  const FeasibilityResult rej = evaluate_decision_feasibility(
      state, state.statistics, nullptr, false, cfg_.safety);
  const FeasibilityResult acc = evaluate_decision_feasibility(
      state, state.statistics, &person, true, cfg_.safety);
  const double delta = acc.min_slack - rej.min_slack;

  Decision d;
  d.scoring.feasibility = feasibility_scoring(rej, acc, unmet);
  double value_threshold = 0.0;

  if (helps) {
    value_threshold = pc.value_threshold;
    if (rej.feasible && !acc.feasible) {
      d.accept = false;
      d.reason = fmt::format("helper breaks feasibility (reject bottleneck {} "
                             "slack {:.2f})",
                             rej.min_slack_attr, rej.min_slack);
    } else if (!rej.feasible && acc.feasible) {
      d.accept = true;
      d.reason = fmt::format("helper restores feasibility (bottleneck {} slack "
                             "{:.2f})",
                             acc.min_slack_attr, acc.min_slack);
    } else if (pc.end_game_rule && unmet == 1) {
      // Accepting can move the minimum elsewhere, so follow the bottleneck of
      // the reject hypothesis rather than the new minimum.
      double true_delta = delta;
      if (const FeasibilityPerAttr *pa = acc.find(rej.min_slack_attr))
        true_delta = pa->slack - rej.min_slack;
      d.accept = true_delta >= pc.helper_eps;
      d.reason = fmt::format("end-game helper, bottleneck {} delta {:.2f}",
                             rej.min_slack_attr, true_delta);
    } else if (pc.aggressive_unmet > 1 && unmet <= pc.aggressive_unmet) {
      d.accept = true;
      d.reason = fmt::format("helper with {} constraints left", unmet);
    } else {
      const bool slack_ok = delta >= pc.helper_eps;
      const bool value_ok = !score || score->total_value >= pc.value_threshold;
      d.accept = slack_ok && value_ok;
      d.reason = score ? fmt::format("helper delta {:.2f}, value {:.2f}", delta,
                                     score->total_value)
                       : fmt::format("helper delta {:.2f}", delta);
    }
  } else {
    value_threshold = pc.filler_value_threshold;
    const double threshold =
        std::max(pc.filler_min_slack, rej.min_slack + pc.filler_margin);
    const bool slack_ok = acc.feasible && acc.min_slack >= threshold;
    const bool value_ok = !score || score->total_value >= pc.filler_value_threshold;
    d.accept = slack_ok && value_ok;
    d.reason = fmt::format("filler slack {:.2f} vs threshold {:.2f} ({})",
                           acc.min_slack, threshold, acc.min_slack_attr);
  }

  if (score)
    d.scoring.dual = dual_scoring(*score, value_threshold);
  log_debug("{} person {}: {} ({})", name(), person.index,
            d.accept ? "ACCEPT" : "REJECT", d.reason);
  return d;
}

// ---------------------------------------------------------------------------

DualPricingStrategy::DualPricingStrategy(StrategyConfig cfg)
    : PricedStrategy(std::move(cfg)) {}

Decision DualPricingStrategy::decide(const CurrentState &state,
                                     const Person &person) {
  refresh_prices(state);

  const Eigen::ArrayXi deficits = compute_deficits(state);
  if (cfg_.fill_when_satisfied && all_minima_met(deficits))
    return fill_decision();

  const PersonScore score = score_person(person, duals_, state, cfg_.seat_cost);
  const DualPricingConfig &dp = cfg_.pricing;

  double threshold = dp.filler_threshold;
  const char *kind = "filler";
  if (all_minima_met(deficits)) {
    threshold = dp.satisfied_threshold;
    kind = "satisfied filler";
  } else if (!score.helped_attributes.empty()) {
    threshold = dp.helper_threshold;
    kind = "helper";
  }

  Decision d;
  d.accept = score.total_value >= threshold;
  d.reason = fmt::format("{} value {:.2f} {} {:.2f}", kind, score.total_value,
                         d.accept ? ">=" : "<", threshold);
  d.scoring.dual = dual_scoring(score, threshold);
  log_debug("dual-pricing person {}: {} ({})", person.index,
            d.accept ? "ACCEPT" : "REJECT", d.reason);
  return d;
}

// ---------------------------------------------------------------------------

PrimalLPStrategy::PrimalLPStrategy(StrategyConfig cfg,
                                   std::unique_ptr<LinearProgramSolver> solver)
    : cfg_(std::move(cfg)), solver_(std::move(solver)), rng_(cfg_.primal.seed) {
  if (!solver_)
    solver_ = make_lp_solver();
}

Decision PrimalLPStrategy::decide(const CurrentState &state,
                                  const Person &person) {
  const Eigen::ArrayXi deficits = compute_deficits(state);
  if (cfg_.fill_when_satisfied && all_minima_met(deficits))
    return fill_decision();

  Decision d;
  LPScoring lps;
  lps.draw = -1.0;

  if (state.admitted_count >= state.venue_capacity) {
    d.reason = "venue full";
    d.scoring.lp = lps;
    return d;
  }

  const ScaledLPProblem problem = formulate_scaled_lp(state, person, cfg_.lp);
  const LPSolution sol = solver_->solve(problem);
  ++total_solves_;
  total_solve_ms_ += sol.solve_time_ms;

  lps.feasible = sol.feasible;
  lps.admission_probability = sol.admission_probability;
  lps.optimal_value = sol.optimal_value;
  lps.active_constraints = sol.active_constraints;
  lps.constraint_slacks = sol.constraint_slacks;

  if (!sol.feasible) {
    d.reason = "relaxation infeasible";
  } else {
    const double x = std::max(0.0, std::min(1.0, sol.admission_probability));
    ++rounded_;
    prob_sum_ += x;
    prob_min_ = std::min(prob_min_, x);
    prob_max_ = std::max(prob_max_, x);
    if (x < cfg_.primal.min_probability) {
      d.reason = fmt::format("x*={:.4f} below {}", x, cfg_.primal.min_probability);
    } else {
      lps.draw = unif_(rng_);
      d.accept = lps.draw < x;
      d.reason = fmt::format("x*={:.3f} draw {:.3f}", x, lps.draw);
    }
    if (d.accept)
      ++admitted_;
  }

  d.scoring.lp = std::move(lps);
  log_debug("primal-lp person {}: {} ({}, {})", person.index,
            d.accept ? "ACCEPT" : "REJECT", d.reason,
            to_string(sol.solution_type));
  return d;
}

PrimalStats PrimalLPStrategy::stats() const {
  PrimalStats s;
  s.total_solves = total_solves_;
  s.mean_solve_time_ms = total_solves_ > 0 ? total_solve_ms_ / total_solves_ : 0.0;
  if (rounded_ > 0) {
    s.mean_probability = prob_sum_ / rounded_;
    s.min_probability = prob_min_;
    s.max_probability = prob_max_;
  }
  s.expected_admissions = prob_sum_;
  s.actual_admissions = admitted_;
  return s;
}

void PrimalLPStrategy::reset() {
  total_solves_ = 0;
  total_solve_ms_ = 0.0;
  rounded_ = 0;
  prob_sum_ = 0.0;
  prob_min_ = 1.0;
  prob_max_ = 0.0;
  admitted_ = 0;
  rng_.seed(cfg_.primal.seed);
  unif_.reset();
}

// ---------------------------------------------------------------------------

std::unique_ptr<AdmissionStrategy> make_strategy(StrategyKind kind,
                                                 const StrategyConfig &cfg) {
  switch (kind) {
  case StrategyKind::DeficitGreedy:
    return std::make_unique<DeficitGreedyStrategy>();
  case StrategyKind::PacedFeasible:
  case StrategyKind::PacedFeasibleDuals:
    return std::make_unique<PacedFeasibleStrategy>(cfg);
  case StrategyKind::DualPricing:
    return std::make_unique<DualPricingStrategy>(cfg);
  case StrategyKind::PrimalLP:
    return std::make_unique<PrimalLPStrategy>(cfg);
  }
  throw std::invalid_argument("make_strategy: unknown kind");
}

std::unique_ptr<AdmissionStrategy> make_strategy(StrategyKind kind) {
  return make_strategy(kind, StrategyConfig::defaults_for(kind));
}

} // namespace admit_core
