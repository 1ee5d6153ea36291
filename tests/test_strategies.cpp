#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "admit_core/diagnostics.hpp"
#include "admit_core/strategy.hpp"
#include "fixtures.hpp"

using namespace admit_core;
using namespace admit_core::testing;
using Catch::Approx;

namespace {

const std::vector<StrategyKind> kAllKinds = {
    StrategyKind::DeficitGreedy, StrategyKind::PacedFeasible,
    StrategyKind::PacedFeasibleDuals, StrategyKind::DualPricing,
    StrategyKind::PrimalLP};

bool mentions(const Decision &d, const std::string &word) {
  return d.reason.find(word) != std::string::npos;
}

} // namespace

TEST_CASE("Strategies: names round-trip", "[strategy]") {
  for (StrategyKind k : kAllKinds) {
    REQUIRE(parse_strategy_kind(to_string(k)) == k);
    REQUIRE(make_strategy(k)->name() == to_string(k));
  }
  REQUIRE(parse_strategy_kind("Dual_Pricing") == StrategyKind::DualPricing);
  REQUIRE_THROWS_AS(parse_strategy_kind("coin-flip"), std::invalid_argument);
}

TEST_CASE("Strategies: presets", "[strategy]") {
  const auto duals = StrategyConfig::defaults_for(StrategyKind::PacedFeasibleDuals);
  REQUIRE(duals.paced.dual_gate);
  REQUIRE(duals.paced.aggressive_unmet == 2);
  REQUIRE(duals.duals.seeding == DualSeeding::Zero);
  REQUIRE(duals.dual_update_every == 25);

  const auto pricing = StrategyConfig::defaults_for(StrategyKind::DualPricing);
  REQUIRE(pricing.duals.learning_rate == 0.15);
  REQUIRE(pricing.duals.max_dual == 20.0);
  REQUIRE(pricing.duals.seeding == DualSeeding::Rarity);
  REQUIRE(pricing.dual_update_every == 10);

  StrategyConfig bad;
  bad.dual_update_every = 0;
  REQUIRE_THROWS_AS(DualPricingStrategy(bad), std::invalid_argument);
}

TEST_CASE("Strategies: every policy fills once all minima are met", "[strategy]") {
  const auto st = state_at({{"a", 10}, {"b", 5}}, stats_of({{"a", 0.4}, {"b", 0.2}}), 100,
                           50, {{"a", 10}, {"b", 7}});
  const auto nobody = person_with(150, {});
  for (StrategyKind k : kAllKinds) {
    auto strategy = make_strategy(k);
    const auto d = strategy->decide(st, nobody);
    INFO(to_string(k));
    REQUIRE(d.accept);
  }
}

TEST_CASE("Strategies: last seat with a minimum still open", "[strategy]") {
  const auto stats = stats_of({{"a", 0.5}, {"b", 0.3}});
  const auto filler = person_with(999, {"a"});

  SECTION("every policy turns the filler away") {
    const auto st = state_at({{"a", 100}, {"b", 50}}, stats, 999, 0, {{"a", 100}, {"b", 10}});
    for (StrategyKind k : kAllKinds) {
      auto strategy = make_strategy(k);
      INFO(to_string(k));
      REQUIRE_FALSE(strategy->decide(st, filler).accept);
    }
  }

  SECTION("every policy takes the filler once the minimum closes") {
    const auto st = state_at({{"a", 100}, {"b", 50}}, stats, 999, 0, {{"a", 100}, {"b", 50}});
    for (StrategyKind k : kAllKinds) {
      auto strategy = make_strategy(k);
      INFO(to_string(k));
      REQUIRE(strategy->decide(st, filler).accept);
    }
  }
}

TEST_CASE("DeficitGreedy: helpers in, fillers out", "[strategy]") {
  DeficitGreedyStrategy greedy;
  const auto st = state_at({{"a", 10}, {"b", 10}}, stats_of({{"a", 0.5}, {"b", 0.5}}), 30,
                           0, {{"a", 10}, {"b", 3}});

  REQUIRE(greedy.decide(st, person_with(30, {"b"})).accept);
  REQUIRE_FALSE(greedy.decide(st, person_with(31, {"a"})).accept);
  REQUIRE_FALSE(greedy.decide(st, person_with(32, {})).accept);
}

TEST_CASE("PacedFeasible: helper rules", "[strategy]") {
  PacedFeasibleStrategy paced;
  REQUIRE(paced.name() == "paced-feasible");

  SECTION("helper that would break another minimum is rejected") {
    // 100 seats left: b sits at slack 0.25 and drops below zero on accept
    const auto st = state_at({{"a", 10}, {"b", 43}}, stats_of({{"a", 0.5}, {"b", 0.5}}),
                             900, 0);
    const auto d = paced.decide(st, person_with(900, {"a"}));
    REQUIRE_FALSE(d.accept);
    REQUIRE(mentions(d, "breaks"));
    REQUIRE(d.scoring.feasibility.has_value());
    REQUIRE(d.scoring.feasibility->reject_feasible);
    REQUIRE_FALSE(d.scoring.feasibility->accept_feasible);
    REQUIRE(d.scoring.feasibility->reject_bottleneck == "b");
  }

  SECTION("helper that restores feasibility is accepted") {
    const auto st = state_at({{"a", 6}}, stats_of({{"a", 0.1}}), 900, 0);
    const auto d = paced.decide(st, person_with(900, {"a"}));
    REQUIRE(d.accept);
    REQUIRE(mentions(d, "restores"));
  }

  SECTION("helper that drains the other bottleneck is rejected") {
    const auto st = state_at({{"a", 100}, {"b", 100}}, stats_of({{"a", 0.5}, {"b", 0.5}}),
                             0, 0);
    REQUIRE_FALSE(paced.decide(st, person_with(0, {"a"})).accept);
    REQUIRE(paced.decide(st, person_with(0, {"a", "b"})).accept);
  }

  SECTION("single open minimum uses the end-game rule") {
    const auto st = state_at({{"a", 100}}, stats_of({{"a", 0.5}}), 0, 0);
    const auto d = paced.decide(st, person_with(0, {"a"}));
    REQUIRE(d.accept);
    REQUIRE(mentions(d, "end-game"));
  }

  SECTION("filler has to beat the reject slack by the margin") {
    const auto st = state_at({{"a", 100}}, stats_of({{"a", 0.5}}), 0, 0);
    const auto d = paced.decide(st, person_with(0, {"young"}));
    REQUIRE_FALSE(d.accept);
    REQUIRE(mentions(d, "filler"));
    REQUIRE_FALSE(d.scoring.dual.has_value());
  }
}

TEST_CASE("PacedFeasible with duals: gate and aggressive mode", "[strategy]") {
  PacedFeasibleStrategy gated(StrategyConfig::defaults_for(StrategyKind::PacedFeasibleDuals));
  REQUIRE(gated.name() == "paced-feasible-duals");

  SECTION("two open minima: helpers are always taken") {
    const auto st = state_at({{"a", 100}, {"b", 100}}, stats_of({{"a", 0.5}, {"b", 0.5}}),
                             0, 0);
    const auto d = gated.decide(st, person_with(0, {"a"}));
    REQUIRE(d.accept);
    REQUIRE(d.scoring.dual.has_value());
  }

  SECTION("zero-seeded prices hold back helpers while many minima are open") {
    const auto st = state_at({{"a", 100}, {"b", 100}, {"c", 100}},
                             stats_of({{"a", 0.5}, {"b", 0.5}, {"c", 0.5}}), 0, 0);
    const auto all = person_with(0, {"a", "b", "c"});

    PacedFeasibleStrategy plain;
    REQUIRE(plain.decide(st, all).accept);

    const auto d = gated.decide(st, all);
    REQUIRE_FALSE(d.accept);
    REQUIRE(d.scoring.dual->total_value == 0.0);
    REQUIRE(d.scoring.dual->threshold == 0.5);
  }
}

TEST_CASE("DualPricing: thresholds", "[strategy]") {
  const auto stats = stats_of({{"a", 0.5}, {"b", 0.1}});

  SECTION("empty venue takes helpers and fillers") {
    DualPricingStrategy dp;
    const auto st = state_at({{"a", 100}, {"b", 100}}, stats, 0, 0);
    const auto helper = dp.decide(st, person_with(0, {"a"}));
    REQUIRE(helper.accept);
    REQUIRE(helper.scoring.dual->total_value == Approx(0.5));
    REQUIRE(dp.decide(st, person_with(0, {})).accept);
  }

  SECTION("seat cost at 60% utilization") {
    DualPricingStrategy dp;
    const auto st = state_at({{"a", 100}, {"b", 100}}, stats, 600, 0, {{"a", 50}, {"b", 20}});
    // cost = 3 * 0.6^3 = 0.648
    const auto filler = dp.decide(st, person_with(600, {}));
    REQUIRE_FALSE(filler.accept);
    REQUIRE(filler.scoring.dual->seat_cost == Approx(0.648));
    REQUIRE_FALSE(dp.decide(st, person_with(600, {"a"})).accept);
    REQUIRE(dp.decide(st, person_with(600, {"b"})).accept);
  }

  SECTION("satisfied threshold applies when unconditional fill is off") {
    auto cfg = StrategyConfig::defaults_for(StrategyKind::DualPricing);
    cfg.fill_when_satisfied = false;
    DualPricingStrategy dp(cfg);
    const auto st = state_at({{"a", 10}}, stats, 100, 0, {{"a", 10}});
    const auto d = dp.decide(st, person_with(100, {"a"}));
    REQUIRE_FALSE(d.accept);
    REQUIRE(mentions(d, "satisfied"));
    REQUIRE(d.scoring.dual->threshold == 0.8);
  }
}

TEST_CASE("DualPricing: prices refresh on schedule", "[strategy]") {
  const auto stats = stats_of({{"a", 0.5}, {"b", 0.1}});
  DualPricingStrategy dp;
  RecordingSink sink;
  dp.set_diagnostics(&sink);

  const auto at = [&](int rejected) {
    return state_at({{"a", 100}, {"b", 100}}, stats, 0, rejected);
  };
  const auto nobody = person_with(0, {});

  dp.decide(at(0), nobody);
  REQUIRE(dp.duals().initialized());
  REQUIRE(sink.prices.empty());

  dp.decide(at(5), nobody);
  REQUIRE(sink.prices.empty());

  dp.decide(at(10), nobody);
  REQUIRE(sink.prices.size() == 1);
  REQUIRE(sink.prices[0].processed == 10);
  // a is ahead of pace and gets cheaper; b is behind and gets dearer
  REQUIRE(sink.prices[0].prices.at("a") < 0.5);
  REQUIRE(sink.prices[0].prices.at("b") > 5.0);
  REQUIRE(sink.prices[0].slacks.at("b") < 0.0);
  REQUIRE(dp.duals().get("a") == sink.prices[0].prices.at("a"));

  dp.decide(at(15), nobody);
  dp.decide(at(20), nobody);
  REQUIRE(sink.prices.size() == 2);
}

TEST_CASE("PrimalLP: rounding the relaxation", "[strategy]") {
  const auto stats = stats_of({{"a", 0.5}});

  SECTION("behind schedule: x* = 1 always admits") {
    PrimalLPStrategy primal;
    const auto st = state_at({{"a", 100}}, stats, 0, 4000);
    const auto d = primal.decide(st, person_with(4000, {"a"}));
    REQUIRE(d.accept);
    REQUIRE(d.scoring.lp->admission_probability == 1.0);
    REQUIRE(d.scoring.lp->draw >= 0.0);

    const auto s = primal.stats();
    REQUIRE(s.total_solves == 1);
    REQUIRE(s.actual_admissions == 1);
    REQUIRE(s.expected_admissions == Approx(1.0));
  }

  SECTION("x* below the threshold") {
    PrimalLPStrategy primal;
    const auto st = state_at({{"a", 100}}, stats, 0, 0);
    const auto d = primal.decide(st, person_with(0, {"a"}));
    REQUIRE_FALSE(d.accept);
    REQUIRE(d.scoring.lp->feasible);
    REQUIRE(d.scoring.lp->draw == -1.0);
  }

  SECTION("ahead of schedule is infeasible") {
    PrimalLPStrategy primal;
    const auto st = state_at({{"a", 100}}, stats, 60, 3940, {{"a", 60}});
    const auto d = primal.decide(st, person_with(4000, {"a"}));
    REQUIRE_FALSE(d.accept);
    REQUIRE_FALSE(d.scoring.lp->feasible);
  }

  SECTION("on-pace row the candidate does not touch") {
    PrimalLPStrategy primal;
    const auto st = state_at({{"berlin_local", 750}, {"techno_lover", 650}},
                             stats_of({{"berlin_local", 0.398}, {"techno_lover", 0.627}}),
                             100, 188, {{"berlin_local", 27}, {"techno_lover", 20}});
    const auto d = primal.decide(st, person_with(288, {"techno_lover"}));
    REQUIRE(d.accept);
    REQUIRE(d.scoring.lp->feasible);
    REQUIRE(d.scoring.lp->admission_probability == 1.0);
  }

  SECTION("full venue") {
    PrimalLPStrategy primal;
    const auto st = state_at({{"a", 100}}, stats, 1000, 3000, {{"a", 10}});
    const auto d = primal.decide(st, person_with(4000, {"a"}));
    REQUIRE_FALSE(d.accept);
    REQUIRE(mentions(d, "full"));
    REQUIRE(primal.stats().total_solves == 0);
  }

  SECTION("seeded draws are reproducible") {
    // progress 0.5: scaled capacity 50.5 with 50 admitted, x* = 0.5
    const auto st = state_at({{"a", 101}}, stats, 50, 3950, {{"a", 50}});
    const auto p = person_with(4000, {"a"});
    PrimalLPStrategy first;
    PrimalLPStrategy second;

    std::vector<bool> a, b;
    for (int i = 0; i < 64; ++i) {
      a.push_back(first.decide(st, p).accept);
      b.push_back(second.decide(st, p).accept);
    }
    REQUIRE(a == b);
    const auto s = first.stats();
    REQUIRE(s.actual_admissions > 0);
    REQUIRE(s.actual_admissions < 64);
    REQUIRE(s.mean_probability == Approx(0.5));
    REQUIRE(s.expected_admissions == Approx(32.0));

    first.reset();
    REQUIRE(first.stats().total_solves == 0);
    std::vector<bool> again;
    for (int i = 0; i < 64; ++i)
      again.push_back(first.decide(st, p).accept);
    REQUIRE(again == a);
  }
}
