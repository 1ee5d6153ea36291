#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "admit_core/person_scorer.hpp"
#include "fixtures.hpp"

using namespace admit_core;
using namespace admit_core::testing;
using Catch::Approx;

TEST_CASE("PersonScorer: seat cost grows with utilization", "[scorer]") {
  const auto stats = stats_of({{"a", 0.5}});
  REQUIRE(seat_cost_risk(state_at({{"a", 10}}, stats, 0, 0)) == 0.0);
  REQUIRE(seat_cost_risk(state_at({{"a", 10}}, stats, 500, 0)) == Approx(3.0 * 0.125));
  REQUIRE(seat_cost_risk(state_at({{"a", 10}}, stats, 1000, 0)) == Approx(3.0));

  SeatCostConfig linear;
  linear.alpha = 2.0;
  linear.beta = 1.0;
  REQUIRE(seat_cost_risk(state_at({{"a", 10}}, stats, 250, 0), linear) == Approx(0.5));
}

TEST_CASE("PersonScorer: only unmet helped constraints earn their price", "[scorer]") {
  const auto stats = stats_of({{"a", 0.5}, {"b", 0.1}, {"c", 0.25}});
  const auto st = state_at({{"a", 100}, {"b", 50}, {"c", 20}}, stats, 500, 0,
                           {{"a", 40}, {"b", 10}, {"c", 20}});
  DualPriceTracker duals;
  duals.init(st.constraints, st.statistics);

  const auto score = score_person(person_with(3, {"a", "b", "c", "young"}), duals, st);
  REQUIRE(score.helped_attributes.size() == 2);
  REQUIRE(score.shadow_price_sum == Approx(duals.get("a") + duals.get("b")));
  REQUIRE(score.seat_cost == Approx(0.375));
  REQUIRE(score.total_value == Approx(score.shadow_price_sum - 0.375));

  const auto filler = score_person(person_with(4, {"c"}), duals, st);
  REQUIRE(filler.helped_attributes.empty());
  REQUIRE(filler.shadow_price_sum == 0.0);
  REQUIRE(filler.total_value == Approx(-0.375));
}

TEST_CASE("PersonScorer: scoring is idempotent", "[scorer]") {
  const auto st = state_at({{"a", 100}}, stats_of({{"a", 0.3}}), 100, 50, {{"a", 20}});
  DualPriceTracker duals;
  duals.init(st.constraints, st.statistics);
  const auto p = person_with(150, {"a"});

  const auto s1 = score_person(p, duals, st);
  const auto s2 = score_person(p, duals, st);
  REQUIRE(s1.total_value == s2.total_value);
  REQUIRE(s1.helped_attributes == s2.helped_attributes);
}
