#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <random>
#include <stdexcept>

#include "admit_core/dual_tracker.hpp"
#include "fixtures.hpp"

using namespace admit_core;
using namespace admit_core::testing;
using Catch::Approx;

TEST_CASE("DualPriceTracker: rarity seeding", "[duals]") {
  DualPriceTracker duals;
  REQUIRE_FALSE(duals.initialized());

  SECTION("inverse frequency mapped onto [0.5, 5.0]") {
    duals.init({{"common", 0}, {"rare", 0}, {"mid", 0}},
               stats_of({{"common", 0.5}, {"rare", 0.1}, {"mid", 0.25}}));
    REQUIRE(duals.initialized());
    REQUIRE(duals.size() == 3);
    REQUIRE(duals.get("common") == Approx(0.5));
    REQUIRE(duals.get("rare") == Approx(5.0));
    REQUIRE(duals.get("mid") == Approx(0.5 + 4.5 * 2.0 / 8.0));
  }

  SECTION("equal frequencies seed a flat price") {
    duals.init({{"a", 0}, {"b", 0}}, stats_of({{"a", 0.3}, {"b", 0.3}}));
    REQUIRE(duals.get("a") == Approx(2.5));
    REQUIRE(duals.get("b") == Approx(2.5));
  }

  SECTION("zero frequency is floored") {
    duals.init({{"never", 0}, {"half", 0}}, stats_of({{"never", 0.0}, {"half", 0.5}}));
    REQUIRE(duals.get("never") == Approx(5.0));
    REQUIRE(duals.get("half") == Approx(0.5));
  }
}

TEST_CASE("DualPriceTracker: zero seeding", "[duals]") {
  DualTrackerConfig cfg;
  cfg.seeding = DualSeeding::Zero;
  DualPriceTracker duals(cfg);
  duals.init({{"a", 0}, {"b", 0}}, stats_of({{"a", 0.1}, {"b", 0.9}}));
  REQUIRE(duals.get("a") == 0.0);
  REQUIRE(duals.get("b") == 0.0);
}

TEST_CASE("DualPriceTracker: behind raises, ahead lowers", "[duals]") {
  DualPriceTracker duals;
  duals.init({{"common", 0}, {"rare", 0}}, stats_of({{"common", 0.5}, {"rare", 0.1}}));

  duals.update({{"common", -100.0}, {"rare", 200.0}});
  REQUIRE(duals.get("common") == Approx(0.5 + 0.1 * 100.0 / 1000.0));
  REQUIRE(duals.get("rare") == Approx(5.0 - 0.1 * 200.0 / 1000.0));

  const auto all = duals.get_all();
  REQUIRE(all.size() == 2);
  REQUIRE(all.begin()->first == "common");
}

TEST_CASE("DualPriceTracker: ignores untracked and non-finite slacks", "[duals]") {
  DualPriceTracker duals;
  duals.init({{"a", 0}, {"b", 0}}, stats_of({{"a", 0.2}, {"b", 0.4}}));
  const double a0 = duals.get("a");
  const double b0 = duals.get("b");

  duals.update({{"a", std::numeric_limits<double>::quiet_NaN()},
                {"b", std::numeric_limits<double>::infinity()},
                {"ghost", -500.0}});
  REQUIRE(duals.get("a") == a0);
  REQUIRE(duals.get("b") == b0);
  REQUIRE(duals.get("ghost") == 0.0);
  REQUIRE(duals.size() == 2);
}

TEST_CASE("DualPriceTracker: prices stay within bounds", "[duals]") {
  DualTrackerConfig cfg;
  cfg.learning_rate = 5.0;
  cfg.min_dual = 0.25;
  cfg.max_dual = 3.0;
  DualPriceTracker duals(cfg);
  duals.init({{"a", 0}, {"b", 0}, {"c", 0}},
             stats_of({{"a", 0.05}, {"b", 0.5}, {"c", 0.9}}));

  std::mt19937_64 rng(7);
  std::uniform_real_distribution<double> slack(-800.0, 800.0);
  for (int i = 0; i < 2000; ++i) {
    duals.update({{"a", slack(rng)}, {"b", slack(rng)}, {"c", slack(rng)}});
    for (const auto &kv : duals.get_all()) {
      REQUIRE(kv.second >= cfg.min_dual);
      REQUIRE(kv.second <= cfg.max_dual);
    }
  }
}

TEST_CASE("DualPriceTracker: zero price is a floor", "[duals]") {
  DualTrackerConfig cfg;
  cfg.seeding = DualSeeding::Zero;
  DualPriceTracker duals(cfg);
  duals.init({{"a", 0}}, stats_of({{"a", 0.5}}));

  duals.update({{"a", 300.0}});
  REQUIRE(duals.get("a") == 0.0);
  duals.update({{"a", -300.0}});
  REQUIRE(duals.get("a") == Approx(0.03));
}

TEST_CASE("DualPriceTracker: invalid configuration", "[duals]") {
  DualTrackerConfig cfg;
  cfg.min_dual = 2.0;
  cfg.max_dual = 1.0;
  REQUIRE_THROWS_AS(DualPriceTracker(cfg), std::invalid_argument);

  DualTrackerConfig neg;
  neg.learning_rate = -0.1;
  REQUIRE_THROWS_AS(DualPriceTracker(neg), std::invalid_argument);
}
