#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "admit_core/client.hpp"
#include "admit_core/log.hpp"

using namespace admit_core;
using std::chrono::milliseconds;

namespace {

// Throws `failures` transient errors before answering, then keeps answering.
class FlakyClient final : public GameClient {
public:
  explicit FlakyClient(int failures) : failures_(failures) {}

  NewGame start_new_game(int scenario) override {
    ++calls;
    if (failures_-- > 0)
      throw TransientClientError("connection reset");
    NewGame g;
    g.game_id = "flaky-" + std::to_string(scenario);
    return g;
  }

  DecideAndNextResponse decide_and_next(const std::string &game_id, std::int64_t,
                                        std::optional<bool>) override {
    ++calls;
    throw GameFinished(game_id);
  }

  int calls{0};

private:
  int failures_;
};

struct QuietLog {
  QuietLog() : before(log_level()) { set_log_level(LogLevel::Off); }
  ~QuietLog() { set_log_level(before); }
  LogLevel before;
};

} // namespace

TEST_CASE("RetryPolicy: exponential delays are capped", "[client]") {
  RetryPolicy policy;
  REQUIRE(policy.delay_for(1) == milliseconds(1000));
  REQUIRE(policy.delay_for(2) == milliseconds(2000));
  REQUIRE(policy.delay_for(4) == milliseconds(8000));
  REQUIRE(policy.delay_for(5) == milliseconds(8000));
}

TEST_CASE("RetryingGameClient: transient errors are retried", "[client]") {
  QuietLog quiet;
  std::vector<milliseconds> slept;
  auto sleeper = [&](milliseconds d) { slept.push_back(d); };

  SECTION("recovers within the attempt budget") {
    FlakyClient inner(2);
    RetryingGameClient client(inner, RetryPolicy{}, sleeper);
    const auto game = client.start_new_game(3);
    REQUIRE(game.game_id == "flaky-3");
    REQUIRE(inner.calls == 3);
    REQUIRE(client.retries() == 2);
    REQUIRE(slept == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000)});
  }

  SECTION("gives up after the last attempt") {
    FlakyClient inner(5);
    RetryingGameClient client(inner, RetryPolicy{}, sleeper);
    REQUIRE_THROWS_AS(client.start_new_game(1), TransientClientError);
    REQUIRE(inner.calls == 3);
    REQUIRE(slept.size() == 2);
  }

  SECTION("a finished game is not retried") {
    FlakyClient inner(0);
    RetryingGameClient client(inner, RetryPolicy{}, sleeper);
    REQUIRE_THROWS_AS(client.decide_and_next("g", 1, true), GameFinished);
    REQUIRE(inner.calls == 1);
    REQUIRE(slept.empty());
    REQUIRE(client.retries() == 0);
  }
}

TEST_CASE("RetryingGameClient: policy validation", "[client]") {
  FlakyClient inner(0);
  RetryPolicy no_attempts;
  no_attempts.max_attempts = 0;
  REQUIRE_THROWS_AS(RetryingGameClient(inner, no_attempts), std::invalid_argument);

  RetryPolicy shrinking;
  shrinking.multiplier = 0.5;
  REQUIRE_THROWS_AS(RetryingGameClient(inner, shrinking), std::invalid_argument);
}

TEST_CASE("SimulatedGameClient: passes calls to the simulator", "[client]") {
  SimulatedGameClient client(7);
  const auto game = client.start_new_game(2);
  REQUIRE(game.constraints.size() == 5);
  const auto res = client.decide_and_next(game.game_id, 0, std::nullopt);
  REQUIRE(res.next_person.has_value());
  REQUIRE(client.simulator().game_count() == 1);
}
