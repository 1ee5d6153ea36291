#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "admit_core/protocol.hpp"
#include "admit_core/simulator.hpp"

namespace admit_core {

// Transport to the challenge service.
class GameClient {
public:
  virtual ~GameClient() = default;

  virtual NewGame start_new_game(int scenario) = 0;
  // Decide for `person_index` and fetch the next candidate. The first call
  // of a game passes person_index 0 and no decision.
  virtual DecideAndNextResponse decide_and_next(const std::string &game_id,
                                                std::int64_t person_index,
                                                std::optional<bool> accept) = 0;
};

// In-process client over a GameSimulator.
class SimulatedGameClient final : public GameClient {
public:
  explicit SimulatedGameClient(std::uint64_t seed = 42) : sim_(seed) {}

  NewGame start_new_game(int scenario) override { return sim_.start_new_game(scenario); }
  DecideAndNextResponse decide_and_next(const std::string &game_id,
                                        std::int64_t person_index,
                                        std::optional<bool> accept) override {
    return sim_.decide_and_next(game_id, person_index, accept);
  }

  GameSimulator &simulator() { return sim_; }
  const GameSimulator &simulator() const { return sim_; }

private:
  GameSimulator sim_;
};

struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  double multiplier{2.0};
  std::chrono::milliseconds max_delay{8000};

  // Delay before retry number `attempt` (1-based):
  // min(max_delay, base_delay * multiplier^(attempt - 1)).
  std::chrono::milliseconds delay_for(int attempt) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Retries TransientClientError with exponential backoff. Anything else,
// GameFinished included, propagates on the first throw.
class RetryingGameClient final : public GameClient {
public:
  RetryingGameClient(GameClient &inner, RetryPolicy policy = {},
                     Sleeper sleeper = nullptr);

  NewGame start_new_game(int scenario) override;
  DecideAndNextResponse decide_and_next(const std::string &game_id,
                                        std::int64_t person_index,
                                        std::optional<bool> accept) override;

  const RetryPolicy &policy() const { return policy_; }
  int retries() const { return retries_; }

private:
  template <typename Fn> auto with_retries(const char *what, Fn &&fn);

  GameClient &inner_;
  RetryPolicy policy_;
  Sleeper sleeper_;
  int retries_{0};
};

} // namespace admit_core
