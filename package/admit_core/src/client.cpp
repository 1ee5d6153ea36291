#include "admit_core/client.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

#include "admit_core/log.hpp"

namespace admit_core {

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
  const double scaled = static_cast<double>(base_delay.count()) *
                        std::pow(multiplier, std::max(0, attempt - 1));
  const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

RetryingGameClient::RetryingGameClient(GameClient &inner, RetryPolicy policy,
                                       Sleeper sleeper)
    : inner_(inner), policy_(policy), sleeper_(std::move(sleeper)) {
  if (policy_.max_attempts < 1)
    throw std::invalid_argument("RetryPolicy: max_attempts must be >= 1");
  if (policy_.multiplier < 1.0)
    throw std::invalid_argument("RetryPolicy: multiplier must be >= 1");
  if (!sleeper_)
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

template <typename Fn>
auto RetryingGameClient::with_retries(const char *what, Fn &&fn) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransientClientError &e) {
      if (attempt >= policy_.max_attempts) {
        log_error("{} failed after {} attempts: {}", what, attempt, e.what());
        throw;
      }
      const auto delay = policy_.delay_for(attempt);
      log_warn("{} failed ({}), retrying in {} ms (attempt {}/{})", what,
               e.what(), delay.count(), attempt + 1, policy_.max_attempts);
      ++retries_;
      sleeper_(delay);
    }
  }
}

NewGame RetryingGameClient::start_new_game(int scenario) {
  return with_retries("start_new_game",
                      [&] { return inner_.start_new_game(scenario); });
}

DecideAndNextResponse
RetryingGameClient::decide_and_next(const std::string &game_id,
                                    std::int64_t person_index,
                                    std::optional<bool> accept) {
  return with_retries("decide_and_next", [&] {
    return inner_.decide_and_next(game_id, person_index, accept);
  });
}

} // namespace admit_core
