#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "admit_core/state.hpp"

namespace admit_core {

enum class GameStatus { Running, Completed, Failed };

inline const char *to_string(GameStatus status) {
  switch (status) {
  case GameStatus::Running:
    return "running";
  case GameStatus::Completed:
    return "completed";
  case GameStatus::Failed:
    return "failed";
  }
  return "?";
}

struct NewGame {
  std::string game_id;
  std::vector<Constraint> constraints;
  AttributeStatistics statistics;
  int venue_capacity{kVenueCapacity};
  int max_rejections{kMaxRejections};
};

// Reply to a decision for the previous candidate. Counts are authoritative;
// next_person is empty once the game has ended.
struct DecideAndNextResponse {
  GameStatus status{GameStatus::Running};
  int admitted_count{0};
  int rejected_count{0};
  std::optional<Person> next_person;
  std::string reason; // set when the game failed
};

// The service refuses decisions for a game that has already ended.
class GameFinished : public std::runtime_error {
public:
  explicit GameFinished(const std::string &game_id)
      : std::runtime_error("Game is already finished: " + game_id) {}
};

// Failure worth retrying (timeouts, dropped connections, 5xx).
class TransientClientError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace admit_core
