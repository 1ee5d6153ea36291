#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>

#include "admit_core/protocol.hpp"
#include "admit_core/state.hpp"

namespace admit_core {

// splitmix64-style mixing to decorrelate seeds.
std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b);

struct ScenarioConfig {
  int id{0};
  std::vector<Constraint> constraints;
  AttributeStatistics statistics;
  int venue_capacity{kVenueCapacity};
  int max_rejections{kMaxRejections};
};

// Scenarios 1-3 of the challenge. Throws std::invalid_argument otherwise.
ScenarioConfig builtin_scenario(int scenario);

// Draws candidates attribute by attribute. With a positive-definite
// correlation matrix the draw goes through a Gaussian copula:
//
//   z = L * n,  n ~ N(0, I),  C = L * L^T
//   has[i] = Phi(z[i]) < p[i]
//
// which keeps each marginal at p[i] while correlated attributes co-occur.
// Without correlations, or when C is not positive definite, the attributes
// are drawn independently.
class PersonSampler {
public:
  PersonSampler(const AttributeStatistics &stats, std::uint64_t seed);

  Person sample(std::int64_t index);

  const std::vector<std::string> &attributes() const { return attributes_; }
  bool correlated() const { return correlated_; }

private:
  std::vector<std::string> attributes_; // sorted
  Eigen::ArrayXd probabilities_;
  Eigen::MatrixXd chol_;
  bool correlated_{false};
  std::mt19937_64 rng_;
  std::normal_distribution<double> normal_{0.0, 1.0};
  std::uniform_real_distribution<double> unif_{0.0, 1.0};
};

struct SimulatedGame {
  std::string game_id;
  ScenarioConfig config;
  PersonSampler sampler;
  int admitted_count{0};
  int rejected_count{0};
  std::unordered_map<std::string, int> admitted_attributes;
  std::int64_t next_index{0};
  std::optional<Person> pending; // issued, awaiting a decision
  GameStatus status{GameStatus::Running};
  std::string reason;

  bool finished() const { return status != GameStatus::Running; }
};

// Local stand-in for the challenge service. Games end as completed once the
// venue is full and as failed once the rejection ceiling is hit.
class GameSimulator {
public:
  explicit GameSimulator(std::uint64_t seed = 42);

  // Adds or replaces a scenario.
  void add_scenario(ScenarioConfig cfg);
  bool has_scenario(int scenario) const { return scenarios_.count(scenario) > 0; }

  NewGame start_new_game(int scenario);

  // Applies `accept` to the waiting candidate (it must be `person_index`),
  // then checks the end conditions and issues the next candidate. The first
  // call of a game carries no decision; any later call without one throws
  // std::invalid_argument.
  DecideAndNextResponse decide_and_next(const std::string &game_id,
                                        std::int64_t person_index,
                                        std::optional<bool> accept);

  const SimulatedGame &game(const std::string &game_id) const;
  std::size_t game_count() const { return games_.size(); }

  // Returns the number of games removed.
  std::size_t cleanup_finished_games();

private:
  SimulatedGame &find_game(const std::string &game_id);

  std::uint64_t seed_;
  std::uint64_t games_started_{0};
  std::map<int, ScenarioConfig> scenarios_;
  std::unordered_map<std::string, SimulatedGame> games_;
};

} // namespace admit_core
