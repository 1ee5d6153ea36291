#include "admit_core/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "admit_core/log.hpp"

namespace admit_core {

std::uint64_t mix_seed(std::uint64_t a, std::uint64_t b) {
  std::uint64_t z = a + 0x9e3779b97f4a7c15ULL + (b << 6) + (b >> 2);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

namespace {

void set_pair(AttributeStatistics &stats, const std::string &a,
              const std::string &b, double rho) {
  stats.correlations[a][b] = rho;
  stats.correlations[b][a] = rho;
}

ScenarioConfig scenario_1() {
  ScenarioConfig cfg;
  cfg.id = 1;
  cfg.constraints = {{"techno_lover", 650},
                     {"well_connected", 450},
                     {"creative", 300},
                     {"berlin_local", 750}};
  cfg.statistics.relative_frequencies = {{"techno_lover", 0.627},
                                         {"well_connected", 0.470},
                                         {"creative", 0.062},
                                         {"berlin_local", 0.398}};
  for (const auto &kv : cfg.statistics.relative_frequencies)
    cfg.statistics.correlations[kv.first][kv.first] = 1.0;
  set_pair(cfg.statistics, "techno_lover", "berlin_local", 0.15);
  set_pair(cfg.statistics, "techno_lover", "well_connected", 0.03);
  set_pair(cfg.statistics, "techno_lover", "creative", 0.01);
  set_pair(cfg.statistics, "well_connected", "creative", -0.01);
  set_pair(cfg.statistics, "well_connected", "berlin_local", 0.04);
  set_pair(cfg.statistics, "creative", "berlin_local", -0.02);
  return cfg;
}

ScenarioConfig scenario_2() {
  ScenarioConfig cfg;
  cfg.id = 2;
  cfg.constraints = {{"berlin_local", 400},
                     {"techno_lover", 800},
                     {"creative", 150},
                     {"well_connected", 600},
                     {"fashion_forward", 350}};
  cfg.statistics.relative_frequencies = {
      {"berlin_local", 0.398},    {"techno_lover", 0.627},
      {"creative", 0.062},        {"well_connected", 0.470},
      {"fashion_forward", 0.332}, {"young", 0.425},
      {"artist", 0.183},          {"regular_visitor", 0.245}};
  return cfg;
}

ScenarioConfig scenario_3() {
  ScenarioConfig cfg;
  cfg.id = 3;
  cfg.constraints = {{"creative", 180},        {"berlin_local", 350},
                     {"techno_lover", 900},    {"well_connected", 700},
                     {"fashion_forward", 400}, {"artist", 100}};
  cfg.statistics.relative_frequencies = {
      {"creative", 0.062},        {"berlin_local", 0.398},
      {"techno_lover", 0.627},    {"well_connected", 0.470},
      {"fashion_forward", 0.332}, {"artist", 0.183},
      {"young", 0.425},           {"regular_visitor", 0.245}};
  return cfg;
}

inline double normal_cdf(double z) { return 0.5 * std::erfc(-z / std::sqrt(2.0)); }

} // namespace

ScenarioConfig builtin_scenario(int scenario) {
  switch (scenario) {
  case 1:
    return scenario_1();
  case 2:
    return scenario_2();
  case 3:
    return scenario_3();
  default:
    throw std::invalid_argument(fmt::format("Unknown scenario: {}", scenario));
  }
}

// ---------------------------------------------------------------------------

PersonSampler::PersonSampler(const AttributeStatistics &stats, std::uint64_t seed)
    : rng_(seed) {
  attributes_.reserve(stats.relative_frequencies.size());
  for (const auto &kv : stats.relative_frequencies)
    attributes_.push_back(kv.first);
  std::sort(attributes_.begin(), attributes_.end());

  const Eigen::Index n = static_cast<Eigen::Index>(attributes_.size());
  probabilities_.resize(n);
  Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(n, n);
  bool any_pair = false;
  for (Eigen::Index i = 0; i < n; ++i) {
    const std::string &a = attributes_[static_cast<std::size_t>(i)];
    probabilities_[i] = stats.probability(a);
    for (Eigen::Index j = i + 1; j < n; ++j) {
      const std::string &b = attributes_[static_cast<std::size_t>(j)];
      const double rho = 0.5 * (stats.correlation(a, b) + stats.correlation(b, a));
      corr(i, j) = rho;
      corr(j, i) = rho;
      any_pair = any_pair || rho != 0.0;
    }
  }

  if (!any_pair)
    return;
  Eigen::LLT<Eigen::MatrixXd> llt(corr);
  if (llt.info() != Eigen::Success) {
    log_warn("correlation matrix is not positive definite, drawing "
             "attributes independently");
    return;
  }
  chol_ = llt.matrixL();
  correlated_ = true;
}

Person PersonSampler::sample(std::int64_t index) {
  Person p;
  p.index = index;
  const Eigen::Index n = probabilities_.size();
  if (correlated_) {
    Eigen::VectorXd draw(n);
    for (Eigen::Index i = 0; i < n; ++i)
      draw[i] = normal_(rng_);
    const Eigen::VectorXd z = chol_ * draw;
    for (Eigen::Index i = 0; i < n; ++i)
      p.attributes[attributes_[static_cast<std::size_t>(i)]] =
          normal_cdf(z[i]) < probabilities_[i];
  } else {
    for (Eigen::Index i = 0; i < n; ++i)
      p.attributes[attributes_[static_cast<std::size_t>(i)]] =
          unif_(rng_) < probabilities_[i];
  }
  return p;
}

// ---------------------------------------------------------------------------

GameSimulator::GameSimulator(std::uint64_t seed) : seed_(seed) {
  for (int s = 1; s <= 3; ++s)
    scenarios_.emplace(s, builtin_scenario(s));
}

void GameSimulator::add_scenario(ScenarioConfig cfg) {
  if (cfg.venue_capacity <= 0 || cfg.max_rejections <= 0) {
    throw std::invalid_argument(
        "add_scenario: capacity and rejection ceiling must be positive");
  }
  const int id = cfg.id;
  scenarios_[id] = std::move(cfg);
}

NewGame GameSimulator::start_new_game(int scenario) {
  auto it = scenarios_.find(scenario);
  if (it == scenarios_.end())
    throw std::invalid_argument(fmt::format("Unknown scenario: {}", scenario));
  const ScenarioConfig &cfg = it->second;

  const std::uint64_t game_seed = mix_seed(seed_, games_started_);
  std::string game_id = fmt::format("sim-{}-{:08x}", games_started_,
                                    game_seed & 0xffffffffULL);
  ++games_started_;

  SimulatedGame game{game_id, cfg, PersonSampler(cfg.statistics, game_seed)};
  for (const auto &c : cfg.constraints)
    game.admitted_attributes[c.attribute] = 0;
  games_.emplace(game_id, std::move(game));

  log_debug("simulated game {} started for scenario {}", game_id, scenario);

  NewGame out;
  out.game_id = std::move(game_id);
  out.constraints = cfg.constraints;
  out.statistics = cfg.statistics;
  out.venue_capacity = cfg.venue_capacity;
  out.max_rejections = cfg.max_rejections;
  return out;
}

DecideAndNextResponse
GameSimulator::decide_and_next(const std::string &game_id,
                               std::int64_t person_index,
                               std::optional<bool> accept) {
  SimulatedGame &g = find_game(game_id);
  if (g.finished())
    throw GameFinished(game_id);

  if (accept.has_value()) {
    if (!g.pending) {
      throw std::invalid_argument(fmt::format(
          "decide_and_next: no candidate is waiting in game {}", game_id));
    }
    if (g.pending->index != person_index) {
      throw std::invalid_argument(fmt::format(
          "decide_and_next: decision for person {} but person {} is waiting",
          person_index, g.pending->index));
    }
    if (*accept) {
      ++g.admitted_count;
      for (auto &kv : g.admitted_attributes) {
        if (g.pending->has(kv.first))
          ++kv.second;
      }
    } else {
      ++g.rejected_count;
    }
    g.pending.reset();
  } else if (g.pending) {
    throw std::invalid_argument(fmt::format(
        "decide_and_next: person {} is waiting for a decision in game {}",
        g.pending->index, game_id));
  }

  DecideAndNextResponse res;
  if (g.admitted_count >= g.config.venue_capacity) {
    g.status = GameStatus::Completed;
  } else if (g.rejected_count >= g.config.max_rejections) {
    g.status = GameStatus::Failed;
    g.reason = "Maximum rejections reached";
  } else {
    g.pending = g.sampler.sample(g.next_index++);
    res.next_person = g.pending;
  }
  res.status = g.status;
  res.admitted_count = g.admitted_count;
  res.rejected_count = g.rejected_count;
  res.reason = g.reason;
  return res;
}

const SimulatedGame &GameSimulator::game(const std::string &game_id) const {
  auto it = games_.find(game_id);
  if (it == games_.end())
    throw std::out_of_range("Game not found: " + game_id);
  return it->second;
}

SimulatedGame &GameSimulator::find_game(const std::string &game_id) {
  auto it = games_.find(game_id);
  if (it == games_.end())
    throw std::out_of_range("Game not found: " + game_id);
  return it->second;
}

std::size_t GameSimulator::cleanup_finished_games() {
  std::size_t cleaned = 0;
  for (auto it = games_.begin(); it != games_.end();) {
    if (it->second.finished()) {
      it = games_.erase(it);
      ++cleaned;
    } else {
      ++it;
    }
  }
  log_debug("cleaned up {} finished games", cleaned);
  return cleaned;
}

} // namespace admit_core
