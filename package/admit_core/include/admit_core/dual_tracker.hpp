#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include <Eigen/Dense>

#include "admit_core/state.hpp"

namespace admit_core {

enum class DualSeeding { Zero, Rarity };

struct DualTrackerConfig {
  double learning_rate{0.1}; // eta
  double min_dual{0.0};
  double max_dual{20.0};
  int venue_capacity{kVenueCapacity};
  DualSeeding seeding{DualSeeding::Rarity};
  // Rarity seeding maps inverse frequency onto [seed_low, seed_high].
  double seed_low{0.5};
  double seed_high{5.0};
  double seed_flat{2.5}; // every frequency equal
  double min_frequency{0.01};
};

// Shadow price per constraint attribute. Seeded once per game, then moved by
// one projected sub-gradient step per update():
//
//   price <- clamp(price - eta * slack / venue_capacity, min_dual, max_dual)
//
// Slack is negative when a constraint is behind its statistical pace, so a
// behind constraint gains price and an ahead one loses it.
class DualPriceTracker {
public:
  DualPriceTracker() = default;
  explicit DualPriceTracker(DualTrackerConfig cfg);

  void init(const std::vector<Constraint> &constraints,
            const AttributeStatistics &stats);

  void update(const std::map<std::string, double> &slacks);

  // 0.0 for untracked attributes.
  double get(const std::string &attribute) const;
  std::map<std::string, double> get_all() const;

  bool initialized() const { return initialized_; }
  std::size_t size() const { return attributes_.size(); }
  const DualTrackerConfig &config() const { return cfg_; }

private:
  DualTrackerConfig cfg_{};
  bool initialized_{false};
  std::vector<std::string> attributes_;
  std::unordered_map<std::string, Eigen::Index> index_;
  Eigen::ArrayXd prices_;
};

} // namespace admit_core
