#include "admit_core/dual_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "admit_core/log.hpp"

namespace admit_core {

DualPriceTracker::DualPriceTracker(DualTrackerConfig cfg) : cfg_(cfg) {
  if (!(cfg_.min_dual <= cfg_.max_dual)) {
    throw std::invalid_argument("DualPriceTracker: require min_dual <= max_dual");
  }
  if (!(cfg_.learning_rate >= 0.0)) {
    throw std::invalid_argument("DualPriceTracker: learning rate must be >= 0");
  }
  if (cfg_.venue_capacity <= 0) {
    throw std::invalid_argument("DualPriceTracker: venue capacity must be positive");
  }
  log_debug("DualPriceTracker: eta={} bounds=[{}, {}]", cfg_.learning_rate,
            cfg_.min_dual, cfg_.max_dual);
}

void DualPriceTracker::init(const std::vector<Constraint> &constraints,
                            const AttributeStatistics &stats) {
  const int n = static_cast<int>(constraints.size());
  attributes_.clear();
  index_.clear();
  prices_ = Eigen::ArrayXd::Zero(n);
  for (int i = 0; i < n; ++i) {
    const std::string &attr = constraints[static_cast<std::size_t>(i)].attribute;
    attributes_.push_back(attr);
    index_[attr] = i;
  }

  if (cfg_.seeding == DualSeeding::Rarity && n > 0) {
    Eigen::ArrayXd inverse(n);
    for (int i = 0; i < n; ++i) {
      const double freq = stats.probability(attributes_[static_cast<std::size_t>(i)]);
      inverse[i] = 1.0 / std::max(freq, cfg_.min_frequency);
    }
    const double lo = inverse.minCoeff();
    const double range = inverse.maxCoeff() - lo;
    const double span = cfg_.seed_high - cfg_.seed_low;
    if (range > 0.0) {
      prices_ = cfg_.seed_low + span * (inverse - lo) / range;
    } else {
      prices_ = Eigen::ArrayXd::Constant(n, cfg_.seed_flat);
    }
    prices_ = prices_.max(cfg_.min_dual).min(cfg_.max_dual);
  }
  initialized_ = true;

  for (int i = 0; i < n; ++i) {
    log_debug("init dual {} = {:.3f}", attributes_[static_cast<std::size_t>(i)],
              prices_[i]);
  }
}

void DualPriceTracker::update(const std::map<std::string, double> &slacks) {
  const double scale = cfg_.learning_rate / static_cast<double>(cfg_.venue_capacity);
  for (const auto &kv : slacks) {
    auto it = index_.find(kv.first);
    if (it == index_.end() || !std::isfinite(kv.second))
      continue;
    const double before = prices_[it->second];
    const double raw = before - scale * kv.second;
    prices_[it->second] = std::max(cfg_.min_dual, std::min(cfg_.max_dual, raw));
    log_debug("dual {}: {:.4f} - {}*{:.2f}/{} -> {:.4f}", kv.first, before,
              cfg_.learning_rate, kv.second, cfg_.venue_capacity,
              prices_[it->second]);
  }
}

double DualPriceTracker::get(const std::string &attribute) const {
  auto it = index_.find(attribute);
  return it == index_.end() ? 0.0 : prices_[it->second];
}

std::map<std::string, double> DualPriceTracker::get_all() const {
  std::map<std::string, double> out;
  for (std::size_t i = 0; i < attributes_.size(); ++i)
    out[attributes_[i]] = prices_[static_cast<Eigen::Index>(i)];
  return out;
}

} // namespace admit_core
