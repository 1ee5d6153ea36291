#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace admit_core {

constexpr int kVenueCapacity = 1000;
constexpr int kMaxRejections = 20000;

struct Constraint {
  std::string attribute;
  int min_count{0};

  Constraint() = default;
  Constraint(std::string attribute_, int min_count_)
      : attribute(std::move(attribute_)), min_count(min_count_) {}
};

struct AttributeStatistics {
  std::unordered_map<std::string, double> relative_frequencies;
  std::unordered_map<std::string, std::unordered_map<std::string, double>>
      correlations;

  // Clamped to [0,1]; a missing or NaN frequency reads as 0.
  double probability(const std::string &attribute) const;
  // 1 on the diagonal, 0 when the pair is not given.
  double correlation(const std::string &a, const std::string &b) const;
};

struct Person {
  std::int64_t index{0};
  std::unordered_map<std::string, bool> attributes;

  Person() = default;
  Person(std::int64_t index_, std::unordered_map<std::string, bool> attributes_)
      : index(index_), attributes(std::move(attributes_)) {}

  bool has(const std::string &attribute) const {
    auto it = attributes.find(attribute);
    return it != attributes.end() && it->second;
  }
};

struct CurrentState {
  int admitted_count{0};
  int rejected_count{0};
  std::unordered_map<std::string, int> admitted_attributes;
  std::vector<Constraint> constraints;
  AttributeStatistics statistics;
  int venue_capacity{kVenueCapacity};

  int processed() const { return admitted_count + rejected_count; }
  int seats_left() const { return venue_capacity - admitted_count; }
  int admitted_with(const std::string &attribute) const {
    auto it = admitted_attributes.find(attribute);
    return it == admitted_attributes.end() ? 0 : it->second;
  }
};

// Raised when an attribute is looked up that no constraint declares.
class UnknownConstraint : public std::out_of_range {
public:
  explicit UnknownConstraint(const std::string &attribute)
      : std::out_of_range("Unknown constraint: " + attribute),
        attribute_(attribute) {}

  const std::string &attribute() const { return attribute_; }

private:
  std::string attribute_;
};

CurrentState init_state(std::vector<Constraint> constraints,
                        AttributeStatistics statistics,
                        int venue_capacity = kVenueCapacity);

// Full local update: totals and per-attribute tallies.
void record_decision(CurrentState &state, const Person &person, bool accepted);

// Per-attribute tallies only; totals are synced from the server.
void record_local_admission(CurrentState &state, const Person &person);

// Overwrite totals with authoritative counts. Counts never decrease.
void sync_counts(CurrentState &state, int admitted, int rejected);

const Constraint &find_constraint(const CurrentState &state,
                                  const std::string &attribute);

// max(0, min_count - admitted) per constraint, in declaration order.
Eigen::ArrayXi compute_deficits(const CurrentState &state);

bool all_minima_met(const Eigen::ArrayXi &deficits);

int unmet_count(const Eigen::ArrayXi &deficits);

// Constraint attributes the person carries whose deficit is still positive.
std::vector<std::string> helped_attributes(const CurrentState &state,
                                           const Eigen::ArrayXi &deficits,
                                           const Person &person);

} // namespace admit_core
