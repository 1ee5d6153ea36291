#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "admit_core/scaled_lp.hpp"

namespace admit_core {

enum class SolutionType { Optimal, Infeasible, Unbounded };

const char *to_string(SolutionType type);

struct LPSolution {
  bool feasible{false};
  double optimal_value{0.0};
  double admission_probability{0.0}; // x* in [0,1]
  std::vector<std::string> active_constraints;
  std::map<std::string, double> constraint_slacks;
  SolutionType solution_type{SolutionType::Infeasible};
  int iterations{0};
  double solve_time_ms{0.0};
};

class LinearProgramSolver {
public:
  virtual ~LinearProgramSolver() = default;
  virtual LPSolution solve(const ScaledLPProblem &problem) const = 0;
  virtual std::string name() const = 0;
};

// Closed-form solver for the one-variable relaxation. Infeasible (x* = 0)
// when some row is already above its scaled capacity at x = 0 by more than
// kActiveTolerance; otherwise x*
// is the tightest per-row ceiling, clamped to [0,1]. Rows whose slack at x*
// is within 1e-6 of zero are reported active.
class AnalyticalLPSolver final : public LinearProgramSolver {
public:
  static constexpr double kActiveTolerance = 1e-6;

  LPSolution solve(const ScaledLPProblem &problem) const override;
  std::string name() const override { return "AnalyticalSolver"; }
};

std::unique_ptr<LinearProgramSolver> make_lp_solver();

} // namespace admit_core
