#include "admit_core/lp_solver.hpp"

#include <chrono>
#include <cmath>
#include <limits>

#include <fmt/ranges.h>

#include "admit_core/log.hpp"

namespace admit_core {

const char *to_string(SolutionType type) {
  switch (type) {
  case SolutionType::Optimal:
    return "optimal";
  case SolutionType::Infeasible:
    return "infeasible";
  case SolutionType::Unbounded:
    return "unbounded";
  }
  return "?";
}

LPSolution AnalyticalLPSolver::solve(const ScaledLPProblem &problem) const {
  const auto start = std::chrono::steady_clock::now();
  auto elapsed_ms = [&]() {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  LPSolution sol;
  sol.iterations = 1;

  // Scaled capacities are fractions of an integer schedule, so a row exactly
  // on pace can come out a few ulps short of its tally.
  const Eigen::ArrayXd headroom = problem.scaled_capacity - problem.current_admitted;
  if ((headroom < -kActiveTolerance).any()) {
    for (Eigen::Index i = 0; i < problem.rows(); ++i)
      sol.constraint_slacks[problem.attributes[static_cast<std::size_t>(i)]] = headroom[i];
    sol.feasible = false;
    sol.optimal_value = -std::numeric_limits<double>::infinity();
    sol.admission_probability = 0.0;
    sol.solution_type = SolutionType::Infeasible;
    sol.solve_time_ms = elapsed_ms();
    log_debug("lp person {}: infeasible at x=0", problem.person_index);
    return sol;
  }

  const double x = max_feasible_probability(problem);
  const Eigen::ArrayXd slack = headroom - x * problem.contribution;
  for (Eigen::Index i = 0; i < problem.rows(); ++i) {
    const std::string &attr = problem.attributes[static_cast<std::size_t>(i)];
    sol.constraint_slacks[attr] = slack[i];
    if (std::abs(slack[i]) < kActiveTolerance)
      sol.active_constraints.push_back(attr);
  }
  sol.feasible = true;
  sol.optimal_value = x;
  sol.admission_probability = x;
  sol.solution_type = SolutionType::Optimal;
  sol.solve_time_ms = elapsed_ms();

  log_debug("lp person {}: x*={:.3f} active=[{}]", problem.person_index, x,
            fmt::join(sol.active_constraints, ","));
  return sol;
}

std::unique_ptr<LinearProgramSolver> make_lp_solver() {
  return std::make_unique<AnalyticalLPSolver>();
}

} // namespace admit_core
