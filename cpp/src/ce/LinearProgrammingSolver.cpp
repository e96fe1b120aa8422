#include "ce/LinearProgrammingSolver.hpp"

#include "ce/EquilibriumLPBuilder.hpp"
#include "ce/Exceptions.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <ortools/linear_solver/linear_solver.h>

#include <cmath>
#include <utility>

namespace ce {

namespace opres = operations_research;

LinearProgrammingSolver::LinearProgrammingSolver(game_sptr_t game, const Params& params)
    : game_(std::move(game)), params_(params) {
  if (!game_) {
    throw InvalidParameterError("LinearProgrammingSolver requires a game");
  }
  if (!std::isfinite(params_.violation_tolerance) || params_.violation_tolerance < 0) {
    throw InvalidParameterError("violation_tolerance must be finite and >= 0 (got {})",
                                params_.violation_tolerance);
  }
}

LinearProgrammingSolver::LinearProgrammingSolver(game_sptr_t game, bool maximize_welfare)
    : LinearProgrammingSolver(std::move(game), Params{.maximize_welfare = maximize_welfare}) {}

Distribution LinearProgrammingSolver::to_distribution(game_sptr_t game,
                                                      const Eigen::VectorXd& raw) {
  double raw_sum = raw.sum();
  if (!std::isfinite(raw_sum) || raw_sum <= 0) {
    throw SolverFailureError("LP backend returned a solution with total mass {}", raw_sum);
  }
  if (std::abs(raw_sum - 1) > kDefaultViolationTolerance || raw.minCoeff() < 0) {
    LOG_DEBUG("Renormalizing LP solution (sum={} min={})", raw_sum, raw.minCoeff());
  }
  return Distribution::normalized(std::move(game), raw);
}

LinearProgrammingSolver::Result LinearProgrammingSolver::solve() const {
  util::Timer timer;

  EquilibriumLPBuilder builder(*game_, params_.maximize_welfare);
  EquilibriumLPBuilder::Model model = builder.build();
  opres::MPSolver& solver = *model.solver;
  if (params_.enable_backend_output) {
    solver.EnableOutput();
  }

  opres::MPSolver::ResultStatus status = solver.Solve();
  EquilibriumLPBuilder::check_status(status, solver);

  Eigen::VectorXd raw(game_->num_profiles());
  for (profile_index_t i = 0; i < game_->num_profiles(); ++i) {
    raw[i] = model.probabilities[i]->solution_value();
  }

  Result result{to_distribution(game_, raw)};
  result.objective_value = solver.Objective().Value();
  result.expected_welfare = result.distribution.expected_welfare();
  result.slacks = result.distribution.incentive_slacks();
  for (const IncentiveConstraint& c : result.slacks) {
    if (c.slack < -params_.violation_tolerance) {
      result.violations.push_back(c);
    }
  }
  result.num_variables = solver.NumVariables();
  result.num_constraints = solver.NumConstraints();
  result.solve_seconds = timer.elapsed_seconds();

  if (!result.violations.empty()) {
    LOG_WARN("{}: {} incentive constraints violated beyond tolerance {}", name(),
             result.violations.size(), params_.violation_tolerance);
  }
  LOG_DEBUG("{}: status={} objective={} welfare={} time={:.3f}s", name(),
            EquilibriumLPBuilder::status_name(status),
            result.objective_value, result.expected_welfare, result.solve_seconds);
  return result;
}

}  // namespace ce
