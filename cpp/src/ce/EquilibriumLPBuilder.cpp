#include "ce/EquilibriumLPBuilder.hpp"

#include "ce/Exceptions.hpp"
#include "ce/IncentiveConstraint.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

namespace ce {

namespace opres = operations_research;

EquilibriumLPBuilder::Model EquilibriumLPBuilder::build() const {
  Model model;
  model.solver = std::make_unique<opres::MPSolver>("correlated_equilibrium",
                                                   opres::MPSolver::GLOP_LINEAR_PROGRAMMING);

  add_variables(model);
  add_incentive_constraints(model);
  set_objective(model);

  LOG_DEBUG("Built correlated-equilibrium LP: {} variables, {} constraints, objective={}",
            model.solver->NumVariables(), model.solver->NumConstraints(),
            maximize_welfare_ ? "max-welfare" : "none");
  return model;
}

std::string EquilibriumLPBuilder::status_name(opres::MPSolver::ResultStatus status) {
  switch (status) {
    case opres::MPSolver::OPTIMAL:
      return "OPTIMAL";
    case opres::MPSolver::FEASIBLE:
      return "FEASIBLE";
    case opres::MPSolver::INFEASIBLE:
      return "INFEASIBLE";
    case opres::MPSolver::UNBOUNDED:
      return "UNBOUNDED";
    case opres::MPSolver::ABNORMAL:
      return "ABNORMAL";
    case opres::MPSolver::MODEL_INVALID:
      return "MODEL_INVALID";
    case opres::MPSolver::NOT_SOLVED:
      return "NOT_SOLVED";
  }
  return "UNKNOWN(" + std::to_string(static_cast<int>(status)) + ")";
}

void EquilibriumLPBuilder::check_status(opres::MPSolver::ResultStatus status,
                                        const opres::MPSolver& solver) {
  switch (status) {
    case opres::MPSolver::OPTIMAL:
      return;
    case opres::MPSolver::FEASIBLE:
      LOG_WARN("LP backend stopped at a feasible but unproven-optimal point");
      return;
    case opres::MPSolver::INFEASIBLE:
      LOG_WARN("LP backend reports INFEASIBLE");
      throw InfeasibleError(
        "Correlated-equilibrium LP reported infeasible ({} variables, {} constraints); the LP "
        "construction is broken",
        solver.NumVariables(), solver.NumConstraints());
    default:
      LOG_WARN("LP backend failed with status {}", status_name(status));
      throw SolverFailureError("LP backend failed with status {} ({} variables, {} constraints)",
                               status_name(status), solver.NumVariables(),
                               solver.NumConstraints());
  }
}

void EquilibriumLPBuilder::add_variables(Model& model) const {
  opres::MPSolver& solver = *model.solver;
  profile_index_t n = game_.num_profiles();

  model.probabilities.reserve(n);
  model.sum_to_one = solver.MakeRowConstraint(1.0, 1.0, "sum_to_one");
  for (profile_index_t i = 0; i < n; ++i) {
    opres::MPVariable* x = solver.MakeNumVar(0.0, 1.0, fmt::format("x_{}", i));
    model.sum_to_one->SetCoefficient(x, 1.0);
    model.probabilities.push_back(x);
  }
}

void EquilibriumLPBuilder::add_incentive_constraints(Model& model) const {
  opres::MPSolver& solver = *model.solver;
  const ProfileIndexer& indexer = game_.indexer();

  model.incentive_rows.reserve(incentive::num_constraints(game_));
  for (int p = 0; p < game_.num_players(); ++p) {
    int n = game_.num_actions(p);

    // rows[a * n + b] is the (p, a, b) row; diagonal entries stay null
    std::vector<opres::MPConstraint*> rows(n * n, nullptr);
    for (action_t a = 0; a < n; ++a) {
      for (action_t b = 0; b < n; ++b) {
        if (b == a) continue;
        opres::MPConstraint* row = solver.MakeRowConstraint(
          0.0, opres::MPSolver::infinity(), fmt::format("incentive_p{}_a{}_b{}", p, a, b));
        rows[a * n + b] = row;
        model.incentive_rows.push_back(row);
      }
    }

    // Each profile s contributes to the rows (p, s[p], b) for every b != s[p].
    for (profile_index_t i = 0; i < game_.num_profiles(); ++i) {
      action_t a = indexer.action_of(i, p);
      for (action_t b = 0; b < n; ++b) {
        if (b == a) continue;
        double coeff = incentive::deviation_gain(game_, p, i, b);
        if (coeff != 0) {
          rows[a * n + b]->SetCoefficient(model.probabilities[i], coeff);
        }
      }
    }
  }
}

void EquilibriumLPBuilder::set_objective(Model& model) const {
  opres::MPObjective* objective = model.solver->MutableObjective();
  if (!maximize_welfare_) {
    objective->SetMinimization();
    return;
  }

  for (profile_index_t i = 0; i < game_.num_profiles(); ++i) {
    objective->SetCoefficient(model.probabilities[i], game_.welfare(i));
  }
  objective->SetMaximization();
}

}  // namespace ce
