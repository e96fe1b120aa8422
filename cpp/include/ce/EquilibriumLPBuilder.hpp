#pragma once

#include "ce/Game.hpp"

#include <ortools/linear_solver/linear_solver.h>

#include <memory>
#include <string>
#include <vector>

namespace ce {

/*
 * Translates a ce::Game into a linear program whose feasible region is exactly the set of
 * correlated equilibria of the game (Aumann; see Sec 4.6 of Shoham & Leyton-Brown, "Multiagent
 * Systems"):
 *
 *   variables:  x(s) in [0, 1] for each joint profile s
 *   simplex:    sum_s x(s) = 1
 *   incentive:  for each player p, action a, deviation b != a:
 *                 sum_{s : s[p] = a} (u_p(s) - u_p(s with a -> b)) * x(s) >= 0
 *
 * The objective is either empty (any feasible point will do), or expected welfare
 * sum_s x(s) * sum_p u_p(s), maximized.
 *
 * Incentive rows are created in the canonical order documented in ce/IncentiveConstraint.hpp.
 */
class EquilibriumLPBuilder {
 public:
  struct Model {
    std::unique_ptr<operations_research::MPSolver> solver;
    std::vector<operations_research::MPVariable*> probabilities;  // indexed by profile index
    operations_research::MPConstraint* sum_to_one = nullptr;
    std::vector<operations_research::MPConstraint*> incentive_rows;
  };

  EquilibriumLPBuilder(const Game& game, bool maximize_welfare)
      : game_(game), maximize_welfare_(maximize_welfare) {}

  Model build() const;

  // "OPTIMAL", "INFEASIBLE", etc.
  static std::string status_name(operations_research::MPSolver::ResultStatus status);

  /*
   * Maps the backend's result status to the solver's error contract. OPTIMAL and FEASIBLE are
   * accepted (FEASIBLE with a warning). INFEASIBLE throws ce::InfeasibleError. Every other status
   * throws ce::SolverFailureError, whose message names the status.
   */
  static void check_status(operations_research::MPSolver::ResultStatus status,
                           const operations_research::MPSolver& solver);

 private:
  void add_variables(Model& model) const;
  void add_incentive_constraints(Model& model) const;
  void set_objective(Model& model) const;

  const Game& game_;
  const bool maximize_welfare_;
};

}  // namespace ce
