#pragma once

#include "ce/BasicTypes.hpp"
#include "ce/Distribution.hpp"
#include "ce/Game.hpp"
#include "ce/IncentiveConstraint.hpp"

#include <Eigen/Core>

#include <string>

namespace ce {

/*
 * Exact correlated-equilibrium computation: builds the correlated-equilibrium LP with
 * ce::EquilibriumLPBuilder, solves it with OR-tools' GLOP backend, and reads the joint
 * distribution off the solution.
 *
 * In the default mode any feasible point is returned. With maximize_welfare, the returned
 * distribution maximizes expected welfare over the correlated equilibria.
 *
 * solve() throws ce::InfeasibleError if the backend reports an empty feasible set (which, since
 * every finite game has a correlated equilibrium, indicates a bug in the LP construction), and
 * ce::SolverFailureError if the backend fails in any other way.
 *
 * Numerical slop in the backend's solution is not an error: the result reports the signed slack
 * of every incentive constraint, and the subset violated by more than violation_tolerance.
 */
class LinearProgrammingSolver {
 public:
  struct Params {
    auto make_options_description();

    bool maximize_welfare = false;
    double violation_tolerance = kDefaultViolationTolerance;
    bool enable_backend_output = false;
  };

  struct Result {
    Distribution distribution;
    double objective_value = 0;
    double expected_welfare = 0;
    incentive_constraint_vec_t slacks;
    incentive_constraint_vec_t violations;  // slacks below -violation_tolerance
    int num_variables = 0;
    int num_constraints = 0;
    double solve_seconds = 0;
  };

  // Throws ce::InvalidParameterError on a negative or non-finite violation_tolerance.
  LinearProgrammingSolver(game_sptr_t game, const Params& params);
  LinearProgrammingSolver(game_sptr_t game, bool maximize_welfare = false);

  std::string name() const { return params_.maximize_welfare ? "lp-welfare" : "lp"; }
  const Params& params() const { return params_; }

  Result solve() const;

  /*
   * Turns the backend's raw solution into a Distribution: negative entries are clipped and the
   * rest rescaled to sum to 1. Throws ce::SolverFailureError if nothing positive and finite is
   * left.
   */
  static Distribution to_distribution(game_sptr_t game, const Eigen::VectorXd& raw);

 private:
  game_sptr_t game_;
  const Params params_;
};

}  // namespace ce

#include "inline/ce/LinearProgrammingSolver.inl"
