#pragma once

#include "ce/Distribution.hpp"
#include "ce/Game.hpp"
#include "util/Random.hpp"

#include <Eigen/Core>

#include <cstdint>
#include <string>
#include <vector>

namespace ce {

/*
 * Approximate correlated-equilibrium computation by repeated play.
 *
 * Every player runs a ce::SwapRegretLearner with learning rate epsilon. In each of num_rounds
 * rounds, each player samples an action from its learner's current strategy, then feeds the
 * learner the counterfactual payoff of each of its actions against the other players' realized
 * actions (rescaled to [0, 1] by the game's payoff range).
 *
 * The result is the empirical distribution of the realized joint profiles. Its distance from
 * the correlated-equilibrium set is measured by the players' average swap regret, which is
 * reported alongside it. That number is a diagnostic: the distribution is returned whether or
 * not the dynamics have converged.
 *
 * The run is a deterministic function of (game, epsilon, num_rounds, seed). A seed of 0 means
 * that a seed is drawn from std::random_device; the seed used is logged and returned.
 */
class SwapRegretSolver {
 public:
  struct Params {
    auto make_options_description();

    double epsilon = 0.1;
    int64_t num_rounds = 10000;
    util::Random::seed_t seed = 0;

    // If positive, record the max swap regret every tracking_interval rounds.
    int64_t tracking_interval = 0;
  };

  struct RegretCheckpoint {
    int64_t round;
    double max_swap_regret;
  };
  using regret_trace_t = std::vector<RegretCheckpoint>;

  struct Result {
    Distribution distribution;
    double max_swap_regret = 0;   // max over players of swap_regrets
    Eigen::VectorXd swap_regrets;  // per-player average swap regret of the realized play
    regret_trace_t regret_trace;
    util::Random::seed_t seed = 0;
    double solve_seconds = 0;
  };

  /*
   * Throws ce::InvalidParameterError if epsilon is not a positive finite number, if num_rounds is
   * not positive, or if tracking_interval is negative.
   */
  SwapRegretSolver(game_sptr_t game, const Params& params);
  SwapRegretSolver(game_sptr_t game, double epsilon);

  std::string name() const { return "swap-regret"; }
  const Params& params() const { return params_; }

  Result solve() const;

 private:
  game_sptr_t game_;
  const Params params_;
};

}  // namespace ce

#include "inline/ce/SwapRegretSolver.inl"
