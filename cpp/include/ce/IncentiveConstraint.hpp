#pragma once

#include "ce/BasicTypes.hpp"
#include "ce/Game.hpp"

#include <Eigen/Core>

#include <vector>

namespace ce {

/*
 * One correlated-equilibrium incentive constraint, evaluated at a distribution x:
 *
 *   slack = sum_{s : s[player] = action} x(s) * (u_player(s) - u_player(s with action -> deviation))
 *
 * The constraint holds iff slack >= 0. A negative slack is a violation of magnitude -slack.
 */
struct IncentiveConstraint {
  double violation() const { return slack < 0 ? -slack : 0; }

  player_t player;
  action_t action;     // the recommended action
  action_t deviation;  // the alternative that player considers switching to
  double slack;
};

using incentive_constraint_vec_t = std::vector<IncentiveConstraint>;

namespace incentive {

/*
 * All incentive constraints are enumerated in a single canonical order:
 *
 * for player p:
 *   for action a:
 *     for deviation b != a:
 *       ...
 *
 * Both the LP rows built by ce::EquilibriumLPBuilder and the diagnostic vectors returned here
 * follow this order, so the k-th slack corresponds to the k-th LP incentive row.
 */
int num_constraints(const Game& game);

// u_p(s) - u_p(s with p's action replaced by deviation), where s is the profile at index.
inline double deviation_gain(const Game& game, player_t p, profile_index_t index,
                             action_t deviation) {
  return game.payoff_at(p, index) -
         game.payoff_at(p, game.indexer().with_action(index, p, deviation));
}

/*
 * Returns one matrix per player. Entry (a, b) of player p's matrix is the slack of the
 * constraint (p, a, b) at weights, which must be indexed by flat profile index. Diagonal entries
 * are zero.
 *
 * weights need not be normalized: the empirical play counts of the swap-regret dynamics go
 * through this function too.
 */
std::vector<Eigen::MatrixXd> slack_matrices(const Game& game, const Eigen::VectorXd& weights);

// Off-diagonal entries of slack_matrices(), in canonical order.
incentive_constraint_vec_t flatten(const std::vector<Eigen::MatrixXd>& slack_matrices);

/*
 * Per-player swap regret implied by the slack matrices:
 *
 *   swap_regret[p] = sum_a max(0, max_b -slack_p(a, b))
 *
 * This is the most that player p could have gained, in expectation, by remapping each
 * recommended action to a best alternative.
 */
Eigen::VectorXd swap_regrets(const std::vector<Eigen::MatrixXd>& slack_matrices);

}  // namespace incentive

}  // namespace ce
