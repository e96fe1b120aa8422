#pragma once

#include <Eigen/Core>

namespace ce {

/*
 * A single player's swap-regret minimizer, via the Blum-Mansour reduction ("From External to
 * Internal Regret", JMLR 2007).
 *
 * The learner runs n copies of Hedge (multiplicative weights), one per action. Copy j is
 * responsible for the rounds in which action j is recommended, and holds a distribution q_j over
 * the n actions. The mixed strategy p played each round is the stationary distribution of the
 * row-stochastic matrix Q whose j-th row is q_j, that is, p = p Q.
 *
 * After the round, given the reward r(b) in [0, 1] of every action b, copy j is fed the scaled
 * reward vector p(j) * r. With learning rate eta, each copy's external regret is at most
 * ln(n) / eta + eta * T / 8, which gives an average swap regret of
 * O(n ln(n) / (eta T) + eta) per round; eta ~ sqrt(ln(n) / T) yields the O(sqrt(ln(n) / T)) rate.
 */
class SwapRegretLearner {
 public:
  SwapRegretLearner(int num_actions, double learning_rate);

  int num_actions() const { return strategy_.size(); }

  // The mixed strategy p to play in the current round.
  const Eigen::VectorXd& strategy() const { return strategy_; }

  // Row j is the Hedge distribution of copy j.
  Eigen::MatrixXd copy_distributions() const;

  // rewards(b) is the reward, in [0, 1], that action b would have earned this round.
  void update(const Eigen::VectorXd& rewards);

  /*
   * Returns the stationary distribution p of the row-stochastic matrix q (p = p q, p >= 0,
   * sum(p) = 1).
   *
   * If q has more than one stationary distribution, the one reached by averaging the power
   * iterates from the uniform distribution is returned.
   */
  static Eigen::VectorXd stationary_distribution(const Eigen::MatrixXd& q);

 private:
  const double learning_rate_;

  // Row j holds copy j's cumulative scaled rewards, multiplied by learning_rate_. Copy j's
  // distribution is the softmax of row j.
  Eigen::MatrixXd log_weights_;
  Eigen::VectorXd strategy_;
};

}  // namespace ce
