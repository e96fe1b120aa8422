#pragma once

#include "ce/BasicTypes.hpp"
#include "ce/Game.hpp"
#include "ce/IncentiveConstraint.hpp"

#include <Eigen/Core>

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ce {

/*
 * A probability distribution over the joint action profiles of a game, as produced by the
 * solvers. Probabilities are indexed by flat profile index (see ce::ProfileIndexer).
 *
 * Besides lookups, a Distribution answers the diagnostic questions that both solvers report:
 * expected welfare, and how well each correlated-equilibrium incentive constraint is satisfied.
 *
 * The constructor checks sizes only. Use normalized() to build one from raw non-negative
 * weights.
 */
class Distribution {
 public:
  struct SupportEntry {
    action_profile_t profile;
    double probability;
  };
  using support_t = std::vector<SupportEntry>;

  Distribution(game_sptr_t game, Eigen::VectorXd probabilities);

  /*
   * Clips negative weights to zero and rescales so that the weights sum to 1.
   *
   * Throws util::Exception if the clipped weights sum to zero or are not finite.
   */
  static Distribution normalized(game_sptr_t game, const Eigen::VectorXd& weights);

  const Game& game() const { return *game_; }
  const game_sptr_t& game_ptr() const { return game_; }
  const Eigen::VectorXd& probabilities() const { return probabilities_; }

  // Throws ce::IndexError if profile is out of range.
  double probability(const action_profile_t& profile) const;
  // Unchecked lookup by flat profile index.
  double probability_at(profile_index_t index) const { return probabilities_[index]; }

  double total_mass() const { return probabilities_.sum(); }
  double min_probability() const { return probabilities_.minCoeff(); }

  // Entry p is player p's expected payoff.
  Eigen::VectorXd expected_payoffs() const;

  // Expected sum of payoffs across players.
  double expected_welfare() const;

  // Every incentive constraint with its signed slack, in canonical order.
  incentive_constraint_vec_t incentive_slacks() const;

  // The incentive constraints with slack < -tolerance, in canonical order.
  incentive_constraint_vec_t violations(double tolerance = kDefaultViolationTolerance) const;

  // The largest violation magnitude, or 0 if every constraint holds.
  double max_violation() const;

  // Entry p is player p's swap regret under this distribution.
  Eigen::VectorXd swap_regrets() const;

  // Profiles with probability > threshold, in index order.
  support_t support(double threshold = 0) const;

  std::string to_string(double threshold = 0) const;

 private:
  game_sptr_t game_;
  Eigen::VectorXd probabilities_;
};

std::ostream& operator<<(std::ostream& os, const Distribution& distribution);

}  // namespace ce
