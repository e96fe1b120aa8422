#include "ce/IncentiveConstraint.hpp"

#include "util/Asserts.hpp"

#include <algorithm>

namespace ce {

namespace incentive {

int num_constraints(const Game& game) {
  int n = 0;
  for (int p = 0; p < game.num_players(); ++p) {
    n += game.num_actions(p) * (game.num_actions(p) - 1);
  }
  return n;
}

std::vector<Eigen::MatrixXd> slack_matrices(const Game& game, const Eigen::VectorXd& weights) {
  RELEASE_ASSERT(weights.size() == game.num_profiles(), "weights size {} != num profiles {}",
                 weights.size(), game.num_profiles());

  std::vector<Eigen::MatrixXd> out;
  out.reserve(game.num_players());
  for (int p = 0; p < game.num_players(); ++p) {
    out.push_back(Eigen::MatrixXd::Zero(game.num_actions(p), game.num_actions(p)));
  }

  const ProfileIndexer& indexer = game.indexer();
  for (profile_index_t i = 0; i < game.num_profiles(); ++i) {
    double w = weights[i];
    if (w == 0) continue;
    for (int p = 0; p < game.num_players(); ++p) {
      action_t a = indexer.action_of(i, p);
      for (action_t b = 0; b < game.num_actions(p); ++b) {
        if (b == a) continue;
        out[p](a, b) += w * deviation_gain(game, p, i, b);
      }
    }
  }
  return out;
}

incentive_constraint_vec_t flatten(const std::vector<Eigen::MatrixXd>& slack_matrices) {
  incentive_constraint_vec_t out;
  for (size_t p = 0; p < slack_matrices.size(); ++p) {
    const Eigen::MatrixXd& m = slack_matrices[p];
    for (action_t a = 0; a < m.rows(); ++a) {
      for (action_t b = 0; b < m.cols(); ++b) {
        if (b == a) continue;
        out.push_back(IncentiveConstraint{player_t(p), a, b, m(a, b)});
      }
    }
  }
  return out;
}

Eigen::VectorXd swap_regrets(const std::vector<Eigen::MatrixXd>& slack_matrices) {
  Eigen::VectorXd out(slack_matrices.size());
  for (size_t p = 0; p < slack_matrices.size(); ++p) {
    const Eigen::MatrixXd& m = slack_matrices[p];
    double regret = 0;
    for (int a = 0; a < m.rows(); ++a) {
      // the diagonal is zero, so this is max(0, max_{b != a} -m(a, b))
      regret += std::max(0.0, (-m.row(a)).maxCoeff());
    }
    out[p] = regret;
  }
  return out;
}

}  // namespace incentive

}  // namespace ce
