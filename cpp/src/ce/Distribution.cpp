#include "ce/Distribution.hpp"

#include "util/Asserts.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace ce {

Distribution::Distribution(game_sptr_t game, Eigen::VectorXd probabilities)
    : game_(std::move(game)), probabilities_(std::move(probabilities)) {
  RELEASE_ASSERT(game_ != nullptr, "Distribution requires a game");
  RELEASE_ASSERT(probabilities_.size() == game_->num_profiles(),
                 "Distribution size {} != num profiles {}", probabilities_.size(),
                 game_->num_profiles());
}

Distribution Distribution::normalized(game_sptr_t game, const Eigen::VectorXd& weights) {
  Eigen::VectorXd clipped = weights.cwiseMax(0.0);
  double total = clipped.sum();
  if (!std::isfinite(total) || total <= 0) {
    throw util::Exception("Cannot normalize weights with total mass {}", total);
  }
  return Distribution(std::move(game), clipped / total);
}

double Distribution::probability(const action_profile_t& profile) const {
  return probabilities_[game_->indexer().to_index(profile)];
}

Eigen::VectorXd Distribution::expected_payoffs() const {
  return game_->payoff_matrix().transpose() * probabilities_;
}

double Distribution::expected_welfare() const { return expected_payoffs().sum(); }

incentive_constraint_vec_t Distribution::incentive_slacks() const {
  return incentive::flatten(incentive::slack_matrices(*game_, probabilities_));
}

incentive_constraint_vec_t Distribution::violations(double tolerance) const {
  incentive_constraint_vec_t out;
  for (const IncentiveConstraint& c : incentive_slacks()) {
    if (c.slack < -tolerance) {
      out.push_back(c);
    }
  }
  return out;
}

double Distribution::max_violation() const {
  double out = 0;
  for (const IncentiveConstraint& c : incentive_slacks()) {
    out = std::max(out, c.violation());
  }
  return out;
}

Eigen::VectorXd Distribution::swap_regrets() const {
  return incentive::swap_regrets(incentive::slack_matrices(*game_, probabilities_));
}

Distribution::support_t Distribution::support(double threshold) const {
  support_t out;
  action_profile_t profile(game_->num_players(), 0);
  profile_index_t index = 0;
  do {
    if (probabilities_[index] > threshold) {
      out.push_back(SupportEntry{profile, probabilities_[index]});
    }
    ++index;
  } while (game_->indexer().next(profile));
  return out;
}

std::string Distribution::to_string(double threshold) const {
  std::ostringstream ss;
  for (const SupportEntry& entry : support(threshold)) {
    ss << fmt::format("{}: {:.6f}\n", entry.profile, entry.probability);
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Distribution& distribution) {
  return os << distribution.to_string();
}

}  // namespace ce
