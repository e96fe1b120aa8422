#pragma once

#include "ce/BasicTypes.hpp"
#include "ce/GameType.hpp"
#include "ce/ProfileIndexer.hpp"
#include "util/Random.hpp"

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ce {

/*
 * An immutable N-player finite game in normal form.
 *
 * Player p's actions are {0, ..., action_counts[p] - 1}. Each player has a payoff tensor indexed
 * by joint action profile. All tensors are stored together in a single num_profiles x num_players
 * matrix, whose row i holds every player's payoff at the profile with flat index i (see
 * ce::ProfileIndexer for the index layout).
 *
 * All validation happens in the constructor, which throws ce::InvalidGameError on bad input.
 *
 * Solvers and distributions share a Game via game_sptr_t and never modify it.
 */
class Game {
 public:
  using payoff_matrix_t = Eigen::MatrixXd;

  // Upper bound on the size of the joint action space.
  static constexpr profile_index_t kMaxNumProfiles = profile_index_t(1) << 26;

  Game(int num_players, const action_count_vec_t& action_counts, const GameType& game_type);

  int num_players() const { return indexer_.num_players(); }
  const action_count_vec_t& action_counts() const { return indexer_.action_counts(); }
  int num_actions(player_t p) const { return indexer_.num_actions(p); }
  profile_index_t num_profiles() const { return indexer_.num_profiles(); }
  const ProfileIndexer& indexer() const { return indexer_; }

  /*
   * The tabulated payoff of player at profile.
   *
   * Throws ce::IndexError if player or profile is out of range.
   */
  double payoff(player_t player, const action_profile_t& profile) const;

  // Unchecked lookup by flat profile index, for use in inner loops.
  double payoff_at(player_t player, profile_index_t index) const {
    return payoffs_(index, player);
  }

  // Every player's payoff at profile. Throws ce::IndexError if profile is out of range.
  std::vector<double> payoffs(const action_profile_t& profile) const;

  // Sum of all players' payoffs at the profile with the given index.
  double welfare(profile_index_t index) const { return payoffs_.row(index).sum(); }

  double min_payoff() const { return min_payoff_; }
  double max_payoff() const { return max_payoff_; }

  const payoff_matrix_t& payoff_matrix() const { return payoffs_; }

  /*
   * Copy of player's payoff tensor. Rank must equal num_players().
   *
   * Throws ce::IndexError if player is out of range.
   */
  template <int Rank>
  Eigen::Tensor<double, Rank> payoff_tensor(player_t player) const;

  // The name of the GameType this game was constructed from.
  const std::string& type_name() const { return type_name_; }

  // For RandomUniform games, the seed that was used. Empty for all other types.
  std::optional<util::Random::seed_t> seed() const { return seed_; }

  std::string to_string() const;

 private:
  struct PayoffGenerator;

  static void validate(int num_players, const action_count_vec_t& action_counts);

  ProfileIndexer indexer_;
  payoff_matrix_t payoffs_;
  std::string type_name_;
  std::optional<util::Random::seed_t> seed_;
  double min_payoff_ = 0;
  double max_payoff_ = 0;
};

using game_sptr_t = std::shared_ptr<const Game>;

std::ostream& operator<<(std::ostream& os, const Game& game);

}  // namespace ce

#include "inline/ce/Game.inl"
