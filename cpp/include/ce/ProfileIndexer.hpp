#pragma once

#include "ce/BasicTypes.hpp"

#include <vector>

namespace ce {

/*
 * Bijection between joint action profiles and flat indices in [0, num_profiles()).
 *
 * The layout is mixed-radix with player 0 varying fastest:
 *
 *   index = s[0] + s[1] * n[0] + s[2] * n[0] * n[1] + ...
 *
 * where n = action_counts. This is also the memory layout of a column-major
 * Eigen::Tensor<double, N> with dimensions n, which lets explicit payoff tensors be copied
 * without any reshuffling.
 *
 * The constructor assumes that action_counts has already been validated (see ce::Game).
 */
class ProfileIndexer {
 public:
  explicit ProfileIndexer(const action_count_vec_t& action_counts);

  int num_players() const { return action_counts_.size(); }
  const action_count_vec_t& action_counts() const { return action_counts_; }
  int num_actions(player_t p) const { return action_counts_[p]; }
  profile_index_t num_profiles() const { return num_profiles_; }
  profile_index_t stride(player_t p) const { return strides_[p]; }

  // Throws ce::IndexError if the profile has the wrong length or an out-of-range action.
  profile_index_t to_index(const action_profile_t& profile) const;

  // Throws ce::IndexError if index is out of range.
  action_profile_t to_profile(profile_index_t index) const;

  // The action that player p takes in the profile at index.
  action_t action_of(profile_index_t index, player_t p) const;

  // Index of the profile obtained from the one at index by replacing p's action with a.
  profile_index_t with_action(profile_index_t index, player_t p, action_t a) const;

  /*
   * Advances profile to the next profile in index order (player 0 fastest). Returns false, and
   * resets profile to all-zeros, after the last profile.
   *
   * Usage:
   *
   * action_profile_t profile(indexer.num_players(), 0);
   * do {
   *   ...
   * } while (indexer.next(profile));
   */
  bool next(action_profile_t& profile) const;

  bool operator==(const ProfileIndexer& other) const = default;

 private:
  action_count_vec_t action_counts_;
  std::vector<profile_index_t> strides_;
  profile_index_t num_profiles_;
};

}  // namespace ce

#include "inline/ce/ProfileIndexer.inl"
