#include "ce/ProfileIndexer.hpp"

#include "ce/Exceptions.hpp"
#include "util/Asserts.hpp"

#include <fmt/ranges.h>

namespace ce {

inline ProfileIndexer::ProfileIndexer(const action_count_vec_t& action_counts)
    : action_counts_(action_counts), strides_(action_counts.size()), num_profiles_(1) {
  for (size_t p = 0; p < action_counts_.size(); ++p) {
    strides_[p] = num_profiles_;
    num_profiles_ *= action_counts_[p];
  }
}

inline profile_index_t ProfileIndexer::to_index(const action_profile_t& profile) const {
  if (profile.size() != action_counts_.size()) {
    throw IndexError("Profile {} has {} entries, expected {}", profile, profile.size(),
                     action_counts_.size());
  }
  profile_index_t index = 0;
  for (size_t p = 0; p < profile.size(); ++p) {
    if (profile[p] < 0 || profile[p] >= action_counts_[p]) {
      throw IndexError("Profile {} out of range for action counts {}", profile, action_counts_);
    }
    index += profile[p] * strides_[p];
  }
  return index;
}

inline action_profile_t ProfileIndexer::to_profile(profile_index_t index) const {
  if (index < 0 || index >= num_profiles_) {
    throw IndexError("Profile index {} out of range [0, {})", index, num_profiles_);
  }
  action_profile_t profile(action_counts_.size());
  for (size_t p = 0; p < action_counts_.size(); ++p) {
    profile[p] = index % action_counts_[p];
    index /= action_counts_[p];
  }
  return profile;
}

inline action_t ProfileIndexer::action_of(profile_index_t index, player_t p) const {
  DEBUG_ASSERT(index >= 0 && index < num_profiles_, "bad index {}", index);
  return (index / strides_[p]) % action_counts_[p];
}

inline profile_index_t ProfileIndexer::with_action(profile_index_t index, player_t p,
                                                   action_t a) const {
  DEBUG_ASSERT(a >= 0 && a < action_counts_[p], "bad action {} for player {}", a, p);
  return index + (a - action_of(index, p)) * strides_[p];
}

inline bool ProfileIndexer::next(action_profile_t& profile) const {
  for (size_t p = 0; p < profile.size(); ++p) {
    if (++profile[p] < action_counts_[p]) return true;
    profile[p] = 0;
  }
  return false;
}

}  // namespace ce
