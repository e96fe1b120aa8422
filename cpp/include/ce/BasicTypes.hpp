#pragma once

#include <cstdint>
#include <vector>

namespace ce {

using player_t = int32_t;
using action_t = int32_t;

// Flat index of a joint action profile. See ce::ProfileIndexer for the layout.
using profile_index_t = int64_t;

// One action per player. This is the JointActionProfile of the problem statement.
using action_profile_t = std::vector<action_t>;

// action_counts[p] is the number of actions available to player p.
using action_count_vec_t = std::vector<int>;

// Tolerance below which a negative incentive-constraint slack is treated as numerical noise.
constexpr double kDefaultViolationTolerance = 1e-6;

}  // namespace ce
