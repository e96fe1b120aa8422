#include "ce/Game.hpp"

#include "ce/Exceptions.hpp"
#include "util/Asserts.hpp"

#include <array>

namespace ce {

template <int Rank>
Eigen::Tensor<double, Rank> Game::payoff_tensor(player_t player) const {
  RELEASE_ASSERT(Rank == num_players(), "payoff_tensor<{}>() called on a {}-player game", Rank,
                 num_players());
  if (player < 0 || player >= num_players()) {
    throw IndexError("Player {} out of range [0, {})", player, num_players());
  }

  std::array<Eigen::Index, Rank> dims;
  for (int d = 0; d < Rank; ++d) {
    dims[d] = action_counts()[d];
  }
  Eigen::TensorMap<const Eigen::Tensor<double, Rank>> map(payoffs_.col(player).data(), dims);
  Eigen::Tensor<double, Rank> tensor = map;
  return tensor;
}

}  // namespace ce
