#pragma once

#include "ce/BasicTypes.hpp"
#include "util/Random.hpp"

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

#include <string>
#include <variant>
#include <vector>

namespace ce {

/*
 * The alternatives of ce::GameType. Each one describes how ce::Game fills in its payoff tensors.
 * The choice is resolved once, in the ce::Game constructor.
 */
namespace game_type {

/*
 * Every payoff of every player is drawn i.i.d. from Uniform[low, high).
 *
 * A seed of 0 means that a seed is drawn from std::random_device. The seed actually used is
 * logged and is available via ce::Game::seed().
 */
struct RandomUniform {
  static constexpr const char* kName = "random";

  util::Random::seed_t seed = 0;
  double low = -10.0;
  double high = 10.0;
};

/*
 * The 2-player, 2-action game of chicken. Player 0 picks the row, and each entry lists
 * (player 0's payoff, player 1's payoff):
 *
 *              0           1
 *   0        0, 0        1, -1
 *   1       -1, 1      -10, -10
 *
 * Action 0 is strictly dominant for both players, so (0, 0) is the unique correlated equilibrium.
 */
struct Chicken {
  static constexpr const char* kName = "chicken";
};

/*
 * A 2-player congestion game where both players have the same n >= 2 actions (routes). Both
 * players get 0 if they pick the same route. Otherwise both get -1 if player 0 took route 0, and
 * -2 if not.
 */
struct Congestion {
  static constexpr const char* kName = "congestion";
};

/*
 * Caller-provided payoffs. payoffs[p] is player p's tensor flattened with player 0's action
 * varying fastest (see ce::ProfileIndexer).
 *
 * If shapes is non-empty, it holds one tensor shape per player, and ce::Game checks that each one
 * equals the action counts it was given.
 */
struct Explicit {
  static constexpr const char* kName = "explicit";

  /*
   * Builds an Explicit from one column-major tensor per player. The tensor dimensions are
   * recorded in shapes.
   */
  template <int Rank>
  static Explicit from_tensors(const std::vector<Eigen::Tensor<double, Rank>>& tensors);

  std::vector<action_count_vec_t> shapes;
  std::vector<Eigen::VectorXd> payoffs;
};

}  // namespace game_type

using GameType = std::variant<game_type::RandomUniform, game_type::Chicken, game_type::Congestion,
                              game_type::Explicit>;

// "random", "chicken", "congestion", or "explicit"
std::string game_type_name(const GameType& game_type);

}  // namespace ce

#include "inline/ce/GameType.inl"
