#include "ce/Game.hpp"

#include "ce/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>
#include <sstream>

namespace ce {

/*
 * std::visit() target that fills in the payoff matrix for each GameType alternative.
 */
struct Game::PayoffGenerator {
  Game& game;

  void operator()(const game_type::RandomUniform& type) {
    if (!std::isfinite(type.low) || !std::isfinite(type.high) || type.low >= type.high) {
      throw InvalidGameError("Invalid uniform payoff range [{}, {})", type.low, type.high);
    }
    util::Random::seed_t seed = type.seed ? type.seed : util::Random::nondeterministic_seed();
    if (!type.seed) {
      LOG_INFO("Generating random game payoffs with nondeterministic seed {}", seed);
    }
    game.seed_ = seed;

    std::mt19937 prng = util::Random::make_prng(seed);
    for (int p = 0; p < game.num_players(); ++p) {
      for (profile_index_t i = 0; i < game.num_profiles(); ++i) {
        game.payoffs_(i, p) = util::Random::uniform_real(prng, type.low, type.high);
      }
    }
  }

  void operator()(const game_type::Chicken&) {
    if (game.num_players() != 2 || game.num_actions(0) != 2 || game.num_actions(1) != 2) {
      throw InvalidGameError("Chicken is a 2-player game with 2 actions each (got {})",
                             game.action_counts());
    }
    const double p0[2][2] = {{0, 1}, {-1, -10}};
    const double p1[2][2] = {{0, -1}, {1, -10}};
    for (action_t a0 = 0; a0 < 2; ++a0) {
      for (action_t a1 = 0; a1 < 2; ++a1) {
        profile_index_t i = game.indexer_.to_index({a0, a1});
        game.payoffs_(i, 0) = p0[a0][a1];
        game.payoffs_(i, 1) = p1[a0][a1];
      }
    }
  }

  void operator()(const game_type::Congestion&) {
    if (game.num_players() != 2 || game.num_actions(0) != game.num_actions(1) ||
        game.num_actions(0) < 2) {
      throw InvalidGameError(
        "Congestion is a 2-player game with the same number (>= 2) of actions each (got {})",
        game.action_counts());
    }
    int n = game.num_actions(0);
    for (action_t a0 = 0; a0 < n; ++a0) {
      for (action_t a1 = 0; a1 < n; ++a1) {
        double u = (a0 == a1) ? 0 : (a0 == 0 ? -1 : -2);
        profile_index_t i = game.indexer_.to_index({a0, a1});
        game.payoffs_(i, 0) = u;
        game.payoffs_(i, 1) = u;
      }
    }
  }

  void operator()(const game_type::Explicit& type) {
    if ((int)type.payoffs.size() != game.num_players()) {
      throw InvalidGameError("Got {} payoff tensors for a {}-player game", type.payoffs.size(),
                             game.num_players());
    }
    if (!type.shapes.empty() && (int)type.shapes.size() != game.num_players()) {
      throw InvalidGameError("Got {} payoff tensor shapes for a {}-player game",
                             type.shapes.size(), game.num_players());
    }
    for (int p = 0; p < game.num_players(); ++p) {
      if (!type.shapes.empty() && type.shapes[p] != game.action_counts()) {
        throw InvalidGameError("Payoff tensor for player {} has shape {}, expected {}", p,
                               type.shapes[p], game.action_counts());
      }
      const Eigen::VectorXd& v = type.payoffs[p];
      if (v.size() != game.num_profiles()) {
        throw InvalidGameError("Payoff tensor for player {} has {} entries, expected {}", p,
                               v.size(), game.num_profiles());
      }
      if (!v.allFinite()) {
        throw InvalidGameError("Payoff tensor for player {} has non-finite entries", p);
      }
      game.payoffs_.col(p) = v;
    }
  }
};

Game::Game(int num_players, const action_count_vec_t& action_counts, const GameType& game_type)
    : indexer_((validate(num_players, action_counts), action_counts)),
      payoffs_(payoff_matrix_t::Zero(indexer_.num_profiles(), num_players)),
      type_name_(game_type_name(game_type)) {
  std::visit(PayoffGenerator{*this}, game_type);

  min_payoff_ = payoffs_.minCoeff();
  max_payoff_ = payoffs_.maxCoeff();

  LOG_DEBUG("Constructed {} game: action_counts={} payoff range=[{}, {}]", type_name_,
            action_counts, min_payoff_, max_payoff_);
}

void Game::validate(int num_players, const action_count_vec_t& action_counts) {
  if (num_players < 2) {
    throw InvalidGameError("A game needs at least 2 players (got {})", num_players);
  }
  if ((int)action_counts.size() != num_players) {
    throw InvalidGameError("Got {} action counts for a {}-player game", action_counts.size(),
                           num_players);
  }
  profile_index_t num_profiles = 1;
  for (int p = 0; p < num_players; ++p) {
    if (action_counts[p] < 1) {
      throw InvalidGameError("Player {} has {} actions; every player needs at least 1", p,
                             action_counts[p]);
    }
    num_profiles *= action_counts[p];
    if (num_profiles > kMaxNumProfiles) {
      throw InvalidGameError("Joint action space of {} exceeds the limit of {} profiles",
                             action_counts, kMaxNumProfiles);
    }
  }
}

double Game::payoff(player_t player, const action_profile_t& profile) const {
  if (player < 0 || player >= num_players()) {
    throw IndexError("Player {} out of range [0, {})", player, num_players());
  }
  return payoffs_(indexer_.to_index(profile), player);
}

std::vector<double> Game::payoffs(const action_profile_t& profile) const {
  profile_index_t index = indexer_.to_index(profile);
  std::vector<double> out(num_players());
  for (int p = 0; p < num_players(); ++p) {
    out[p] = payoffs_(index, p);
  }
  return out;
}

std::string Game::to_string() const {
  std::ostringstream ss;
  ss << fmt::format("{}-player {} game with action counts {}\n", num_players(), type_name_,
                    action_counts());
  action_profile_t profile(num_players(), 0);
  do {
    ss << fmt::format("  {}: {}\n", profile, payoffs(profile));
  } while (indexer_.next(profile));
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Game& game) { return os << game.to_string(); }

}  // namespace ce
