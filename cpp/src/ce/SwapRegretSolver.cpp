#include "ce/SwapRegretSolver.hpp"

#include "ce/Exceptions.hpp"
#include "ce/IncentiveConstraint.hpp"
#include "ce/SwapRegretLearner.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <cmath>

namespace ce {

namespace {

/*
 * gains[p](a, b) is the cumulative payoff that player p would have gained, over the rounds in
 * which it played a, by playing b instead. Divided by the round count, these are the negated
 * incentive slacks of the empirical distribution.
 */
Eigen::VectorXd average_swap_regrets(const std::vector<Eigen::MatrixXd>& gains, int64_t rounds) {
  std::vector<Eigen::MatrixXd> slacks;
  slacks.reserve(gains.size());
  for (const Eigen::MatrixXd& g : gains) {
    slacks.push_back(-g / double(rounds));
  }
  return incentive::swap_regrets(slacks);
}

}  // namespace

SwapRegretSolver::SwapRegretSolver(game_sptr_t game, const Params& params)
    : game_(std::move(game)), params_(params) {
  if (!game_) {
    throw InvalidParameterError("SwapRegretSolver requires a game");
  }
  if (!std::isfinite(params_.epsilon) || params_.epsilon <= 0) {
    throw InvalidParameterError("epsilon must be a positive number (got {})", params_.epsilon);
  }
  if (params_.num_rounds <= 0) {
    throw InvalidParameterError("num_rounds must be positive (got {})", params_.num_rounds);
  }
  if (params_.tracking_interval < 0) {
    throw InvalidParameterError("tracking_interval must be >= 0 (got {})",
                                params_.tracking_interval);
  }
}

SwapRegretSolver::SwapRegretSolver(game_sptr_t game, double epsilon)
    : SwapRegretSolver(std::move(game), Params{.epsilon = epsilon}) {}

SwapRegretSolver::Result SwapRegretSolver::solve() const {
  util::Timer timer;

  const Game& game = *game_;
  const ProfileIndexer& indexer = game.indexer();
  const int num_players = game.num_players();

  util::Random::seed_t seed = params_.seed ? params_.seed : util::Random::nondeterministic_seed();
  if (!params_.seed) {
    LOG_INFO("{}: using nondeterministic seed {}", name(), seed);
  }
  std::mt19937 prng = util::Random::make_prng(seed);

  // Rewards fed to the learners are payoffs rescaled to [0, 1].
  double payoff_range = game.max_payoff() - game.min_payoff();
  double reward_scale = payoff_range > 0 ? 1.0 / payoff_range : 0.0;

  std::vector<SwapRegretLearner> learners;
  std::vector<Eigen::MatrixXd> gains;
  for (int p = 0; p < num_players; ++p) {
    learners.emplace_back(game.num_actions(p), params_.epsilon);
    gains.push_back(Eigen::MatrixXd::Zero(game.num_actions(p), game.num_actions(p)));
  }

  Eigen::VectorXd counts = Eigen::VectorXd::Zero(game.num_profiles());
  regret_trace_t trace;
  action_profile_t actions(num_players);

  for (int64_t t = 1; t <= params_.num_rounds; ++t) {
    profile_index_t index = 0;
    for (int p = 0; p < num_players; ++p) {
      const Eigen::VectorXd& strategy = learners[p].strategy();
      actions[p] = util::Random::weighted_sample(prng, strategy.begin(), strategy.end());
      index += actions[p] * indexer.stride(p);
    }
    counts[index] += 1;

    for (int p = 0; p < num_players; ++p) {
      int n = game.num_actions(p);
      Eigen::VectorXd payoffs(n);
      for (action_t b = 0; b < n; ++b) {
        payoffs[b] = game.payoff_at(p, indexer.with_action(index, p, b));
      }

      action_t a = actions[p];
      gains[p].row(a) += (payoffs.array() - payoffs[a]).matrix().transpose();
      learners[p].update((payoffs.array() - game.min_payoff()).matrix() * reward_scale);
    }

    if (params_.tracking_interval > 0 && t % params_.tracking_interval == 0) {
      double max_regret = average_swap_regrets(gains, t).maxCoeff();
      trace.push_back(RegretCheckpoint{t, max_regret});
      LOG_DEBUG("{}: round {} max swap regret {:.6f}", name(), t, max_regret);
    }
  }

  Result result{Distribution(game_, counts / double(params_.num_rounds))};
  result.swap_regrets = average_swap_regrets(gains, params_.num_rounds);
  result.max_swap_regret = result.swap_regrets.maxCoeff();
  result.regret_trace = std::move(trace);
  result.seed = seed;
  result.solve_seconds = timer.elapsed_seconds();

  LOG_DEBUG("{}: epsilon={} rounds={} seed={} max swap regret={:.6f} time={:.3f}s", name(),
            params_.epsilon, params_.num_rounds, seed, result.max_swap_regret,
            result.solve_seconds);
  return result;
}

}  // namespace ce
