#include "ce/SwapRegretSolver.hpp"

#include <boost/program_options.hpp>

namespace ce {

inline auto SwapRegretSolver::Params::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("SwapRegretSolver options");
  desc.add_options()
    ("epsilon", po::value<double>(&epsilon)->default_value(epsilon, "0.1"),
     "learning rate of each player's swap-regret learner")
    ("num-rounds", po::value<int64_t>(&num_rounds)->default_value(num_rounds),
     "number of rounds of repeated play")
    ("seed", po::value<util::Random::seed_t>(&seed)->default_value(seed),
     "seed for action sampling (default: 0 means seed nondeterministically)")
    ("tracking-interval", po::value<int64_t>(&tracking_interval)->default_value(tracking_interval),
     "record the max swap regret every this many rounds (0 disables)");
  return desc;
}

}  // namespace ce
