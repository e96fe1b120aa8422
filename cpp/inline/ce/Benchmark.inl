#include "ce/Benchmark.hpp"

#include "ce/Distribution.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

namespace ce {

inline auto Benchmark::Args::make_options_description() {
  namespace po = boost::program_options;

  po::options_description desc("Program options");
  desc.add_options()
    ("game-type", po::value<std::string>(&game_type)->default_value(game_type),
     "random, chicken, or congestion")
    ("num-players", po::value<int>(&num_players)->default_value(num_players), "number of players")
    ("num-actions", po::value<int>(&num_actions)->default_value(num_actions),
     "number of actions of each player")
    ("game-seed", po::value<util::Random::seed_t>(&game_seed)->default_value(game_seed),
     "seed for random payoffs (default: 0 means seed nondeterministically)")
    ("solver", po::value<std::vector<std::string>>(&solvers)
                 ->multitoken()
                 ->default_value(solvers, "lp lp-welfare swap-regret"),
     "solvers to run: any of lp, lp-welfare, swap-regret")
    ("csv-filename", po::value<std::string>(&csv_filename),
     "if specified, append one row per solver to this csv file");
  return desc;
}

template <concepts::Solver Solver>
Benchmark::Row Benchmark::run(const Solver& solver, const Args& args,
                              double violation_tolerance) {
  auto result = solver.solve();
  const Distribution& distribution = result.distribution;

  Row row{args.num_players,
          args.num_actions,
          solver.name(),
          result.solve_seconds,
          distribution.max_violation(),
          int(distribution.violations(violation_tolerance).size()),
          distribution.expected_welfare()};

  LOG_INFO("{}: welfare={:.6f} max_violation={:.3g} num_violations={} time={:.3f}s", row.solver,
           row.welfare, row.max_violation, row.num_violations, row.runtime_seconds);
  LOG_DEBUG("{} distribution:\n{}", row.solver, distribution.to_string(1e-9));

  if (!args.csv_filename.empty()) {
    append_to_csv(row, args.csv_filename);
  }
  return row;
}

}  // namespace ce
