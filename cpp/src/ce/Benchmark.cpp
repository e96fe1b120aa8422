#include "ce/Benchmark.hpp"

#include "ce/BasicTypes.hpp"
#include "ce/Game.hpp"
#include "ce/LinearProgrammingSolver.hpp"
#include "ce/SwapRegretSolver.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <iostream>
#include <memory>

namespace ce {

std::string Benchmark::to_csv_line(const Row& row) {
  return fmt::format("{},{},{},{},{},{},{}", row.num_players, row.num_actions, row.solver,
                     row.runtime_seconds, row.max_violation, row.num_violations, row.welfare);
}

void Benchmark::append_to_csv(const Row& row, const boost::filesystem::path& path) {
  boost::system::error_code ec;
  bool exists = boost::filesystem::exists(path, ec);

  std::string str;
  if (!exists) {
    str = std::string(kCsvHeader) + "\n";
  }
  str += to_csv_line(row) + "\n";
  boost_util::write_str_to_file(str, path, true);
}

GameType Benchmark::make_game_type(const Args& args) {
  if (args.game_type == game_type::RandomUniform::kName) {
    return game_type::RandomUniform{.seed = args.game_seed};
  } else if (args.game_type == game_type::Chicken::kName) {
    return game_type::Chicken{};
  } else if (args.game_type == game_type::Congestion::kName) {
    return game_type::Congestion{};
  }
  throw util::CleanException("Unknown --game-type: {}", args.game_type);
}

int Benchmark::main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    LinearProgrammingSolver::Params lp_params;
    SwapRegretSolver::Params sr_params;

    po::options_description desc("General options");
    desc.add_options()("help,h", "help");
    desc.add(args.make_options_description())
      .add(lp_params.make_options_description())
      .add(sr_params.make_options_description())
      .add(log_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);

    CLEAN_ASSERT(args.num_players >= 2, "--num-players must be at least 2 (got {})",
                 args.num_players);
    CLEAN_ASSERT(args.num_actions >= 1, "--num-actions must be at least 1 (got {})",
                 args.num_actions);

    action_count_vec_t action_counts(args.num_players, args.num_actions);
    auto game = std::make_shared<const Game>(args.num_players, action_counts,
                                             make_game_type(args));
    LOG_INFO("Game: {} players, {} actions each, type={}", args.num_players, args.num_actions,
             game->type_name());
    LOG_DEBUG("{}", game->to_string());

    for (const std::string& solver_name : args.solvers) {
      if (solver_name == "lp" || solver_name == "lp-welfare") {
        LinearProgrammingSolver::Params params = lp_params;
        params.maximize_welfare = (solver_name == "lp-welfare");
        run(LinearProgrammingSolver(game, params), args, params.violation_tolerance);
      } else if (solver_name == "swap-regret") {
        run(SwapRegretSolver(game, sr_params), args, lp_params.violation_tolerance);
      } else {
        throw util::CleanException("Unknown --solver: {}", solver_name);
      }
    }
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const util::Exception& e) {
    LOG_ERROR("Solver error: {}", e.what());
    return 1;
  }

  return 0;
}

}  // namespace ce
