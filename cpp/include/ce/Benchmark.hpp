#pragma once

#include "ce/GameType.hpp"
#include "ce/concepts/SolverConcept.hpp"
#include "util/Random.hpp"

#include <boost/filesystem.hpp>

#include <string>
#include <vector>

namespace ce {

/*
 * The ce_solve program: builds a game, computes its correlated equilibria with the requested
 * solvers, and reports each solver's runtime, welfare and incentive-constraint violations.
 *
 * With --csv-filename, one row per solver is appended to the given file. The header row is
 * written only if the file does not exist yet.
 *
 * main() returns 0 on success, and 1 after printing a util::CleanException (bad input) to stderr
 * or logging a util::Exception (solver failure).
 */
struct Benchmark {
  struct Args {
    std::string game_type = game_type::RandomUniform::kName;
    int num_players = 2;
    int num_actions = 2;
    util::Random::seed_t game_seed = 0;
    std::vector<std::string> solvers = {"lp", "lp-welfare", "swap-regret"};
    std::string csv_filename;

    auto make_options_description();
  };

  struct Row {
    int num_players;
    int num_actions;
    std::string solver;
    double runtime_seconds;
    double max_violation;
    int num_violations;
    double welfare;
  };

  static constexpr const char* kCsvHeader =
    "NPlayers,NActions,Solver,RuntimeSeconds,MaxViolation,NViolations,Welfare";

  // One csv line, without the trailing newline.
  static std::string to_csv_line(const Row& row);

  // Throws util::CleanException if the file can't be written.
  static void append_to_csv(const Row& row, const boost::filesystem::path& path);

  // Throws util::CleanException on an unknown --game-type.
  static GameType make_game_type(const Args& args);

  template <concepts::Solver Solver>
  static Row run(const Solver& solver, const Args& args, double violation_tolerance);

  static int main(int ac, char* av[]);
};

}  // namespace ce

#include "inline/ce/Benchmark.inl"
