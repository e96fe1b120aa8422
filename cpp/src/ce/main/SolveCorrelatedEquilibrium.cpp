/*
 * Example:
 *
 * ce_solve --game-type random --num-players 3 --num-actions 4 --game-seed 7 \
 *     --solver lp lp-welfare swap-regret --num-rounds 20000 --csv-filename results.csv
 *
 * See ce::Benchmark for details.
 */

#include "ce/Benchmark.hpp"

int main(int ac, char* av[]) { return ce::Benchmark::main(ac, av); }
