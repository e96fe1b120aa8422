#pragma once

#include "ce/Distribution.hpp"
#include "ce/Game.hpp"

#include <concepts>
#include <string>

namespace ce::concepts {

/*
 * The capability shared by ce::LinearProgrammingSolver and ce::SwapRegretSolver: constructed from
 * a shared game and a Params struct, a solver's solve() returns a Result that carries the
 * computed Distribution along with solver-specific diagnostics.
 */
template <typename S>
concept Solver = requires(const S& solver, typename S::Result result) {
  requires std::constructible_from<S, game_sptr_t, typename S::Params>;
  { solver.name() } -> std::convertible_to<std::string>;
  { solver.solve() } -> std::same_as<typename S::Result>;
  { result.distribution } -> std::convertible_to<const Distribution&>;
};

}  // namespace ce::concepts
