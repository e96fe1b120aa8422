#pragma once

#include "util/Exception.hpp"

namespace ce {

/*
 * Malformed action counts, or payoffs that don't match them. Thrown only from the ce::Game
 * constructor.
 */
class InvalidGameError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

/*
 * Out-of-range solver parameters. Thrown from solver constructors, before any computation.
 */
class InvalidParameterError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

/*
 * The correlated-equilibrium polytope is never empty, so if the LP backend reports infeasibility,
 * the LP was built wrong.
 */
class InfeasibleError : public util::Exception {
 public:
  using util::Exception::Exception;
};

/*
 * The LP backend did not produce a solution (unbounded, abnormal termination, invalid model, ...).
 * The message carries the backend status.
 */
class SolverFailureError : public util::Exception {
 public:
  using util::Exception::Exception;
};

/*
 * A player index or joint action profile outside of the game's bounds.
 */
class IndexError : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace ce
