#pragma once

#include <chrono>
#include <cstdint>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Useful macro for constexpr-detection of whether a macro is assigned to 1. This is useful given
 * the behavior of the -D option in CMake.
 *
 * #define FOO 1
 * // #define BAR
 *
 * static_assert(IS_MACRO_ENABLED(FOO))
 * static_assert(!IS_MACRO_ENABLED(BAR))
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

/*
 * Marks the arguments as used without evaluating them. The logging macros rely on this so that
 * compiled-out log statements don't produce unused-variable warnings.
 */
#define USE_UNEVALUATED(...) static_cast<void>(sizeof((__VA_ARGS__, 0)))

namespace util {

template <typename Rep, typename Period>
int64_t to_ns(const std::chrono::duration<Rep, Period>& duration) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count();
}

template <typename Rep, typename Period>
double to_seconds(const std::chrono::duration<Rep, Period>& duration) {
  return std::chrono::duration<double>(duration).count();
}

/*
 * Measures wall-clock time since construction.
 *
 * Usage:
 *
 * util::Timer timer;
 * ...
 * double seconds = timer.elapsed_seconds();
 */
class Timer {
 public:
  using clock_t = std::chrono::steady_clock;

  Timer() : start_(clock_t::now()) {}

  int64_t elapsed_ns() const { return to_ns(clock_t::now() - start_); }
  double elapsed_seconds() const { return to_seconds(clock_t::now() - start_); }

 private:
  clock_t::time_point start_;
};

}  // namespace util
