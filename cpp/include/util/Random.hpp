#pragma once

#include <cstdint>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * There is no process-wide default prng. Every function takes the std::mt19937 to draw from.
 *
 * Usage:
 *
 * std::mt19937 prng = util::Random::make_prng(seed);
 * double x = util::Random::uniform_real(prng, 0.0, 1.0);
 *
 * Components that take a seed parameter treat 0 as "pick one for me"; they should call
 * nondeterministic_seed() and log the result, so that the run can be reproduced.
 */
namespace util {

class Random {
 public:
  using seed_t = uint64_t;

  /*
   * Returns a nonzero seed drawn from std::random_device.
   */
  static seed_t nondeterministic_seed();

  // Seeds an std::mt19937 from all 64 bits of seed.
  static std::mt19937 make_prng(seed_t seed);

  /*
   * Produces a random real value in the range [left, right).
   */
  template <typename FloatType>
  static FloatType uniform_real(std::mt19937& prng, FloatType left, FloatType right);

  /*
   * Given an array A of n values, produces a random integer on the interval [0, n), where integer i
   * is chosen with probability proportional to A[i].
   *
   * The begin/end of the array is passed in as the two arguments.
   *
   * Example:
   *
   * std::array<float, 3> arr = {1, 2, 3};
   * int k = util::Random::weighted_sample(prng, arr.begin(), arr.end());
   */
  template <typename InputIt>
  static int weighted_sample(std::mt19937& prng, InputIt begin, InputIt end);
};

}  // namespace util

#include "inline/util/Random.inl"
