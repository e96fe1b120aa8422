#include "util/Random.hpp"

#include "util/Exception.hpp"

namespace util {

inline Random::seed_t Random::nondeterministic_seed() {
  std::random_device rd;
  seed_t seed = (seed_t(rd()) << 32) | seed_t(rd());
  return seed ? seed : 1;
}

inline std::mt19937 Random::make_prng(seed_t seed) {
  std::seed_seq seq{uint32_t(seed & 0xffffffff), uint32_t(seed >> 32)};
  return std::mt19937(seq);
}

template <typename FloatType>
FloatType Random::uniform_real(std::mt19937& prng, FloatType left, FloatType right) {
  if (left >= right) {
    throw util::Exception("Random::uniform_real() - invalid range [{}, {})", left, right);
  }
  std::uniform_real_distribution<FloatType> dist(left, right);
  return dist(prng);
}

template <typename InputIt>
inline int Random::weighted_sample(std::mt19937& prng, InputIt begin, InputIt end) {
  std::discrete_distribution<int> dist(begin, end);
  return dist(prng);
}

}  // namespace util
