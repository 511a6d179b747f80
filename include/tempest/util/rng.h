#pragma once

#include <cstdint>

namespace tempest::util {

// splitmix64 step (Sebastiano Vigna). Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a 64-bit word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0); // 2^53
}

// Explicit, seedable random source for the stochastic parts of the model.
//
// Two generators built from the same seed produce identical streams, which is
// what makes hurricane timings reproducible in tests and from scenario files.
class SplitMixRng {
 public:
  explicit SplitMixRng(std::uint64_t seed = 0) : seed_(seed), s_(seed) {}

  std::uint64_t seed() const { return seed_; }

  // Restart the stream from a new seed.
  void reseed(std::uint64_t seed) {
    seed_ = seed;
    s_ = seed;
  }

  std::uint64_t next_u64() {
    s_ = splitmix64(s_);
    return s_;
  }

  // Uniform in [0,1).
  double uniform() { return u01_from_u64(next_u64()); }

  // Uniform in [lo, hi).
  double uniform(double lo, double hi) { return lo + (hi - lo) * uniform(); }

 private:
  std::uint64_t seed_;
  std::uint64_t s_;
};

} // namespace tempest::util
