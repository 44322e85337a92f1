#pragma once

#include <cstdint>
#include <mutex>

namespace humin {

// Thread-safe pseudo random source. Every generator owns one; nothing in the
// library touches a process-wide generator.
class RandomSource {
 public:
  explicit RandomSource(uint64_t seed);

  RandomSource(const RandomSource&) = delete;
  RandomSource& operator=(const RandomSource&) = delete;

  // Mixes the wall clock with a per-process counter, so two sources created
  // back to back still diverge.
  static uint64_t clock_seed() noexcept;

  uint64_t next_u64();

  // [0, 1)
  double uniform01();
  // [lo, hi); swapped when inverted.
  double uniform(double lo, double hi);
  // [lo, hi] inclusive; swapped when inverted.
  int uniform_int(int lo, int hi);
  bool chance(double probability);

 private:
  std::mutex mu_;
  uint64_t state_;
};

}  // namespace humin
