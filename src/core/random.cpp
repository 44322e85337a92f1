#include "humin/core/random.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>

#include "core/curve_math.hpp"

namespace humin {
namespace {

std::atomic<uint64_t> g_seed_counter{0};

}  // namespace

RandomSource::RandomSource(uint64_t seed) {
  // xorshift64 has a fixed point at zero, so scramble and keep away from it.
  uint64_t s = seed;
  state_ = core::splitmix64(s);
  if (state_ == 0) {
    state_ = 0x9e3779b97f4a7c15ULL;
  }
}

uint64_t RandomSource::clock_seed() noexcept {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto mono = std::chrono::steady_clock::now().time_since_epoch();
  uint64_t s = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
  s ^= static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(mono).count()) << 1;
  s ^= (g_seed_counter.fetch_add(1, std::memory_order_relaxed) + 1) * 0x9e3779b97f4a7c15ULL;
  return core::splitmix64(s);
}

uint64_t RandomSource::next_u64() {
  std::scoped_lock lock(mu_);
  return core::xorshift64(state_);
}

double RandomSource::uniform01() {
  return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
}

double RandomSource::uniform(double lo, double hi) {
  if (lo > hi) {
    std::swap(lo, hi);
  }
  return lo + uniform01() * (hi - lo);
}

int RandomSource::uniform_int(int lo, int hi) {
  if (lo > hi) {
    std::swap(lo, hi);
  }
  if (lo == hi) {
    return lo;
  }
  const auto span = static_cast<uint64_t>(static_cast<int64_t>(hi) - static_cast<int64_t>(lo)) + 1;
  return static_cast<int>(static_cast<int64_t>(lo) + static_cast<int64_t>(next_u64() % span));
}

bool RandomSource::chance(double probability) {
  if (!(probability > 0.0)) {
    return false;
  }
  if (probability >= 1.0) {
    return true;
  }
  return uniform01() < probability;
}

}  // namespace humin
