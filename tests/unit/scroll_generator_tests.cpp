#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

#include "humin/scroll/scroll_generator.hpp"

namespace {

using namespace std::chrono_literals;

std::unique_ptr<humin::IScrollGenerator> make_generator(uint64_t seed) {
  auto gen = humin::make_scroll_generator(std::make_shared<const humin::HumanizerConfig>(), seed);
  if (!gen) {
    std::cerr << "make_scroll_generator failed: " << gen.error().what() << "\n";
    return nullptr;
  }
  return std::move(*gen);
}

double to_ms(humin::Duration d) { return std::chrono::duration<double, std::milli>(d).count(); }

bool test_chunks_sum_exactly() {
  auto gen = make_generator(1);
  if (!gen) {
    return false;
  }
  const std::vector<humin::IntRange> ranges = {{50, 200}, {1, 1}, {1, 1000}, {300, 100}, {0, -5}, {500, 500}};
  for (const auto dir : {humin::Direction::Forward, humin::Direction::Backward}) {
    const int sign = dir == humin::Direction::Backward ? -1 : 1;
    for (const auto& range : ranges) {
      for (const int total : {1, 7, 50, 333, 1000, 5000}) {
        for (int trial = 0; trial < 5; ++trial) {
          const auto actions = gen->generate_scroll(dir, total, range);
          if (actions.size() < 2) {
            std::cerr << "scroll of " << total << " produced " << actions.size() << " actions\n";
            return false;
          }
          int sum = 0;
          for (size_t i = 0; i + 1 < actions.size(); ++i) {
            const int d = actions[i].distance;
            if (d == 0 || (d > 0) != (sign > 0)) {
              std::cerr << "chunk " << i << " has distance " << d << "\n";
              return false;
            }
            sum += d;
          }
          if (sum != sign * total) {
            std::cerr << "chunks of [" << range.min << "," << range.max << "] summed to " << sum
                      << " instead of " << sign * total << "\n";
            return false;
          }
          const auto& settle = actions.back();
          if (settle.distance != 0 || settle.delay < 200ms || settle.delay > 501ms) {
            std::cerr << "bad settle pause: " << to_ms(settle.delay) << "ms\n";
            return false;
          }
        }
      }
    }
  }
  return true;
}

bool test_chunk_delays() {
  auto gen = make_generator(2);
  if (!gen) {
    return false;
  }
  constexpr double kSlackMs = 0.102;
  for (int trial = 0; trial < 20; ++trial) {
    const auto actions = gen->generate_scroll(humin::Direction::Forward, 1200, {50, 200});
    const size_t chunks = actions.size() - 1;
    for (size_t i = 0; i < chunks; ++i) {
      const double base = 50.0 + 0.5 * actions[i].distance;
      const bool edge = (i == 0 || i + 1 == chunks);
      const double lo = edge ? base * 1.5 : base * 0.7;
      const double hi = (edge ? base * 2.0 : base) + 20.0 + kSlackMs;
      const double ms = to_ms(actions[i].delay);
      if (ms < lo || ms > hi) {
        std::cerr << "chunk " << i << " delay " << ms << "ms outside [" << lo << "," << hi << "]\n";
        return false;
      }
      if (actions[i].delay % 1ms == humin::Duration::zero()) {
        std::cerr << "chunk " << i << " delay is a whole millisecond\n";
        return false;
      }
    }
  }
  return true;
}

bool test_chunks_grow_towards_middle() {
  auto gen = make_generator(3);
  if (!gen) {
    return false;
  }
  for (int trial = 0; trial < 20; ++trial) {
    const auto actions = gen->generate_scroll(humin::Direction::Forward, 2000, {50, 200});
    int largest = 0;
    for (size_t i = 0; i + 1 < actions.size(); ++i) {
      largest = std::max(largest, actions[i].distance);
    }
    if (actions.front().distance > 65 || largest < 139) {
      std::cerr << "first chunk " << actions.front().distance << ", largest " << largest << "\n";
      return false;
    }
  }
  return true;
}

bool test_zero_and_negative_distance() {
  auto gen = make_generator(4);
  if (!gen) {
    return false;
  }
  if (!gen->generate_scroll(humin::Direction::Forward, 0, {50, 200}).empty() ||
      !gen->generate_smooth_scroll(humin::Direction::Backward, 0).empty()) {
    std::cerr << "zero distance produced actions\n";
    return false;
  }

  const auto actions = gen->generate_scroll(humin::Direction::Forward, -400, {50, 200});
  int sum = 0;
  for (const auto& a : actions) {
    sum += a.distance;
  }
  if (sum != 400) {
    std::cerr << "negative distance was not treated as magnitude, sum=" << sum << "\n";
    return false;
  }
  return true;
}

bool test_smooth_scroll() {
  auto gen = make_generator(5);
  if (!gen) {
    return false;
  }
  for (int trial = 0; trial < 30; ++trial) {
    const auto actions = gen->generate_smooth_scroll(humin::Direction::Backward, 487);
    if (actions.size() < 10 || actions.size() > 20) {
      std::cerr << "smooth scroll used " << actions.size() << " steps\n";
      return false;
    }
    int sum = 0;
    int lo = actions.front().distance;
    int hi = actions.front().distance;
    for (const auto& a : actions) {
      sum += a.distance;
      lo = std::min(lo, a.distance);
      hi = std::max(hi, a.distance);
      const double ms = to_ms(a.delay);
      if (ms < 10.0 || ms > 30.102) {
        std::cerr << "smooth step delay " << ms << "ms\n";
        return false;
      }
    }
    if (sum != -487 || hi - lo > 1) {
      std::cerr << "smooth steps uneven: sum=" << sum << " spread=" << hi - lo << "\n";
      return false;
    }
  }

  const auto tiny = gen->generate_smooth_scroll(humin::Direction::Forward, 3);
  if (tiny.size() != 3) {
    std::cerr << "tiny smooth scroll used " << tiny.size() << " steps\n";
    return false;
  }
  return true;
}

bool test_huge_distance_is_bounded() {
  auto gen = make_generator(6);
  if (!gen) {
    return false;
  }
  constexpr int kMax = std::numeric_limits<int>::max();
  for (const auto dir : {humin::Direction::Forward, humin::Direction::Backward}) {
    const auto actions = gen->generate_scroll(dir, kMax, {1, 1});
    if (actions.size() > 6000) {
      std::cerr << "huge scroll produced " << actions.size() << " actions\n";
      return false;
    }
    long long sum = 0;
    for (const auto& a : actions) {
      sum += a.distance;
    }
    const long long expected = dir == humin::Direction::Backward ? -static_cast<long long>(kMax) : kMax;
    if (sum != expected) {
      std::cerr << "huge scroll summed to " << sum << "\n";
      return false;
    }
  }

  const auto lowest = gen->generate_scroll(humin::Direction::Forward, std::numeric_limits<int>::min(), {1, 1});
  if (lowest.size() > 6000 || lowest.size() < 2) {
    std::cerr << "INT_MIN scroll produced " << lowest.size() << " actions\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_chunks_sum_exactly()) {
    return 1;
  }
  if (!test_chunk_delays()) {
    return 1;
  }
  if (!test_chunks_grow_towards_middle()) {
    return 1;
  }
  if (!test_zero_and_negative_distance()) {
    return 1;
  }
  if (!test_smooth_scroll()) {
    return 1;
  }
  if (!test_huge_distance_is_bounded()) {
    return 1;
  }
  return 0;
}
