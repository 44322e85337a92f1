#include "humin/scroll/scroll_generator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <limits>
#include <utility>

#include "core/curve_math.hpp"
#include "humin/core/random.hpp"
#include "timing/jitter.hpp"

namespace humin {
namespace {

constexpr double kBaseDelayMs = 50.0;
constexpr double kDelayPerPixelMs = 0.5;
constexpr double kMaxJitterMs = 20.0;
constexpr int kMaxPlannedChunks = 4096;

int magnitude(int distance) {
  const auto wide = std::llabs(static_cast<long long>(distance));
  return static_cast<int>(std::min<long long>(wide, std::numeric_limits<int>::max()));
}

// 0 at both ends of the scroll, 1 in the middle, eased on each side.
double chunk_bias(double t) { return core::ease_in_out_cubic(1.0 - std::abs(2.0 * t - 1.0)); }

class ChunkedScrollGenerator final : public IScrollGenerator {
 public:
  ChunkedScrollGenerator(std::shared_ptr<const HumanizerConfig> cfg, uint64_t seed)
      : cfg_(std::move(cfg)), rng_(seed) {}

  std::vector<ScrollAction> generate_scroll(Direction direction,
                                            int total_distance,
                                            IntRange chunk) override {
    std::vector<ScrollAction> actions;
    const int total = magnitude(total_distance);
    if (total == 0) {
      return actions;
    }

    chunk.min = std::max(1, chunk.min);
    chunk.max = std::max(1, chunk.max);
    if (chunk.min > chunk.max) {
      std::swap(chunk.min, chunk.max);
    }
    // Long scrolls get proportionally larger chunks instead of more of them.
    const int floor_size = static_cast<int>((static_cast<long long>(total) + kMaxPlannedChunks - 1) / kMaxPlannedChunks);
    chunk.min = std::max(chunk.min, floor_size);
    chunk.max = std::max(chunk.max, chunk.min);

    const std::vector<int> sizes = chunk_sizes(total, chunk);
    const int sign = direction == Direction::Backward ? -1 : 1;

    actions.reserve(sizes.size() + 1);
    for (size_t i = 0; i < sizes.size(); ++i) {
      const bool edge = (i == 0 || i + 1 == sizes.size());
      double delay_ms = kBaseDelayMs + static_cast<double>(sizes[i]) * kDelayPerPixelMs;
      // Orientation pauses on the first and last chunk, quick flicks between.
      delay_ms *= edge ? rng_.uniform(1.5, 2.0) : rng_.uniform(0.7, 1.0);
      delay_ms += rng_.uniform(0.0, kMaxJitterMs);

      actions.push_back(ScrollAction{
          .distance = sizes[i] * sign,
          .delay = timing::with_fractional_offset(timing::millis_to_duration(delay_ms), rng_),
      });
    }

    const double settle_ms = rng_.uniform(cfg_->scroll_settle_ms.min, cfg_->scroll_settle_ms.max);
    actions.push_back(ScrollAction{
        .distance = 0,
        .delay = timing::with_fractional_offset(timing::millis_to_duration(settle_ms), rng_),
    });
    return actions;
  }

  std::vector<ScrollAction> generate_smooth_scroll(Direction direction,
                                                   int total_distance) override {
    std::vector<ScrollAction> actions;
    const int total = magnitude(total_distance);
    if (total == 0) {
      return actions;
    }

    const int steps = std::min(rng_.uniform_int(10, 20), total);
    const int step = total / steps;
    const int remainder = total % steps;
    const int sign = direction == Direction::Backward ? -1 : 1;

    actions.reserve(static_cast<size_t>(steps));
    for (int i = 0; i < steps; ++i) {
      const int size = step + (i < remainder ? 1 : 0);
      const double delay_ms = rng_.uniform(10.0, 30.0);
      actions.push_back(ScrollAction{
          .distance = size * sign,
          .delay = timing::with_fractional_offset(timing::millis_to_duration(delay_ms), rng_),
      });
    }
    return actions;
  }

 private:
  std::vector<int> chunk_sizes(int total, IntRange chunk) {
    const int average = std::max(1, chunk.min + (chunk.max - chunk.min) / 2);
    const int count = std::max(1, static_cast<int>(std::ceil(static_cast<double>(total) / average)));

    std::vector<int> sizes;
    sizes.reserve(static_cast<size_t>(count) + 4);

    int remaining = total;
    for (int i = 0; i < count && remaining > 0; ++i) {
      const double t = count == 1 ? 0.5 : static_cast<double>(i) / static_cast<double>(count - 1);
      const int size = draw(chunk, chunk_bias(t), remaining);
      sizes.push_back(size);
      remaining -= size;
    }
    // Random variation can leave a tail; finish it with average-sized chunks.
    while (remaining > 0) {
      const int size = draw(chunk, 0.5, remaining);
      sizes.push_back(size);
      remaining -= size;
    }
    return sizes;
  }

  int draw(IntRange chunk, double bias, int remaining) {
    const double base = chunk.min + bias * static_cast<double>(chunk.max - chunk.min);
    const double size = std::min(base * rng_.uniform(0.7, 1.3), static_cast<double>(remaining));
    return std::max(1, static_cast<int>(size));
  }

  std::shared_ptr<const HumanizerConfig> cfg_;
  RandomSource rng_;
};

}  // namespace

Expected<std::unique_ptr<IScrollGenerator>> make_scroll_generator(
    std::shared_ptr<const HumanizerConfig> cfg,
    uint64_t seed) noexcept {
  if (!cfg) {
    return fail(ErrorCode::InvalidArgument, "scroll generator requires a configuration");
  }
  try {
    return std::unique_ptr<IScrollGenerator>(new ChunkedScrollGenerator(std::move(cfg), seed));
  } catch (const std::exception& ex) {
    return fail(ErrorCode::Internal, ex.what());
  }
}

}  // namespace humin
