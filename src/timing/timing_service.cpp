#include "humin/timing/timing_service.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numbers>

#include "humin/core/random.hpp"
#include "timing/jitter.hpp"

namespace humin {
namespace {

double non_negative(double v) { return (std::isfinite(v) && v > 0.0) ? v : 0.0; }

class TimingService final : public ITimingService {
 public:
  explicit TimingService(uint64_t seed) : rng_(seed) {}

  Duration sample(double min_seconds, double max_seconds) override {
    min_seconds = non_negative(min_seconds);
    max_seconds = non_negative(max_seconds);
    return finish(rng_.uniform(min_seconds, max_seconds));
  }

  Duration gaussian(double mean_seconds, double std_dev_seconds) override {
    mean_seconds = non_negative(mean_seconds);
    std_dev_seconds = non_negative(std_dev_seconds);

    // u1 in (0, 1] so the log stays finite.
    const double u1 = 1.0 - rng_.uniform01();
    const double u2 = rng_.uniform01();
    const double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
    return finish(mean_seconds + z0 * std_dev_seconds);
  }

  Duration jittered(double base_seconds, double variance_seconds) override {
    base_seconds = non_negative(base_seconds);
    variance_seconds = non_negative(variance_seconds);
    const double variance = (rng_.uniform01() * 2.0 - 1.0) * variance_seconds;
    return finish(base_seconds + variance);
  }

  Expected<void> sleep(Duration delay, CancelToken& token) override {
    if (token.is_cancelled() || token.wait_for(delay)) {
      return fail(ErrorCode::Cancelled, "sleep cancelled");
    }
    return {};
  }

  Expected<void> sleep_for(double base_seconds,
                           double variance_seconds,
                           CancelToken& token) override {
    return sleep(jittered(base_seconds, variance_seconds), token);
  }

  Expected<void> sleep_range(double min_seconds,
                             double max_seconds,
                             CancelToken& token) override {
    return sleep(sample(min_seconds, max_seconds), token);
  }

  Expected<void> sleep_gaussian(double mean_seconds,
                                double std_dev_seconds,
                                CancelToken& token) override {
    return sleep(gaussian(mean_seconds, std_dev_seconds), token);
  }

 private:
  Duration finish(double seconds) {
    const Duration d = std::max(timing::seconds_to_duration(seconds), timing::kMinDelay);
    return timing::with_fractional_offset(d, rng_);
  }

  RandomSource rng_;
};

}  // namespace

Expected<std::unique_ptr<ITimingService>> make_timing_service(uint64_t seed) noexcept {
  try {
    return std::unique_ptr<ITimingService>(new TimingService(seed));
  } catch (const std::exception& ex) {
    return fail(ErrorCode::Internal, ex.what());
  }
}

}  // namespace humin
