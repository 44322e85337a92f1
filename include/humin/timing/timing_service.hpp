#pragma once

#include <cstdint>
#include <memory>

#include "humin/core/expected.hpp"
#include "humin/core/types.hpp"
#include "humin/timing/cancel_token.hpp"

namespace humin {

// Randomized delays that are never a whole number of milliseconds and never
// shorter than 1ms. All inputs are seconds; negative values are treated as 0.
class ITimingService {
 public:
  virtual ~ITimingService() = default;

  // Uniform in [min, max].
  virtual Duration sample(double min_seconds, double max_seconds) = 0;
  // Normal(mean, std_dev) via Box-Muller.
  virtual Duration gaussian(double mean_seconds, double std_dev_seconds) = 0;
  // base + uniform(-variance, +variance).
  virtual Duration jittered(double base_seconds, double variance_seconds) = 0;

  // Blocking waits. A cancelled wait returns ErrorCode::Cancelled right away
  // and the remaining delay is dropped.
  virtual Expected<void> sleep(Duration delay, CancelToken& token) = 0;
  virtual Expected<void> sleep_for(double base_seconds,
                                   double variance_seconds,
                                   CancelToken& token) = 0;
  virtual Expected<void> sleep_range(double min_seconds,
                                     double max_seconds,
                                     CancelToken& token) = 0;
  virtual Expected<void> sleep_gaussian(double mean_seconds,
                                        double std_dev_seconds,
                                        CancelToken& token) = 0;
};

Expected<std::unique_ptr<ITimingService>> make_timing_service(uint64_t seed) noexcept;

}  // namespace humin
