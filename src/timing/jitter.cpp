#include "timing/jitter.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace humin::timing {

Duration seconds_to_duration(double seconds) {
  if (!(seconds > 0.0)) {
    return Duration::zero();
  }
  // Keep far away from the int64 nanosecond limit (~292 years).
  constexpr double kMaxSeconds = 1.0e9;
  seconds = std::min(seconds, kMaxSeconds);
  return Duration(static_cast<Duration::rep>(std::llround(seconds * 1e9)));
}

Duration millis_to_duration(double millis) { return seconds_to_duration(millis / 1000.0); }

Duration with_fractional_offset(Duration d, RandomSource& rng, Duration cap) {
  constexpr auto kMicro = std::chrono::microseconds(1);
  const Duration lo = kMicro;
  const Duration hi = std::max<Duration>(cap, lo + kMicro);
  const auto span = static_cast<double>((hi - lo).count());
  d += lo + Duration(static_cast<Duration::rep>(rng.uniform01() * span));
  if (d % std::chrono::milliseconds(1) == Duration::zero()) {
    d += kMicro;
  }
  return d;
}

}  // namespace humin::timing
