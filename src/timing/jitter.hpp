#pragma once

#include <chrono>

#include "humin/core/random.hpp"
#include "humin/core/types.hpp"

namespace humin::timing {

inline constexpr Duration kMinDelay = std::chrono::milliseconds(1);
inline constexpr Duration kDefaultOffsetCap = std::chrono::microseconds(100);

Duration seconds_to_duration(double seconds);
Duration millis_to_duration(double millis);

// Adds a random offset in [1us, cap) and nudges the result off any whole
// millisecond boundary.
Duration with_fractional_offset(Duration d, RandomSource& rng, Duration cap = kDefaultOffsetCap);

}  // namespace humin::timing
