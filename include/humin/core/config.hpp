#pragma once

#include <string>
#include <vector>

#include "humin/core/types.hpp"

namespace humin {

struct NormalizedConfig {
  HumanizerConfig config{};
  // One entry per swapped range or clamped value.
  std::vector<std::string> adjustments{};
};

// Ranges are made non-negative and ordered, probabilities clamped to [0, 1],
// WPM and chunk minimums raised to 1. Never rejects a configuration.
NormalizedConfig normalize_config(HumanizerConfig cfg);

}  // namespace humin
