#pragma once

#include <cstdint>
#include <memory>

#include "humin/core/expected.hpp"
#include "humin/core/types.hpp"

namespace humin {

struct PathLimits {
  double min_distance{1.0};
  int min_steps{10};
  int max_steps{100};
  double step_divisor{10.0};
  double correction_step_factor{0.2};
  int min_correction_steps{5};
};

class IPathGenerator {
 public:
  virtual ~IPathGenerator() = default;

  // Cursor trajectory from `start` to `end`. The start point is the caller's
  // last known position; the last returned point is always exactly `end`.
  virtual Path generate_path(Point start, Point end, bool allow_overshoot) = 0;
};

Expected<std::unique_ptr<IPathGenerator>> make_path_generator(
    std::shared_ptr<const HumanizerConfig> cfg,
    uint64_t seed,
    PathLimits limits = {}) noexcept;

}  // namespace humin
