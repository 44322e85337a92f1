#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "humin/cadence/cadence_generator.hpp"
#include "humin/core/expected.hpp"
#include "humin/core/random.hpp"
#include "humin/core/types.hpp"
#include "humin/path/path_generator.hpp"
#include "humin/scroll/scroll_generator.hpp"
#include "humin/timing/cancel_token.hpp"
#include "humin/timing/timing_service.hpp"

namespace humin {

class Humanizer;

// With a seed every sub-generator is seeded from it and the output is
// reproducible; without one each is seeded from the clock independently.
Expected<std::unique_ptr<Humanizer>> make_humanizer(HumanizerConfig cfg,
                                                    std::optional<uint64_t> seed = std::nullopt) noexcept;

// Single entry point for callers. Holds one normalized, immutable
// configuration and the generators built from it; per-call parameters left
// empty fall back to the configuration.
class Humanizer {
 public:
  Humanizer(const Humanizer&) = delete;
  Humanizer& operator=(const Humanizer&) = delete;

  const HumanizerConfig& config() const noexcept { return *cfg_; }
  const std::vector<std::string>& config_adjustments() const noexcept { return adjustments_; }

  // Center of the smallest configured viewport; where a cursor with no
  // tracked position is assumed to rest.
  Point default_start() const noexcept;
  Viewport sample_viewport();

  Path generate_path(Point start, Point end, bool allow_overshoot = true);

  std::vector<KeyAction> generate_typing(std::u32string_view text,
                                         std::optional<IntRange> wpm = std::nullopt,
                                         std::optional<double> typo_probability = std::nullopt);
  std::vector<KeyAction> generate_typing_utf8(std::string_view text,
                                              std::optional<IntRange> wpm = std::nullopt,
                                              std::optional<double> typo_probability = std::nullopt);

  std::vector<ScrollAction> generate_scroll(Direction direction,
                                            int distance,
                                            std::optional<IntRange> chunk = std::nullopt);
  std::vector<ScrollAction> generate_smooth_scroll(Direction direction, int distance);

  Duration sample_delay(double min_seconds, double max_seconds);
  Duration gaussian_delay(double mean_seconds, double std_dev_seconds);

  // Omitted base is base_delay.min, omitted variance is the width of base_delay.
  Expected<void> sleep(std::optional<double> base_seconds,
                       std::optional<double> variance_seconds,
                       CancelToken& token);
  Expected<void> sleep_range(std::optional<double> min_seconds,
                             std::optional<double> max_seconds,
                             CancelToken& token);
  Expected<void> sleep_gaussian(double mean_seconds, double std_dev_seconds, CancelToken& token);
  // Replays an action's delay field.
  Expected<void> sleep(Duration delay, CancelToken& token);

 private:
  friend Expected<std::unique_ptr<Humanizer>> make_humanizer(HumanizerConfig cfg,
                                                             std::optional<uint64_t> seed) noexcept;

  Humanizer(std::shared_ptr<const HumanizerConfig> cfg,
            std::vector<std::string> adjustments,
            uint64_t viewport_seed);

  std::shared_ptr<const HumanizerConfig> cfg_;
  std::vector<std::string> adjustments_;
  RandomSource viewport_rng_;

  std::unique_ptr<IPathGenerator> path_;
  std::unique_ptr<ICadenceGenerator> cadence_;
  std::unique_ptr<IScrollGenerator> scroll_;
  std::unique_ptr<ITimingService> timing_;
};

}  // namespace humin
