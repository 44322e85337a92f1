#include "humin/humanizer/humanizer.hpp"

#include <exception>
#include <utility>

#include "core/curve_math.hpp"
#include "humin/core/config.hpp"
#include "humin/core/utf8.hpp"

namespace humin {

Humanizer::Humanizer(std::shared_ptr<const HumanizerConfig> cfg,
                     std::vector<std::string> adjustments,
                     uint64_t viewport_seed)
    : cfg_(std::move(cfg)), adjustments_(std::move(adjustments)), viewport_rng_(viewport_seed) {}

Point Humanizer::default_start() const noexcept {
  return Point{static_cast<double>(cfg_->viewport_width.min) / 2.0,
               static_cast<double>(cfg_->viewport_height.min) / 2.0};
}

Viewport Humanizer::sample_viewport() {
  return Viewport{
      .width = viewport_rng_.uniform_int(cfg_->viewport_width.min, cfg_->viewport_width.max),
      .height = viewport_rng_.uniform_int(cfg_->viewport_height.min, cfg_->viewport_height.max),
  };
}

Path Humanizer::generate_path(Point start, Point end, bool allow_overshoot) {
  return path_->generate_path(start, end, allow_overshoot);
}

std::vector<KeyAction> Humanizer::generate_typing(std::u32string_view text,
                                                  std::optional<IntRange> wpm,
                                                  std::optional<double> typo_probability) {
  return cadence_->generate_typing(text,
                                   wpm.value_or(cfg_->typing_wpm),
                                   typo_probability.value_or(cfg_->typo_probability));
}

std::vector<KeyAction> Humanizer::generate_typing_utf8(std::string_view text,
                                                       std::optional<IntRange> wpm,
                                                       std::optional<double> typo_probability) {
  const std::u32string decoded = decode_utf8(text);
  return generate_typing(decoded, wpm, typo_probability);
}

std::vector<ScrollAction> Humanizer::generate_scroll(Direction direction,
                                                     int distance,
                                                     std::optional<IntRange> chunk) {
  return scroll_->generate_scroll(direction, distance, chunk.value_or(cfg_->scroll_chunk));
}

std::vector<ScrollAction> Humanizer::generate_smooth_scroll(Direction direction, int distance) {
  return scroll_->generate_smooth_scroll(direction, distance);
}

Duration Humanizer::sample_delay(double min_seconds, double max_seconds) {
  return timing_->sample(min_seconds, max_seconds);
}

Duration Humanizer::gaussian_delay(double mean_seconds, double std_dev_seconds) {
  return timing_->gaussian(mean_seconds, std_dev_seconds);
}

Expected<void> Humanizer::sleep(std::optional<double> base_seconds,
                                std::optional<double> variance_seconds,
                                CancelToken& token) {
  return timing_->sleep_for(base_seconds.value_or(cfg_->base_delay.min),
                            variance_seconds.value_or(cfg_->base_delay.max - cfg_->base_delay.min),
                            token);
}

Expected<void> Humanizer::sleep_range(std::optional<double> min_seconds,
                                      std::optional<double> max_seconds,
                                      CancelToken& token) {
  return timing_->sleep_range(min_seconds.value_or(cfg_->base_delay.min),
                              max_seconds.value_or(cfg_->base_delay.max),
                              token);
}

Expected<void> Humanizer::sleep_gaussian(double mean_seconds,
                                         double std_dev_seconds,
                                         CancelToken& token) {
  return timing_->sleep_gaussian(mean_seconds, std_dev_seconds, token);
}

Expected<void> Humanizer::sleep(Duration delay, CancelToken& token) {
  return timing_->sleep(delay, token);
}

Expected<std::unique_ptr<Humanizer>> make_humanizer(HumanizerConfig cfg,
                                                    std::optional<uint64_t> seed) noexcept {
  try {
    auto normalized = normalize_config(cfg);
    auto shared = std::make_shared<const HumanizerConfig>(normalized.config);

    uint64_t state = seed.value_or(0);
    const auto next_seed = [&]() {
      return seed ? core::splitmix64(state) : RandomSource::clock_seed();
    };

    auto path = make_path_generator(shared, next_seed());
    if (!path) {
      return unexpected<Error>(path.error());
    }
    auto cadence = make_cadence_generator(shared, next_seed());
    if (!cadence) {
      return unexpected<Error>(cadence.error());
    }
    auto scroll = make_scroll_generator(shared, next_seed());
    if (!scroll) {
      return unexpected<Error>(scroll.error());
    }
    auto timing = make_timing_service(next_seed());
    if (!timing) {
      return unexpected<Error>(timing.error());
    }

    std::unique_ptr<Humanizer> out(
        new Humanizer(std::move(shared), std::move(normalized.adjustments), next_seed()));
    out->path_ = std::move(*path);
    out->cadence_ = std::move(*cadence);
    out->scroll_ = std::move(*scroll);
    out->timing_ = std::move(*timing);
    return out;
  } catch (const std::exception& ex) {
    return fail(ErrorCode::Internal, ex.what());
  }
}

}  // namespace humin
