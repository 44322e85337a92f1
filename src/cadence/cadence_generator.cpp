#include "humin/cadence/cadence_generator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

#include "cadence/qwerty_layout.hpp"
#include "humin/core/random.hpp"
#include "timing/jitter.hpp"

namespace humin {
namespace {

// 5 letters plus a space.
constexpr double kCharsPerWord = 6.0;
constexpr Duration kJitterCap = std::chrono::milliseconds(1);

bool is_whitespace(char32_t c) { return c == U' ' || c == U'\n' || c == U'\t'; }

bool is_sentence_punctuation(char32_t c) {
  return c == U'.' || c == U',' || c == U'!' || c == U'?';
}

class WpmCadenceGenerator final : public ICadenceGenerator {
 public:
  WpmCadenceGenerator(std::shared_ptr<const HumanizerConfig> cfg, uint64_t seed)
      : cfg_(std::move(cfg)), rng_(seed) {}

  std::vector<KeyAction> generate_typing(std::u32string_view text,
                                         IntRange wpm,
                                         double typo_probability) override {
    std::vector<KeyAction> actions;
    if (text.empty()) {
      return actions;
    }

    wpm.min = std::max(1, wpm.min);
    wpm.max = std::max(1, wpm.max);
    if (std::isnan(typo_probability)) {
      typo_probability = 0.0;
    }
    typo_probability = std::clamp(typo_probability, 0.0, 1.0);

    // One speed for the whole string.
    const int words_per_minute = rng_.uniform_int(wpm.min, wpm.max);
    const double base_seconds = (60.0 / static_cast<double>(words_per_minute)) / kCharsPerWord;

    actions.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
      const char32_t c = text[i];
      const bool last = (i + 1 == text.size());

      if (rng_.chance(typo_probability) && !last) {
        actions.push_back(key(cadence::typo_for(c, rng_), delay_for(base_seconds, c)));
        actions.push_back(KeyAction{
            .kind = KeyActionKind::Delay,
            .character = 0,
            .delay = notice_pause(),
        });
        actions.push_back(key(kBackspace, delay_for(base_seconds, kBackspace)));
      }
      actions.push_back(key(c, delay_for(base_seconds, c)));
    }
    return actions;
  }

 private:
  static KeyAction key(char32_t c, Duration delay) {
    return KeyAction{.kind = KeyActionKind::Key, .character = c, .delay = delay};
  }

  Duration notice_pause() {
    const double ms = rng_.uniform(cfg_->typo_pause_ms.min, cfg_->typo_pause_ms.max);
    return timing::with_fractional_offset(timing::millis_to_duration(ms), rng_, kJitterCap);
  }

  Duration delay_for(double base_seconds, char32_t c) {
    double seconds = base_seconds * rng_.uniform(0.8, 1.2);
    if (is_whitespace(c)) {
      seconds *= rng_.uniform(1.5, 2.0);
    } else if (is_sentence_punctuation(c)) {
      seconds *= rng_.uniform(1.2, 1.5);
    } else if (c == kBackspace) {
      seconds *= rng_.uniform(0.7, 0.9);
    }
    return timing::with_fractional_offset(timing::seconds_to_duration(seconds), rng_, kJitterCap);
  }

  std::shared_ptr<const HumanizerConfig> cfg_;
  RandomSource rng_;
};

}  // namespace

Expected<std::unique_ptr<ICadenceGenerator>> make_cadence_generator(
    std::shared_ptr<const HumanizerConfig> cfg,
    uint64_t seed) noexcept {
  if (!cfg) {
    return fail(ErrorCode::InvalidArgument, "cadence generator requires a configuration");
  }
  try {
    return std::unique_ptr<ICadenceGenerator>(new WpmCadenceGenerator(std::move(cfg), seed));
  } catch (const std::exception& ex) {
    return fail(ErrorCode::Internal, ex.what());
  }
}

}  // namespace humin
