#include "humin/core/config.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string_view>
#include <utility>

namespace humin {
namespace {

template <class... Args>
std::string concat(const Args&... args) {
  std::ostringstream os;
  (os << ... << args);
  return os.str();
}

class Normalizer {
 public:
  explicit Normalizer(std::vector<std::string>& notes) : notes_(notes) {}

  void range(std::string_view name, RealRange& r, double floor = 0.0) {
    if (!std::isfinite(r.min)) {
      notes_.push_back(concat(name, ".min is not finite, using ", floor));
      r.min = floor;
    }
    if (!std::isfinite(r.max)) {
      notes_.push_back(concat(name, ".max is not finite, using ", r.min));
      r.max = r.min;
    }
    if (r.min < floor) {
      notes_.push_back(concat(name, ".min ", r.min, " raised to ", floor));
      r.min = floor;
    }
    if (r.max < floor) {
      notes_.push_back(concat(name, ".max ", r.max, " raised to ", floor));
      r.max = floor;
    }
    if (r.min > r.max) {
      notes_.push_back(concat(name, " swapped (", r.min, " > ", r.max, ")"));
      std::swap(r.min, r.max);
    }
  }

  void range(std::string_view name, IntRange& r, int floor = 0) {
    if (r.min < floor) {
      notes_.push_back(concat(name, ".min ", r.min, " raised to ", floor));
      r.min = floor;
    }
    if (r.max < floor) {
      notes_.push_back(concat(name, ".max ", r.max, " raised to ", floor));
      r.max = floor;
    }
    if (r.min > r.max) {
      notes_.push_back(concat(name, " swapped (", r.min, " > ", r.max, ")"));
      std::swap(r.min, r.max);
    }
  }

  void probability(std::string_view name, double& p) {
    if (std::isnan(p)) {
      notes_.push_back(concat(name, " is NaN, using 0"));
      p = 0.0;
      return;
    }
    const double clamped = std::clamp(p, 0.0, 1.0);
    if (clamped != p) {
      notes_.push_back(concat(name, " ", p, " clamped to ", clamped));
      p = clamped;
    }
  }

 private:
  std::vector<std::string>& notes_;
};

}  // namespace

NormalizedConfig normalize_config(HumanizerConfig cfg) {
  NormalizedConfig out{};
  Normalizer n{out.adjustments};

  n.range("mouse_speed", cfg.mouse_speed);
  n.probability("overshoot_chance", cfg.overshoot_chance);
  n.range("overshoot_distance", cfg.overshoot_distance);
  n.range("control_point_offset", cfg.control_point_offset);
  n.range("control_point_spread", cfg.control_point_spread);

  n.range("typing_wpm", cfg.typing_wpm, 1);
  n.probability("typo_probability", cfg.typo_probability);
  n.range("typo_pause_ms", cfg.typo_pause_ms);

  n.range("scroll_chunk", cfg.scroll_chunk, 1);
  n.range("scroll_settle_ms", cfg.scroll_settle_ms);

  n.range("base_delay", cfg.base_delay);

  n.range("viewport_width", cfg.viewport_width, 1);
  n.range("viewport_height", cfg.viewport_height, 1);

  out.config = cfg;
  return out;
}

}  // namespace humin
