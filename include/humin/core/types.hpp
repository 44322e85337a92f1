#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace humin {

using Duration = std::chrono::nanoseconds;

inline constexpr char32_t kBackspace = U'\b';

struct Point {
  double x{};
  double y{};

  friend bool operator==(const Point&, const Point&) = default;
};

enum class Direction { Forward, Backward };

struct IntRange {
  int min{};
  int max{};
};

struct RealRange {
  double min{};
  double max{};
};

enum class KeyActionKind { Key, Delay };

struct KeyAction {
  KeyActionKind kind{KeyActionKind::Key};
  char32_t character{};
  Duration delay{};
};

struct ScrollAction {
  int distance{};
  Duration delay{};
};

struct Viewport {
  int width{};
  int height{};
};

using Path = std::vector<Point>;

struct HumanizerConfig {
  RealRange mouse_speed{0.5, 1.5};
  double overshoot_chance{0.3};
  RealRange overshoot_distance{0.05, 0.15};
  RealRange control_point_offset{0.1, 0.3};
  RealRange control_point_spread{0.2, 0.6};

  IntRange typing_wpm{40, 80};
  double typo_probability{0.02};
  RealRange typo_pause_ms{100.0, 300.0};

  IntRange scroll_chunk{50, 200};
  RealRange scroll_settle_ms{200.0, 500.0};

  // Seconds.
  RealRange base_delay{0.1, 0.5};

  IntRange viewport_width{1920, 1920};
  IntRange viewport_height{1080, 1080};
};

}  // namespace humin
