#include "humin/path/path_generator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <utility>

#include "core/curve_math.hpp"
#include "humin/core/random.hpp"

namespace humin {
namespace {

constexpr double kMinSpeedFactor = 1e-3;
constexpr double kMaxCorrectionSteps = 1e6;

using ControlPoints = std::array<Point, 4>;

class BezierPathGenerator final : public IPathGenerator {
 public:
  BezierPathGenerator(std::shared_ptr<const HumanizerConfig> cfg, uint64_t seed, PathLimits limits)
      : cfg_(std::move(cfg)), limits_(limits), rng_(seed) {}

  Path generate_path(Point start, Point end, bool allow_overshoot) override {
    const double dist = core::distance(start, end);
    if (!std::isfinite(dist) || !(dist >= limits_.min_distance)) {
      return Path{end};
    }

    const Point primary = allow_overshoot ? overshoot_target(start, end, dist) : end;

    Path points = sample(control_points(start, primary), steps_for(dist));

    if (primary != end) {
      // Correction density follows the full move, not the short hop back.
      const double raw = std::min(dist * limits_.correction_step_factor, kMaxCorrectionSteps);
      const int steps = std::max(limits_.min_correction_steps, static_cast<int>(raw));
      Path correction = sample(control_points(primary, end), steps);
      points.insert(points.end(), correction.begin(), correction.end());
    }

    points.back() = end;
    return points;
  }

 private:
  Point overshoot_target(Point start, Point end, double dist) {
    if (!rng_.chance(cfg_->overshoot_chance)) {
      return end;
    }
    const double factor = rng_.uniform(cfg_->overshoot_distance.min, cfg_->overshoot_distance.max);
    const double extra = dist * factor;
    const double angle = std::atan2(end.y - start.y, end.x - start.x);
    return Point{end.x + extra * std::cos(angle), end.y + extra * std::sin(angle)};
  }

  int steps_for(double dist) {
    const double speed = std::max(kMinSpeedFactor, rng_.uniform(cfg_->mouse_speed.min, cfg_->mouse_speed.max));
    const double raw = dist / (limits_.step_divisor * speed);
    if (!(raw < static_cast<double>(limits_.max_steps))) {
      return limits_.max_steps;
    }
    return std::clamp(static_cast<int>(raw), limits_.min_steps, limits_.max_steps);
  }

  // [P0, P1, P2, P3]; P1 hangs off the start, P2 off the end, on opposite
  // sides of the chord scaled by independent spreads.
  ControlPoints control_points(Point from, Point to) {
    const double dx = to.x - from.x;
    const double dy = to.y - from.y;

    double perp_x = -dy;
    double perp_y = dx;
    const double len = std::hypot(perp_x, perp_y);
    if (len > 0.0) {
      const double arc =
          rng_.uniform(cfg_->control_point_offset.min, cfg_->control_point_offset.max) * len;
      perp_x = perp_x / len * arc;
      perp_y = perp_y / len * arc;
    }

    const double spread1 = rng_.uniform(cfg_->control_point_spread.min, cfg_->control_point_spread.max);
    const double spread2 = rng_.uniform(cfg_->control_point_spread.min, cfg_->control_point_spread.max);

    return ControlPoints{
        from,
        Point{from.x + perp_x * spread1, from.y + perp_y * spread1},
        Point{to.x - perp_x * spread2, to.y - perp_y * spread2},
        to,
    };
  }

  static Path sample(const ControlPoints& cp, int steps) {
    steps = std::max(steps, 2);
    Path out;
    out.reserve(static_cast<size_t>(steps));
    for (int i = 0; i < steps; ++i) {
      const double t = static_cast<double>(i) / static_cast<double>(steps - 1);
      out.push_back(core::cubic_bezier(cp[0], cp[1], cp[2], cp[3], core::ease_in_out_cubic(t)));
    }
    return out;
  }

  std::shared_ptr<const HumanizerConfig> cfg_;
  PathLimits limits_;
  RandomSource rng_;
};

}  // namespace

Expected<std::unique_ptr<IPathGenerator>> make_path_generator(
    std::shared_ptr<const HumanizerConfig> cfg,
    uint64_t seed,
    PathLimits limits) noexcept {
  if (!cfg) {
    return fail(ErrorCode::InvalidArgument, "path generator requires a configuration");
  }
  if (limits.min_steps < 2 || limits.max_steps < limits.min_steps) {
    return fail(ErrorCode::InvalidArgument, "path step limits must satisfy 2 <= min <= max");
  }
  if (!(limits.step_divisor > 0.0) || limits.min_correction_steps < 2) {
    return fail(ErrorCode::InvalidArgument, "invalid path correction limits");
  }

  try {
    return std::unique_ptr<IPathGenerator>(new BezierPathGenerator(std::move(cfg), seed, limits));
  } catch (const std::exception& ex) {
    return fail(ErrorCode::Internal, ex.what());
  }
}

}  // namespace humin
