#include "core/curve_math.hpp"

#include <algorithm>
#include <cmath>

namespace humin::core {

uint64_t xorshift64(uint64_t& s) {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

uint64_t splitmix64(uint64_t& s) {
  uint64_t z = (s += 0x9e3779b97f4a7c15ULL);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

double ease_in_out_cubic(double t) {
  t = std::clamp(t, 0.0, 1.0);
  if (t < 0.5) {
    return 4.0 * t * t * t;
  }
  return 1.0 - std::pow(-2.0 * t + 2.0, 3.0) / 2.0;
}

double distance(const Point& a, const Point& b) {
  return std::hypot(b.x - a.x, b.y - a.y);
}

// B(t) = (1-t)^3 P0 + 3(1-t)^2 t P1 + 3(1-t) t^2 P2 + t^3 P3
Point cubic_bezier(const Point& p0, const Point& p1, const Point& p2, const Point& p3, double t) {
  const double mt = 1.0 - t;
  const double mt2 = mt * mt;
  const double mt3 = mt2 * mt;
  const double t2 = t * t;
  const double t3 = t2 * t;

  return Point{
      mt3 * p0.x + 3.0 * mt2 * t * p1.x + 3.0 * mt * t2 * p2.x + t3 * p3.x,
      mt3 * p0.y + 3.0 * mt2 * t * p1.y + 3.0 * mt * t2 * p2.y + t3 * p3.y,
  };
}

}  // namespace humin::core
