#pragma once

#include <cstdint>

#include "humin/core/types.hpp"

namespace humin::core {

uint64_t xorshift64(uint64_t& s);
uint64_t splitmix64(uint64_t& s);

// Clamps t to [0, 1]; 4t^3 below the midpoint, 1 - (2 - 2t)^3 / 2 above.
double ease_in_out_cubic(double t);
double distance(const Point& a, const Point& b);
Point cubic_bezier(const Point& p0, const Point& p1, const Point& p2, const Point& p3, double t);

}  // namespace humin::core
