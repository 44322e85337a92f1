#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "humin/core/types.hpp"

namespace humin::app {

enum class Op { Path, Type, Scroll, SmoothScroll, Sleep };

struct Config {
  Op op{Op::Path};
  HumanizerConfig engine{};

  std::optional<Point> from;
  Point to{500.0, 300.0};
  bool overshoot{true};

  std::string text{"hello world"};
  std::optional<IntRange> wpm;
  std::optional<double> typo_probability;

  Direction direction{Direction::Forward};
  int distance{600};
  std::optional<IntRange> chunk;

  std::optional<double> base_seconds;
  std::optional<double> variance_seconds;

  std::optional<uint64_t> seed;
  uint32_t repeats{1};

  std::optional<std::filesystem::path> json_output;
  std::string executable_path;
};

struct Stats {
  double mean{0.0};
  double median{0.0};
  double p95{0.0};
  double min{0.0};
  double max{0.0};
};

struct RunResult {
  // Milliseconds of every delay produced across all repeats.
  std::vector<double> delays_ms;
  size_t actions{0};
  Stats delay_stats{};
};

}  // namespace humin::app
