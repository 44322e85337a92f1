#pragma once

#include <iosfwd>
#include <string>

#include "app/config_types.hpp"
#include "humin/core/expected.hpp"

int run_cli_impl(int argc, char** argv);

namespace humin::app {

humin::Expected<Op> parse_op(const std::string& s);
humin::Expected<Direction> parse_direction(const std::string& s);
humin::Expected<Point> parse_point(const std::string& s);

humin::Expected<Config> parse_args(int argc, char** argv);

// Runs cfg.op cfg.repeats times, printing every action of every repeat to `out`.
humin::Expected<RunResult> run_preview(const Config& cfg, std::ostream& out);

}  // namespace humin::app
