#include "app/preview_runner.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <argparse/argparse.hpp>

#include "app/math_utils.hpp"
#include "humin/core/config.hpp"
#include "humin/core/utf8.hpp"
#include "humin/humanizer/humanizer.hpp"

namespace {

using Clock = std::chrono::steady_clock;

using humin::Expected;
using humin::ErrorCode;
using humin::app::Config;
using humin::app::Op;
using humin::app::RunResult;
using humin::app::Stats;

std::string op_to_string(Op op) {
  switch (op) {
    case Op::Path:
      return "path";
    case Op::Type:
      return "type";
    case Op::Scroll:
      return "scroll";
    case Op::SmoothScroll:
      return "smooth-scroll";
    case Op::Sleep:
      return "sleep";
  }
  return "unknown";
}

double to_ms(humin::Duration d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

std::string describe_key(char32_t c) {
  switch (c) {
    case humin::kBackspace:
      return "<backspace>";
    case U' ':
      return "<space>";
    case U'\n':
      return "<enter>";
    case U'\t':
      return "<tab>";
    default:
      return humin::encode_utf8(c);
  }
}

std::string stats_json(const Stats& s) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(4) << "{\"mean\": " << s.mean << ", \"median\": " << s.median
     << ", \"p95\": " << s.p95 << ", \"min\": " << s.min << ", \"max\": " << s.max << "}";
  return os.str();
}

bool has_help_flag(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
  }
  return false;
}

void add_arguments(argparse::ArgumentParser& program) {
  const humin::HumanizerConfig d{};

  program.add_argument("--op")
      .default_value(std::string("path"))
      .help("path | type | scroll | smooth-scroll | sleep");
  program.add_argument("--from").help("cursor start as x,y (default: viewport center)");
  program.add_argument("--to").default_value(std::string("500,300")).help("cursor target as x,y");
  program.add_argument("--no-overshoot").default_value(false).implicit_value(true);
  program.add_argument("--text").default_value(std::string("hello world"));
  program.add_argument("--wpm-min").scan<'i', int>();
  program.add_argument("--wpm-max").scan<'i', int>();
  program.add_argument("--typo-prob").scan<'g', double>();
  program.add_argument("--direction").default_value(std::string("down")).help("down | up");
  program.add_argument("--distance").scan<'i', int>().default_value(600);
  program.add_argument("--chunk-min").scan<'i', int>();
  program.add_argument("--chunk-max").scan<'i', int>();
  program.add_argument("--base").scan<'g', double>().help("sleep base in seconds");
  program.add_argument("--variance").scan<'g', double>().help("sleep variance in seconds");
  program.add_argument("--seed").scan<'u', uint64_t>().help("fixed seed for reproducible output");
  program.add_argument("--repeats").scan<'u', uint32_t>().default_value(1u);
  program.add_argument("--json").default_value(std::string("")).help("write a JSON summary here");

  // Engine configuration.
  program.add_argument("--mouse-speed-min").scan<'g', double>().default_value(d.mouse_speed.min);
  program.add_argument("--mouse-speed-max").scan<'g', double>().default_value(d.mouse_speed.max);
  program.add_argument("--overshoot-chance").scan<'g', double>().default_value(d.overshoot_chance);
  program.add_argument("--overshoot-dist-min")
      .scan<'g', double>()
      .default_value(d.overshoot_distance.min);
  program.add_argument("--overshoot-dist-max")
      .scan<'g', double>()
      .default_value(d.overshoot_distance.max);
  program.add_argument("--control-offset-min")
      .scan<'g', double>()
      .default_value(d.control_point_offset.min);
  program.add_argument("--control-offset-max")
      .scan<'g', double>()
      .default_value(d.control_point_offset.max);
  program.add_argument("--control-spread-min")
      .scan<'g', double>()
      .default_value(d.control_point_spread.min);
  program.add_argument("--control-spread-max")
      .scan<'g', double>()
      .default_value(d.control_point_spread.max);
  program.add_argument("--typing-wpm-min").scan<'i', int>().default_value(d.typing_wpm.min);
  program.add_argument("--typing-wpm-max").scan<'i', int>().default_value(d.typing_wpm.max);
  program.add_argument("--typo-probability").scan<'g', double>().default_value(d.typo_probability);
  program.add_argument("--typo-pause-ms-min").scan<'g', double>().default_value(d.typo_pause_ms.min);
  program.add_argument("--typo-pause-ms-max").scan<'g', double>().default_value(d.typo_pause_ms.max);
  program.add_argument("--scroll-chunk-min").scan<'i', int>().default_value(d.scroll_chunk.min);
  program.add_argument("--scroll-chunk-max").scan<'i', int>().default_value(d.scroll_chunk.max);
  program.add_argument("--settle-ms-min").scan<'g', double>().default_value(d.scroll_settle_ms.min);
  program.add_argument("--settle-ms-max").scan<'g', double>().default_value(d.scroll_settle_ms.max);
  program.add_argument("--base-delay-min").scan<'g', double>().default_value(d.base_delay.min);
  program.add_argument("--base-delay-max").scan<'g', double>().default_value(d.base_delay.max);
  program.add_argument("--viewport-width-min").scan<'i', int>().default_value(d.viewport_width.min);
  program.add_argument("--viewport-width-max").scan<'i', int>().default_value(d.viewport_width.max);
  program.add_argument("--viewport-height-min")
      .scan<'i', int>()
      .default_value(d.viewport_height.min);
  program.add_argument("--viewport-height-max")
      .scan<'i', int>()
      .default_value(d.viewport_height.max);
}

void print_key_actions(const std::vector<humin::KeyAction>& actions,
                       RunResult& result,
                       std::ostream& out) {
  for (const auto& a : actions) {
    const double ms = to_ms(a.delay);
    result.delays_ms.push_back(ms);
    if (a.kind == humin::KeyActionKind::Delay) {
      out << "pause " << std::setw(10) << ms << "ms\n";
    } else {
      out << "key   " << std::setw(10) << ms << "ms " << describe_key(a.character) << "\n";
    }
  }
  result.actions += actions.size();
}

void print_scroll_actions(const std::vector<humin::ScrollAction>& actions,
                          RunResult& result,
                          std::ostream& out) {
  for (const auto& a : actions) {
    const double ms = to_ms(a.delay);
    result.delays_ms.push_back(ms);
    out << "scroll " << std::setw(6) << a.distance << " " << std::setw(10) << ms << "ms\n";
  }
  result.actions += actions.size();
}

Expected<void> run_once(const Config& cfg,
                        humin::Humanizer& engine,
                        humin::CancelToken& token,
                        RunResult& result,
                        std::ostream& out) {
  switch (cfg.op) {
    case Op::Path: {
      const humin::Point start = cfg.from.value_or(engine.default_start());
      const auto path = engine.generate_path(start, cfg.to, cfg.overshoot);
      for (const auto& p : path) {
        out << "move " << p.x << "," << p.y << "\n";
      }
      out << "click " << path.back().x << "," << path.back().y << "\n";
      result.actions += path.size();
      return {};
    }
    case Op::Type:
      print_key_actions(engine.generate_typing_utf8(cfg.text, cfg.wpm, cfg.typo_probability),
                        result, out);
      return {};
    case Op::Scroll:
      print_scroll_actions(engine.generate_scroll(cfg.direction, cfg.distance, cfg.chunk), result,
                           out);
      return {};
    case Op::SmoothScroll:
      print_scroll_actions(engine.generate_smooth_scroll(cfg.direction, cfg.distance), result, out);
      return {};
    case Op::Sleep: {
      const auto t0 = Clock::now();
      auto slept = engine.sleep(cfg.base_seconds, cfg.variance_seconds, token);
      if (!slept) {
        return humin::unexpected<humin::Error>(slept.error());
      }
      const double ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
      result.delays_ms.push_back(ms);
      result.actions += 1;
      out << "slept " << ms << "ms\n";
      return {};
    }
  }
  return humin::fail(ErrorCode::Unsupported, "unknown operation");
}

Expected<void> write_json_summary(const Config& cfg, const RunResult& result) {
  if (!cfg.json_output.has_value()) {
    return {};
  }
  std::ofstream out(*cfg.json_output, std::ios::trunc);
  if (!out.is_open()) {
    return humin::fail(ErrorCode::InvalidArgument, "failed to open JSON output path");
  }

  out << "{\n";
  out << "  \"config\": {\"op\": \"" << op_to_string(cfg.op) << "\", \"repeats\": " << cfg.repeats
      << ", \"seeded\": " << (cfg.seed.has_value() ? "true" : "false") << "},\n";
  out << "  \"actions\": " << result.actions << ",\n";
  out << "  \"delay_ms\": " << stats_json(result.delay_stats) << "\n";
  out << "}\n";
  return {};
}

void print_human_summary(const Config& cfg, const RunResult& result) {
  const auto& s = result.delay_stats;
  std::cout << "\n=== " << op_to_string(cfg.op) << " x" << cfg.repeats << ": " << result.actions
            << " actions ===\n";
  if (!result.delays_ms.empty()) {
    std::cout << std::fixed << std::setprecision(3) << "delay_ms (mean/median/p95/min/max): " << s.mean
              << " / " << s.median << " / " << s.p95 << " / " << s.min << " / " << s.max << "\n";
  }
}

}  // namespace

namespace humin::app {

Expected<Op> parse_op(const std::string& s) {
  if (s == "path") {
    return Op::Path;
  }
  if (s == "type") {
    return Op::Type;
  }
  if (s == "scroll") {
    return Op::Scroll;
  }
  if (s == "smooth-scroll") {
    return Op::SmoothScroll;
  }
  if (s == "sleep") {
    return Op::Sleep;
  }
  return fail(ErrorCode::InvalidArgument, "invalid --op: " + s);
}

Expected<Direction> parse_direction(const std::string& s) {
  if (s == "down" || s == "forward") {
    return Direction::Forward;
  }
  if (s == "up" || s == "backward") {
    return Direction::Backward;
  }
  return fail(ErrorCode::InvalidArgument, "invalid --direction: " + s);
}

Expected<Point> parse_point(const std::string& s) {
  const auto comma = s.find(',');
  if (comma == std::string::npos) {
    return fail(ErrorCode::InvalidArgument, "point must be x,y: " + s);
  }

  const auto parse = [](std::string_view part, double& value) {
    while (!part.empty() && part.front() == ' ') {
      part.remove_prefix(1);
    }
    const auto* end = part.data() + part.size();
    const auto [ptr, ec] = std::from_chars(part.data(), end, value);
    return ec == std::errc{} && ptr == end;
  };

  Point p{};
  const std::string_view view{s};
  if (!parse(view.substr(0, comma), p.x) || !parse(view.substr(comma + 1), p.y)) {
    return fail(ErrorCode::InvalidArgument, "point must be x,y: " + s);
  }
  return p;
}

Expected<Config> parse_args(int argc, char** argv) {
  Config cfg{};
  if (argc > 0) {
    cfg.executable_path = argv[0];
  }

  argparse::ArgumentParser program("humin", "1.0", argparse::default_arguments::none);
  add_arguments(program);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return fail(ErrorCode::InvalidArgument, "argument parsing failed");
  }

  auto op = parse_op(program.get<std::string>("--op"));
  if (!op) {
    return unexpected<Error>(op.error());
  }
  cfg.op = *op;

  auto direction = parse_direction(program.get<std::string>("--direction"));
  if (!direction) {
    return unexpected<Error>(direction.error());
  }
  cfg.direction = *direction;

  if (auto from = program.present<std::string>("--from")) {
    auto p = parse_point(*from);
    if (!p) {
      return unexpected<Error>(p.error());
    }
    cfg.from = *p;
  }
  auto to = parse_point(program.get<std::string>("--to"));
  if (!to) {
    return unexpected<Error>(to.error());
  }
  cfg.to = *to;
  cfg.overshoot = !program.get<bool>("--no-overshoot");

  cfg.text = program.get<std::string>("--text");
  const auto wpm_min = program.present<int>("--wpm-min");
  const auto wpm_max = program.present<int>("--wpm-max");
  if (wpm_min || wpm_max) {
    const int lo = wpm_min.value_or(wpm_max.value_or(0));
    cfg.wpm = IntRange{lo, wpm_max.value_or(lo)};
  }
  cfg.typo_probability = program.present<double>("--typo-prob");

  cfg.distance = program.get<int>("--distance");
  const auto chunk_min = program.present<int>("--chunk-min");
  const auto chunk_max = program.present<int>("--chunk-max");
  if (chunk_min || chunk_max) {
    const int lo = chunk_min.value_or(chunk_max.value_or(1));
    cfg.chunk = IntRange{lo, chunk_max.value_or(lo)};
  }

  cfg.base_seconds = program.present<double>("--base");
  cfg.variance_seconds = program.present<double>("--variance");
  cfg.seed = program.present<uint64_t>("--seed");
  cfg.repeats = program.get<uint32_t>("--repeats");
  const auto json = program.get<std::string>("--json");
  if (!json.empty()) {
    cfg.json_output = std::filesystem::path(json);
  }

  auto& e = cfg.engine;
  e.mouse_speed = {program.get<double>("--mouse-speed-min"), program.get<double>("--mouse-speed-max")};
  e.overshoot_chance = program.get<double>("--overshoot-chance");
  e.overshoot_distance = {program.get<double>("--overshoot-dist-min"),
                          program.get<double>("--overshoot-dist-max")};
  e.control_point_offset = {program.get<double>("--control-offset-min"),
                            program.get<double>("--control-offset-max")};
  e.control_point_spread = {program.get<double>("--control-spread-min"),
                            program.get<double>("--control-spread-max")};
  e.typing_wpm = {program.get<int>("--typing-wpm-min"), program.get<int>("--typing-wpm-max")};
  e.typo_probability = program.get<double>("--typo-probability");
  e.typo_pause_ms = {program.get<double>("--typo-pause-ms-min"),
                     program.get<double>("--typo-pause-ms-max")};
  e.scroll_chunk = {program.get<int>("--scroll-chunk-min"), program.get<int>("--scroll-chunk-max")};
  e.scroll_settle_ms = {program.get<double>("--settle-ms-min"), program.get<double>("--settle-ms-max")};
  e.base_delay = {program.get<double>("--base-delay-min"), program.get<double>("--base-delay-max")};
  e.viewport_width = {program.get<int>("--viewport-width-min"),
                      program.get<int>("--viewport-width-max")};
  e.viewport_height = {program.get<int>("--viewport-height-min"),
                       program.get<int>("--viewport-height-max")};

  if (cfg.repeats == 0) {
    return fail(ErrorCode::InvalidArgument, "--repeats must be > 0");
  }
  return cfg;
}

Expected<RunResult> run_preview(const Config& cfg, std::ostream& out) {
  auto engine = make_humanizer(cfg.engine, cfg.seed);
  if (!engine) {
    return unexpected<Error>(engine.error());
  }
  for (const auto& note : (*engine)->config_adjustments()) {
    std::cerr << "[warn] config: " << note << "\n";
  }

  CancelToken token;
  RunResult result{};
  out << std::fixed << std::setprecision(3);
  for (uint32_t r = 0; r < cfg.repeats; ++r) {
    if (cfg.repeats > 1) {
      out << "# repeat " << r << "\n";
    }
    auto run = run_once(cfg, **engine, token, result, out);
    if (!run) {
      return unexpected<Error>(run.error());
    }
  }

  result.delay_stats = calc_stats(result.delays_ms);
  return result;
}

}  // namespace humin::app

int run_cli_impl(int argc, char** argv) {
  if (has_help_flag(argc, argv)) {
    argparse::ArgumentParser program("humin", "1.0", argparse::default_arguments::none);
    add_arguments(program);
    std::cout << program;
    return 0;
  }

  auto cfg = humin::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().what() << "\n";
    return 2;
  }

  auto run = humin::app::run_preview(*cfg, std::cout);
  if (!run) {
    std::cerr << "run error (" << humin::error_code_name(run.error().code())
              << "): " << run.error().what() << "\n";
    return 1;
  }

  print_human_summary(*cfg, *run);
  auto json = write_json_summary(*cfg, *run);
  if (!json) {
    std::cerr << "error: " << json.error().what() << "\n";
    return 1;
  }
  return 0;
}
