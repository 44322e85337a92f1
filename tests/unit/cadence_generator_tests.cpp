#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <utility>

#include "humin/cadence/cadence_generator.hpp"

namespace {

using namespace std::chrono_literals;

std::unique_ptr<humin::ICadenceGenerator> make_generator(uint64_t seed) {
  auto gen = humin::make_cadence_generator(std::make_shared<const humin::HumanizerConfig>(), seed);
  if (!gen) {
    std::cerr << "make_cadence_generator failed: " << gen.error().what() << "\n";
    return nullptr;
  }
  return std::move(*gen);
}

bool whole_millisecond(humin::Duration d) { return d % 1ms == humin::Duration::zero(); }

bool test_empty_text() {
  auto gen = make_generator(1);
  if (!gen) {
    return false;
  }
  if (!gen->generate_typing(U"", {40, 80}, 1.0).empty()) {
    std::cerr << "empty text produced actions\n";
    return false;
  }
  return true;
}

bool test_clean_typing() {
  auto gen = make_generator(2);
  if (!gen) {
    return false;
  }
  const std::u32string text = U"The quick, brown fox!";
  const auto actions = gen->generate_typing(text, {40, 80}, 0.0);
  if (actions.size() != text.size()) {
    std::cerr << "expected " << text.size() << " actions, got " << actions.size() << "\n";
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    if (actions[i].kind != humin::KeyActionKind::Key || actions[i].character != text[i]) {
      std::cerr << "action " << i << " does not match the text\n";
      return false;
    }
    if (actions[i].delay < 1ms || whole_millisecond(actions[i].delay)) {
      std::cerr << "bad delay at " << i << ": " << actions[i].delay.count() << "ns\n";
      return false;
    }
  }
  return true;
}

bool test_every_typo_corrected() {
  auto gen = make_generator(3);
  if (!gen) {
    return false;
  }
  const std::u32string text = U"hello world";
  const auto actions = gen->generate_typing(text, {40, 80}, 1.0);
  const size_t groups = text.size() - 1;
  if (actions.size() != groups * 4 + 1) {
    std::cerr << "expected " << groups * 4 + 1 << " actions, got " << actions.size() << "\n";
    return false;
  }

  std::u32string typed;
  for (size_t g = 0; g < groups; ++g) {
    const auto& wrong = actions[g * 4];
    const auto& pause = actions[g * 4 + 1];
    const auto& erase = actions[g * 4 + 2];
    const auto& right = actions[g * 4 + 3];
    if (wrong.kind != humin::KeyActionKind::Key || wrong.character == text[g]) {
      std::cerr << "group " << g << " does not start with a wrong key\n";
      return false;
    }
    if (pause.kind != humin::KeyActionKind::Delay || pause.delay < 100ms || pause.delay > 302ms) {
      std::cerr << "group " << g << " notice pause out of range: " << pause.delay.count() << "ns\n";
      return false;
    }
    if (erase.kind != humin::KeyActionKind::Key || erase.character != humin::kBackspace) {
      std::cerr << "group " << g << " is missing the backspace\n";
      return false;
    }
    typed.push_back(right.character);
  }

  // The last character is never mistyped.
  if (actions.back().kind != humin::KeyActionKind::Key || actions.back().character != text.back()) {
    std::cerr << "last character was mistyped\n";
    return false;
  }
  typed.push_back(actions.back().character);

  if (typed != text) {
    std::cerr << "corrected text does not match the input\n";
    return false;
  }
  return true;
}

bool test_typo_fallbacks() {
  auto gen = make_generator(4);
  if (!gen) {
    return false;
  }
  struct Case {
    char32_t intended;
    char32_t expected;
  };
  for (const Case c : {Case{U' ', U'x'}, Case{U'1', U'0'}, Case{U'7', U'6'}, Case{U'0', U'9'}, Case{U'#', U'#'}}) {
    const std::u32string text{c.intended, U'a'};
    const auto actions = gen->generate_typing(text, {60, 60}, 1.0);
    if (actions.size() != 5 || actions[0].character != c.expected) {
      std::cerr << "typo for U+" << static_cast<uint32_t>(c.intended) << " was U+"
                << static_cast<uint32_t>(actions.empty() ? 0 : actions[0].character) << "\n";
      return false;
    }
  }

  for (int i = 0; i < 50; ++i) {
    const auto actions = gen->generate_typing(U"Qa", {60, 60}, 1.0);
    const char32_t typo = actions[0].character;
    if (typo != U'W' && typo != U'A') {
      std::cerr << "uppercase typo lost its case: U+" << static_cast<uint32_t>(typo) << "\n";
      return false;
    }
  }

  if (humin::qwerty_neighbours(U'Q') != U"wa" || !humin::qwerty_neighbours(U'5').empty()) {
    std::cerr << "qwerty neighbour lookup is wrong\n";
    return false;
  }
  return true;
}

bool test_delay_factors() {
  auto gen = make_generator(5);
  if (!gen) {
    return false;
  }
  // 60 wpm, six characters per word.
  constexpr double kBaseMs = 1000.0 / 6.0;
  constexpr double kSlackMs = 1.01;

  auto within = [](humin::Duration d, double lo_ms, double hi_ms) {
    const double ms = std::chrono::duration<double, std::milli>(d).count();
    return ms >= lo_ms && ms <= hi_ms + kSlackMs;
  };

  for (int i = 0; i < 50; ++i) {
    const auto actions = gen->generate_typing(U"a b.", {60, 60}, 0.0);
    if (!within(actions[0].delay, kBaseMs * 0.8, kBaseMs * 1.2)) {
      std::cerr << "letter delay out of range\n";
      return false;
    }
    if (!within(actions[1].delay, kBaseMs * 0.8 * 1.5, kBaseMs * 1.2 * 2.0)) {
      std::cerr << "space delay out of range\n";
      return false;
    }
    if (!within(actions[3].delay, kBaseMs * 0.8 * 1.2, kBaseMs * 1.2 * 1.5)) {
      std::cerr << "punctuation delay out of range\n";
      return false;
    }

    const auto typo = gen->generate_typing(U"ab", {60, 60}, 1.0);
    if (!within(typo[2].delay, kBaseMs * 0.8 * 0.7, kBaseMs * 1.2 * 0.9)) {
      std::cerr << "backspace delay out of range\n";
      return false;
    }
  }
  return true;
}

bool test_degenerate_inputs() {
  auto gen = make_generator(6);
  if (!gen) {
    return false;
  }
  // wpm floored at 1: ten seconds per character.
  const auto slow = gen->generate_typing(U"ab", {0, -5}, 0.0);
  if (slow.size() != 2 || slow[0].delay < 8s) {
    std::cerr << "zero wpm was not floored at 1\n";
    return false;
  }

  const auto clamped = gen->generate_typing(U"abc", {80, 40}, 5.0);
  if (clamped.size() != 9) {
    std::cerr << "typo probability above 1 was not clamped, got " << clamped.size() << "\n";
    return false;
  }

  const auto nan = gen->generate_typing(U"abc", {40, 80}, std::numeric_limits<double>::quiet_NaN());
  if (nan.size() != 3) {
    std::cerr << "NaN typo probability produced typos\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_empty_text()) {
    return 1;
  }
  if (!test_clean_typing()) {
    return 1;
  }
  if (!test_every_typo_corrected()) {
    return 1;
  }
  if (!test_typo_fallbacks()) {
    return 1;
  }
  if (!test_delay_factors()) {
    return 1;
  }
  if (!test_degenerate_inputs()) {
    return 1;
  }
  return 0;
}
