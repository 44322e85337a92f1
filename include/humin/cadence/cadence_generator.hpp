#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "humin/core/expected.hpp"
#include "humin/core/types.hpp"

namespace humin {

class ICadenceGenerator {
 public:
  virtual ~ICadenceGenerator() = default;

  // Keystrokes for `text` in replay order. A typo expands to
  // {wrong key, Delay, kBackspace, intended key}; the last character is
  // never mistyped.
  virtual std::vector<KeyAction> generate_typing(std::u32string_view text,
                                                 IntRange wpm,
                                                 double typo_probability) = 0;
};

Expected<std::unique_ptr<ICadenceGenerator>> make_cadence_generator(
    std::shared_ptr<const HumanizerConfig> cfg,
    uint64_t seed) noexcept;

// Lowercase QWERTY neighbours of `c`, empty when the key has no entry.
std::u32string_view qwerty_neighbours(char32_t c) noexcept;

}  // namespace humin
