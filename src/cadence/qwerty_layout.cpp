#include "cadence/qwerty_layout.hpp"

#include <array>

#include "humin/cadence/cadence_generator.hpp"

namespace humin {
namespace {

constexpr std::array<std::u32string_view, 26> kLetterNeighbours = {
    U"sqwzx",   // a
    U"vghn",    // b
    U"xdfv",    // c
    U"serfcx",  // d
    U"wrds",    // e
    U"drtgvc",  // f
    U"ftyhbv",  // g
    U"gyujnb",  // h
    U"uokj",    // i
    U"huikmn",  // j
    U"jiol,m",  // k
    U"kop;.,",  // l
    U"njk,",    // m
    U"bhjm",    // n
    U"iplk",    // o
    U"o[]l;",   // p
    U"wa",      // q
    U"etfd",    // r
    U"awedxz",  // s
    U"rygf",    // t
    U"yijh",    // u
    U"cfgb",    // v
    U"qesa",    // w
    U"zsdc",    // x
    U"tuhg",    // y
    U"asx",     // z
};

bool is_upper(char32_t c) { return c >= U'A' && c <= U'Z'; }

}  // namespace

std::u32string_view qwerty_neighbours(char32_t c) noexcept {
  if (is_upper(c)) {
    c = c - U'A' + U'a';
  }
  if (c < U'a' || c > U'z') {
    return {};
  }
  return kLetterNeighbours[static_cast<size_t>(c - U'a')];
}

namespace cadence {

char32_t typo_for(char32_t intended, RandomSource& rng) {
  const auto nearby = qwerty_neighbours(intended);
  if (!nearby.empty()) {
    const auto idx = static_cast<size_t>(rng.uniform_int(0, static_cast<int>(nearby.size()) - 1));
    char32_t typo = nearby[idx];
    if (is_upper(intended) && typo >= U'a' && typo <= U'z') {
      typo = typo - U'a' + U'A';
    }
    return typo;
  }
  if (intended == U' ') {
    return U'x';
  }
  if (intended >= U'0' && intended <= U'9') {
    return intended == U'0' ? U'9' : intended - 1;
  }
  return intended;
}

}  // namespace cadence
}  // namespace humin
