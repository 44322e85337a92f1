#pragma once

#include "humin/core/random.hpp"

namespace humin::cadence {

// Adjacent-key substitute for `intended`. Letters keep their case; space maps
// to 'x', digits to their predecessor ('0' wraps to '9'); anything else is
// returned unchanged.
char32_t typo_for(char32_t intended, RandomSource& rng);

}  // namespace humin::cadence
