#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "humin/core/expected.hpp"
#include "humin/core/types.hpp"

namespace humin {

class IScrollGenerator {
 public:
  virtual ~IScrollGenerator() = default;

  // Chunked scroll whose |distance| values sum to |total_distance|, followed
  // by one zero-distance settle pause. Backward chunks are negative.
  // Chunks never go below ceil(|total_distance| / 4096) px, which keeps the
  // result under roughly 6000 actions for any distance.
  virtual std::vector<ScrollAction> generate_scroll(Direction direction,
                                                    int total_distance,
                                                    IntRange chunk) = 0;

  // 10-20 near-equal short steps with no settle pause.
  virtual std::vector<ScrollAction> generate_smooth_scroll(Direction direction,
                                                           int total_distance) = 0;
};

Expected<std::unique_ptr<IScrollGenerator>> make_scroll_generator(
    std::shared_ptr<const HumanizerConfig> cfg,
    uint64_t seed) noexcept;

}  // namespace humin
