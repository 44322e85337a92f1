#pragma once

#include <condition_variable>
#include <mutex>

#include "humin/core/types.hpp"

namespace humin {

// Sticky cancellation flag shared between the thread replaying a sequence and
// whoever may abort it.
class CancelToken {
 public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void cancel();
  bool is_cancelled() const;

  // Blocks up to `timeout`. Returns true if cancelled before or during the wait.
  bool wait_for(Duration timeout);

 private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_{false};
};

}  // namespace humin
