#include "humin/timing/cancel_token.hpp"

namespace humin {

void CancelToken::cancel() {
  {
    std::scoped_lock lock(mu_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancelToken::is_cancelled() const {
  std::scoped_lock lock(mu_);
  return cancelled_;
}

bool CancelToken::wait_for(Duration timeout) {
  std::unique_lock lock(mu_);
  if (timeout <= Duration::zero()) {
    return cancelled_;
  }
  return cv_.wait_for(lock, timeout, [this]() { return cancelled_; });
}

}  // namespace humin
