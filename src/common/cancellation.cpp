#include "beeptunnel/common/cancellation.hpp"

namespace beeptunnel::common {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    canceled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::wait_for(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return canceled_.load(); });
}

} // namespace beeptunnel::common
