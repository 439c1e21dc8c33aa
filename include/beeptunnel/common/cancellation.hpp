#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace beeptunnel::common {

/// Cooperative cancellation flag shared between a caller and a long-running operation.
class CancellationToken {
public:
  void cancel();
  [[nodiscard]] bool is_canceled() const { return canceled_.load(); }

  /// Sleeps up to `timeout`; returns true if canceled before it elapsed.
  bool wait_for(std::chrono::milliseconds timeout) const;

private:
  std::atomic<bool> canceled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

/// Shorthand used by APIs that accept an optional token.
[[nodiscard]] inline bool canceled(const CancellationToken *token) {
  return token != nullptr && token->is_canceled();
}

} // namespace beeptunnel::common
