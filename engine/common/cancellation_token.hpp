#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>

namespace pacer {
namespace engine {
namespace common {

/**
 * @brief Caller-owned cancellation flag with wake-up callbacks
 *
 * Cancel() is sticky and runs every registered callback once. A callback
 * subscribed after cancellation runs immediately on the subscribing thread.
 */
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  bool IsCancelled() const { return cancelled_.load(); }

  /** @brief Register a callback, returns a subscription ID for Unsubscribe */
  int Subscribe(std::function<void()> callback);
  void Unsubscribe(int subscription_id);

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  int next_id_{1};
  std::map<int, std::function<void()>> callbacks_;
};

}  // namespace common
}  // namespace engine
}  // namespace pacer
