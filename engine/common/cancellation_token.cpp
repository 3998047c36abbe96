#include "cancellation_token.hpp"

#include <vector>

namespace pacer {
namespace engine {
namespace common {

void CancellationToken::Cancel() {
  std::vector<std::function<void()>> to_run;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true)) {
      return;
    }
    for (auto& entry : callbacks_) {
      to_run.push_back(std::move(entry.second));
    }
    callbacks_.clear();
  }
  // Run outside the lock so callbacks may Unsubscribe
  for (auto& callback : to_run) {
    callback();
  }
}

int CancellationToken::Subscribe(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load()) {
      int id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  callback();
  return -1;
}

void CancellationToken::Unsubscribe(int subscription_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(subscription_id);
}

}  // namespace common
}  // namespace engine
}  // namespace pacer
