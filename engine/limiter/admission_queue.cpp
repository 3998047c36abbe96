#include "admission_queue.hpp"

#include <spdlog/spdlog.h>

namespace pacer {

std::shared_ptr<Waiter> AdmissionQueue::Enqueue(double now, double ready_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  const uint64_t id = next_id_++;
  auto waiter = std::make_shared<Waiter>(id, group_, now, ready_at);
  waiters_.emplace(id, waiter);
  SPDLOG_DEBUG("{} waiter {} queued, ready in {:.4f}s (depth={})", ToString(group_), id, ready_at - now,
               waiters_.size());
  return waiter;
}

bool AdmissionQueue::Remove(uint64_t waiter_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiters_.erase(waiter_id) > 0;
}

size_t AdmissionQueue::WakeDue(double now) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t woken = 0;
  for (auto& [id, waiter] : waiters_) {
    if (waiter->WakeIfDue(now)) {
      ++woken;
    }
  }
  return woken;
}

std::optional<double> AdmissionQueue::NextReadyAt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<double> earliest;
  for (const auto& [id, waiter] : waiters_) {
    if (!waiter->IsWaiting()) {
      continue;
    }
    const double ready_at = waiter->GetReadyAt();
    if (!earliest || ready_at < *earliest) {
      earliest = ready_at;
    }
  }
  return earliest;
}

size_t AdmissionQueue::ReleaseAll(WakeReason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t released = 0;
  for (auto& [id, waiter] : waiters_) {
    if (waiter->Signal(reason)) {
      ++released;
    }
  }
  if (released > 0) {
    SPDLOG_WARN("{}: released {} waiters ({})", ToString(group_), released, ToString(reason));
  }
  return released;
}

size_t AdmissionQueue::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiters_.size();
}

}  // namespace pacer
