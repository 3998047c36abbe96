#include "timeout_guard.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pacer {

std::string ToString(WaitOutcome outcome) {
  switch (outcome) {
    case WaitOutcome::GRANTED:
      return "GRANTED";
    case WaitOutcome::TIMEOUT:
      return "TIMEOUT";
    case WaitOutcome::CANCELLED:
      return "CANCELLED";
    case WaitOutcome::FORCE_RELEASED:
      return "FORCE_RELEASED";
    case WaitOutcome::SHUTDOWN:
      return "SHUTDOWN";
  }
  return "UNKNOWN";
}

TimeoutGuard::TimeoutGuard(engine::common::EventThread& timer_thread, std::chrono::milliseconds waiter_timeout,
                           const engine::common::Clock& clock)
    : timer_thread_(timer_thread), waiter_timeout_(waiter_timeout), clock_(clock) {
}

bool TimeoutGuard::Arm(const std::shared_ptr<Waiter>& waiter) {
  const RateLimitGroup group = waiter->GetGroup();
  const uint64_t id = waiter->GetId();
  std::weak_ptr<Waiter> weak = waiter;

  // Registry lock held across PostDelayed so Cleanup cannot miss the entry
  std::lock_guard<std::mutex> lock(mutex_);
  const int task_id = timer_thread_.PostDelayed(
      [weak, group, id]() {
        if (auto target = weak.lock()) {
          if (target->Signal(WakeReason::TIMEOUT)) {
            SPDLOG_DEBUG("{} waiter {} timed out", ToString(group), id);
          }
        }
      },
      waiter_timeout_);
  if (task_id < 0) {
    SPDLOG_WARN("{} waiter {}: timer thread not running, cannot arm timeout", ToString(group), id);
    return false;
  }
  groups_[GroupIndex(group)].active[id] = task_id;
  return true;
}

void TimeoutGuard::Cleanup(AdmissionQueue& queue, const Waiter& waiter, WaitOutcome outcome) {
  const uint64_t id = waiter.GetId();
  const bool removed = queue.Remove(id);

  std::lock_guard<std::mutex> lock(mutex_);
  GroupTimeouts& timeouts = groups_[GroupIndex(waiter.GetGroup())];
  auto it = timeouts.active.find(id);
  if (it != timeouts.active.end()) {
    timer_thread_.CancelDelayed(it->second);
    timeouts.active.erase(it);
  }

  if (!removed) {
    return;  // already cleaned up
  }
  const double waited = std::max(0.0, clock_.Now() - waiter.GetArrivalTime());
  Record(timeouts.stats, outcome, waited);
  SPDLOG_DEBUG("{} waiter {} finished: {} after {:.4f}s", ToString(waiter.GetGroup()), id, ToString(outcome),
               waited);
}

void TimeoutGuard::Record(WaitStats& stats, WaitOutcome outcome, double waited) {
  ++stats.completed_waits;
  switch (outcome) {
    case WaitOutcome::GRANTED:
      ++stats.grants;
      break;
    case WaitOutcome::TIMEOUT:
      ++stats.timeouts;
      break;
    case WaitOutcome::CANCELLED:
      ++stats.cancellations;
      break;
    case WaitOutcome::FORCE_RELEASED:
      ++stats.fail_open_releases;
      break;
    case WaitOutcome::SHUTDOWN:
      ++stats.shutdowns;
      break;
  }
  stats.total_wait += waited;
  stats.ema_wait = stats.completed_waits == 1 ? waited : 0.9 * stats.ema_wait + 0.1 * waited;
  stats.max_wait = std::max(stats.max_wait, waited);
}

size_t TimeoutGuard::ActiveTimeouts(RateLimitGroup group) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_[GroupIndex(group)].active.size();
}

WaitStats TimeoutGuard::GetStats(RateLimitGroup group) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return groups_[GroupIndex(group)].stats;
}

}  // namespace pacer
