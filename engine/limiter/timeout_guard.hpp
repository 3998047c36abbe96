#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "admission_queue.hpp"
#include "engine/common/clock.hpp"
#include "engine/common/event_thread.hpp"
#include "rate_limit_group.hpp"
#include "waiter.hpp"

namespace pacer {

enum class WaitOutcome { GRANTED, TIMEOUT, CANCELLED, FORCE_RELEASED, SHUTDOWN };

std::string ToString(WaitOutcome outcome);

// Wait-time statistics for callers that had to suspend
struct WaitStats {
  uint64_t completed_waits = 0;
  uint64_t grants = 0;
  uint64_t timeouts = 0;
  uint64_t cancellations = 0;
  uint64_t fail_open_releases = 0;
  uint64_t shutdowns = 0;
  double total_wait = 0.0;
  double ema_wait = 0.0;  ///< 0.9 * previous + 0.1 * latest
  double max_wait = 0.0;
};

/**
 * @brief Bounds every suspension and guarantees its cleanup
 *
 * Arm schedules a cancellable task on the timer thread that signals the
 * waiter with TIMEOUT after the configured timeout. The active-timeout
 * registry keeps only waiter id -> timer task id; the task itself holds a
 * weak reference, so the queue stays the waiter's only owner besides the
 * caller.
 *
 * Cleanup cancels the timer, removes the waiter from its queue and from the
 * registry, and records statistics. It is idempotent: only the call that
 * actually removes the waiter records anything.
 */
class TimeoutGuard {
 public:
  TimeoutGuard(engine::common::EventThread& timer_thread, std::chrono::milliseconds waiter_timeout,
               const engine::common::Clock& clock = engine::common::SteadyClock::Instance());

  TimeoutGuard(const TimeoutGuard&) = delete;
  TimeoutGuard& operator=(const TimeoutGuard&) = delete;

  // False if the timer thread is not running; the caller must not suspend then
  bool Arm(const std::shared_ptr<Waiter>& waiter);

  void Cleanup(AdmissionQueue& queue, const Waiter& waiter, WaitOutcome outcome);

  size_t ActiveTimeouts(RateLimitGroup group) const;
  WaitStats GetStats(RateLimitGroup group) const;

  std::chrono::milliseconds GetWaiterTimeout() const { return waiter_timeout_; }

  // Runs Cleanup on every exit path of a suspended acquire
  class Scope {
   public:
    Scope(TimeoutGuard& guard, AdmissionQueue& queue, std::shared_ptr<Waiter> waiter)
        : guard_(guard), queue_(queue), waiter_(std::move(waiter)) {}
    ~Scope() { guard_.Cleanup(queue_, *waiter_, outcome_); }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    void SetOutcome(WaitOutcome outcome) { outcome_ = outcome; }

   private:
    TimeoutGuard& guard_;
    AdmissionQueue& queue_;
    std::shared_ptr<Waiter> waiter_;
    WaitOutcome outcome_{WaitOutcome::CANCELLED};
  };

 private:
  struct GroupTimeouts {
    std::unordered_map<uint64_t, int> active;  ///< waiter id -> timer task id
    WaitStats stats;
  };

  void Record(WaitStats& stats, WaitOutcome outcome, double waited);

  engine::common::EventThread& timer_thread_;
  std::chrono::milliseconds waiter_timeout_;
  const engine::common::Clock& clock_;

  mutable std::mutex mutex_;
  std::array<GroupTimeouts, kRateLimitGroupCount> groups_;
};

}  // namespace pacer
