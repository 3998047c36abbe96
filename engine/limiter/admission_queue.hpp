#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "rate_limit_group.hpp"
#include "waiter.hpp"

namespace pacer {

/**
 * @brief Ordered set of suspended callers for one group
 *
 * Waiters are keyed by a monotonically increasing id, so iteration is in
 * arrival order. Waking is soft FIFO: every due waiter is woken in arrival
 * order, and the woken callers then race for the group's lock on re-check.
 */
class AdmissionQueue {
 public:
  explicit AdmissionQueue(RateLimitGroup group) : group_(group) {}

  AdmissionQueue(const AdmissionQueue&) = delete;
  AdmissionQueue& operator=(const AdmissionQueue&) = delete;

  RateLimitGroup GetGroup() const { return group_; }

  std::shared_ptr<Waiter> Enqueue(double now, double ready_at);

  // False if the waiter was already removed
  bool Remove(uint64_t waiter_id);

  // Move every due WAITING waiter to READY, returns how many were woken
  size_t WakeDue(double now);

  // Earliest readyAt among WAITING waiters
  std::optional<double> NextReadyAt() const;

  // Signal every queued waiter with `reason` (fail-open or shutdown); the
  // waiters stay queued until their callers clean up
  size_t ReleaseAll(WakeReason reason);

  size_t Size() const;

 private:
  const RateLimitGroup group_;

  mutable std::mutex mutex_;
  uint64_t next_id_{1};
  std::map<uint64_t, std::shared_ptr<Waiter>> waiters_;
};

}  // namespace pacer
