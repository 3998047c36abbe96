#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

#include "rate_limit_group.hpp"

namespace pacer {

enum class WaiterState { WAITING, READY, CANCELLED, COMPLETED };

// Why a waiter left WAITING
enum class WakeReason { NONE, READY, TIMEOUT, CANCELLED, FORCE_RELEASED, SHUTDOWN };

std::string ToString(WaiterState state);
std::string ToString(WakeReason reason);

/**
 * @brief A suspended caller awaiting admission
 *
 * WAITING -> READY when the notifier finds readyAt elapsed; READY -> WAITING
 * again when the re-check is still denied (Rearm). TIMEOUT, CANCELLED and
 * SHUTDOWN are terminal (CANCELLED state). FORCE_RELEASED moves to READY but
 * can never be re-armed. The caller ends it with Complete.
 */
class Waiter {
 public:
  Waiter(uint64_t id, RateLimitGroup group, double arrival_time, double ready_at)
      : id_(id), group_(group), arrival_time_(arrival_time), ready_at_(ready_at) {}

  Waiter(const Waiter&) = delete;
  Waiter& operator=(const Waiter&) = delete;

  uint64_t GetId() const { return id_; }
  RateLimitGroup GetGroup() const { return group_; }
  double GetArrivalTime() const { return arrival_time_; }

  double GetReadyAt() const;
  WaiterState GetState() const;
  WakeReason GetWakeReason() const;

  bool IsWaiting() const { return GetState() == WaiterState::WAITING; }

  // WAITING -> READY if readyAt <= now
  bool WakeIfDue(double now);

  // Leave WAITING or READY for the given reason; false if already decided.
  // READY reasons never override a pending force release or cancellation.
  bool Signal(WakeReason reason);

  // READY -> WAITING with a fresh readyAt; false if the waiter was cancelled
  // or force-released in the meantime
  bool Rearm(double ready_at);

  void Complete();

  // Block while WAITING; returns the reason it was woken
  WakeReason Wait();

 private:
  const uint64_t id_;
  const RateLimitGroup group_;
  const double arrival_time_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  double ready_at_;
  WaiterState state_{WaiterState::WAITING};
  WakeReason reason_{WakeReason::NONE};
};

}  // namespace pacer
