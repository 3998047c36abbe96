#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "engine/common/clock.hpp"
#include "notifier_task.hpp"
#include "rate_limit_group.hpp"

namespace pacer {

enum class NotifierHealth { HEALTHY, DEGRADED, FAILED, RESTARTING };

std::string ToString(NotifierHealth health);

struct NotifierHealthInfo {
  NotifierHealth status = NotifierHealth::HEALTHY;
  int consecutive_errors = 0;
  bool has_restart = false;
  double last_restart_at = 0.0;
  uint64_t restart_count = 0;
};

/**
 * @brief Owns one notifier per group and replaces unhealthy ones
 *
 * CheckAndHeal is meant to run on a fixed interval. A notifier that has
 * terminated is FAILED; one with at least half the maximum consecutive
 * errors is DEGRADED. Either triggers a restart (at most one per cooldown
 * per group, the first is immediate): the old task is swapped out, every
 * queued waiter of the group is force-released, and a fresh notifier with
 * a zero error count is started.
 */
class HealthSupervisor {
 public:
  using NotifierFactory = std::function<std::unique_ptr<NotifierTask>(RateLimitGroup)>;
  // Force-wakes every queued waiter of the group, returns how many
  using ReleaseFn = std::function<size_t(RateLimitGroup)>;

  HealthSupervisor(NotifierFactory factory, ReleaseFn release_waiters,
                   std::chrono::milliseconds restart_cooldown, int max_consecutive_errors,
                   const engine::common::Clock& clock = engine::common::SteadyClock::Instance());
  ~HealthSupervisor();

  HealthSupervisor(const HealthSupervisor&) = delete;
  HealthSupervisor& operator=(const HealthSupervisor&) = delete;

  void StartAll();
  void StopAll();

  // One health pass over every group
  void CheckAndHeal();

  // Kick the group's notifier so it recomputes its sleep
  void Wake(RateLimitGroup group);

  NotifierHealthInfo GetHealth(RateLimitGroup group) const;

  static NotifierHealth Assess(bool alive, int consecutive_errors, int max_consecutive_errors);

 private:
  struct Slot {
    mutable std::mutex mutex;
    std::unique_ptr<NotifierTask> notifier;
    NotifierHealthInfo info;
  };

  void CheckGroup(RateLimitGroup group, double now);

  NotifierFactory factory_;
  ReleaseFn release_waiters_;
  std::chrono::milliseconds restart_cooldown_;
  int max_consecutive_errors_;
  const engine::common::Clock& clock_;

  std::array<Slot, kRateLimitGroupCount> slots_;
};

}  // namespace pacer
