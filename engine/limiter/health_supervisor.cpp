#include "health_supervisor.hpp"

#include <spdlog/spdlog.h>

namespace pacer {

std::string ToString(NotifierHealth health) {
  switch (health) {
    case NotifierHealth::HEALTHY:
      return "HEALTHY";
    case NotifierHealth::DEGRADED:
      return "DEGRADED";
    case NotifierHealth::FAILED:
      return "FAILED";
    case NotifierHealth::RESTARTING:
      return "RESTARTING";
  }
  return "UNKNOWN";
}

HealthSupervisor::HealthSupervisor(NotifierFactory factory, ReleaseFn release_waiters,
                                   std::chrono::milliseconds restart_cooldown, int max_consecutive_errors,
                                   const engine::common::Clock& clock)
    : factory_(std::move(factory)),
      release_waiters_(std::move(release_waiters)),
      restart_cooldown_(restart_cooldown),
      max_consecutive_errors_(max_consecutive_errors),
      clock_(clock) {
}

HealthSupervisor::~HealthSupervisor() {
  StopAll();
}

NotifierHealth HealthSupervisor::Assess(bool alive, int consecutive_errors, int max_consecutive_errors) {
  if (!alive) {
    return NotifierHealth::FAILED;
  }
  if (consecutive_errors > 0 && consecutive_errors >= max_consecutive_errors / 2) {
    return NotifierHealth::DEGRADED;
  }
  return NotifierHealth::HEALTHY;
}

void HealthSupervisor::StartAll() {
  for (RateLimitGroup group : AllRateLimitGroups()) {
    Slot& slot = slots_[GroupIndex(group)];
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.notifier) {
      continue;
    }
    slot.notifier = factory_(group);
    slot.notifier->Start();
    slot.info.status = NotifierHealth::HEALTHY;
    slot.info.consecutive_errors = 0;
    SPDLOG_INFO("Notifier started for {}", ToString(group));
  }
}

void HealthSupervisor::StopAll() {
  for (Slot& slot : slots_) {
    std::unique_ptr<NotifierTask> notifier;
    {
      std::lock_guard<std::mutex> lock(slot.mutex);
      notifier = std::move(slot.notifier);
    }
    if (notifier) {
      notifier->Stop();
    }
  }
}

void HealthSupervisor::CheckAndHeal() {
  const double now = clock_.Now();
  for (RateLimitGroup group : AllRateLimitGroups()) {
    try {
      CheckGroup(group, now);
    } catch (const std::exception& e) {
      SPDLOG_ERROR("Health check failed for {}: {}", ToString(group), e.what());
    }
  }
}

void HealthSupervisor::CheckGroup(RateLimitGroup group, double now) {
  Slot& slot = slots_[GroupIndex(group)];
  std::unique_ptr<NotifierTask> retired;
  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (!slot.notifier) {
      return;  // not started or already stopped
    }

    slot.info.consecutive_errors = slot.notifier->GetConsecutiveErrors();
    slot.info.status = Assess(slot.notifier->IsAlive(), slot.info.consecutive_errors, max_consecutive_errors_);
    if (slot.info.status == NotifierHealth::HEALTHY) {
      return;
    }

    const double cooldown = std::chrono::duration<double>(restart_cooldown_).count();
    if (slot.info.has_restart && now - slot.info.last_restart_at < cooldown) {
      SPDLOG_DEBUG("Notifier for {} is {}, restart deferred by cooldown", ToString(group),
                   ToString(slot.info.status));
      return;
    }

    SPDLOG_ERROR("Notifier for {} is {} (errors={}), restarting", ToString(group), ToString(slot.info.status),
                 slot.info.consecutive_errors);
    slot.info.status = NotifierHealth::RESTARTING;

    std::unique_ptr<NotifierTask> replacement = factory_(group);
    retired = std::move(slot.notifier);
    slot.notifier = std::move(replacement);

    const size_t released = release_waiters_(group);
    if (released > 0) {
      SPDLOG_WARN("Fail-open: force-released {} waiters of {}", released, ToString(group));
    }

    slot.notifier->Start();
    slot.info.has_restart = true;
    slot.info.last_restart_at = now;
    ++slot.info.restart_count;
    slot.info.consecutive_errors = 0;
    slot.info.status = NotifierHealth::HEALTHY;
  }

  // Joining waits for an in-progress tick; keep it off the slot lock
  retired->Stop();
  SPDLOG_INFO("Notifier for {} restarted", ToString(group));
}

void HealthSupervisor::Wake(RateLimitGroup group) {
  Slot& slot = slots_[GroupIndex(group)];
  std::lock_guard<std::mutex> lock(slot.mutex);
  if (slot.notifier) {
    slot.notifier->Wake();
  }
}

NotifierHealthInfo HealthSupervisor::GetHealth(RateLimitGroup group) const {
  const Slot& slot = slots_[GroupIndex(group)];
  std::lock_guard<std::mutex> lock(slot.mutex);
  NotifierHealthInfo info = slot.info;
  if (slot.notifier && info.status != NotifierHealth::RESTARTING) {
    info.consecutive_errors = slot.notifier->GetConsecutiveErrors();
    info.status = Assess(slot.notifier->IsAlive(), info.consecutive_errors, max_consecutive_errors_);
  }
  return info;
}

}  // namespace pacer
