#include "rate_limiter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "limiter_errors.hpp"

namespace pacer {

namespace {

// Tracks concurrent waiters of one group for the lifetime of a suspension
class ConcurrentWaiterScope {
 public:
  ConcurrentWaiterScope(std::atomic<int>& current, std::atomic<int>& peak) : current_(current) {
    const int now_waiting = ++current_;
    int observed = peak.load();
    while (now_waiting > observed && !peak.compare_exchange_weak(observed, now_waiting)) {
    }
  }
  ~ConcurrentWaiterScope() { --current_; }

 private:
  std::atomic<int>& current_;
};

class TokenSubscription {
 public:
  TokenSubscription(engine::common::CancellationToken* token, std::function<void()> on_cancel) : token_(token) {
    if (token_) {
      id_ = token_->Subscribe(std::move(on_cancel));
    }
  }
  ~TokenSubscription() {
    if (token_ && id_ >= 0) {
      token_->Unsubscribe(id_);
    }
  }

 private:
  engine::common::CancellationToken* token_;
  int id_{-1};
};

template <typename Fn, typename... Args>
void InvokeCallback(const char* name, const Fn& fn, Args&&... args) {
  if (!fn) {
    return;
  }
  try {
    fn(std::forward<Args>(args)...);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("{} callback threw: {}", name, e.what());
  }
}

}  // namespace

std::string ToString(AcquireStatus status) {
  switch (status) {
    case AcquireStatus::GRANTED:
      return "GRANTED";
    case AcquireStatus::TIMEOUT:
      return "TIMEOUT";
    case AcquireStatus::CANCELLED:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

//==============================================================================
// Lifecycle
//==============================================================================

UnifiedRateLimiter::UnifiedRateLimiter(LimiterConfig config, const engine::common::Clock& clock)
    : config_(std::move(config)),
      clock_(clock),
      registry_(std::make_shared<GroupRegistry>(config_.groups)),
      throttle_(*registry_, config_.options.violation_retention) {
  for (RateLimitGroup group : AllRateLimitGroups()) {
    queues_[GroupIndex(group)] = std::make_unique<AdmissionQueue>(group);
  }

  timeout_guard_ = std::make_unique<TimeoutGuard>(timer_thread_, config_.options.waiter_timeout, clock_);
  supervisor_ = std::make_unique<HealthSupervisor>(
      [this](RateLimitGroup group) { return CreateNotifier(group); },
      [this](RateLimitGroup group) { return queues_[GroupIndex(group)]->ReleaseAll(WakeReason::FORCE_RELEASED); },
      config_.options.restart_cooldown, config_.options.max_consecutive_errors, clock_);
}

UnifiedRateLimiter::~UnifiedRateLimiter() {
  Stop();
}

void UnifiedRateLimiter::Start() {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    return;
  }

  timer_thread_.Start();
  maintenance_thread_.Start();
  supervisor_->StartAll();
  maintenance_thread_.SchedulePeriodic([this]() { CheckHealth(); }, config_.options.health_check_interval);
  maintenance_thread_.SchedulePeriodic([this]() { CheckRecovery(); }, config_.options.recovery_check_interval);

  stopped_ = false;
  running_ = true;
  SPDLOG_INFO("UnifiedRateLimiter started ({} groups, waiter timeout {}ms)", kRateLimitGroupCount,
              config_.options.waiter_timeout.count());
}

void UnifiedRateLimiter::Stop() {
  {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
    stopped_ = true;
    if (!running_.exchange(false)) {
      return;
    }
  }

  // Nothing can enqueue past this point
  for (auto& queue : queues_) {
    queue->ReleaseAll(WakeReason::SHUTDOWN);
  }
  maintenance_thread_.Stop();
  supervisor_->StopAll();
  timer_thread_.Stop();
  SPDLOG_INFO("UnifiedRateLimiter stopped");
}

void UnifiedRateLimiter::SetEndpointResolver(std::shared_ptr<const EndpointResolver> resolver) {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
  resolver_ = std::move(resolver);
}

void UnifiedRateLimiter::SetCallbacks(LimiterCallbacks callbacks) {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
  callbacks_ = std::move(callbacks);
}

void UnifiedRateLimiter::SetNotifierTickHook(std::function<void(RateLimitGroup)> hook) {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
  if (running_.load()) {
    throw std::logic_error("notifier tick hook must be set before Start");
  }
  tick_hook_ = std::move(hook);
}

//==============================================================================
// Admission
//==============================================================================

AcquireResult UnifiedRateLimiter::Acquire(RateLimitGroup group, const std::string& endpoint_tag,
                                          engine::common::CancellationToken* token) {
  const size_t index = GroupIndex(group);
  if (!running_.load() && !stopped_.load()) {
    Start();
  }

  GroupCounters& counters = counters_[index];
  ++counters.total_requests;
  const double started_at = clock_.Now();

  if (token && token->IsCancelled()) {
    return AcquireResult{};
  }

  std::shared_lock<std::shared_mutex> lifecycle(lifecycle_mutex_);
  if (!running_.load()) {
    SPDLOG_DEBUG("Acquire {} ({}) after stop", ToString(group), endpoint_tag);
    return AcquireResult{};
  }

  const double preventive = throttle_.PreventiveDelay(group, started_at);
  AdmissionDecision decision = registry_->ReadAndMaybeAdmit(group, started_at, preventive);
  if (decision.granted) {
    return MakeGrant(group, started_at, false);
  }

  ++counters.total_waits;
  SPDLOG_DEBUG("Acquire {} ({}) must wait {:.4f}s (preventive={:.4f}s)", ToString(group), endpoint_tag,
               decision.wait, preventive);
  return WaitForAdmission(group, started_at, decision.wait, token, std::move(lifecycle));
}

AcquireResult UnifiedRateLimiter::WaitForAdmission(RateLimitGroup group, double started_at, double wait,
                                                   engine::common::CancellationToken* token,
                                                   std::shared_lock<std::shared_mutex> lifecycle) {
  GroupCounters& counters = counters_[GroupIndex(group)];
  AdmissionQueue& queue = *queues_[GroupIndex(group)];

  // Queued under the shared lifecycle lock: Stop either releases this waiter
  // or it was never queued
  std::shared_ptr<Waiter> waiter = queue.Enqueue(started_at, started_at + wait);
  TimeoutGuard::Scope scope(*timeout_guard_, queue, waiter);
  ConcurrentWaiterScope concurrency(counters.concurrent_waiters, counters.max_concurrent_waiters);

  if (!timeout_guard_->Arm(waiter)) {
    waiter->Signal(WakeReason::SHUTDOWN);
  }
  TokenSubscription subscription(token, [waiter]() { waiter->Signal(WakeReason::CANCELLED); });
  supervisor_->Wake(group);
  lifecycle.unlock();

  AcquireResult result;
  while (true) {
    WakeReason reason = waiter->Wait();

    if (reason == WakeReason::READY) {
      // State may have moved since the wait was computed
      const double now = clock_.Now();
      AdmissionDecision recheck = registry_->ReadAndMaybeAdmit(group, now);
      if (recheck.granted) {
        waiter->Complete();
        scope.SetOutcome(WaitOutcome::GRANTED);
        return MakeGrant(group, started_at, false);
      }
      if (waiter->Rearm(now + recheck.wait)) {
        supervisor_->Wake(group);
        continue;
      }
      reason = waiter->GetWakeReason();
    }

    switch (reason) {
      case WakeReason::FORCE_RELEASED:
        registry_->ForceAdmit(group, clock_.Now());
        waiter->Complete();
        scope.SetOutcome(WaitOutcome::FORCE_RELEASED);
        SPDLOG_WARN("Acquire {} granted fail-open after notifier failure", ToString(group));
        return MakeGrant(group, started_at, true);
      case WakeReason::TIMEOUT:
        scope.SetOutcome(WaitOutcome::TIMEOUT);
        result.status = AcquireStatus::TIMEOUT;
        SPDLOG_WARN("Acquire {} timed out after {}ms", ToString(group), config_.options.waiter_timeout.count());
        break;
      case WakeReason::SHUTDOWN:
        scope.SetOutcome(WaitOutcome::SHUTDOWN);
        result.status = AcquireStatus::CANCELLED;
        break;
      default:
        scope.SetOutcome(WaitOutcome::CANCELLED);
        result.status = AcquireStatus::CANCELLED;
        break;
    }
    result.waited = clock_.Now() - started_at;
    return result;
  }
}

AcquireResult UnifiedRateLimiter::MakeGrant(RateLimitGroup group, double started_at, bool fail_open) {
  AcquireResult result;
  result.status = AcquireStatus::GRANTED;
  result.permit = Permit(registry_, group, clock_);
  result.waited = std::max(0.0, clock_.Now() - started_at);
  result.fail_open = fail_open;
  return result;
}

AcquireResult UnifiedRateLimiter::AcquireEndpoint(const std::string& path, const std::string& method,
                                                  engine::common::CancellationToken* token) {
  RateLimitGroup group = ResolveEndpoint(path, method);
  return Acquire(group, method + " " + path, token);
}

RateLimitGroup UnifiedRateLimiter::ResolveEndpoint(const std::string& path, const std::string& method) const {
  std::shared_ptr<const EndpointResolver> resolver;
  {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
    resolver = resolver_;
  }
  if (!resolver) {
    throw ConfigurationError("no endpoint resolver configured for " + method + " " + path);
  }
  return resolver->Resolve(path, method);
}

//==============================================================================
// Provider feedback
//==============================================================================

void UnifiedRateLimiter::Notify429(RateLimitGroup group, const std::string& endpoint_tag, double retry_after) {
  const double now = clock_.Now();
  SPDLOG_ERROR("429 received for {} ({}), retry_after={:.3f}s", ToString(group), endpoint_tag, retry_after);

  RatioChange change = throttle_.OnViolation(group, now, retry_after);

  InvokeCallback("on_429", callbacks_.on_429, group, endpoint_tag, retry_after);
  if (change.changed) {
    InvokeCallback("on_rate_reduced", callbacks_.on_rate_reduced, group, change.old_ratio, change.new_ratio);
  }
}

void UnifiedRateLimiter::Notify429Endpoint(const std::string& path, const std::string& method,
                                           double retry_after) {
  Notify429(ResolveEndpoint(path, method), method + " " + path, retry_after);
}

//==============================================================================
// Background passes
//==============================================================================

void UnifiedRateLimiter::CheckRecovery() {
  const double now = clock_.Now();
  for (RateLimitGroup group : AllRateLimitGroups()) {
    RatioChange change = throttle_.TryRecover(group, now);
    if (change.changed) {
      InvokeCallback("on_rate_recovered", callbacks_.on_rate_recovered, group, change.old_ratio,
                     change.new_ratio);
    }
  }
}

void UnifiedRateLimiter::CheckHealth() {
  supervisor_->CheckAndHeal();
}

std::chrono::microseconds UnifiedRateLimiter::NotifierTick(RateLimitGroup group) {
  if (tick_hook_) {
    tick_hook_(group);
  }
  AdmissionQueue& queue = *queues_[GroupIndex(group)];
  const double now = clock_.Now();
  const size_t woken = queue.WakeDue(now);
  if (woken > 0) {
    SPDLOG_TRACE("{} notifier woke {} waiters", ToString(group), woken);
  }

  double sleep = std::chrono::duration<double>(config_.options.notifier_tick).count();
  if (auto next = queue.NextReadyAt()) {
    sleep = std::min(sleep, std::max(0.0, *next - clock_.Now()));
  }
  return engine::common::ToMicros(sleep);
}

std::unique_ptr<NotifierTask> UnifiedRateLimiter::CreateNotifier(RateLimitGroup group) {
  NotifierOptions options;
  options.backoff_base = config_.options.backoff_base;
  options.backoff_cap = config_.options.backoff_cap;
  options.backoff_jitter = config_.options.backoff_jitter;
  options.max_consecutive_errors = config_.options.max_consecutive_errors;
  return std::make_unique<NotifierTask>("notifier_" + ToString(group),
                                        [this, group]() { return NotifierTick(group); }, options);
}

//==============================================================================
// Diagnostics
//==============================================================================

const GroupConfig& UnifiedRateLimiter::GetGroupConfig(RateLimitGroup group) const {
  return registry_->GetConfig(group);
}

GroupStatus UnifiedRateLimiter::GetGroupStatus(RateLimitGroup group) const {
  const size_t index = GroupIndex(group);
  const GroupConfig& config = registry_->GetConfig(group);
  const GroupState state = registry_->Snapshot(group);
  const GroupCounters& counters = counters_[index];

  GroupStatus status;
  status.group = group;
  status.base_rps = config.base_rps;
  status.current_ratio = state.current_ratio;
  status.effective_rps = config.base_rps * config.safety_factor * state.current_ratio;
  status.burst_capacity = config.burst_capacity;
  status.dual_limit = config.IsDualLimit();
  status.requests_per_minute = config.requests_per_minute;
  status.rpm_burst_capacity = config.rpm_burst_capacity;

  status.tat_primary = state.primary.tat;
  status.tat_secondary = state.secondary.tat;
  status.burst_window_occupancy = state.primary.window.size();
  status.secondary_window_occupancy = state.secondary.window.size();
  status.in_flight = state.primary.in_flight;
  status.held_until = state.held_until;

  status.violation_count = state.violation_count;
  status.recent_violations = state.violation_history.size();

  status.queue_depth = queues_[index]->Size();
  status.active_timeouts = timeout_guard_->ActiveTimeouts(group);
  status.total_requests = counters.total_requests.load();
  status.total_waits = counters.total_waits.load();
  status.concurrent_waiters = counters.concurrent_waiters.load();
  status.max_concurrent_waiters = counters.max_concurrent_waiters.load();
  status.wait_stats = timeout_guard_->GetStats(group);
  status.notifier = supervisor_->GetHealth(group);
  return status;
}

std::vector<GroupStatus> UnifiedRateLimiter::GetStatus() const {
  std::vector<GroupStatus> statuses;
  statuses.reserve(kRateLimitGroupCount);
  for (RateLimitGroup group : AllRateLimitGroups()) {
    statuses.push_back(GetGroupStatus(group));
  }
  return statuses;
}

}  // namespace pacer
