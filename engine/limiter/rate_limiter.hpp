#pragma once

#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "adaptive_throttle.hpp"
#include "admission_queue.hpp"
#include "endpoint_resolver.hpp"
#include "engine/common/cancellation_token.hpp"
#include "engine/common/clock.hpp"
#include "engine/common/event_thread.hpp"
#include "group_config.hpp"
#include "group_registry.hpp"
#include "health_supervisor.hpp"
#include "limiter_status.hpp"
#include "permit.hpp"
#include "timeout_guard.hpp"

namespace pacer {

enum class AcquireStatus { GRANTED, TIMEOUT, CANCELLED };

std::string ToString(AcquireStatus status);

struct AcquireResult {
  AcquireStatus status = AcquireStatus::CANCELLED;
  Permit permit;           ///< valid only when GRANTED
  double waited = 0.0;     ///< seconds spent inside Acquire
  bool fail_open = false;  ///< granted by a force release after a notifier failure

  bool IsGranted() const { return status == AcquireStatus::GRANTED; }
};

struct LimiterCallbacks {
  std::function<void(RateLimitGroup, const std::string& endpoint_tag, double retry_after)> on_429;
  std::function<void(RateLimitGroup, double old_ratio, double new_ratio)> on_rate_reduced;
  std::function<void(RateLimitGroup, double old_ratio, double new_ratio)> on_rate_recovered;
};

/**
 * @brief Client-side limiter for every provider rate-limit group
 *
 * Construct one per process and share it. Acquire returns at once when the
 * admission core grants; otherwise the caller is queued and suspended
 * until a notifier finds it due, re-checks, and either proceeds or is
 * re-armed. Every suspension is bounded by waiter_timeout and ends with
 * TIMEOUT rather than an exception.
 *
 * Background machinery (auto-started by the first Acquire): one notifier
 * thread per group, a maintenance thread running the health supervisor and
 * the recovery loop, and a timer thread for waiter timeouts.
 */
class UnifiedRateLimiter {
 public:
  explicit UnifiedRateLimiter(LimiterConfig config = DefaultLimiterConfig(),
                              const engine::common::Clock& clock = engine::common::SteadyClock::Instance());
  ~UnifiedRateLimiter();

  UnifiedRateLimiter(const UnifiedRateLimiter&) = delete;
  UnifiedRateLimiter& operator=(const UnifiedRateLimiter&) = delete;

  // Lifecycle
  void Start();
  // Pending waiters return CANCELLED; later Acquire calls too, until Start
  void Stop();
  bool IsRunning() const { return running_.load(); }

  void SetEndpointResolver(std::shared_ptr<const EndpointResolver> resolver);
  // Set before Start; callbacks run on the notifying or maintenance thread
  void SetCallbacks(LimiterCallbacks callbacks);

  // Runs at the top of every notifier tick. An exception it throws counts as
  // a notifier error, so fault injection drives the recovery and fail-open
  // paths. Set before Start.
  void SetNotifierTickHook(std::function<void(RateLimitGroup)> hook);

  // Admission
  AcquireResult Acquire(RateLimitGroup group, const std::string& endpoint_tag = "",
                        engine::common::CancellationToken* token = nullptr);

  // Throws ConfigurationError when the endpoint maps to no group
  AcquireResult AcquireEndpoint(const std::string& path, const std::string& method,
                                engine::common::CancellationToken* token = nullptr);

  // Provider feedback
  void Notify429(RateLimitGroup group, const std::string& endpoint_tag = "", double retry_after = 0.0);
  void Notify429Endpoint(const std::string& path, const std::string& method, double retry_after = 0.0);

  // Diagnostics
  std::vector<GroupStatus> GetStatus() const;
  GroupStatus GetGroupStatus(RateLimitGroup group) const;
  const GroupConfig& GetGroupConfig(RateLimitGroup group) const;
  const LimiterOptions& GetOptions() const { return config_.options; }

  // One pass of the periodic loops, also callable directly
  void CheckRecovery();
  void CheckHealth();

 private:
  struct GroupCounters {
    std::atomic<uint64_t> total_requests{0};
    std::atomic<uint64_t> total_waits{0};
    std::atomic<int> concurrent_waiters{0};
    std::atomic<int> max_concurrent_waiters{0};
  };

  AcquireResult MakeGrant(RateLimitGroup group, double started_at, bool fail_open);
  AcquireResult WaitForAdmission(RateLimitGroup group, double started_at, double wait,
                                 engine::common::CancellationToken* token,
                                 std::shared_lock<std::shared_mutex> lifecycle);
  std::chrono::microseconds NotifierTick(RateLimitGroup group);
  std::unique_ptr<NotifierTask> CreateNotifier(RateLimitGroup group);
  RateLimitGroup ResolveEndpoint(const std::string& path, const std::string& method) const;

  LimiterConfig config_;
  const engine::common::Clock& clock_;

  std::shared_ptr<GroupRegistry> registry_;
  AdaptiveThrottle throttle_;
  std::array<std::unique_ptr<AdmissionQueue>, kRateLimitGroupCount> queues_;
  std::array<GroupCounters, kRateLimitGroupCount> counters_;

  std::shared_ptr<const EndpointResolver> resolver_;
  LimiterCallbacks callbacks_;
  std::function<void(RateLimitGroup)> tick_hook_;

  // Shared by Acquire while it enqueues, exclusive for Start/Stop
  mutable std::shared_mutex lifecycle_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};

  std::unique_ptr<TimeoutGuard> timeout_guard_;
  std::unique_ptr<HealthSupervisor> supervisor_;

  // Destroyed first: their tasks reference everything above
  engine::common::EventThread maintenance_thread_{"limiter_maintenance"};
  engine::common::EventThread timer_thread_{"limiter_timer"};
};

}  // namespace pacer
