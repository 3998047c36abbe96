#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <vector>

#include "health_supervisor.hpp"
#include "rate_limit_group.hpp"
#include "timeout_guard.hpp"

namespace pacer {

// Read-only diagnostic snapshot of one group
struct GroupStatus {
  RateLimitGroup group = RateLimitGroup::REST_PUBLIC;

  // Limits
  double base_rps = 0.0;
  double effective_rps = 0.0;  ///< base_rps * safety_factor * current_ratio
  int burst_capacity = 0;
  bool dual_limit = false;
  double requests_per_minute = 0.0;
  int rpm_burst_capacity = 0;
  double current_ratio = 1.0;

  // Admission state
  double tat_primary = 0.0;
  double tat_secondary = 0.0;
  size_t burst_window_occupancy = 0;
  size_t secondary_window_occupancy = 0;
  int in_flight = 0;
  double held_until = 0.0;

  // Violations
  uint64_t violation_count = 0;
  size_t recent_violations = 0;  ///< inside the retention horizon

  // Queue
  size_t queue_depth = 0;
  size_t active_timeouts = 0;
  uint64_t total_requests = 0;
  uint64_t total_waits = 0;
  int concurrent_waiters = 0;
  int max_concurrent_waiters = 0;
  WaitStats wait_stats;

  NotifierHealthInfo notifier;
};

void to_json(nlohmann::json& j, const WaitStats& stats);
void to_json(nlohmann::json& j, const NotifierHealthInfo& info);
void to_json(nlohmann::json& j, const GroupStatus& status);

// Object keyed by group name
nlohmann::json StatusToJson(const std::vector<GroupStatus>& statuses);

}  // namespace pacer
