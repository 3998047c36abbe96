#include "limiter_status.hpp"

namespace pacer {

void to_json(nlohmann::json& j, const WaitStats& stats) {
  j = nlohmann::json{
      {"completed_waits", stats.completed_waits},
      {"grants", stats.grants},
      {"timeouts", stats.timeouts},
      {"cancellations", stats.cancellations},
      {"fail_open_releases", stats.fail_open_releases},
      {"shutdowns", stats.shutdowns},
      {"total_wait_s", stats.total_wait},
      {"ema_wait_s", stats.ema_wait},
      {"max_wait_s", stats.max_wait},
  };
}

void to_json(nlohmann::json& j, const NotifierHealthInfo& info) {
  j = nlohmann::json{
      {"status", ToString(info.status)},
      {"consecutive_errors", info.consecutive_errors},
      {"restart_count", info.restart_count},
  };
  j["last_restart_at"] = info.has_restart ? nlohmann::json(info.last_restart_at) : nlohmann::json();
}

void to_json(nlohmann::json& j, const GroupStatus& status) {
  j = nlohmann::json{
      {"base_rps", status.base_rps},
      {"effective_rps", status.effective_rps},
      {"burst_capacity", status.burst_capacity},
      {"current_ratio", status.current_ratio},
      {"tat_primary", status.tat_primary},
      {"burst_window_occupancy", status.burst_window_occupancy},
      {"in_flight", status.in_flight},
      {"held_until", status.held_until},
      {"violation_count", status.violation_count},
      {"recent_violations", status.recent_violations},
      {"queue_depth", status.queue_depth},
      {"active_timeouts", status.active_timeouts},
      {"total_requests", status.total_requests},
      {"total_waits", status.total_waits},
      {"concurrent_waiters", status.concurrent_waiters},
      {"max_concurrent_waiters", status.max_concurrent_waiters},
      {"wait_stats", status.wait_stats},
      {"notifier", status.notifier},
  };
  j["dual_limit"] = status.dual_limit;
  if (status.dual_limit) {
    j["rpm"] = status.requests_per_minute;
    j["rpm_burst_capacity"] = status.rpm_burst_capacity;
    j["tat_secondary"] = status.tat_secondary;
    j["secondary_window_occupancy"] = status.secondary_window_occupancy;
  }
}

nlohmann::json StatusToJson(const std::vector<GroupStatus>& statuses) {
  nlohmann::json result = nlohmann::json::object();
  for (const auto& status : statuses) {
    result[ToString(status.group)] = status;
  }
  return result;
}

}  // namespace pacer
