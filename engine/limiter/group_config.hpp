#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>

#include "engine/common/config_manager.hpp"
#include "rate_limit_group.hpp"

namespace pacer {

/**
 * @brief Immutable limits and throttle policy for one rate-limit group
 *
 * Times are in seconds. A group becomes dual-limited when
 * requests_per_minute > 0; the per-minute leg then runs beside the
 * per-second leg and both must admit a request.
 */
struct GroupConfig {
  // Continuous rate and burst
  double base_rps = 10.0;
  int burst_capacity = 10;
  double safety_factor = 1.0;  // multiplies every rate, 1.0 = provider limit

  // Optional per-minute leg
  double requests_per_minute = 0.0;
  int rpm_burst_capacity = 0;

  // Adaptive throttle
  bool enable_dynamic_adjustment = true;
  int error_threshold = 1;
  double error_window = 60.0;
  double reduction_ratio = 0.8;
  double min_ratio = 0.5;
  double recovery_delay = 300.0;
  double recovery_step = 0.05;

  // Preventive throttle
  bool enable_preventive_throttling = true;
  double preventive_window = 30.0;
  double max_preventive_delay = 0.5;
  double preventive_delay_per_violation = 0.1;

  bool IsDualLimit() const { return requests_per_minute > 0.0; }

  // Throws ConfigurationError describing the first invalid field
  void Validate() const;

  bool operator==(const GroupConfig& other) const = default;
};

// JSON keys: rps, burst_capacity, safety_factor, rpm, rpm_burst_capacity,
// enable_dynamic_adjustment, error_threshold, error_window_s, reduction_ratio,
// min_ratio, recovery_delay_s, recovery_step, enable_preventive_throttling,
// preventive_window_s, max_preventive_delay_s, preventive_delay_per_violation_s
void to_json(nlohmann::json& j, const GroupConfig& config);
void from_json(const nlohmann::json& j, GroupConfig& config);

// Overlay the keys present in `j` on top of `base`
GroupConfig MergeGroupConfig(const nlohmann::json& j, GroupConfig base);

// Built-in provider limits for each group
GroupConfig DefaultGroupConfig(RateLimitGroup group);

// Process-wide settings for the background machinery
struct LimiterOptions {
  std::chrono::milliseconds waiter_timeout{30000};
  std::chrono::milliseconds notifier_tick{100};
  std::chrono::milliseconds health_check_interval{5000};
  std::chrono::milliseconds restart_cooldown{30000};
  int max_consecutive_errors = 10;
  std::chrono::milliseconds backoff_base{100};
  std::chrono::milliseconds backoff_cap{30000};
  std::chrono::milliseconds backoff_jitter{100};
  std::chrono::milliseconds recovery_check_interval{30000};
  double violation_retention = 3600.0;
};

struct LimiterConfig {
  std::map<RateLimitGroup, GroupConfig> groups;
  LimiterOptions options;
};

// Defaults for every group, overridden by limiter.groups.<name> and limiter.*
// options. Throws ConfigurationError on unknown group names or invalid values.
LimiterConfig LoadLimiterConfig(const engine::common::ConfigManager& config);

// All groups at their built-in defaults
LimiterConfig DefaultLimiterConfig();

}  // namespace pacer
