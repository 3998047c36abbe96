#include "group_config.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "limiter_errors.hpp"

namespace pacer {

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw ConfigurationError("invalid group config: " + message);
  }
}

template <typename T>
void ReadIfPresent(const nlohmann::json& j, const char* key, T& target) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    target = it->template get<T>();
  }
}

std::chrono::milliseconds ReadMillis(const engine::common::ConfigManager& config,
                                     const std::string& key, std::chrono::milliseconds fallback) {
  int value = config.GetInt(key, static_cast<int>(fallback.count()));
  if (value <= 0) {
    throw ConfigurationError(key + " must be positive, got " + std::to_string(value));
  }
  return std::chrono::milliseconds(value);
}

}  // namespace

void GroupConfig::Validate() const {
  Require(base_rps > 0.0, "rps must be > 0");
  Require(burst_capacity >= 1, "burst_capacity must be >= 1");
  Require(safety_factor > 0.0 && safety_factor <= 1.0, "safety_factor must be in (0, 1]");
  Require(requests_per_minute >= 0.0, "rpm must be >= 0");
  if (IsDualLimit()) {
    Require(rpm_burst_capacity >= 1, "rpm_burst_capacity must be >= 1 when rpm is set");
  }
  Require(error_threshold >= 1, "error_threshold must be >= 1");
  Require(error_window > 0.0, "error_window_s must be > 0");
  Require(reduction_ratio > 0.0 && reduction_ratio <= 1.0, "reduction_ratio must be in (0, 1]");
  Require(min_ratio > 0.0 && min_ratio <= 1.0, "min_ratio must be in (0, 1]");
  Require(recovery_delay >= 0.0, "recovery_delay_s must be >= 0");
  Require(recovery_step > 0.0, "recovery_step must be > 0");
  Require(preventive_window > 0.0, "preventive_window_s must be > 0");
  Require(max_preventive_delay >= 0.0, "max_preventive_delay_s must be >= 0");
  Require(preventive_delay_per_violation >= 0.0, "preventive_delay_per_violation_s must be >= 0");
}

void to_json(nlohmann::json& j, const GroupConfig& config) {
  j = nlohmann::json{
      {"rps", config.base_rps},
      {"burst_capacity", config.burst_capacity},
      {"safety_factor", config.safety_factor},
      {"rpm", config.requests_per_minute},
      {"rpm_burst_capacity", config.rpm_burst_capacity},
      {"enable_dynamic_adjustment", config.enable_dynamic_adjustment},
      {"error_threshold", config.error_threshold},
      {"error_window_s", config.error_window},
      {"reduction_ratio", config.reduction_ratio},
      {"min_ratio", config.min_ratio},
      {"recovery_delay_s", config.recovery_delay},
      {"recovery_step", config.recovery_step},
      {"enable_preventive_throttling", config.enable_preventive_throttling},
      {"preventive_window_s", config.preventive_window},
      {"max_preventive_delay_s", config.max_preventive_delay},
      {"preventive_delay_per_violation_s", config.preventive_delay_per_violation},
  };
}

void from_json(const nlohmann::json& j, GroupConfig& config) {
  config = MergeGroupConfig(j, GroupConfig{});
}

GroupConfig MergeGroupConfig(const nlohmann::json& j, GroupConfig base) {
  if (!j.is_object()) {
    throw ConfigurationError("group config must be a JSON object");
  }
  ReadIfPresent(j, "rps", base.base_rps);
  ReadIfPresent(j, "burst_capacity", base.burst_capacity);
  ReadIfPresent(j, "safety_factor", base.safety_factor);
  ReadIfPresent(j, "rpm", base.requests_per_minute);
  ReadIfPresent(j, "rpm_burst_capacity", base.rpm_burst_capacity);
  ReadIfPresent(j, "enable_dynamic_adjustment", base.enable_dynamic_adjustment);
  ReadIfPresent(j, "error_threshold", base.error_threshold);
  ReadIfPresent(j, "error_window_s", base.error_window);
  ReadIfPresent(j, "reduction_ratio", base.reduction_ratio);
  ReadIfPresent(j, "min_ratio", base.min_ratio);
  ReadIfPresent(j, "recovery_delay_s", base.recovery_delay);
  ReadIfPresent(j, "recovery_step", base.recovery_step);
  ReadIfPresent(j, "enable_preventive_throttling", base.enable_preventive_throttling);
  ReadIfPresent(j, "preventive_window_s", base.preventive_window);
  ReadIfPresent(j, "max_preventive_delay_s", base.max_preventive_delay);
  ReadIfPresent(j, "preventive_delay_per_violation_s", base.preventive_delay_per_violation);
  return base;
}

GroupConfig DefaultGroupConfig(RateLimitGroup group) {
  GroupConfig config;
  switch (group) {
    case RateLimitGroup::REST_PUBLIC:
      config.base_rps = 10.0;
      config.burst_capacity = 10;
      break;
    case RateLimitGroup::REST_PRIVATE_DEFAULT:
      config.base_rps = 30.0;
      config.burst_capacity = 30;
      break;
    case RateLimitGroup::REST_PRIVATE_ORDER:
      config.base_rps = 8.0;
      config.burst_capacity = 8;
      break;
    case RateLimitGroup::REST_PRIVATE_CANCEL_ALL:
      // One request every two seconds
      config.base_rps = 0.5;
      config.burst_capacity = 1;
      break;
    case RateLimitGroup::WEBSOCKET:
      config.base_rps = 5.0;
      config.burst_capacity = 5;
      config.requests_per_minute = 100.0;
      config.rpm_burst_capacity = 20;
      config.enable_dynamic_adjustment = false;
      break;
  }
  return config;
}

LimiterConfig DefaultLimiterConfig() {
  LimiterConfig result;
  for (RateLimitGroup group : AllRateLimitGroups()) {
    result.groups[group] = DefaultGroupConfig(group);
  }
  return result;
}

LimiterConfig LoadLimiterConfig(const engine::common::ConfigManager& config) {
  LimiterConfig result = DefaultLimiterConfig();

  nlohmann::json groups_node = config.GetNodeValue("limiter.groups");
  if (!groups_node.is_null()) {
    if (!groups_node.is_object()) {
      throw ConfigurationError("limiter.groups must be an object keyed by group name");
    }
    for (auto it = groups_node.begin(); it != groups_node.end(); ++it) {
      RateLimitGroup group = RateLimitGroupFromString(it.key());
      try {
        result.groups[group] = MergeGroupConfig(it.value(), result.groups[group]);
      } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("limiter.groups." + it.key() + ": " + e.what());
      }
    }
  }

  for (const auto& [group, group_config] : result.groups) {
    try {
      group_config.Validate();
    } catch (const ConfigurationError& e) {
      throw ConfigurationError(ToString(group) + ": " + e.what());
    }
  }

  LimiterOptions& options = result.options;
  options.waiter_timeout = ReadMillis(config, "limiter.waiter_timeout_ms", options.waiter_timeout);
  options.notifier_tick = ReadMillis(config, "limiter.notifier_tick_ms", options.notifier_tick);
  options.health_check_interval =
      ReadMillis(config, "limiter.health_check_interval_ms", options.health_check_interval);
  options.restart_cooldown = ReadMillis(config, "limiter.restart_cooldown_ms", options.restart_cooldown);
  options.backoff_base = ReadMillis(config, "limiter.backoff_base_ms", options.backoff_base);
  options.backoff_cap = ReadMillis(config, "limiter.backoff_cap_ms", options.backoff_cap);
  options.backoff_jitter = ReadMillis(config, "limiter.backoff_jitter_ms", options.backoff_jitter);
  options.recovery_check_interval =
      ReadMillis(config, "limiter.recovery_check_interval_ms", options.recovery_check_interval);
  options.max_consecutive_errors =
      config.GetInt("limiter.max_consecutive_errors", options.max_consecutive_errors);
  options.violation_retention = config.GetDouble("limiter.violation_retention_s", options.violation_retention);
  if (options.max_consecutive_errors < 1) {
    throw ConfigurationError("limiter.max_consecutive_errors must be >= 1");
  }
  if (options.violation_retention <= 0.0) {
    throw ConfigurationError("limiter.violation_retention_s must be > 0");
  }

  for (const auto& [group, group_config] : result.groups) {
    SPDLOG_DEBUG("Group {}: rps={} burst={} rpm={} rpm_burst={} dynamic={}", ToString(group),
                 group_config.base_rps, group_config.burst_capacity, group_config.requests_per_minute,
                 group_config.rpm_burst_capacity, group_config.enable_dynamic_adjustment);
  }
  return result;
}

}  // namespace pacer
