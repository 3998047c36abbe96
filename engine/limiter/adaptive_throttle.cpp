#include "adaptive_throttle.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pacer {

RatioChange ApplyViolation(GroupState& state, const GroupConfig& config, double now, double retention) {
  RatioChange change;
  change.old_ratio = state.current_ratio;
  change.new_ratio = state.current_ratio;

  state.violation_history.push_back(now);
  ++state.violation_count;
  while (!state.violation_history.empty() && now - state.violation_history.front() > retention) {
    state.violation_history.pop_front();
  }

  if (!config.enable_dynamic_adjustment) {
    return change;
  }

  const auto recent = std::count_if(state.violation_history.begin(), state.violation_history.end(),
                                    [&](double ts) { return now - ts <= config.error_window; });
  if (recent < config.error_threshold) {
    return change;
  }

  const double reduced = std::max(config.min_ratio, state.current_ratio * config.reduction_ratio);
  state.has_reduction = true;
  state.last_reduction_at = now;
  if (reduced < state.current_ratio) {
    state.current_ratio = reduced;
    change.changed = true;
    change.new_ratio = reduced;
  }
  return change;
}

RatioChange ApplyRecovery(GroupState& state, const GroupConfig& config, double now) {
  RatioChange change;
  change.old_ratio = state.current_ratio;
  change.new_ratio = state.current_ratio;

  if (!config.enable_dynamic_adjustment || !state.has_reduction || state.current_ratio >= 1.0) {
    return change;
  }
  if (now - state.last_reduction_at < config.recovery_delay) {
    return change;
  }

  state.current_ratio = std::min(1.0, state.current_ratio + config.recovery_step);
  state.has_recovery = true;
  state.last_recovery_at = now;
  change.changed = true;
  change.new_ratio = state.current_ratio;
  return change;
}

double ComputePreventiveDelay(const GroupState& state, const GroupConfig& config, double now) {
  if (!config.enable_preventive_throttling || state.violation_history.empty()) {
    return 0.0;
  }

  const double since_latest = now - state.violation_history.back();
  if (since_latest < 0.0 || since_latest >= config.preventive_window) {
    return 0.0;
  }

  const auto recent = std::count_if(state.violation_history.begin(), state.violation_history.end(),
                                    [&](double ts) { return now - ts < config.preventive_window; });
  const double cap = std::min(config.max_preventive_delay,
                              static_cast<double>(recent) * config.preventive_delay_per_violation);
  return cap * (1.0 - since_latest / config.preventive_window);
}

RatioChange AdaptiveThrottle::OnViolation(RateLimitGroup group, double now, double retry_after) {
  RatioChange change;
  registry_.Mutate(group, [&](GroupState& state, const GroupConfig& config) {
    change = ApplyViolation(state, config, now, violation_retention_);
    if (retry_after > 0.0) {
      state.held_until = std::max(state.held_until, now + retry_after);
    }
  });

  if (change.changed) {
    SPDLOG_WARN("Rate reduced for {}: ratio {:.3f} -> {:.3f}", ToString(group), change.old_ratio,
                change.new_ratio);
  }
  return change;
}

RatioChange AdaptiveThrottle::TryRecover(RateLimitGroup group, double now) {
  RatioChange change;
  registry_.Mutate(group, [&](GroupState& state, const GroupConfig& config) {
    change = ApplyRecovery(state, config, now);
  });

  if (change.changed) {
    SPDLOG_INFO("Rate recovered for {}: ratio {:.3f} -> {:.3f}", ToString(group), change.old_ratio,
                change.new_ratio);
  }
  return change;
}

double AdaptiveThrottle::PreventiveDelay(RateLimitGroup group, double now) {
  double delay = 0.0;
  registry_.Mutate(group, [&](GroupState& state, const GroupConfig& config) {
    delay = ComputePreventiveDelay(state, config, now);
  });
  return delay;
}

}  // namespace pacer
