#pragma once

#include "group_registry.hpp"

namespace pacer {

// Ratio movement produced by a violation or a recovery step
struct RatioChange {
  bool changed = false;
  double old_ratio = 1.0;
  double new_ratio = 1.0;
};

// Pure policy pieces, applied under the group's lock by AdaptiveThrottle

// Record a violation at `now`; prunes history older than `retention` seconds
// and reduces the ratio once `error_threshold` violations fall inside
// `error_window`. The ratio stays within [min_ratio, 1.0].
RatioChange ApplyViolation(GroupState& state, const GroupConfig& config, double now, double retention);

// One recovery step if recovery_delay has elapsed since the last reduction
RatioChange ApplyRecovery(GroupState& state, const GroupConfig& config, double now);

// Extra delay after a recent violation, decaying linearly to zero across
// preventive_window since the most recent violation
double ComputePreventiveDelay(const GroupState& state, const GroupConfig& config, double now);

/**
 * @brief 429-driven feedback on a group's effective rate
 *
 * Reduction is immediate on violation; recovery is incremental and driven
 * by a periodic caller (the limiter's recovery loop).
 */
class AdaptiveThrottle {
 public:
  AdaptiveThrottle(GroupRegistry& registry, double violation_retention)
      : registry_(registry), violation_retention_(violation_retention) {}

  // Records the violation; a positive retry_after holds the group until now + retry_after
  RatioChange OnViolation(RateLimitGroup group, double now, double retry_after = 0.0);

  RatioChange TryRecover(RateLimitGroup group, double now);

  double PreventiveDelay(RateLimitGroup group, double now);

 private:
  GroupRegistry& registry_;
  double violation_retention_;
};

}  // namespace pacer
