#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "admission_core.hpp"
#include "group_config.hpp"
#include "rate_limit_group.hpp"

namespace pacer {

// Mutable per-group state, only touched under the group's lock
struct GroupState {
  LegState primary;
  LegState secondary;  ///< used only by dual-limit groups

  double current_ratio = 1.0;  ///< always within [min_ratio, 1.0]

  std::deque<double> violation_history;  ///< oldest first, pruned past retention
  uint64_t violation_count = 0;          ///< lifetime total
  double held_until = 0.0;               ///< provider Retry-After hold

  bool has_reduction = false;
  double last_reduction_at = 0.0;
  bool has_recovery = false;
  double last_recovery_at = 0.0;
};

struct AdmissionDecision {
  bool granted = false;
  double wait = 0.0;  ///< 0 when granted
  LegDecision primary;
  LegDecision secondary;
  double hold_wait = 0.0;
};

/**
 * @brief Config and state for every group, one lock per group
 *
 * Contention on one group never blocks another. ReadAndMaybeAdmit runs the
 * whole decide-and-reserve sequence under the group's lock.
 */
class GroupRegistry {
 public:
  // Groups missing from `configs` use DefaultGroupConfig; every config is validated
  explicit GroupRegistry(const std::map<RateLimitGroup, GroupConfig>& configs);

  GroupRegistry(const GroupRegistry&) = delete;
  GroupRegistry& operator=(const GroupRegistry&) = delete;

  const GroupConfig& GetConfig(RateLimitGroup group) const;

  // Decide and, on grant, advance TAT(s) and reserve burst slot(s).
  // A positive provisional_gap_hint is a wait floor already known to apply.
  AdmissionDecision ReadAndMaybeAdmit(RateLimitGroup group, double now,
                                      double provisional_gap_hint = 0.0);

  // Fail-open grant: reserve as a grant would, regardless of the decision
  void ForceAdmit(RateLimitGroup group, double now);

  // Reserved slot(s) become committed timestamps
  void Commit(RateLimitGroup group, double completed_at);

  // Reserved slot(s) returned unused
  void Release(RateLimitGroup group);

  // Run `fn` under the group's lock
  void Mutate(RateLimitGroup group, const std::function<void(GroupState&, const GroupConfig&)>& fn);

  GroupState Snapshot(RateLimitGroup group) const;

 private:
  struct Slot {
    GroupConfig config;
    GroupState state;
    mutable std::mutex mutex;
  };

  Slot& GetSlot(RateLimitGroup group) const;

  std::array<std::unique_ptr<Slot>, kRateLimitGroupCount> slots_;
};

}  // namespace pacer
