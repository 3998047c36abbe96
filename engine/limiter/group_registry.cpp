#include "group_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pacer {

GroupRegistry::GroupRegistry(const std::map<RateLimitGroup, GroupConfig>& configs) {
  for (RateLimitGroup group : AllRateLimitGroups()) {
    auto slot = std::make_unique<Slot>();
    auto it = configs.find(group);
    slot->config = (it != configs.end()) ? it->second : DefaultGroupConfig(group);
    slot->config.Validate();
    slots_[GroupIndex(group)] = std::move(slot);
  }
}

GroupRegistry::Slot& GroupRegistry::GetSlot(RateLimitGroup group) const {
  return *slots_[GroupIndex(group)];
}

const GroupConfig& GroupRegistry::GetConfig(RateLimitGroup group) const {
  return GetSlot(group).config;
}

AdmissionDecision GroupRegistry::ReadAndMaybeAdmit(RateLimitGroup group, double now,
                                                   double provisional_gap_hint) {
  Slot& slot = GetSlot(group);
  std::lock_guard<std::mutex> lock(slot.mutex);
  GroupState& state = slot.state;
  const GroupConfig& config = slot.config;

  AdmissionDecision decision;

  const LegLimits primary_limits = PrimaryLimits(config, state.current_ratio);
  EvictExpired(state.primary.window, primary_limits.interval, now);
  decision.primary = EvaluateLeg(primary_limits, state.primary, now);
  decision.wait = decision.primary.wait;
  decision.granted = decision.primary.granted;

  if (config.IsDualLimit()) {
    const LegLimits secondary_limits = SecondaryLimits(config, state.current_ratio);
    EvictExpired(state.secondary.window, secondary_limits.interval, now);
    decision.secondary = EvaluateLeg(secondary_limits, state.secondary, now);
    decision.wait = std::max(decision.wait, decision.secondary.wait);
    decision.granted = decision.granted && decision.secondary.granted;
  }

  decision.hold_wait = std::max(0.0, state.held_until - now);
  if (decision.hold_wait > 0.0 || provisional_gap_hint > 0.0) {
    decision.granted = false;
    decision.wait = std::max({decision.wait, decision.hold_wait, provisional_gap_hint});
  }

  if (!decision.granted) {
    SPDLOG_TRACE("{} denied: wait={:.4f}s (steady={:.4f} window={:.4f})", ToString(group), decision.wait,
                 decision.primary.steady_wait, decision.primary.window_wait);
    return decision;
  }

  decision.wait = 0.0;
  ApplyGrant(state.primary, decision.primary.new_tat);
  if (config.IsDualLimit()) {
    ApplyGrant(state.secondary, decision.secondary.new_tat);
  }
  SPDLOG_TRACE("{} granted: tat={:.4f}", ToString(group), state.primary.tat);
  return decision;
}

void GroupRegistry::ForceAdmit(RateLimitGroup group, double now) {
  Slot& slot = GetSlot(group);
  std::lock_guard<std::mutex> lock(slot.mutex);
  GroupState& state = slot.state;

  const LegLimits primary_limits = PrimaryLimits(slot.config, state.current_ratio);
  ApplyGrant(state.primary, std::max(state.primary.tat, now) + primary_limits.EmissionInterval());
  if (slot.config.IsDualLimit()) {
    const LegLimits secondary_limits = SecondaryLimits(slot.config, state.current_ratio);
    ApplyGrant(state.secondary, std::max(state.secondary.tat, now) + secondary_limits.EmissionInterval());
  }
}

void GroupRegistry::Commit(RateLimitGroup group, double completed_at) {
  Slot& slot = GetSlot(group);
  std::lock_guard<std::mutex> lock(slot.mutex);
  GroupState& state = slot.state;

  CommitSlot(state.primary, PrimaryLimits(slot.config, state.current_ratio), completed_at);
  if (slot.config.IsDualLimit()) {
    CommitSlot(state.secondary, SecondaryLimits(slot.config, state.current_ratio), completed_at);
  }
}

void GroupRegistry::Release(RateLimitGroup group) {
  Slot& slot = GetSlot(group);
  std::lock_guard<std::mutex> lock(slot.mutex);
  ReleaseSlot(slot.state.primary);
  if (slot.config.IsDualLimit()) {
    ReleaseSlot(slot.state.secondary);
  }
}

void GroupRegistry::Mutate(RateLimitGroup group,
                           const std::function<void(GroupState&, const GroupConfig&)>& fn) {
  Slot& slot = GetSlot(group);
  std::lock_guard<std::mutex> lock(slot.mutex);
  fn(slot.state, slot.config);
}

GroupState GroupRegistry::Snapshot(RateLimitGroup group) const {
  Slot& slot = GetSlot(group);
  std::lock_guard<std::mutex> lock(slot.mutex);
  return slot.state;
}

}  // namespace pacer
