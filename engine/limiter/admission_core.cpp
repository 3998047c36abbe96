#include "admission_core.hpp"

#include <algorithm>

namespace pacer {

LegLimits PrimaryLimits(const GroupConfig& config, double ratio) {
  LegLimits limits;
  limits.rate = config.base_rps * config.safety_factor * ratio;
  limits.capacity = std::max(1, config.burst_capacity);
  // capacity / rate: one second when burst == rps, longer while the ratio is reduced
  limits.interval = limits.capacity / limits.rate;
  return limits;
}

LegLimits SecondaryLimits(const GroupConfig& config, double ratio) {
  LegLimits limits;
  limits.rate = config.requests_per_minute / 60.0 * config.safety_factor * ratio;
  limits.capacity = std::max(1, config.rpm_burst_capacity);
  limits.interval = limits.capacity / limits.rate;
  return limits;
}

double WindowShortfall(const std::deque<double>& window, double interval, double now) {
  if (window.empty()) {
    return 0.0;
  }

  double covered = now - window.front();
  if (covered >= interval) {
    return 0.0;
  }
  for (size_t i = 1; i < window.size(); ++i) {
    covered += window[i - 1] - window[i];
    if (covered >= interval) {
      return 0.0;
    }
  }
  return std::max(0.0, interval - covered);
}

void EvictExpired(std::deque<double>& window, double interval, double now) {
  const double cutoff = now - interval;
  while (!window.empty() && window.back() <= cutoff) {
    window.pop_back();
  }
}

LegDecision EvaluateLeg(const LegLimits& limits, const LegState& leg, double now) {
  LegDecision decision;
  decision.steady_wait = std::max(0.0, leg.tat - now);
  decision.new_tat = std::max(leg.tat, now) + limits.EmissionInterval();

  const int occupied = static_cast<int>(leg.window.size()) + leg.in_flight;
  if (occupied < limits.capacity) {
    decision.granted = true;
    return decision;
  }

  // Slots held only by in-flight grants carry no timestamp; GCRA spacing covers them
  if (static_cast<int>(leg.window.size()) >= limits.capacity) {
    decision.window_wait = WindowShortfall(leg.window, limits.interval, now);
  }

  double wait = std::max(decision.steady_wait, decision.window_wait);
  if (wait <= 0.0) {
    decision.granted = true;
    return decision;
  }
  decision.wait = std::min(wait, limits.interval / 2.0);
  return decision;
}

void ApplyGrant(LegState& leg, double new_tat) {
  leg.tat = std::max(leg.tat, new_tat);
  ++leg.in_flight;
}

void CommitSlot(LegState& leg, const LegLimits& limits, double completed_at) {
  if (leg.in_flight > 0) {
    --leg.in_flight;
  }
  // Calls may complete out of grant order; keep newest first
  auto pos = std::find_if(leg.window.begin(), leg.window.end(),
                          [completed_at](double ts) { return ts <= completed_at; });
  leg.window.insert(pos, completed_at);
  while (static_cast<int>(leg.window.size()) > limits.capacity) {
    leg.window.pop_back();
  }
  EvictExpired(leg.window, limits.interval, completed_at);
}

void ReleaseSlot(LegState& leg) {
  if (leg.in_flight > 0) {
    --leg.in_flight;
  }
}

}  // namespace pacer
