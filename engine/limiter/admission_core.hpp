#pragma once

#include <deque>

#include "group_config.hpp"

namespace pacer {

/**
 * @brief One limiting leg of a group (per-second or per-minute)
 *
 * `window` holds committed completion timestamps, newest first, never more
 * than `capacity` entries. `in_flight` counts grants not yet committed or
 * released; they occupy burst slots without a timestamp.
 */
struct LegState {
  double tat = 0.0;  ///< Theoretical Arrival Time
  std::deque<double> window;
  int in_flight = 0;
};

// Effective limits of a leg after the adaptive ratio is applied
struct LegLimits {
  double rate = 1.0;      ///< requests per second, > 0
  int capacity = 1;       ///< burst slots
  double interval = 1.0;  ///< observation interval = capacity / rate

  double EmissionInterval() const { return 1.0 / rate; }
};

struct LegDecision {
  bool granted = false;
  double wait = 0.0;         ///< capped combined wait, 0 when granted
  double steady_wait = 0.0;  ///< GCRA component
  double window_wait = 0.0;  ///< burst window component
  double new_tat = 0.0;      ///< TAT to store if the grant is applied
};

// Per-second leg: rate = base_rps * safety_factor * ratio, capacity = burst_capacity
LegLimits PrimaryLimits(const GroupConfig& config, double ratio);

// Per-minute leg: rate = rpm / 60 * safety_factor * ratio, capacity = rpm_burst_capacity,
// so the interval spans rpm_burst_capacity * 60 / rpm seconds at full ratio
LegLimits SecondaryLimits(const GroupConfig& config, double ratio);

// Walk the window from the most recent timestamp backward accumulating gaps
// until they cover `interval`; the uncovered remainder is the wait.
double WindowShortfall(const std::deque<double>& window, double interval, double now);

// Drop timestamps at least `interval` old
void EvictExpired(std::deque<double>& window, double interval, double now);

// GCRA check hybridised with the burst window. Free burst slots admit
// immediately; a full window waits for max(steady, window), capped at half
// the observation interval.
LegDecision EvaluateLeg(const LegLimits& limits, const LegState& leg, double now);

// Record a grant: advance TAT and reserve a burst slot
void ApplyGrant(LegState& leg, double new_tat);

// Two-phase commit: the reserved slot becomes a timestamp
void CommitSlot(LegState& leg, const LegLimits& limits, double completed_at);

// Reserved slot returned unused
void ReleaseSlot(LegState& leg);

}  // namespace pacer
