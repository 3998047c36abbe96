#include <gtest/gtest.h>

#include <map>

#include "engine/limiter/adaptive_throttle.hpp"

using namespace pacer;

namespace {

GroupConfig ThrottledConfig() {
  GroupConfig config;
  config.base_rps = 10.0;
  config.burst_capacity = 5;
  config.error_threshold = 2;
  config.error_window = 60.0;
  config.reduction_ratio = 0.5;
  config.min_ratio = 0.3;
  config.recovery_delay = 100.0;
  config.recovery_step = 0.1;
  config.preventive_window = 10.0;
  config.max_preventive_delay = 0.5;
  config.preventive_delay_per_violation = 0.2;
  return config;
}

}  // namespace

TEST(AdaptivePolicyTest, ReductionWaitsForThreshold) {
  GroupConfig config = ThrottledConfig();
  GroupState state;

  RatioChange first = ApplyViolation(state, config, 0.0, 3600.0);
  EXPECT_FALSE(first.changed);
  EXPECT_DOUBLE_EQ(state.current_ratio, 1.0);
  EXPECT_FALSE(state.has_reduction);

  RatioChange second = ApplyViolation(state, config, 1.0, 3600.0);
  EXPECT_TRUE(second.changed);
  EXPECT_DOUBLE_EQ(second.old_ratio, 1.0);
  EXPECT_DOUBLE_EQ(second.new_ratio, 0.5);
  EXPECT_DOUBLE_EQ(state.last_reduction_at, 1.0);
  EXPECT_EQ(state.violation_count, 2u);
}

TEST(AdaptivePolicyTest, ViolationsOutsideErrorWindowDoNotCount) {
  GroupConfig config = ThrottledConfig();
  GroupState state;

  ApplyViolation(state, config, 0.0, 3600.0);
  RatioChange late = ApplyViolation(state, config, 61.0, 3600.0);
  EXPECT_FALSE(late.changed);
  EXPECT_DOUBLE_EQ(state.current_ratio, 1.0);
  EXPECT_EQ(state.violation_history.size(), 2u);
}

TEST(AdaptivePolicyTest, RatioNeverDropsBelowMinimum) {
  GroupConfig config = ThrottledConfig();
  GroupState state;

  for (int i = 0; i < 10; ++i) {
    ApplyViolation(state, config, static_cast<double>(i), 3600.0);
    EXPECT_GE(state.current_ratio, config.min_ratio);
    EXPECT_LE(state.current_ratio, 1.0);
  }
  EXPECT_DOUBLE_EQ(state.current_ratio, config.min_ratio);

  RatioChange pinned = ApplyViolation(state, config, 11.0, 3600.0);
  EXPECT_FALSE(pinned.changed);
  EXPECT_DOUBLE_EQ(state.last_reduction_at, 11.0);
}

TEST(AdaptivePolicyTest, DisabledAdjustmentOnlyRecords) {
  GroupConfig config = ThrottledConfig();
  config.enable_dynamic_adjustment = false;
  GroupState state;

  for (int i = 0; i < 5; ++i) {
    EXPECT_FALSE(ApplyViolation(state, config, static_cast<double>(i), 3600.0).changed);
  }
  EXPECT_DOUBLE_EQ(state.current_ratio, 1.0);
  EXPECT_EQ(state.violation_count, 5u);
  EXPECT_FALSE(ApplyRecovery(state, config, 1000.0).changed);
}

TEST(AdaptivePolicyTest, HistoryPrunedPastRetention) {
  GroupConfig config = ThrottledConfig();
  GroupState state;

  ApplyViolation(state, config, 0.0, 50.0);
  ApplyViolation(state, config, 10.0, 50.0);
  ApplyViolation(state, config, 55.0, 50.0);
  ASSERT_EQ(state.violation_history.size(), 2u);
  EXPECT_DOUBLE_EQ(state.violation_history.front(), 10.0);
  EXPECT_EQ(state.violation_count, 3u);
}

TEST(AdaptivePolicyTest, RecoveryStepsBackAfterDelay) {
  GroupConfig config = ThrottledConfig();
  GroupState state;
  ApplyViolation(state, config, 0.0, 3600.0);
  ApplyViolation(state, config, 0.0, 3600.0);
  ASSERT_DOUBLE_EQ(state.current_ratio, 0.5);

  EXPECT_FALSE(ApplyRecovery(state, config, 50.0).changed);

  RatioChange step = ApplyRecovery(state, config, 100.0);
  EXPECT_TRUE(step.changed);
  EXPECT_NEAR(state.current_ratio, 0.6, 1e-9);
  EXPECT_TRUE(state.has_recovery);

  // Recovery never overshoots full rate
  for (int i = 0; i < 20; ++i) {
    ApplyRecovery(state, config, 200.0 + i);
    EXPECT_LE(state.current_ratio, 1.0);
  }
  EXPECT_DOUBLE_EQ(state.current_ratio, 1.0);
  EXPECT_FALSE(ApplyRecovery(state, config, 500.0).changed);
}

TEST(AdaptivePolicyTest, RecoveryNeedsAReduction) {
  GroupConfig config = ThrottledConfig();
  GroupState state;
  state.current_ratio = 0.8;
  EXPECT_FALSE(ApplyRecovery(state, config, 1000.0).changed);
}

TEST(AdaptivePolicyTest, PreventiveDelayDecaysToZero) {
  GroupConfig config = ThrottledConfig();
  GroupState state;
  EXPECT_DOUBLE_EQ(ComputePreventiveDelay(state, config, 0.0), 0.0);

  ApplyViolation(state, config, 0.0, 3600.0);
  EXPECT_NEAR(ComputePreventiveDelay(state, config, 0.0), 0.2, 1e-9);
  EXPECT_NEAR(ComputePreventiveDelay(state, config, 5.0), 0.1, 1e-9);
  EXPECT_DOUBLE_EQ(ComputePreventiveDelay(state, config, 10.0), 0.0);

  // Capped at max_preventive_delay however many violations pile up
  for (int i = 0; i < 5; ++i) {
    ApplyViolation(state, config, 20.0, 3600.0);
  }
  EXPECT_NEAR(ComputePreventiveDelay(state, config, 20.0), 0.5, 1e-9);

  config.enable_preventive_throttling = false;
  EXPECT_DOUBLE_EQ(ComputePreventiveDelay(state, config, 20.0), 0.0);
}

class AdaptiveThrottleTest : public ::testing::Test {
 protected:
  AdaptiveThrottleTest()
      : registry_(std::map<RateLimitGroup, GroupConfig>{{RateLimitGroup::REST_PUBLIC, ThrottledConfig()}}),
        throttle_(registry_, 3600.0) {}

  GroupRegistry registry_;
  AdaptiveThrottle throttle_;
};

TEST_F(AdaptiveThrottleTest, RetryAfterHoldsGroup) {
  throttle_.OnViolation(RateLimitGroup::REST_PUBLIC, 10.0, 2.5);
  EXPECT_DOUBLE_EQ(registry_.Snapshot(RateLimitGroup::REST_PUBLIC).held_until, 12.5);

  // A shorter hint never shortens an existing hold
  throttle_.OnViolation(RateLimitGroup::REST_PUBLIC, 11.0, 0.5);
  EXPECT_DOUBLE_EQ(registry_.Snapshot(RateLimitGroup::REST_PUBLIC).held_until, 12.5);

  AdmissionDecision decision = registry_.ReadAndMaybeAdmit(RateLimitGroup::REST_PUBLIC, 11.0);
  EXPECT_FALSE(decision.granted);
  EXPECT_GE(decision.wait, 1.5);
}

TEST_F(AdaptiveThrottleTest, ReductionSlowsAdmission) {
  const LegLimits before = PrimaryLimits(registry_.GetConfig(RateLimitGroup::REST_PUBLIC), 1.0);

  throttle_.OnViolation(RateLimitGroup::REST_PUBLIC, 0.0);
  RatioChange change = throttle_.OnViolation(RateLimitGroup::REST_PUBLIC, 0.0);
  ASSERT_TRUE(change.changed);

  GroupState state = registry_.Snapshot(RateLimitGroup::REST_PUBLIC);
  const LegLimits after = PrimaryLimits(registry_.GetConfig(RateLimitGroup::REST_PUBLIC), state.current_ratio);
  EXPECT_GT(after.EmissionInterval(), before.EmissionInterval());

  EXPECT_FALSE(throttle_.TryRecover(RateLimitGroup::REST_PUBLIC, 10.0).changed);
  EXPECT_TRUE(throttle_.TryRecover(RateLimitGroup::REST_PUBLIC, 100.0).changed);
}

TEST_F(AdaptiveThrottleTest, PreventiveDelayReadsGroupState) {
  EXPECT_DOUBLE_EQ(throttle_.PreventiveDelay(RateLimitGroup::REST_PUBLIC, 0.0), 0.0);
  throttle_.OnViolation(RateLimitGroup::REST_PUBLIC, 0.0);
  EXPECT_GT(throttle_.PreventiveDelay(RateLimitGroup::REST_PUBLIC, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(throttle_.PreventiveDelay(RateLimitGroup::REST_PRIVATE_ORDER, 1.0), 0.0);
}
