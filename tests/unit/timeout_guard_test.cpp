#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "engine/common/event_thread.hpp"
#include "engine/limiter/admission_queue.hpp"
#include "engine/limiter/timeout_guard.hpp"
#include "manual_clock.hpp"

using namespace pacer;
using namespace std::chrono_literals;
using pacer::engine::common::EventThread;

class TimeoutGuardTest : public ::testing::Test {
 protected:
  void SetUp() override { timer_.Start(); }
  void TearDown() override { timer_.Stop(); }

  test::ManualClock clock_{10.0};
  EventThread timer_{"timeout_test"};
  AdmissionQueue queue_{RateLimitGroup::REST_PUBLIC};
};

TEST_F(TimeoutGuardTest, ArmedWaiterTimesOut) {
  TimeoutGuard guard(timer_, 30ms, clock_);
  auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
  ASSERT_TRUE(guard.Arm(waiter));
  EXPECT_EQ(guard.ActiveTimeouts(RateLimitGroup::REST_PUBLIC), 1u);

  EXPECT_EQ(waiter->Wait(), WakeReason::TIMEOUT);
  EXPECT_EQ(waiter->GetState(), WaiterState::CANCELLED);

  clock_.Advance(0.03);
  guard.Cleanup(queue_, *waiter, WaitOutcome::TIMEOUT);
  EXPECT_EQ(guard.ActiveTimeouts(RateLimitGroup::REST_PUBLIC), 0u);
  EXPECT_EQ(queue_.Size(), 0u);

  WaitStats stats = guard.GetStats(RateLimitGroup::REST_PUBLIC);
  EXPECT_EQ(stats.completed_waits, 1u);
  EXPECT_EQ(stats.timeouts, 1u);
  EXPECT_NEAR(stats.max_wait, 0.03, 1e-9);
}

TEST_F(TimeoutGuardTest, CleanupCancelsPendingTimer) {
  TimeoutGuard guard(timer_, 20ms, clock_);
  auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
  ASSERT_TRUE(guard.Arm(waiter));

  guard.Cleanup(queue_, *waiter, WaitOutcome::GRANTED);
  std::this_thread::sleep_for(60ms);

  EXPECT_TRUE(waiter->IsWaiting());
  EXPECT_EQ(guard.ActiveTimeouts(RateLimitGroup::REST_PUBLIC), 0u);
}

TEST_F(TimeoutGuardTest, CleanupIsIdempotent) {
  TimeoutGuard guard(timer_, 5000ms, clock_);
  auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
  ASSERT_TRUE(guard.Arm(waiter));

  guard.Cleanup(queue_, *waiter, WaitOutcome::GRANTED);
  guard.Cleanup(queue_, *waiter, WaitOutcome::CANCELLED);

  WaitStats stats = guard.GetStats(RateLimitGroup::REST_PUBLIC);
  EXPECT_EQ(stats.completed_waits, 1u);
  EXPECT_EQ(stats.grants, 1u);
  EXPECT_EQ(stats.cancellations, 0u);
}

TEST_F(TimeoutGuardTest, ScopeCleansUpOnEveryExit) {
  TimeoutGuard guard(timer_, 5000ms, clock_);
  {
    auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
    ASSERT_TRUE(guard.Arm(waiter));
    TimeoutGuard::Scope scope(guard, queue_, waiter);
  }
  {
    auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
    ASSERT_TRUE(guard.Arm(waiter));
    TimeoutGuard::Scope scope(guard, queue_, waiter);
    scope.SetOutcome(WaitOutcome::FORCE_RELEASED);
  }

  EXPECT_EQ(queue_.Size(), 0u);
  EXPECT_EQ(guard.ActiveTimeouts(RateLimitGroup::REST_PUBLIC), 0u);
  WaitStats stats = guard.GetStats(RateLimitGroup::REST_PUBLIC);
  EXPECT_EQ(stats.cancellations, 1u);
  EXPECT_EQ(stats.fail_open_releases, 1u);
}

TEST_F(TimeoutGuardTest, EmaStartsFromFirstSample) {
  TimeoutGuard guard(timer_, 5000ms, clock_);

  auto first = queue_.Enqueue(clock_.Now(), 1000.0);
  clock_.Advance(1.0);
  guard.Cleanup(queue_, *first, WaitOutcome::GRANTED);
  EXPECT_DOUBLE_EQ(guard.GetStats(RateLimitGroup::REST_PUBLIC).ema_wait, 1.0);

  auto second = queue_.Enqueue(clock_.Now(), 1000.0);
  clock_.Advance(2.0);
  guard.Cleanup(queue_, *second, WaitOutcome::GRANTED);

  WaitStats stats = guard.GetStats(RateLimitGroup::REST_PUBLIC);
  EXPECT_NEAR(stats.ema_wait, 1.1, 1e-9);
  EXPECT_NEAR(stats.total_wait, 3.0, 1e-9);
  EXPECT_NEAR(stats.max_wait, 2.0, 1e-9);
}

TEST_F(TimeoutGuardTest, ArmFailsWithoutTimerThread) {
  timer_.Stop();
  TimeoutGuard guard(timer_, 5000ms, clock_);
  auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
  EXPECT_FALSE(guard.Arm(waiter));
  EXPECT_EQ(guard.ActiveTimeouts(RateLimitGroup::REST_PUBLIC), 0u);
}

TEST_F(TimeoutGuardTest, TimerDoesNotKeepWaiterAlive) {
  TimeoutGuard guard(timer_, 20ms, clock_);
  std::weak_ptr<Waiter> weak;
  {
    auto waiter = queue_.Enqueue(clock_.Now(), 1000.0);
    weak = waiter;
    ASSERT_TRUE(guard.Arm(waiter));
    queue_.Remove(waiter->GetId());
  }
  EXPECT_TRUE(weak.expired());
  std::this_thread::sleep_for(50ms);
}
