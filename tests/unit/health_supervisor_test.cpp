#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "engine/limiter/health_supervisor.hpp"
#include "manual_clock.hpp"

using namespace pacer;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds limit = 2000ms) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

}  // namespace

class HealthSupervisorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    supervisor_ = std::make_unique<HealthSupervisor>(
        [this](RateLimitGroup group) { return MakeNotifier(group); },
        [this](RateLimitGroup group) {
          std::lock_guard<std::mutex> lock(mutex_);
          ++released_[group];
          return static_cast<size_t>(1);
        },
        30000ms, 4, clock_);
  }

  void TearDown() override { supervisor_->StopAll(); }

  std::unique_ptr<NotifierTask> MakeNotifier(RateLimitGroup group) {
    ++created_;
    NotifierOptions options;
    options.backoff_base = 1ms;
    options.backoff_cap = 2ms;
    options.backoff_jitter = 0ms;
    options.max_consecutive_errors = 4;
    auto tick = [this, group]() -> std::chrono::microseconds {
      if (group == broken_group_.load()) {
        throw std::runtime_error("tick exploded");
      }
      return std::chrono::microseconds(5000);
    };
    return std::make_unique<NotifierTask>(ToString(group), tick, options);
  }

  int ReleasedFor(RateLimitGroup group) {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_[group];
  }

  test::ManualClock clock_{100.0};
  std::atomic<int> created_{0};
  std::atomic<RateLimitGroup> broken_group_{static_cast<RateLimitGroup>(-1)};
  std::mutex mutex_;
  std::map<RateLimitGroup, int> released_;
  std::unique_ptr<HealthSupervisor> supervisor_;
};

TEST(HealthAssessTest, Thresholds) {
  EXPECT_EQ(HealthSupervisor::Assess(false, 0, 10), NotifierHealth::FAILED);
  EXPECT_EQ(HealthSupervisor::Assess(true, 0, 10), NotifierHealth::HEALTHY);
  EXPECT_EQ(HealthSupervisor::Assess(true, 4, 10), NotifierHealth::HEALTHY);
  EXPECT_EQ(HealthSupervisor::Assess(true, 5, 10), NotifierHealth::DEGRADED);
  EXPECT_EQ(HealthSupervisor::Assess(true, 1, 1), NotifierHealth::DEGRADED);
  EXPECT_EQ(ToString(NotifierHealth::RESTARTING), "RESTARTING");
}

TEST_F(HealthSupervisorTest, HealthyNotifiersAreLeftAlone) {
  supervisor_->StartAll();
  EXPECT_EQ(created_.load(), static_cast<int>(kRateLimitGroupCount));

  supervisor_->CheckAndHeal();
  EXPECT_EQ(created_.load(), static_cast<int>(kRateLimitGroupCount));
  for (RateLimitGroup group : AllRateLimitGroups()) {
    NotifierHealthInfo info = supervisor_->GetHealth(group);
    EXPECT_EQ(info.status, NotifierHealth::HEALTHY) << ToString(group);
    EXPECT_EQ(info.restart_count, 0u);
    EXPECT_EQ(ReleasedFor(group), 0);
  }
}

TEST_F(HealthSupervisorTest, DeadNotifierIsReplacedAndWaitersReleased) {
  const RateLimitGroup group = RateLimitGroup::REST_PRIVATE_ORDER;
  broken_group_ = group;
  supervisor_->StartAll();

  ASSERT_TRUE(WaitUntil([&] { return supervisor_->GetHealth(group).status == NotifierHealth::FAILED; }));

  broken_group_ = static_cast<RateLimitGroup>(-1);
  supervisor_->CheckAndHeal();

  NotifierHealthInfo info = supervisor_->GetHealth(group);
  EXPECT_EQ(info.status, NotifierHealth::HEALTHY);
  EXPECT_EQ(info.restart_count, 1u);
  EXPECT_TRUE(info.has_restart);
  EXPECT_DOUBLE_EQ(info.last_restart_at, 100.0);
  EXPECT_EQ(info.consecutive_errors, 0);
  EXPECT_EQ(ReleasedFor(group), 1);
  EXPECT_EQ(ReleasedFor(RateLimitGroup::REST_PUBLIC), 0);
}

TEST_F(HealthSupervisorTest, RestartsRespectCooldown) {
  const RateLimitGroup group = RateLimitGroup::WEBSOCKET;
  broken_group_ = group;
  supervisor_->StartAll();
  ASSERT_TRUE(WaitUntil([&] { return supervisor_->GetHealth(group).status == NotifierHealth::FAILED; }));

  // First restart is immediate; the replacement keeps failing
  supervisor_->CheckAndHeal();
  EXPECT_EQ(supervisor_->GetHealth(group).restart_count, 1u);
  ASSERT_TRUE(WaitUntil([&] { return supervisor_->GetHealth(group).status == NotifierHealth::FAILED; }));

  clock_.Advance(10.0);
  supervisor_->CheckAndHeal();
  EXPECT_EQ(supervisor_->GetHealth(group).restart_count, 1u);
  EXPECT_EQ(ReleasedFor(group), 1);

  clock_.Advance(25.0);
  supervisor_->CheckAndHeal();
  EXPECT_EQ(supervisor_->GetHealth(group).restart_count, 2u);
  EXPECT_EQ(ReleasedFor(group), 2);
}

TEST_F(HealthSupervisorTest, StopAllStopsEveryNotifier) {
  supervisor_->StartAll();
  supervisor_->StopAll();
  for (RateLimitGroup group : AllRateLimitGroups()) {
    supervisor_->Wake(group);
  }

  // Nothing to heal once stopped
  supervisor_->CheckAndHeal();
  EXPECT_EQ(created_.load(), static_cast<int>(kRateLimitGroupCount));
}
