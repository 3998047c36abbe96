#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "engine/limiter/notifier_task.hpp"

using namespace pacer;
using namespace std::chrono_literals;

namespace {

NotifierOptions FastOptions(int max_errors = 10) {
  NotifierOptions options;
  options.backoff_base = 1ms;
  options.backoff_cap = 5ms;
  options.backoff_jitter = 0ms;
  options.max_consecutive_errors = max_errors;
  return options;
}

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

TEST(NotifierTaskTest, TicksUntilStopped) {
  std::atomic<int> ticks{0};
  NotifierTask task("ticker", [&ticks] {
    ++ticks;
    return std::chrono::microseconds(2000);
  }, FastOptions());

  EXPECT_FALSE(task.IsAlive());
  task.Start();
  EXPECT_TRUE(task.IsAlive());
  EXPECT_TRUE(WaitUntil([&] { return ticks.load() >= 3; }));

  task.Stop();
  EXPECT_FALSE(task.IsAlive());
  const int after_stop = ticks.load();
  std::this_thread::sleep_for(20ms);
  EXPECT_EQ(ticks.load(), after_stop);
}

TEST(NotifierTaskTest, WakeCutsSleepShort) {
  std::atomic<int> ticks{0};
  NotifierTask task("sleeper", [&ticks] {
    ++ticks;
    return std::chrono::microseconds(std::chrono::seconds(10));
  }, FastOptions());

  task.Start();
  ASSERT_TRUE(WaitUntil([&] { return ticks.load() == 1; }));

  task.Wake();
  EXPECT_TRUE(WaitUntil([&] { return ticks.load() >= 2; }, 1000ms));
  task.Stop();
}

TEST(NotifierTaskTest, RecoversFromTransientErrors) {
  std::atomic<int> calls{0};
  NotifierTask task("flaky", [&calls] {
    if (++calls <= 3) {
      throw std::runtime_error("transient");
    }
    return std::chrono::microseconds(2000);
  }, FastOptions());

  task.Start();
  EXPECT_TRUE(WaitUntil([&] { return calls.load() > 4; }));
  EXPECT_TRUE(task.IsAlive());
  EXPECT_EQ(task.GetConsecutiveErrors(), 0);
  task.Stop();
}

TEST(NotifierTaskTest, TerminatesAfterMaxConsecutiveErrors) {
  std::atomic<int> calls{0};
  NotifierTask task("broken", [&calls]() -> std::chrono::microseconds {
    ++calls;
    throw std::runtime_error("always");
  }, FastOptions(4));

  task.Start();
  EXPECT_TRUE(WaitUntil([&] { return !task.IsAlive(); }));
  EXPECT_EQ(calls.load(), 4);
  EXPECT_EQ(task.GetConsecutiveErrors(), 4);

  // Stop on a self-terminated task only joins
  task.Stop();
  EXPECT_FALSE(task.IsAlive());
}

TEST(NotifierTaskTest, BackoffDoublesUpToCap) {
  NotifierOptions options;
  options.backoff_base = 100ms;
  options.backoff_cap = 30000ms;
  options.backoff_jitter = 0ms;
  NotifierTask task("backoff", [] { return std::chrono::microseconds(1000); }, options);

  EXPECT_EQ(task.BackoffFor(0), 100ms);
  EXPECT_EQ(task.BackoffFor(1), 200ms);
  EXPECT_EQ(task.BackoffFor(3), 800ms);
  EXPECT_EQ(task.BackoffFor(9), 30000ms);
  EXPECT_EQ(task.BackoffFor(1000), 30000ms);
}

TEST(NotifierTaskTest, BackoffJitterStaysBounded) {
  NotifierOptions options;
  options.backoff_base = 100ms;
  options.backoff_cap = 30000ms;
  options.backoff_jitter = 100ms;
  NotifierTask task("jitter", [] { return std::chrono::microseconds(1000); }, options);

  for (int i = 0; i < 50; ++i) {
    const auto backoff = task.BackoffFor(2);
    EXPECT_GE(backoff, 400ms);
    EXPECT_LE(backoff, 500ms);
  }
}
