#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "apps/pacer_bench/bench_workers.hpp"
#include "engine/limiter/rate_limiter.hpp"

using namespace pacer;
using namespace std::chrono_literals;

namespace {

LimiterConfig FastConfig(const std::vector<RateLimitGroup>& groups) {
  LimiterConfig config = DefaultLimiterConfig();
  for (RateLimitGroup group : groups) {
    GroupConfig& group_config = config.groups[group];
    group_config.base_rps = 200.0;
    group_config.burst_capacity = 20;
    group_config.requests_per_minute = 0.0;
    group_config.rpm_burst_capacity = 0;
    group_config.safety_factor = 1.0;
  }
  config.options.notifier_tick = 10ms;
  return config;
}

}  // namespace

TEST(BenchWorkersTest, CountersExistBeforeStart) {
  const std::vector<RateLimitGroup> groups = {RateLimitGroup::REST_PUBLIC, RateLimitGroup::REST_PRIVATE_ORDER,
                                              RateLimitGroup::REST_PRIVATE_DEFAULT};
  UnifiedRateLimiter limiter(FastConfig(groups));
  BenchWorkers workers(limiter, groups, BenchWorkerOptions{});

  for (RateLimitGroup group : groups) {
    EXPECT_EQ(workers.GetCounters(group).granted.load(), 0u) << ToString(group);
  }
  EXPECT_EQ(workers.WorkerCount(), 0u);
  EXPECT_THROW(workers.GetCounters(RateLimitGroup::WEBSOCKET), std::out_of_range);
}

TEST(BenchWorkersTest, EveryGroupRunsConcurrently) {
  const std::vector<RateLimitGroup> groups = {RateLimitGroup::REST_PUBLIC, RateLimitGroup::REST_PRIVATE_ORDER,
                                              RateLimitGroup::REST_PRIVATE_DEFAULT};
  UnifiedRateLimiter limiter(FastConfig(groups));
  limiter.Start();

  BenchWorkerOptions options;
  options.workers_per_group = 3;
  options.call_latency = 1ms;
  options.failure_rate = 0.5;
  BenchWorkers workers(limiter, groups, options);
  workers.Start();
  EXPECT_EQ(workers.WorkerCount(), 9u);

  std::this_thread::sleep_for(200ms);
  workers.Stop();

  for (RateLimitGroup group : groups) {
    const BenchCounters& counters = workers.GetCounters(group);
    EXPECT_GT(counters.granted.load(), 0u) << ToString(group);
    EXPECT_EQ(counters.granted.load(), counters.committed.load() + counters.failed_calls.load())
        << ToString(group);
    EXPECT_EQ(counters.timeouts.load(), 0u) << ToString(group);
    EXPECT_EQ(limiter.GetGroupStatus(group).in_flight, 0) << ToString(group);
  }
}

TEST(BenchWorkersTest, StopUnblocksQueuedWorkers) {
  const RateLimitGroup group = RateLimitGroup::REST_PUBLIC;
  LimiterConfig config = FastConfig({group});
  config.groups[group].base_rps = 1.0;
  config.groups[group].burst_capacity = 1;
  UnifiedRateLimiter limiter(config);
  limiter.Start();

  BenchWorkerOptions options;
  options.workers_per_group = 2;
  options.call_latency = 1ms;
  BenchWorkers workers(limiter, {group}, options);
  workers.Start();
  std::this_thread::sleep_for(100ms);

  const auto started = std::chrono::steady_clock::now();
  workers.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
  EXPECT_GE(workers.GetCounters(group).cancelled.load(), 1u);
}
