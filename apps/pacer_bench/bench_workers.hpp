#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include "cancellation_token.hpp"
#include "rate_limiter.hpp"

namespace pacer {

struct BenchCounters {
  std::atomic<uint64_t> granted{0};
  std::atomic<uint64_t> committed{0};
  std::atomic<uint64_t> failed_calls{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> cancelled{0};
  std::atomic<uint64_t> fail_open{0};
  std::atomic<uint64_t> waited{0};
  std::atomic<double> total_wait{0.0};
};

struct BenchWorkerOptions {
  int workers_per_group = 4;
  std::chrono::milliseconds call_latency{20};
  double failure_rate = 0.0;  ///< failed calls release their permit instead of committing
};

/**
 * @brief Caller threads that acquire, simulate a call, then commit or release
 *
 * Counters for every group exist from construction on and the map is never
 * modified afterwards, so workers and reporters read it without locking.
 * One run per instance: Stop cancels the shared token for good.
 */
class BenchWorkers {
 public:
  BenchWorkers(UnifiedRateLimiter& limiter, std::vector<RateLimitGroup> groups, BenchWorkerOptions options);
  ~BenchWorkers();

  BenchWorkers(const BenchWorkers&) = delete;
  BenchWorkers& operator=(const BenchWorkers&) = delete;

  void Start();
  // Cancels pending acquires and joins every worker
  void Stop();

  const std::vector<RateLimitGroup>& GetGroups() const { return groups_; }
  const BenchCounters& GetCounters(RateLimitGroup group) const { return *counters_.at(group); }
  size_t WorkerCount() const { return workers_.size(); }

 private:
  void WorkerLoop(RateLimitGroup group, BenchCounters& counters, int worker_index);

  UnifiedRateLimiter& limiter_;
  std::vector<RateLimitGroup> groups_;
  BenchWorkerOptions options_;

  std::map<RateLimitGroup, std::unique_ptr<BenchCounters>> counters_;
  std::vector<std::thread> workers_;
  engine::common::CancellationToken stop_token_;
};

}  // namespace pacer
