#include "bench_workers.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <random>

namespace pacer {

BenchWorkers::BenchWorkers(UnifiedRateLimiter& limiter, std::vector<RateLimitGroup> groups,
                           BenchWorkerOptions options)
    : limiter_(limiter), groups_(std::move(groups)), options_(options) {
  options_.workers_per_group = std::max(1, options_.workers_per_group);
  for (RateLimitGroup group : groups_) {
    counters_[group] = std::make_unique<BenchCounters>();
  }
}

BenchWorkers::~BenchWorkers() {
  Stop();
}

void BenchWorkers::Start() {
  for (RateLimitGroup group : groups_) {
    BenchCounters& counters = *counters_.at(group);
    for (int i = 0; i < options_.workers_per_group; ++i) {
      workers_.emplace_back([this, group, &counters, i]() { WorkerLoop(group, counters, i); });
    }
  }
  SPDLOG_INFO("[bench] {} workers on {} groups", workers_.size(), groups_.size());
}

void BenchWorkers::Stop() {
  stop_token_.Cancel();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void BenchWorkers::WorkerLoop(RateLimitGroup group, BenchCounters& counters, int worker_index) {
  std::mt19937 rng(std::random_device{}() + worker_index);
  std::bernoulli_distribution fails(std::clamp(options_.failure_rate, 0.0, 1.0));

  while (!stop_token_.IsCancelled()) {
    AcquireResult result = limiter_.Acquire(group, "bench", &stop_token_);
    if (result.waited > 0.0) {
      ++counters.waited;
      counters.total_wait.fetch_add(result.waited);
    }

    switch (result.status) {
      case AcquireStatus::GRANTED:
        break;
      case AcquireStatus::TIMEOUT:
        ++counters.timeouts;
        continue;
      case AcquireStatus::CANCELLED:
        ++counters.cancelled;
        continue;
    }

    ++counters.granted;
    if (result.fail_open) {
      ++counters.fail_open;
    }
    std::this_thread::sleep_for(options_.call_latency);
    if (fails(rng)) {
      ++counters.failed_calls;
      result.permit.Release();
    } else {
      ++counters.committed;
      result.permit.Commit();
    }
  }
}

}  // namespace pacer
