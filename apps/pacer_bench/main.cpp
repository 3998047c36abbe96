/**
 * @file pacer_bench/main.cpp
 * @brief Load generator for the unified rate limiter
 *
 * Runs bench.workers caller threads per group in bench.groups for
 * bench.duration_s seconds. Each granted call sleeps bench.call_latency_ms
 * and fails with probability bench.failure_rate (failed calls release
 * their permit instead of committing it). An optional 429 is injected at
 * bench.inject_429_at_s. Group status is logged every
 * bench.report_interval_ms and a summary is printed on exit.
 *
 * Usage:
 *   ./pacer_bench --config_file config/pacer_bench.json [--set bench.workers=8]
 */

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>

#include "application_kernel.hpp"
#include "bench_workers.hpp"
#include "endpoint_resolver.hpp"
#include "group_config.hpp"
#include "rate_limiter.hpp"

using namespace pacer::engine::common;
using pacer::RateLimitGroup;

class PacerBenchApp : public ApplicationKernel {
 public:
  PacerBenchApp() { SetAppName("pacer_bench"); }

 protected:
  void OnInitialize() override {
    const ConfigManager& config = GetConfig();

    limiter_ = std::make_unique<pacer::UnifiedRateLimiter>(pacer::LoadLimiterConfig(config));
    if (config.HasKey("limiter.endpoints") || config.HasKey("limiter.default_group")) {
      limiter_->SetEndpointResolver(
          std::make_shared<pacer::PrefixEndpointResolver>(pacer::PrefixEndpointResolver::FromConfig(config)));
    }

    pacer::LimiterCallbacks callbacks;
    callbacks.on_rate_reduced = [](RateLimitGroup group, double old_ratio, double new_ratio) {
      SPDLOG_WARN("[bench] {} ratio reduced {:.2f} -> {:.2f}", pacer::ToString(group), old_ratio, new_ratio);
    };
    callbacks.on_rate_recovered = [](RateLimitGroup group, double old_ratio, double new_ratio) {
      SPDLOG_INFO("[bench] {} ratio recovered {:.2f} -> {:.2f}", pacer::ToString(group), old_ratio, new_ratio);
    };
    limiter_->SetCallbacks(std::move(callbacks));

    nlohmann::json groups = config.GetNodeValue("bench.groups");
    if (groups.is_array()) {
      for (const auto& name : groups) {
        groups_.push_back(pacer::RateLimitGroupFromString(name.get<std::string>()));
      }
    }
    if (groups_.empty()) {
      groups_.push_back(RateLimitGroup::REST_PUBLIC);
    }

    pacer::BenchWorkerOptions options;
    options.workers_per_group = config.GetInt("bench.workers", 4);
    options.call_latency = std::chrono::milliseconds(config.GetInt("bench.call_latency_ms", 20));
    options.failure_rate = config.GetDouble("bench.failure_rate", 0.0);
    workers_ = std::make_unique<pacer::BenchWorkers>(*limiter_, groups_, options);

    duration_s_ = config.GetDouble("bench.duration_s", 10.0);
    inject_429_at_s_ = config.GetDouble("bench.inject_429_at_s", -1.0);
    inject_retry_after_s_ = config.GetDouble("bench.inject_retry_after_s", 0.0);
    report_interval_ = std::chrono::milliseconds(config.GetInt("bench.report_interval_ms", 1000));
  }

  void OnStart() override {
    limiter_->Start();
    started_at_ = std::chrono::steady_clock::now();

    workers_->Start();
    SPDLOG_INFO("[bench] running for {:.1f}s", duration_s_);

    report_task_id_ = SchedulePeriodic([this]() { Report(); }, report_interval_);

    if (inject_429_at_s_ >= 0.0) {
      GetEventThread().PostDelayed(
          [this]() {
            for (RateLimitGroup group : groups_) {
              limiter_->Notify429(group, "bench_injected", inject_retry_after_s_);
            }
          },
          std::chrono::milliseconds(static_cast<int>(inject_429_at_s_ * 1000)));
    }

    GetEventThread().PostDelayed([this]() { RequestStop(); },
                                 std::chrono::milliseconds(static_cast<int>(duration_s_ * 1000)));
  }

  void OnStop() override {
    CancelPeriodic(report_task_id_);
    workers_->Stop();
    PrintSummary();
    limiter_->Stop();
  }

 private:
  double Elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
  }

  void Report() {
    for (RateLimitGroup group : groups_) {
      pacer::GroupStatus status = limiter_->GetGroupStatus(group);
      SPDLOG_INFO("[bench] t={:.1f}s {} ratio={:.2f} window={}/{} in_flight={} queue={} waits={} ema_wait={:.3f}s "
                  "notifier={}",
                  Elapsed(), pacer::ToString(group), status.current_ratio, status.burst_window_occupancy,
                  status.burst_capacity, status.in_flight, status.queue_depth, status.total_waits,
                  status.wait_stats.ema_wait, pacer::ToString(status.notifier.status));
    }
  }

  void PrintSummary() {
    const double elapsed = std::max(Elapsed(), 1e-6);
    for (RateLimitGroup group : groups_) {
      const pacer::BenchCounters& c = workers_->GetCounters(group);
      const pacer::GroupConfig& config = limiter_->GetGroupConfig(group);
      const uint64_t waited = c.waited.load();
      SPDLOG_INFO(
          "[bench] {} summary: granted={} committed={} failed={} timeouts={} cancelled={} fail_open={} "
          "achieved={:.2f} rps (limit {:.2f}) avg_wait={:.3f}s",
          pacer::ToString(group), c.granted.load(), c.committed.load(), c.failed_calls.load(), c.timeouts.load(),
          c.cancelled.load(), c.fail_open.load(), c.committed.load() / elapsed, config.base_rps,
          waited > 0 ? c.total_wait.load() / waited : 0.0);
    }
    SPDLOG_INFO("[bench] final status: {}", pacer::StatusToJson(limiter_->GetStatus()).dump());
  }

  std::unique_ptr<pacer::UnifiedRateLimiter> limiter_;
  std::vector<RateLimitGroup> groups_;
  std::unique_ptr<pacer::BenchWorkers> workers_;

  double duration_s_ = 10.0;
  double inject_429_at_s_ = -1.0;
  double inject_retry_after_s_ = 0.0;
  std::chrono::milliseconds report_interval_{1000};
  int report_task_id_ = -1;
  std::chrono::steady_clock::time_point started_at_;
};

int main(int argc, char** argv) {
  PacerBenchApp app;
  return app.Run(argc, argv);
}
