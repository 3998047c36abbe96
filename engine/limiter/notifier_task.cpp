#include "notifier_task.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pacer {

NotifierTask::NotifierTask(std::string name, TickFn tick, NotifierOptions options)
    : name_(std::move(name)), tick_(std::move(tick)), options_(options) {
}

NotifierTask::~NotifierTask() {
  Stop();
}

void NotifierTask::Start() {
  if (running_.exchange(true)) {
    return;
  }
  alive_ = true;
  thread_ = std::thread(&NotifierTask::Run, this);
  SPDLOG_DEBUG("Notifier {} started", name_);
}

void NotifierTask::Stop() {
  running_ = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wake_pending_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    SPDLOG_DEBUG("Notifier {} stopped", name_);
  }
  alive_ = false;
}

void NotifierTask::Wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    wake_pending_ = true;
  }
  cv_.notify_one();
}

std::chrono::milliseconds NotifierTask::BackoffFor(int consecutive_errors) {
  // base * 2^errors, shift bounded so it cannot overflow before the cap applies
  const int shift = std::clamp(consecutive_errors, 0, 20);
  long long delay_ms = options_.backoff_base.count() * (1LL << shift);
  if (options_.backoff_jitter.count() > 0) {
    std::uniform_int_distribution<long long> jitter(0, options_.backoff_jitter.count());
    delay_ms += jitter(rng_);
  }
  return std::chrono::milliseconds(std::min(delay_ms, static_cast<long long>(options_.backoff_cap.count())));
}

void NotifierTask::Run() {
  while (running_.load()) {
    std::chrono::microseconds sleep_for{0};
    bool backing_off = false;
    try {
      sleep_for = tick_();
      consecutive_errors_ = 0;
    } catch (const std::exception& e) {
      const int errors = ++consecutive_errors_;
      SPDLOG_ERROR("Notifier {} tick failed: {} (consecutive={})", name_, e.what(), errors);
      if (errors >= options_.max_consecutive_errors) {
        SPDLOG_CRITICAL("Notifier {} reached {} consecutive errors, terminating", name_, errors);
        break;
      }
      sleep_for = BackoffFor(errors);
      backing_off = true;
    }

    sleep_for = std::max(sleep_for, std::chrono::microseconds(1000));
    std::unique_lock<std::mutex> lock(mutex_);
    // A backoff sleep only ends early on Stop
    cv_.wait_for(lock, sleep_for, [this, backing_off] {
      return !running_.load() || (wake_pending_ && !backing_off);
    });
    wake_pending_ = false;
  }
  alive_ = false;
}

}  // namespace pacer
