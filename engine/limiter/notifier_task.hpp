#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace pacer {

struct NotifierOptions {
  std::chrono::milliseconds backoff_base{100};
  std::chrono::milliseconds backoff_cap{30000};
  std::chrono::milliseconds backoff_jitter{100};
  int max_consecutive_errors = 10;
};

/**
 * @brief Background loop waking a group's due waiters
 *
 * Each iteration calls the tick function, which returns how long to sleep
 * before the next one. Wake() cuts the sleep short.
 *
 * The loop body runs inside a recovery shell: an exception bumps the
 * consecutive error count and sleeps min(cap, base * 2^errors + jitter)
 * instead; a successful tick resets the count. Reaching
 * max_consecutive_errors ends the thread, which the health supervisor
 * observes through IsAlive().
 */
class NotifierTask {
 public:
  using TickFn = std::function<std::chrono::microseconds()>;

  NotifierTask(std::string name, TickFn tick, NotifierOptions options);
  ~NotifierTask();

  NotifierTask(const NotifierTask&) = delete;
  NotifierTask& operator=(const NotifierTask&) = delete;

  void Start();
  void Stop();

  // Re-run the tick now (a waiter was queued or re-armed)
  void Wake();

  bool IsAlive() const { return alive_.load(); }
  int GetConsecutiveErrors() const { return consecutive_errors_.load(); }
  const std::string& GetName() const { return name_; }

  std::chrono::milliseconds BackoffFor(int consecutive_errors);

 private:
  void Run();

  std::string name_;
  TickFn tick_;
  NotifierOptions options_;

  std::atomic<bool> running_{false};
  std::atomic<bool> alive_{false};
  std::atomic<int> consecutive_errors_{0};
  std::thread thread_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool wake_pending_{false};

  std::mt19937 rng_{std::random_device{}()};
};

}  // namespace pacer
