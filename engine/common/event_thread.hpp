#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace pacer {
namespace engine {
namespace common {

/**
 * @brief Single-threaded event loop for asynchronous task processing
 *
 * Supports immediate, delayed, and periodic task execution.
 * Thread-safe task posting from any thread. Delayed and periodic tasks
 * return an ID that can be cancelled before they run.
 */
class EventThread {
 public:
  // Lifecycle
  explicit EventThread(std::string name = "event_thread");
  virtual ~EventThread();

  // Non-copyable, non-movable (the worker thread captures this)
  EventThread(const EventThread&) = delete;
  EventThread& operator=(const EventThread&) = delete;

  // Thread control
  /** @brief Start event loop thread */
  void Start();

  /** @brief Stop event loop, pending delayed/periodic tasks are dropped */
  void Stop();

  /** @brief Check if thread is running */
  bool IsRunning() const { return running_.load(); }

  const std::string& GetName() const { return name_; }

  // Task posting
  /** @brief Post task for immediate execution */
  void Post(std::function<void()> task);

  /** @brief Post task with delay, returns task ID (-1 if not running) */
  int PostDelayed(std::function<void()> task, std::chrono::milliseconds delay);

  /** @brief Cancel a delayed task, returns false if it already ran or is unknown */
  bool CancelDelayed(int task_id);

  /** @brief Schedule periodic task, returns task ID (-1 if not running) */
  int SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval);

  /** @brief Cancel periodic task by ID */
  void CancelPeriodic(int task_id);

  // Monitoring
  /** @brief Get current queue depth (all task types) */
  size_t GetQueueDepth() const;

 protected:
  /** @brief Delayed task with execution time */
  struct DelayedTask {
    int id;
    std::function<void()> task;
    std::chrono::steady_clock::time_point execute_at;

    bool operator<(const DelayedTask& other) const {
      return execute_at > other.execute_at;  // Min-heap
    }
  };

  /** @brief Periodic task with interval */
  struct PeriodicTask {
    int id;
    std::function<void()> task;
    std::chrono::milliseconds interval;
    std::chrono::steady_clock::time_point next_run;

    bool operator<(const PeriodicTask& other) const {
      return next_run > other.next_run;  // Min-heap
    }
  };

  /** @brief Main event loop (runs in thread_) */
  virtual void Run();

  /** @brief Process ready tasks from all queues */
  void ProcessTasks();

  /** @brief Run one task, logging instead of propagating failures */
  void Execute(const std::function<void()>& task, const char* kind);

  std::string name_;
  std::atomic<bool> running_{false};
  std::thread thread_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int next_task_id_{1};
  std::queue<std::function<void()>> task_queue_;
  std::priority_queue<DelayedTask> delayed_tasks_;
  std::priority_queue<PeriodicTask> periodic_tasks_;
  std::unordered_set<int> pending_delayed_ids_;
  std::unordered_set<int> cancelled_ids_;
};

}  // namespace common
}  // namespace engine
}  // namespace pacer
