#include "event_thread.hpp"

#include <spdlog/spdlog.h>

namespace pacer {
namespace engine {
namespace common {

//==============================================================================
// Lifecycle
//==============================================================================

EventThread::EventThread(std::string name) : name_(std::move(name)) {
}

EventThread::~EventThread() {
  Stop();
}

//==============================================================================
// Thread control
//==============================================================================

void EventThread::Start() {
  if (running_.exchange(true)) {
    return;  // Already running
  }
  thread_ = std::thread(&EventThread::Run, this);
}

void EventThread::Stop() {
  if (!running_.exchange(false)) {
    return;  // Already stopped
  }

  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  delayed_tasks_ = {};
  periodic_tasks_ = {};
  pending_delayed_ids_.clear();
  cancelled_ids_.clear();
  SPDLOG_DEBUG("EventThread {} stopped", name_);
}

//==============================================================================
// Task posting
//==============================================================================

void EventThread::Post(std::function<void()> task) {
  if (!running_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    task_queue_.push(std::move(task));
  }
  cv_.notify_one();
}

int EventThread::PostDelayed(std::function<void()> task, std::chrono::milliseconds delay) {
  if (!running_.load()) {
    return -1;
  }

  int id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_task_id_++;
    delayed_tasks_.push(DelayedTask{id, std::move(task), std::chrono::steady_clock::now() + delay});
    pending_delayed_ids_.insert(id);
  }
  cv_.notify_one();
  return id;
}

bool EventThread::CancelDelayed(int task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_delayed_ids_.erase(task_id) == 0) {
    return false;
  }
  cancelled_ids_.insert(task_id);
  return true;
}

int EventThread::SchedulePeriodic(std::function<void()> task, std::chrono::milliseconds interval) {
  if (!running_.load()) {
    return -1;
  }

  int id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_task_id_++;
    periodic_tasks_.push(
        PeriodicTask{id, std::move(task), interval, std::chrono::steady_clock::now() + interval});
  }
  cv_.notify_one();
  return id;
}

void EventThread::CancelPeriodic(int task_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ids_.insert(task_id);
}

//==============================================================================
// Monitoring
//==============================================================================

size_t EventThread::GetQueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return task_queue_.size() + pending_delayed_ids_.size() + periodic_tasks_.size();
}

//==============================================================================
// Event loop (protected)
//==============================================================================

void EventThread::Run() {
  SPDLOG_DEBUG("EventThread {} started", name_);

  while (running_.load()) {
    ProcessTasks();

    std::unique_lock<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    auto next_wake = now + std::chrono::milliseconds(100);  // Default timeout
    if (!delayed_tasks_.empty() && delayed_tasks_.top().execute_at < next_wake) {
      next_wake = delayed_tasks_.top().execute_at;
    }
    if (!periodic_tasks_.empty() && periodic_tasks_.top().next_run < next_wake) {
      next_wake = periodic_tasks_.top().next_run;
    }

    if (next_wake > now) {
      cv_.wait_until(lock, next_wake, [this, next_wake] {
        return !running_.load() || !task_queue_.empty() ||
               (!delayed_tasks_.empty() && delayed_tasks_.top().execute_at < next_wake) ||
               (!periodic_tasks_.empty() && periodic_tasks_.top().next_run < next_wake);
      });
    }
  }

  // Drain immediate tasks so posted cleanups still run
  ProcessTasks();
}

void EventThread::Execute(const std::function<void()>& task, const char* kind) {
  try {
    task();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("EventThread {} {} task exception: {}", name_, kind, e.what());
  }
}

void EventThread::ProcessTasks() {
  // Immediate tasks
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (task_queue_.empty()) {
        break;
      }
      task = std::move(task_queue_.front());
      task_queue_.pop();
    }
    Execute(task, "immediate");
  }

  // Delayed tasks that are due
  auto now = std::chrono::steady_clock::now();
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (delayed_tasks_.empty() || delayed_tasks_.top().execute_at > now) {
        break;
      }
      DelayedTask delayed = delayed_tasks_.top();
      delayed_tasks_.pop();
      if (cancelled_ids_.erase(delayed.id) > 0) {
        continue;
      }
      pending_delayed_ids_.erase(delayed.id);
      task = std::move(delayed.task);
    }
    Execute(task, "delayed");
  }

  // Periodic tasks that are due
  while (true) {
    std::function<void()> task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (periodic_tasks_.empty() || periodic_tasks_.top().next_run > now) {
        break;
      }
      PeriodicTask periodic = periodic_tasks_.top();
      periodic_tasks_.pop();
      if (cancelled_ids_.erase(periodic.id) > 0) {
        continue;
      }
      task = periodic.task;
      periodic.next_run = now + periodic.interval;
      periodic_tasks_.push(std::move(periodic));
    }
    Execute(task, "periodic");
  }
}

}  // namespace common
}  // namespace engine
}  // namespace pacer
