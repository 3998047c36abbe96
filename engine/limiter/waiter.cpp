#include "waiter.hpp"

namespace pacer {

std::string ToString(WaiterState state) {
  switch (state) {
    case WaiterState::WAITING:
      return "WAITING";
    case WaiterState::READY:
      return "READY";
    case WaiterState::CANCELLED:
      return "CANCELLED";
    case WaiterState::COMPLETED:
      return "COMPLETED";
  }
  return "UNKNOWN";
}

std::string ToString(WakeReason reason) {
  switch (reason) {
    case WakeReason::NONE:
      return "NONE";
    case WakeReason::READY:
      return "READY";
    case WakeReason::TIMEOUT:
      return "TIMEOUT";
    case WakeReason::CANCELLED:
      return "CANCELLED";
    case WakeReason::FORCE_RELEASED:
      return "FORCE_RELEASED";
    case WakeReason::SHUTDOWN:
      return "SHUTDOWN";
  }
  return "UNKNOWN";
}

double Waiter::GetReadyAt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ready_at_;
}

WaiterState Waiter::GetState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

WakeReason Waiter::GetWakeReason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reason_;
}

bool Waiter::WakeIfDue(double now) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != WaiterState::WAITING || ready_at_ > now) {
      return false;
    }
    state_ = WaiterState::READY;
    reason_ = WakeReason::READY;
  }
  cv_.notify_all();
  return true;
}

bool Waiter::Signal(WakeReason reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == WaiterState::CANCELLED || state_ == WaiterState::COMPLETED) {
      return false;
    }
    if (state_ == WaiterState::READY && reason_ != WakeReason::READY) {
      return false;
    }
    switch (reason) {
      case WakeReason::NONE:
        return false;
      case WakeReason::READY:
        if (state_ != WaiterState::WAITING) {
          return false;
        }
        state_ = WaiterState::READY;
        break;
      case WakeReason::FORCE_RELEASED:
        state_ = WaiterState::READY;
        break;
      case WakeReason::TIMEOUT:
      case WakeReason::CANCELLED:
      case WakeReason::SHUTDOWN:
        state_ = WaiterState::CANCELLED;
        break;
    }
    reason_ = reason;
  }
  cv_.notify_all();
  return true;
}

bool Waiter::Rearm(double ready_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != WaiterState::READY || reason_ != WakeReason::READY) {
    return false;
  }
  state_ = WaiterState::WAITING;
  reason_ = WakeReason::NONE;
  ready_at_ = ready_at;
  return true;
}

void Waiter::Complete() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = WaiterState::COMPLETED;
  }
  cv_.notify_all();
}

WakeReason Waiter::Wait() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return state_ != WaiterState::WAITING; });
  return reason_;
}

}  // namespace pacer
