#pragma once

#include <chrono>

namespace pacer {
namespace engine {
namespace common {

// Monotonic time source in seconds. Only differences between readings are
// meaningful; the epoch is whatever the implementation picks.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual double Now() const = 0;
};

// steady_clock backed, the default for production use
class SteadyClock : public Clock {
 public:
  double Now() const override;

  static const SteadyClock& Instance();
};

// Convert a (possibly fractional) number of seconds into a chrono duration
inline std::chrono::microseconds ToMicros(double seconds) {
  return std::chrono::microseconds(static_cast<long long>(seconds * 1e6));
}

}  // namespace common
}  // namespace engine
}  // namespace pacer
