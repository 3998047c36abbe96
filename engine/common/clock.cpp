#include "clock.hpp"

namespace pacer {
namespace engine {
namespace common {

double SteadyClock::Now() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now().time_since_epoch()).count();
}

const SteadyClock& SteadyClock::Instance() {
  static const SteadyClock instance;
  return instance;
}

}  // namespace common
}  // namespace engine
}  // namespace pacer
