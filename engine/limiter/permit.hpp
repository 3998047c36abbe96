#pragma once

#include <memory>

#include "engine/common/clock.hpp"
#include "group_registry.hpp"

namespace pacer {

/**
 * @brief A granted admission holding reserved burst slot(s)
 *
 * Commit once the underlying call has completed successfully; the
 * completion time then enters the burst window. A failed call should
 * Release instead. Destroying a permit that was neither committed nor
 * released releases it.
 */
class Permit {
 public:
  Permit() = default;
  Permit(std::shared_ptr<GroupRegistry> registry, RateLimitGroup group, const engine::common::Clock& clock)
      : registry_(std::move(registry)), group_(group), clock_(&clock) {}
  ~Permit();

  Permit(Permit&& other) noexcept;
  Permit& operator=(Permit&& other) noexcept;
  Permit(const Permit&) = delete;
  Permit& operator=(const Permit&) = delete;

  bool IsValid() const { return registry_ != nullptr; }
  explicit operator bool() const { return IsValid(); }

  RateLimitGroup GetGroup() const { return group_; }

  // Records completion at the clock's current time; no-op on an empty permit
  void Commit();
  void Commit(double completed_at);

  void Release();

 private:
  std::shared_ptr<GroupRegistry> registry_;
  RateLimitGroup group_{RateLimitGroup::REST_PUBLIC};
  const engine::common::Clock* clock_{nullptr};
};

}  // namespace pacer
