#include "permit.hpp"

#include <spdlog/spdlog.h>

namespace pacer {

Permit::~Permit() {
  if (!registry_) {
    return;
  }
  try {
    registry_->Release(group_);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Permit release for {} failed: {}", ToString(group_), e.what());
  }
}

Permit::Permit(Permit&& other) noexcept
    : registry_(std::move(other.registry_)), group_(other.group_), clock_(other.clock_) {
  other.registry_.reset();
}

Permit& Permit::operator=(Permit&& other) noexcept {
  if (this != &other) {
    Release();
    registry_ = std::move(other.registry_);
    group_ = other.group_;
    clock_ = other.clock_;
    other.registry_.reset();
  }
  return *this;
}

void Permit::Commit() {
  if (!registry_) {
    return;
  }
  Commit(clock_->Now());
}

void Permit::Commit(double completed_at) {
  if (!registry_) {
    return;
  }
  auto registry = std::move(registry_);
  registry_.reset();
  registry->Commit(group_, completed_at);
}

void Permit::Release() {
  if (!registry_) {
    return;
  }
  auto registry = std::move(registry_);
  registry_.reset();
  registry->Release(group_);
}

}  // namespace pacer
