#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace pacer {

// Closed set of provider rate-limit categories
enum class RateLimitGroup {
  REST_PUBLIC,
  REST_PRIVATE_DEFAULT,
  REST_PRIVATE_ORDER,
  REST_PRIVATE_CANCEL_ALL,
  WEBSOCKET
};

constexpr size_t kRateLimitGroupCount = 5;

const std::array<RateLimitGroup, kRateLimitGroupCount>& AllRateLimitGroups();

// Config/log name, e.g. "rest_public"
std::string ToString(RateLimitGroup group);

// Returns false for unknown names
bool ParseRateLimitGroup(const std::string& name, RateLimitGroup* group);

// Throws ConfigurationError for unknown names
RateLimitGroup RateLimitGroupFromString(const std::string& name);

// Dense index for per-group arrays; throws ConfigurationError if out of range
size_t GroupIndex(RateLimitGroup group);

}  // namespace pacer
