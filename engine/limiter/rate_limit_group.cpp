#include "rate_limit_group.hpp"

#include "limiter_errors.hpp"

namespace pacer {

const std::array<RateLimitGroup, kRateLimitGroupCount>& AllRateLimitGroups() {
  static const std::array<RateLimitGroup, kRateLimitGroupCount> groups = {
      RateLimitGroup::REST_PUBLIC,
      RateLimitGroup::REST_PRIVATE_DEFAULT,
      RateLimitGroup::REST_PRIVATE_ORDER,
      RateLimitGroup::REST_PRIVATE_CANCEL_ALL,
      RateLimitGroup::WEBSOCKET,
  };
  return groups;
}

std::string ToString(RateLimitGroup group) {
  switch (group) {
    case RateLimitGroup::REST_PUBLIC:
      return "rest_public";
    case RateLimitGroup::REST_PRIVATE_DEFAULT:
      return "rest_private_default";
    case RateLimitGroup::REST_PRIVATE_ORDER:
      return "rest_private_order";
    case RateLimitGroup::REST_PRIVATE_CANCEL_ALL:
      return "rest_private_cancel_all";
    case RateLimitGroup::WEBSOCKET:
      return "websocket";
  }
  return "unknown";
}

bool ParseRateLimitGroup(const std::string& name, RateLimitGroup* group) {
  for (RateLimitGroup candidate : AllRateLimitGroups()) {
    if (ToString(candidate) == name) {
      *group = candidate;
      return true;
    }
  }
  return false;
}

RateLimitGroup RateLimitGroupFromString(const std::string& name) {
  RateLimitGroup group;
  if (!ParseRateLimitGroup(name, &group)) {
    throw ConfigurationError("unknown rate limit group: '" + name + "'");
  }
  return group;
}

size_t GroupIndex(RateLimitGroup group) {
  auto index = static_cast<size_t>(group);
  if (index >= kRateLimitGroupCount) {
    throw ConfigurationError("rate limit group out of range: " + std::to_string(index));
  }
  return index;
}

}  // namespace pacer
