#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/common/config_manager.hpp"
#include "rate_limit_group.hpp"

namespace pacer {

// Maps a concrete API path and HTTP method to the group that limits it
class EndpointResolver {
 public:
  virtual ~EndpointResolver() = default;

  // Throws ConfigurationError when no rule and no default group match
  virtual RateLimitGroup Resolve(const std::string& path, const std::string& method) const = 0;
};

/**
 * @brief Rule table resolver
 *
 * Exact (path, method) rules win, then the longest matching path prefix,
 * then the default group. Methods compare case-insensitively; an exact
 * rule with an empty method matches any method.
 *
 * Config: limiter.endpoints = [{"path": "/v1/orders", "method": "POST",
 * "group": "rest_private_order"}, {"prefix": "/v1/market", "group":
 * "rest_public"}], limiter.default_group = "rest_private_default".
 */
class PrefixEndpointResolver : public EndpointResolver {
 public:
  PrefixEndpointResolver() = default;

  static PrefixEndpointResolver FromConfig(const engine::common::ConfigManager& config);

  void AddExact(const std::string& path, const std::string& method, RateLimitGroup group);
  void AddPrefix(const std::string& prefix, RateLimitGroup group);
  void SetDefaultGroup(RateLimitGroup group) { default_group_ = group; }

  RateLimitGroup Resolve(const std::string& path, const std::string& method) const override;

  size_t RuleCount() const { return exact_.size() + prefixes_.size(); }

 private:
  std::map<std::pair<std::string, std::string>, RateLimitGroup> exact_;
  std::vector<std::pair<std::string, RateLimitGroup>> prefixes_;  ///< longest first
  std::optional<RateLimitGroup> default_group_;
};

}  // namespace pacer
