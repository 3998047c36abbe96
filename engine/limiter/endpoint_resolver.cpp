#include "endpoint_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "limiter_errors.hpp"

namespace pacer {

namespace {

std::string ToUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

}  // namespace

PrefixEndpointResolver PrefixEndpointResolver::FromConfig(const engine::common::ConfigManager& config) {
  PrefixEndpointResolver resolver;

  nlohmann::json endpoints = config.GetNodeValue("limiter.endpoints");
  if (!endpoints.is_null()) {
    if (!endpoints.is_array()) {
      throw ConfigurationError("limiter.endpoints must be an array");
    }
    for (const auto& entry : endpoints) {
      if (!entry.is_object() || !entry.contains("group")) {
        throw ConfigurationError("limiter.endpoints entry needs a group: " + entry.dump());
      }
      RateLimitGroup group = RateLimitGroupFromString(entry.at("group").get<std::string>());
      if (entry.contains("prefix")) {
        resolver.AddPrefix(entry.at("prefix").get<std::string>(), group);
      } else if (entry.contains("path")) {
        resolver.AddExact(entry.at("path").get<std::string>(), entry.value("method", std::string()), group);
      } else {
        throw ConfigurationError("limiter.endpoints entry needs a path or prefix: " + entry.dump());
      }
    }
  }

  std::string default_group = config.GetString("limiter.default_group", "");
  if (!default_group.empty()) {
    resolver.SetDefaultGroup(RateLimitGroupFromString(default_group));
  }

  SPDLOG_DEBUG("Endpoint resolver loaded {} rules (default={})", resolver.RuleCount(),
               default_group.empty() ? "none" : default_group);
  return resolver;
}

void PrefixEndpointResolver::AddExact(const std::string& path, const std::string& method, RateLimitGroup group) {
  exact_[{path, ToUpper(method)}] = group;
}

void PrefixEndpointResolver::AddPrefix(const std::string& prefix, RateLimitGroup group) {
  prefixes_.emplace_back(prefix, group);
  std::stable_sort(prefixes_.begin(), prefixes_.end(),
                   [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

RateLimitGroup PrefixEndpointResolver::Resolve(const std::string& path, const std::string& method) const {
  auto it = exact_.find({path, ToUpper(method)});
  if (it != exact_.end()) {
    return it->second;
  }
  it = exact_.find({path, std::string()});
  if (it != exact_.end()) {
    return it->second;
  }

  for (const auto& [prefix, group] : prefixes_) {
    if (path.compare(0, prefix.size(), prefix) == 0) {
      return group;
    }
  }

  if (default_group_) {
    return *default_group_;
  }
  throw ConfigurationError("no rate limit group mapped for " + ToUpper(method) + " " + path);
}

}  // namespace pacer
