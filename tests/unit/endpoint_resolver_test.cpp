#include <gtest/gtest.h>

#include "engine/common/config_manager.hpp"
#include "engine/limiter/endpoint_resolver.hpp"
#include "engine/limiter/limiter_errors.hpp"

using namespace pacer;
using pacer::engine::common::ConfigManager;

TEST(EndpointResolverTest, ExactMethodBeatsAnyMethod) {
  PrefixEndpointResolver resolver;
  resolver.AddExact("/v1/orders", "", RateLimitGroup::REST_PRIVATE_DEFAULT);
  resolver.AddExact("/v1/orders", "post", RateLimitGroup::REST_PRIVATE_ORDER);
  resolver.AddExact("/v1/orders", "DELETE", RateLimitGroup::REST_PRIVATE_CANCEL_ALL);

  EXPECT_EQ(resolver.Resolve("/v1/orders", "POST"), RateLimitGroup::REST_PRIVATE_ORDER);
  EXPECT_EQ(resolver.Resolve("/v1/orders", "delete"), RateLimitGroup::REST_PRIVATE_CANCEL_ALL);
  EXPECT_EQ(resolver.Resolve("/v1/orders", "GET"), RateLimitGroup::REST_PRIVATE_DEFAULT);
}

TEST(EndpointResolverTest, LongestPrefixWins) {
  PrefixEndpointResolver resolver;
  resolver.AddPrefix("/v1", RateLimitGroup::REST_PRIVATE_DEFAULT);
  resolver.AddPrefix("/v1/market", RateLimitGroup::REST_PUBLIC);
  resolver.AddExact("/v1/market/ws", "", RateLimitGroup::WEBSOCKET);

  EXPECT_EQ(resolver.Resolve("/v1/market/ticker", "GET"), RateLimitGroup::REST_PUBLIC);
  EXPECT_EQ(resolver.Resolve("/v1/account", "GET"), RateLimitGroup::REST_PRIVATE_DEFAULT);
  EXPECT_EQ(resolver.Resolve("/v1/market/ws", "GET"), RateLimitGroup::WEBSOCKET);
  EXPECT_EQ(resolver.RuleCount(), 3u);
}

TEST(EndpointResolverTest, UnmappedPathNeedsDefault) {
  PrefixEndpointResolver resolver;
  resolver.AddPrefix("/v1/market", RateLimitGroup::REST_PUBLIC);
  EXPECT_THROW(resolver.Resolve("/v2/other", "GET"), ConfigurationError);

  resolver.SetDefaultGroup(RateLimitGroup::REST_PRIVATE_DEFAULT);
  EXPECT_EQ(resolver.Resolve("/v2/other", "GET"), RateLimitGroup::REST_PRIVATE_DEFAULT);
}

TEST(EndpointResolverTest, LoadsRulesFromConfig) {
  ConfigManager config;
  ASSERT_TRUE(config.LoadFromString(R"({
    "limiter": {
      "endpoints": [
        {"path": "/v1/orders", "method": "POST", "group": "rest_private_order"},
        {"path": "/v1/orders/cancel-all", "group": "rest_private_cancel_all"},
        {"prefix": "/v1/market", "group": "rest_public"}
      ],
      "default_group": "rest_private_default"
    }
  })"));

  PrefixEndpointResolver resolver = PrefixEndpointResolver::FromConfig(config);
  EXPECT_EQ(resolver.RuleCount(), 3u);
  EXPECT_EQ(resolver.Resolve("/v1/orders", "POST"), RateLimitGroup::REST_PRIVATE_ORDER);
  EXPECT_EQ(resolver.Resolve("/v1/orders/cancel-all", "DELETE"), RateLimitGroup::REST_PRIVATE_CANCEL_ALL);
  EXPECT_EQ(resolver.Resolve("/v1/market/depth", "GET"), RateLimitGroup::REST_PUBLIC);
  EXPECT_EQ(resolver.Resolve("/v1/orders", "GET"), RateLimitGroup::REST_PRIVATE_DEFAULT);
}

TEST(EndpointResolverTest, MalformedConfigRejected) {
  ConfigManager no_group;
  ASSERT_TRUE(no_group.LoadFromString(R"({"limiter": {"endpoints": [{"path": "/v1/x"}]}})"));
  EXPECT_THROW(PrefixEndpointResolver::FromConfig(no_group), ConfigurationError);

  ConfigManager unknown_group;
  ASSERT_TRUE(unknown_group.LoadFromString(R"({"limiter": {"endpoints": [{"prefix": "/v1", "group": "bogus"}]}})"));
  EXPECT_THROW(PrefixEndpointResolver::FromConfig(unknown_group), ConfigurationError);

  ConfigManager not_array;
  ASSERT_TRUE(not_array.LoadFromString(R"({"limiter": {"endpoints": {"path": "/v1/x"}}})"));
  EXPECT_THROW(PrefixEndpointResolver::FromConfig(not_array), ConfigurationError);

  ConfigManager no_target;
  ASSERT_TRUE(no_target.LoadFromString(R"({"limiter": {"endpoints": [{"group": "rest_public"}]}})"));
  EXPECT_THROW(PrefixEndpointResolver::FromConfig(no_target), ConfigurationError);
}
