#include "turbonet/server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <stdexcept>

#include "turbonet/rate-limit-config.hpp"
#include "turbonet/websocket-config.hpp"

namespace turbonet {

TEST(ServerConfigTest, DefaultIsValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_GE(config.effectiveNbWorkers(), 1U);
}

TEST(ServerConfigTest, BuildersChain) {
  ServerConfig config;
  config.withPort(9000).withNbWorkers(3).withEventLoopThreads(2).withFreeThreaded().withDebugMode().withLogLevel(
      "debug");
  EXPECT_EQ(config.port, 9000);
  EXPECT_EQ(config.effectiveNbWorkers(), 3U);
  EXPECT_EQ(config.eventLoopThreads, 2U);
  EXPECT_TRUE(config.freeThreaded);
  EXPECT_TRUE(config.debugMode);
  EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfigTest, InvalidValues) {
  EXPECT_THROW(ServerConfig{}.withEventLoopThreads(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxHeaderBytes(10).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxBodyBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withPollInterval(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withDefaultCacheTtl(std::chrono::milliseconds{0}).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withLogLevel("loud").validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withPort(0).withNbWorkers(2).validate(), std::invalid_argument);
  EXPECT_NO_THROW(ServerConfig{}.withPort(0).withNbWorkers(1).validate());
  EXPECT_NO_THROW(ServerConfig{}.withLogLevel("off").validate());
}

TEST(ServerConfigTest, MaxOutboundBufferBytes) {
  EXPECT_EQ(ServerConfig{}.maxOutboundBufferBytes, std::size_t{4} << 20);
  EXPECT_THROW(ServerConfig{}.withMaxOutboundBufferBytes(0).validate(), std::invalid_argument);
  EXPECT_THROW(ServerConfig{}.withMaxOutboundBufferBytes(1023).validate(), std::invalid_argument);
  EXPECT_NO_THROW(ServerConfig{}.withMaxOutboundBufferBytes(1024).validate());
}

TEST(ServerConfigTest, RateLimitValidatedOnlyWhenEnabled) {
  ServerConfig config;
  config.rateLimit.capacity = 0;
  EXPECT_NO_THROW(config.validate());
  config.rateLimit.enabled = true;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST(RateLimitConfigTest, Validate) {
  EXPECT_NO_THROW(RateLimitConfig{}.withCapacity(10).withRefillRate(5).validate());
  EXPECT_THROW(RateLimitConfig{}.withRefillRate(0).validate(), std::invalid_argument);
  EXPECT_THROW(RateLimitConfig{}.withCapacity(0.5).validate(), std::invalid_argument);
  EXPECT_THROW(RateLimitConfig{}.withIdleRetention(std::chrono::milliseconds{-1}).validate(), std::invalid_argument);
}

TEST(WebSocketConfigTest, Validate) {
  EXPECT_NO_THROW(WebSocketConfig{}.validate());
  EXPECT_THROW(
      WebSocketConfig{}.withHeartbeatInterval(std::chrono::seconds{30}).withTimeout(std::chrono::seconds{10}).validate(),
      std::invalid_argument);
  // disabled timeout does not constrain the heartbeat
  EXPECT_NO_THROW(
      WebSocketConfig{}.withHeartbeatInterval(std::chrono::seconds{30}).withTimeout(std::chrono::seconds{0}).validate());
  EXPECT_THROW(WebSocketConfig{}.withCloseTimeout(std::chrono::milliseconds{-5}).validate(), std::invalid_argument);
}

}  // namespace turbonet
