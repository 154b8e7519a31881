#include "turbonet/server-stats.hpp"

#include <gtest/gtest.h>

#include <string>

namespace turbonet {

TEST(ServerStatsTest, JsonContainsAllFields) {
  ServerStats stats;
  stats.totalRequestsServed = 42;
  stats.cacheHits = 7;
  const std::string json = stats.json_str();
  EXPECT_EQ(json.front(), '{');
  EXPECT_EQ(json.back(), '}');
  EXPECT_NE(json.find("\"totalRequestsServed\":42"), std::string::npos);
  EXPECT_NE(json.find("\"cacheHits\":7"), std::string::npos);
  EXPECT_NE(json.find("\"connectionsAccepted\":0,"), std::string::npos);
  EXPECT_EQ(json.find(",,"), std::string::npos);
}

TEST(ServerStatsTest, Aggregation) {
  ServerStats lhs;
  lhs.webSocketMessagesDropped = 2;
  ServerStats rhs;
  rhs.webSocketMessagesDropped = 3;
  rhs.handlerFailures = 1;
  lhs.maxConnectionOutboundBuffer = 4096;
  rhs.maxConnectionOutboundBuffer = 1024;
  rhs.outboundOverflowCloses = 2;
  lhs += rhs;
  EXPECT_EQ(lhs.webSocketMessagesDropped, 5U);
  EXPECT_EQ(lhs.handlerFailures, 1U);
  EXPECT_EQ(lhs.outboundOverflowCloses, 2U);
  // a high-water mark, not a sum
  EXPECT_EQ(lhs.maxConnectionOutboundBuffer, 4096U);
}

}  // namespace turbonet
