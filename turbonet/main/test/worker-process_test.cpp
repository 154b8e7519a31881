#include "turbonet/worker-process.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <string>

#include "turbonet/app.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/server-config.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/test-util.hpp"

namespace turbonet {

using namespace std::chrono_literals;

TEST(WorkerProcessTest, SeveralLoopsShareOnePort) {
  App app(ServerConfig{}
              .withHost("127.0.0.1")
              .withPort(0)
              .withNbWorkers(1)
              .withEventLoopThreads(3)
              .withPollInterval(10ms)
              .withLogLevel("warn"));
  app.route("/ping", http::Method::GET, [](const HttpRequest&) { return "pong"; });

  WorkerProcess process(app.freeze());
  ASSERT_NE(process.port(), 0);

  auto statsFuture = std::async(std::launch::async, [&process] { return process.run(); });

  static constexpr int kNbRequests = 12;
  for (int requestIdx = 0; requestIdx < kNbRequests; ++requestIdx) {
    const std::string resp = test::simpleGet(process.port(), "/ping");
    EXPECT_EQ(test::statusCode(resp), 200);
    EXPECT_EQ(test::responseBody(resp), "pong");
  }

  process.stop();
  const ServerStats stats = statsFuture.get();
  EXPECT_EQ(stats.connectionsAccepted, static_cast<uint64_t>(kNbRequests));
  EXPECT_EQ(stats.totalRequestsServed, static_cast<uint64_t>(kNbRequests));
}

TEST(WorkerProcessTest, StopBeforeTrafficReturnsEmptyStats) {
  App app(ServerConfig{}.withHost("127.0.0.1").withPort(0).withNbWorkers(1).withEventLoopThreads(2).withPollInterval(
      10ms));
  WorkerProcess process(app.freeze());

  auto statsFuture = std::async(std::launch::async, [&process] { return process.run(); });
  process.stop();
  const ServerStats stats = statsFuture.get();
  EXPECT_EQ(stats.connectionsAccepted, 0U);
  EXPECT_EQ(stats.totalRequestsServed, 0U);
}

}  // namespace turbonet
