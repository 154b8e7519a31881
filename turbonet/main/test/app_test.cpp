#include "turbonet/app.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "turbonet/handler-result.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/middleware.hpp"
#include "turbonet/router.hpp"
#include "turbonet/server-config.hpp"
#include "turbonet/server-context.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-endpoint.hpp"

namespace turbonet {

namespace {

HandlerResult Hello(const HttpRequest&) { return "hello"; }

}  // namespace

class AppTest : public ::testing::Test {
 protected:
  App app{ServerConfig{}.withPort(0).withNbWorkers(1)};
};

TEST_F(AppTest, RegistrationBuildsTheSnapshot) {
  app.route("/users/<int:id>", http::Method::GET, Hello)
      .turboRoute("/ping", http::Method::GET, Hello, std::chrono::seconds{5})
      .staticRoute("/robots.txt", "User-agent: *\n")
      .nativeWebSocket("/echo", websocket::NativeMode::Echo)
      .before([](HttpRequest&) { return MiddlewareResult::Continue(); })
      .after([](const HttpRequest&, HttpResponse&) {});

  ServerContext& context = app.freeze();
  const RouteTable& table = *context.routeTable();
  ASSERT_EQ(table.router.size(), 3U);
  ASSERT_EQ(table.targets.size(), 3U);
  EXPECT_EQ(table.router.route(0).mode, RouteMode::Standard);
  EXPECT_EQ(table.router.route(1).mode, RouteMode::Turbo);
  ASSERT_TRUE(table.router.route(1).cacheTtl);
  EXPECT_EQ(table.router.route(1).cacheTtl->count(), 5000);
  EXPECT_TRUE(table.targets[1].handler);
  ASSERT_TRUE(table.targets[2].staticResponse);
  EXPECT_EQ(table.targets[2].staticResponse->body(), "User-agent: *\n");
  EXPECT_EQ(table.requestMiddlewares.size(), 1U);
  EXPECT_EQ(table.responseMiddlewares.size(), 1U);

  ASSERT_EQ(context.webSocketRoutes().size(), 1U);
  const auto echoIdx = context.findWebSocketRoute("/echo");
  ASSERT_TRUE(echoIdx);
  EXPECT_EQ(*echoIdx, 0U);
  EXPECT_FALSE(context.findWebSocketRoute("/echo/"));
}

TEST_F(AppTest, StaticRouteAnswersGetAndHead) {
  app.staticRoute("/version", "1.0");
  const Router& router = app.freeze().routeTable()->router;
  EXPECT_TRUE(router.match(http::Method::GET, "/version").matched());
  EXPECT_TRUE(router.match(http::Method::HEAD, "/version").matched());
  EXPECT_EQ(router.match(http::Method::POST, "/version").status, RoutingResult::Status::MethodNotAllowed);
}

TEST_F(AppTest, RouteConflicts) {
  app.route("/items/<int:id>", http::Method::GET, Hello);
  EXPECT_THROW(app.route("/items/<int:other>", http::Method::GET, Hello), RouteConflictError);
  EXPECT_THROW(app.turboRoute("/items/<int:id>", http::Method::GET | http::Method::POST, Hello), RouteConflictError);
  EXPECT_NO_THROW(app.route("/items/<int:id>", http::Method::DELETE, Hello));
  EXPECT_NO_THROW(app.route("/items/<string:name>", http::Method::GET, Hello));

  app.websocket("/chat", websocket::WebSocketHandlers{});
  EXPECT_THROW(app.nativeWebSocket("/chat", websocket::NativeMode::Broadcast), RouteConflictError);
}

TEST_F(AppTest, InvalidRegistrations) {
  EXPECT_THROW(app.route("no-slash", http::Method::GET, Hello), std::invalid_argument);
  EXPECT_THROW(app.route("/empty", http::Method::GET, RequestHandler{}), std::invalid_argument);
  EXPECT_THROW(app.turboRoute("/neg", http::Method::GET, Hello, std::chrono::milliseconds{-1}),
               std::invalid_argument);
  EXPECT_THROW(app.staticRoute("/files/<path:rest>", "x"), std::invalid_argument);
  EXPECT_THROW(app.nativeWebSocket("ws", websocket::NativeMode::Echo), std::invalid_argument);
  EXPECT_THROW(app.nativeWebSocket("/ws", websocket::NativeMode::Echo,
                                   WebSocketConfig{}.withHeartbeatInterval(std::chrono::seconds{90})),
               std::invalid_argument);
}

TEST_F(AppTest, RegistrationClosedOnceFrozen) {
  app.route("/a", http::Method::GET, Hello);
  EXPECT_FALSE(app.frozen());
  ServerContext& context = app.freeze();
  EXPECT_TRUE(app.frozen());
  EXPECT_EQ(&context, &app.freeze());

  EXPECT_THROW(app.route("/b", http::Method::GET, Hello), std::logic_error);
  EXPECT_THROW(app.staticRoute("/c", "c"), std::logic_error);
  EXPECT_THROW(app.nativeWebSocket("/d", websocket::NativeMode::Echo), std::logic_error);
  EXPECT_THROW(app.before([](HttpRequest&) { return MiddlewareResult::Continue(); }), std::logic_error);
  EXPECT_THROW((void)app.config(), std::logic_error);
}

TEST(AppFreezeTest, InvalidConfigurationKeepsRegistrationOpen) {
  App app(ServerConfig{}.withPort(0).withNbWorkers(2));
  app.route("/a", http::Method::GET, Hello);
  EXPECT_THROW(app.freeze(), std::invalid_argument);
  EXPECT_FALSE(app.frozen());

  app.config().withNbWorkers(1);
  EXPECT_EQ(app.freeze().routeTable()->router.size(), 1U);
}

}  // namespace turbonet
