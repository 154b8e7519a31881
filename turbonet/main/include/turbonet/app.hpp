#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "turbonet/dispatch-engine.hpp"
#include "turbonet/handler-bridge.hpp"
#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/middleware.hpp"
#include "turbonet/server-config.hpp"
#include "turbonet/server-context.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/vector.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-endpoint.hpp"

namespace turbonet {

// Registration facade of a turbonet server.
//
// Routes, hooks and WebSocket endpoints are registered first, then run() freezes them into an immutable snapshot
// shared by every event loop and starts the worker topology. Registration after that point throws
// std::logic_error.
//
//   App app(ServerConfig{}.withPort(8080));
//   app.route("/users/<int:id>", http::Method::GET, [](const HttpRequest& req) { ... });
//   app.turboRoute("/ping", http::Method::GET, [](const HttpRequest&) { return "pong"; });
//   app.nativeWebSocket("/echo", websocket::NativeMode::Echo);
//   app.run();
class App {
 public:
  explicit App(ServerConfig config = {});

  // Configuration, modifiable until the application is frozen.
  [[nodiscard]] ServerConfig& config();

  // Standard route: before hooks, handler, after hooks.
  // Throws std::invalid_argument for a malformed pattern and RouteConflictError for a duplicate route.
  App& route(std::string_view pattern, http::MethodBmp methods, RequestHandler handler);

  App& route(std::string_view pattern, http::Method method, RequestHandler handler) {
    return route(pattern, static_cast<http::MethodBmp>(method), std::move(handler));
  }

  // Turbo route: no hooks. With a positive cache TTL, responses are cached per captured values (kDefaultCacheTtl
  // selects ServerConfig::defaultCacheTtl). Without one, or with a zero TTL, the handler is called for every request.
  App& turboRoute(std::string_view pattern, http::MethodBmp methods, RequestHandler handler,
                  std::optional<std::chrono::milliseconds> cacheTtl = std::nullopt);

  App& turboRoute(std::string_view pattern, http::Method method, RequestHandler handler,
                  std::optional<std::chrono::milliseconds> cacheTtl = std::nullopt) {
    return turboRoute(pattern, static_cast<http::MethodBmp>(method), std::move(handler), cacheTtl);
  }

  // Fixed response for GET and HEAD on a literal path, served without entering user code.
  App& staticRoute(std::string_view path, std::string body, std::string_view contentType = http::ContentTypeTextPlain);

  // WebSocket endpoint whose messages are handled by user callbacks, under the execution lock.
  App& websocket(std::string_view path, websocket::WebSocketHandlers handlers,
                 std::optional<WebSocketConfig> config = std::nullopt);

  // WebSocket endpoint handled by the server itself.
  App& nativeWebSocket(std::string_view path, websocket::NativeMode mode,
                       std::optional<WebSocketConfig> config = std::nullopt,
                       std::string_view prefix = websocket::kDefaultEchoPrefix);

  // Hook run before the handler of standard routes, in registration order.
  App& before(RequestMiddleware hook);

  // Hook run after the handler of standard routes, in reverse registration order.
  App& after(ResponseMiddleware hook);

  // Closes registration and builds the snapshot shared by the event loops. Idempotent.
  // Throws std::invalid_argument if the configuration is invalid.
  ServerContext& freeze();

  [[nodiscard]] bool frozen() const noexcept { return static_cast<bool>(_context); }

  // Freezes the application, applies the configured log level and serves until a termination signal (SIGINT,
  // SIGTERM). A single worker runs in the calling process, several are forked and supervised.
  void run();

 private:
  void checkNotFrozen() const;

  void addWebSocketRoute(std::string_view path, websocket::WebSocketEndpoint endpoint);

  ServerConfig _config;
  std::shared_ptr<RouteTable> _routeTable;
  vector<WebSocketRoute> _webSocketRoutes;
  std::unique_ptr<ServerContext> _context;
};

}  // namespace turbonet
