#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "turbonet/dispatch-engine.hpp"
#include "turbonet/handler-bridge.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/response-cache.hpp"
#include "turbonet/server-config.hpp"
#include "turbonet/vector.hpp"
#include "turbonet/websocket-endpoint.hpp"

namespace turbonet {

// A WebSocket endpoint and the exact request path it is served on.
struct WebSocketRoute {
  std::string path;
  websocket::WebSocketEndpoint endpoint;
};

// Everything shared by the event loops of one worker process: the immutable route snapshot, and the synchronized
// Handler Bridge, Response Cache and HTTP Rate Limiter.
// Built once before the workers are forked, each worker process then owns its own copy.
class ServerContext {
 public:
  // Throws std::invalid_argument if 'config' is invalid.
  ServerContext(ServerConfig config, std::shared_ptr<const RouteTable> routeTable,
                vector<WebSocketRoute> webSocketRoutes);

  ServerContext(const ServerContext&) = delete;
  ServerContext(ServerContext&&) = delete;
  ServerContext& operator=(const ServerContext&) = delete;
  ServerContext& operator=(ServerContext&&) = delete;

  ~ServerContext() = default;

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] const std::shared_ptr<const RouteTable>& routeTable() const noexcept { return _routeTable; }

  [[nodiscard]] std::span<const WebSocketRoute> webSocketRoutes() const noexcept { return _webSocketRoutes; }

  // Index in webSocketRoutes() of the endpoint registered for 'path', if any.
  [[nodiscard]] std::optional<std::size_t> findWebSocketRoute(std::string_view path) const noexcept;

  [[nodiscard]] HandlerBridge& bridge() noexcept { return _bridge; }

  [[nodiscard]] ResponseCache& cache() noexcept { return _cache; }

  // nullptr when HTTP rate limiting is disabled.
  [[nodiscard]] RateLimiter* rateLimiter() noexcept { return _rateLimiter.get(); }

  [[nodiscard]] DispatchEngine::Options dispatchOptions() const noexcept;

  // Period of the maintenance tick of the event loops: the poll interval, shortened to the smallest WebSocket
  // heartbeat interval so that pings are never late by more than one heartbeat.
  [[nodiscard]] std::chrono::milliseconds tickInterval() const noexcept;

 private:
  ServerConfig _config;
  std::shared_ptr<const RouteTable> _routeTable;
  vector<WebSocketRoute> _webSocketRoutes;
  HandlerBridge _bridge;
  ResponseCache _cache;
  std::unique_ptr<RateLimiter> _rateLimiter;
};

}  // namespace turbonet
