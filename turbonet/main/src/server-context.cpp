#include "turbonet/server-context.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "turbonet/dispatch-engine.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/server-config.hpp"
#include "turbonet/websocket-config.hpp"

namespace turbonet {

namespace {

const ServerConfig& Validated(const ServerConfig& config) {
  config.validate();
  return config;
}

}  // namespace

ServerContext::ServerContext(ServerConfig config, std::shared_ptr<const RouteTable> routeTable,
                             vector<WebSocketRoute> webSocketRoutes)
    : _config(Validated(config)),
      _routeTable(std::move(routeTable)),
      _webSocketRoutes(std::move(webSocketRoutes)),
      _bridge(_config.freeThreaded) {
  if (_config.rateLimit.enabled) {
    _rateLimiter = std::make_unique<RateLimiter>(_config.rateLimit);
  }
  for (const WebSocketRoute& route : _webSocketRoutes) {
    if (route.endpoint.config) {
      route.endpoint.config->validate();
    }
  }
}

std::optional<std::size_t> ServerContext::findWebSocketRoute(std::string_view path) const noexcept {
  const auto it =
      std::ranges::find_if(_webSocketRoutes, [path](const WebSocketRoute& route) { return route.path == path; });
  if (it == _webSocketRoutes.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - _webSocketRoutes.begin());
}

DispatchEngine::Options ServerContext::dispatchOptions() const noexcept {
  DispatchEngine::Options options;
  options.defaultCacheTtl = _config.defaultCacheTtl;
  options.debugMode = _config.debugMode;
  options.enableHealthCheck = _config.enableHealthCheck;
  return options;
}

std::chrono::milliseconds ServerContext::tickInterval() const noexcept {
  auto interval = _config.pollInterval;
  const auto consider = [&interval](const WebSocketConfig& webSocketConfig) {
    if (webSocketConfig.heartbeatInterval.count() > 0) {
      interval = std::min(interval, webSocketConfig.heartbeatInterval);
    }
  };
  for (const WebSocketRoute& route : _webSocketRoutes) {
    consider(route.endpoint.config ? *route.endpoint.config : _config.webSocket);
  }
  return interval;
}

}  // namespace turbonet
