#include "turbonet/app.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/dispatch-engine.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/log.hpp"
#include "turbonet/router.hpp"
#include "turbonet/server-context.hpp"
#include "turbonet/signal-handler.hpp"
#include "turbonet/worker-process.hpp"
#include "turbonet/worker-topology.hpp"

namespace turbonet {

App::App(ServerConfig config)
    : _config(std::move(config)), _routeTable(std::make_shared<RouteTable>(RouteTable{Router(_config.router)})) {}

ServerConfig& App::config() {
  checkNotFrozen();
  return _config;
}

void App::checkNotFrozen() const {
  if (frozen()) {
    throw std::logic_error("the application cannot be modified once it runs");
  }
}

App& App::route(std::string_view pattern, http::MethodBmp methods, RequestHandler handler) {
  checkNotFrozen();
  if (!handler) {
    throw std::invalid_argument("empty handler");
  }
  _routeTable->router.add(pattern, methods, RouteMode::Standard);
  _routeTable->targets.push_back(RouteTarget{std::move(handler), nullptr});
  return *this;
}

App& App::turboRoute(std::string_view pattern, http::MethodBmp methods, RequestHandler handler,
                     std::optional<std::chrono::milliseconds> cacheTtl) {
  checkNotFrozen();
  if (!handler) {
    throw std::invalid_argument("empty handler");
  }
  _routeTable->router.add(pattern, methods, RouteMode::Turbo, cacheTtl);
  _routeTable->targets.push_back(RouteTarget{std::move(handler), nullptr});
  return *this;
}

App& App::staticRoute(std::string_view path, std::string body, std::string_view contentType) {
  checkNotFrozen();
  if (path.find('<') != std::string_view::npos) {
    throw std::invalid_argument("static routes cannot have captures");
  }
  _routeTable->router.add(path, http::Method::GET | http::Method::HEAD, RouteMode::Standard);
  _routeTable->targets.push_back(
      RouteTarget{nullptr, std::make_shared<const HttpResponse>(http::StatusCodeOK, std::move(body), contentType)});
  return *this;
}

App& App::websocket(std::string_view path, websocket::WebSocketHandlers handlers,
                    std::optional<WebSocketConfig> config) {
  addWebSocketRoute(path, websocket::WebSocketEndpoint::WithHandlers(std::move(handlers), std::move(config)));
  return *this;
}

App& App::nativeWebSocket(std::string_view path, websocket::NativeMode mode, std::optional<WebSocketConfig> config,
                          std::string_view prefix) {
  addWebSocketRoute(path, websocket::WebSocketEndpoint::Native(mode, std::move(config), prefix));
  return *this;
}

void App::addWebSocketRoute(std::string_view path, websocket::WebSocketEndpoint endpoint) {
  checkNotFrozen();
  if (path.empty() || path.front() != '/') {
    throw std::invalid_argument("WebSocket path must start with '/'");
  }
  for (const WebSocketRoute& route : _webSocketRoutes) {
    if (route.path == path) {
      throw RouteConflictError("WebSocket endpoint already registered for " + std::string(path));
    }
  }
  if (endpoint.config) {
    endpoint.config->validate();
  }
  _webSocketRoutes.push_back(WebSocketRoute{std::string(path), std::move(endpoint)});
}

App& App::before(RequestMiddleware hook) {
  checkNotFrozen();
  _routeTable->requestMiddlewares.push_back(std::move(hook));
  return *this;
}

App& App::after(ResponseMiddleware hook) {
  checkNotFrozen();
  _routeTable->responseMiddlewares.push_back(std::move(hook));
  return *this;
}

ServerContext& App::freeze() {
  if (!_context) {
    _config.validate();
    _context = std::make_unique<ServerContext>(_config, std::move(_routeTable), std::move(_webSocketRoutes));
    log::debug("Application frozen with {} route(s) and {} WebSocket endpoint(s)",
               _context->routeTable()->router.size(), _context->webSocketRoutes().size());
  }
  return *_context;
}

void App::run() {
  ServerContext& context = freeze();
  const ServerConfig& config = context.config();
  log::set_level(log::level::from_str(config.logLevel));

  const uint32_t nbWorkers = config.effectiveNbWorkers();
  SignalHandler::Enable();
  if (nbWorkers == 1) {
    WorkerProcess worker(context);
    log::info("turbonet listening on {}:{} ({} event loop(s))", config.host, worker.port(), config.eventLoopThreads);
    const ServerStats stats = worker.run();
    log::info("Server stopped, stats: {}", stats.json_str());
  } else {
    log::info("turbonet listening on {}:{} with {} workers", config.host, config.port, nbWorkers);
    WorkerTopology topology(nbWorkers, config.maxRespawns, [&context](uint32_t workerIdx) {
      WorkerProcess worker(context);
      const ServerStats stats = worker.run();
      log::info("Worker {} stopped, stats: {}", workerIdx, stats.json_str());
      return EXIT_SUCCESS;
    });
    topology.run();
  }
  SignalHandler::Disable();
}

}  // namespace turbonet
