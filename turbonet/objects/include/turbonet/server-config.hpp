#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "turbonet/rate-limit-config.hpp"
#include "turbonet/router-config.hpp"
#include "turbonet/websocket-config.hpp"

namespace turbonet {

struct ServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IPv4 address to bind. Default: all interfaces.
  std::string host{"0.0.0.0"};

  // TCP port to bind. 0 lets the OS pick an ephemeral port (only meaningful with a single worker, as each process
  // would otherwise get its own port).
  uint16_t port{8000};

  // Enables SO_REUSEPORT so that all workers (and all event loops of a worker) bind the same address and let the
  // kernel distribute accepted connections. Forced on when more than one listener exists. Default: true.
  bool reusePort{true};

  // Disables Nagle's algorithm on accepted connections. Default: true.
  bool tcpNoDelay{true};

  // listen() backlog of each listening socket. Default: 1024.
  int backlog{1024};

  // ================
  // Worker topology
  // ================
  // Number of worker processes. 0 (default) means one per hardware core (1 if it cannot be determined).
  uint32_t nbWorkers{0};

  // Number of event loop threads inside each worker. Default: 1 (one loop per process).
  uint32_t eventLoopThreads{1};

  // Maximum number of times a crashed worker is respawned over the server lifetime. Default: 16.
  uint32_t maxRespawns{16};

  // When true, handler calls are not serialized (free-threaded runtime). When false (default) only one handler call
  // runs at a time within a worker process, whatever the number of event loop threads.
  bool freeThreaded{false};

  // ======================================
  // Keep-alive / request parsing & limits
  // ======================================
  bool enableKeepAlive{true};

  // Maximum number of requests served over a single persistent connection before it is closed.
  uint32_t maxRequestsPerConnection{1000};

  // Idle keep-alive connections are closed after this duration. Default: 5s.
  std::chrono::milliseconds keepAliveTimeout{std::chrono::seconds{5}};

  // Maximum size of the request line + headers. Exceeding it yields 431 and closes the connection. Default: 8 KiB.
  std::size_t maxHeaderBytes{8192};

  // Maximum size of a (decoded) request body. Exceeding it yields 413 and closes the connection. Default: 16 MiB.
  std::size_t maxBodyBytes{std::size_t{16} << 20};

  // Bound of the output queued on one connection (serialized responses, WebSocket frames) that the peer does not
  // read. Above half of it, the connection is no longer read and its pipelined requests wait. A WebSocket session
  // whose output would exceed it is closed with 1008 and its transport dropped. A single HTTP response larger than
  // the bound is still delivered. Default: 4 MiB.
  std::size_t maxOutboundBufferBytes{std::size_t{4} << 20};

  // Maximum duration an event loop blocks in epoll_wait when idle. It bounds the latency of stop requests and the
  // granularity of keep-alive and WebSocket heartbeat checks (the effective tick is never larger than the smallest
  // heartbeat interval). Default: 250ms.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{250}};

  // =========
  // Dispatch
  // =========
  // Applied to every HTTP request, keyed by client address, before routing.
  RateLimitConfig rateLimit;

  // TTL used by turbo routes registered with kDefaultCacheTtl. Default: 60s.
  std::chrono::milliseconds defaultCacheTtl{std::chrono::seconds{60}};

  // WebSocket limits of endpoints registered without their own configuration.
  WebSocketConfig webSocket;

  RouterConfig router;

  // When true, 500 responses include the handler exception message. Must stay false in production.
  bool debugMode{false};

  // Answers GET /health with "OK" unless a route is registered for it.
  bool enableHealthCheck{true};

  // Value of the Server header. Empty to omit it.
  std::string serverName{"turbonet"};

  // spdlog level name ("trace", "debug", "info", "warn", "error", "critical", "off").
  std::string logLevel{"info"};

  ServerConfig& withHost(std::string host);

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withReusePort(bool on = true);

  ServerConfig& withTcpNoDelay(bool on = true);

  ServerConfig& withBacklog(int backlog);

  ServerConfig& withNbWorkers(uint32_t nbWorkers);

  ServerConfig& withEventLoopThreads(uint32_t nbThreads);

  ServerConfig& withMaxRespawns(uint32_t maxRespawns);

  ServerConfig& withFreeThreaded(bool on = true);

  ServerConfig& withKeepAliveMode(bool on = true);

  ServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  ServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  ServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  ServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  ServerConfig& withMaxOutboundBufferBytes(std::size_t maxOutboundBufferBytes);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  ServerConfig& withRateLimit(RateLimitConfig rateLimitConfig);

  ServerConfig& withDefaultCacheTtl(std::chrono::milliseconds ttl);

  ServerConfig& withWebSocketConfig(WebSocketConfig webSocketConfig);

  ServerConfig& withRouterConfig(RouterConfig routerConfig);

  ServerConfig& withDebugMode(bool on = true);

  ServerConfig& withHealthCheck(bool on = true);

  ServerConfig& withServerName(std::string serverName);

  ServerConfig& withLogLevel(std::string logLevel);

  // Effective number of worker processes (resolves 0 to the hardware concurrency).
  [[nodiscard]] uint32_t effectiveNbWorkers() const noexcept;

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;
};

}  // namespace turbonet
