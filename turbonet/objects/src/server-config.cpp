#include "turbonet/server-config.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "turbonet/rate-limit-config.hpp"
#include "turbonet/router-config.hpp"
#include "turbonet/websocket-config.hpp"

namespace turbonet {

ServerConfig& ServerConfig::withHost(std::string host) {
  this->host = std::move(host);
  return *this;
}

ServerConfig& ServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

ServerConfig& ServerConfig::withReusePort(bool on) {
  reusePort = on;
  return *this;
}

ServerConfig& ServerConfig::withTcpNoDelay(bool on) {
  tcpNoDelay = on;
  return *this;
}

ServerConfig& ServerConfig::withBacklog(int backlog) {
  this->backlog = backlog;
  return *this;
}

ServerConfig& ServerConfig::withNbWorkers(uint32_t nbWorkers) {
  this->nbWorkers = nbWorkers;
  return *this;
}

ServerConfig& ServerConfig::withEventLoopThreads(uint32_t nbThreads) {
  eventLoopThreads = nbThreads;
  return *this;
}

ServerConfig& ServerConfig::withMaxRespawns(uint32_t maxRespawns) {
  this->maxRespawns = maxRespawns;
  return *this;
}

ServerConfig& ServerConfig::withFreeThreaded(bool on) {
  freeThreaded = on;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveMode(bool on) {
  enableKeepAlive = on;
  return *this;
}

ServerConfig& ServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  maxRequestsPerConnection = maxRequests;
  return *this;
}

ServerConfig& ServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  keepAliveTimeout = timeout;
  return *this;
}

ServerConfig& ServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes) {
  this->maxHeaderBytes = maxHeaderBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes) {
  this->maxBodyBytes = maxBodyBytes;
  return *this;
}

ServerConfig& ServerConfig::withMaxOutboundBufferBytes(std::size_t maxOutboundBufferBytes) {
  this->maxOutboundBufferBytes = maxOutboundBufferBytes;
  return *this;
}

ServerConfig& ServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  pollInterval = interval;
  return *this;
}

ServerConfig& ServerConfig::withRateLimit(RateLimitConfig rateLimitConfig) {
  rateLimit = rateLimitConfig;
  return *this;
}

ServerConfig& ServerConfig::withDefaultCacheTtl(std::chrono::milliseconds ttl) {
  defaultCacheTtl = ttl;
  return *this;
}

ServerConfig& ServerConfig::withWebSocketConfig(WebSocketConfig webSocketConfig) {
  webSocket = webSocketConfig;
  return *this;
}

ServerConfig& ServerConfig::withRouterConfig(RouterConfig routerConfig) {
  router = routerConfig;
  return *this;
}

ServerConfig& ServerConfig::withDebugMode(bool on) {
  debugMode = on;
  return *this;
}

ServerConfig& ServerConfig::withHealthCheck(bool on) {
  enableHealthCheck = on;
  return *this;
}

ServerConfig& ServerConfig::withServerName(std::string serverName) {
  this->serverName = std::move(serverName);
  return *this;
}

ServerConfig& ServerConfig::withLogLevel(std::string logLevel) {
  this->logLevel = std::move(logLevel);
  return *this;
}

uint32_t ServerConfig::effectiveNbWorkers() const noexcept {
  if (nbWorkers != 0) {
    return nbWorkers;
  }
  const auto nbCores = std::thread::hardware_concurrency();
  return nbCores == 0 ? 1U : nbCores;
}

void ServerConfig::validate() const {
  if (eventLoopThreads == 0) {
    throw std::invalid_argument("eventLoopThreads must be >= 1");
  }
  if (backlog <= 0) {
    throw std::invalid_argument("backlog must be > 0");
  }
  if (port == 0 && effectiveNbWorkers() > 1) {
    throw std::invalid_argument("an explicit port is required with several workers");
  }
  if (maxHeaderBytes < 128) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (maxOutboundBufferBytes < 1024) {
    throw std::invalid_argument("maxOutboundBufferBytes must be >= 1024");
  }
  if (maxRequestsPerConnection == 0) {
    throw std::invalid_argument("maxRequestsPerConnection must be > 0");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (defaultCacheTtl.count() <= 0) {
    throw std::invalid_argument("defaultCacheTtl must be > 0");
  }
  if (spdlog::level::from_str(logLevel) == spdlog::level::off && logLevel != "off") {
    throw std::invalid_argument("unknown log level '" + logLevel + "'");
  }
  if (rateLimit.enabled) {
    rateLimit.validate();
  }
  webSocket.validate();
}

}  // namespace turbonet
