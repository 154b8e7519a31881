#include "turbonet/websocket-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace turbonet {

WebSocketConfig& WebSocketConfig::withMaxMessageSize(std::size_t bytes) {
  maxMessageSize = bytes;
  return *this;
}

WebSocketConfig& WebSocketConfig::withRateLimit(uint32_t messagesPerSecond) {
  rateLimit = messagesPerSecond;
  return *this;
}

WebSocketConfig& WebSocketConfig::withMaxRateViolations(uint32_t nbViolations) {
  maxRateViolations = nbViolations;
  return *this;
}

WebSocketConfig& WebSocketConfig::withHeartbeatInterval(std::chrono::milliseconds interval) {
  heartbeatInterval = interval;
  return *this;
}

WebSocketConfig& WebSocketConfig::withTimeout(std::chrono::milliseconds timeout) {
  this->timeout = timeout;
  return *this;
}

WebSocketConfig& WebSocketConfig::withCloseTimeout(std::chrono::milliseconds timeout) {
  closeTimeout = timeout;
  return *this;
}

void WebSocketConfig::validate() const {
  if (heartbeatInterval.count() < 0 || timeout.count() < 0 || closeTimeout.count() < 0) {
    throw std::invalid_argument("WebSocket durations must be non-negative");
  }
  if (timeout.count() != 0 && heartbeatInterval.count() != 0 && heartbeatInterval >= timeout) {
    throw std::invalid_argument("WebSocket heartbeat interval must be lower than the timeout");
  }
}

}  // namespace turbonet
