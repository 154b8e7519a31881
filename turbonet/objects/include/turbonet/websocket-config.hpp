#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace turbonet {

// Limits and liveness parameters of the WebSocket sessions of one endpoint.
// For each numeric field, 0 disables the corresponding check.
struct WebSocketConfig {
  // Largest accepted message payload (after reassembly of fragments). A frame header announcing more, or fragments
  // adding up to more, closes the session with 1009 before the payload is buffered. Default: 1 MiB.
  std::size_t maxMessageSize{std::size_t{1} << 20};

  // Maximum number of inbound data messages per second (token bucket with a burst equal to the rate).
  // Messages above the budget are dropped. Default: 100.
  uint32_t rateLimit{100};

  // Number of consecutive dropped messages after which the session is closed with 1008 (policy violation).
  // Default: 10.
  uint32_t maxRateViolations{10};

  // A ping is sent after this much silence from the peer. Default: 30s.
  std::chrono::milliseconds heartbeatInterval{std::chrono::seconds{30}};

  // The session is closed when nothing (message, ping or pong) was received for this long. Default: 60s.
  std::chrono::milliseconds timeout{std::chrono::seconds{60}};

  // Time allowed to the peer to answer our Close frame before the transport is dropped. Default: 5s.
  std::chrono::milliseconds closeTimeout{std::chrono::seconds{5}};

  WebSocketConfig& withMaxMessageSize(std::size_t bytes);

  WebSocketConfig& withRateLimit(uint32_t messagesPerSecond);

  WebSocketConfig& withMaxRateViolations(uint32_t nbViolations);

  WebSocketConfig& withHeartbeatInterval(std::chrono::milliseconds interval);

  WebSocketConfig& withTimeout(std::chrono::milliseconds timeout);

  WebSocketConfig& withCloseTimeout(std::chrono::milliseconds timeout);

  // Throws std::invalid_argument if the configuration is invalid.
  void validate() const;

  bool operator==(const WebSocketConfig&) const noexcept = default;
};

}  // namespace turbonet
