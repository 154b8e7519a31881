#pragma once

#include <cstdint>
#include <string>

namespace turbonet {

// Counters of one event loop. Aggregated per worker with operator+= when the worker stops.
struct ServerStats {
  // Serialize this stats snapshot to JSON (single object).
  [[nodiscard]] std::string json_str() const;

  // Introspection enumeration of the counters (order matches serialization order).
  template <class F>
  void for_each_field(F&& fun) const {
    fun("connectionsAccepted", connectionsAccepted);
    fun("totalRequestsServed", totalRequestsServed);
    fun("totalBytesWritten", totalBytesWritten);
    fun("cacheHits", cacheHits);
    fun("cacheMisses", cacheMisses);
    fun("cacheStaleServed", cacheStaleServed);
    fun("rateLimitedRequests", rateLimitedRequests);
    fun("handlerFailures", handlerFailures);
    fun("webSocketSessionsOpened", webSocketSessionsOpened);
    fun("webSocketSessionsClosed", webSocketSessionsClosed);
    fun("webSocketMessagesReceived", webSocketMessagesReceived);
    fun("webSocketMessagesDropped", webSocketMessagesDropped);
    fun("outboundOverflowCloses", outboundOverflowCloses);
    fun("maxConnectionOutboundBuffer", maxConnectionOutboundBuffer);
  }

  ServerStats& operator+=(const ServerStats& other) noexcept;

  uint64_t connectionsAccepted{};
  uint64_t totalRequestsServed{};
  uint64_t totalBytesWritten{};
  uint64_t cacheHits{};
  uint64_t cacheMisses{};
  uint64_t cacheStaleServed{};
  uint64_t rateLimitedRequests{};
  uint64_t handlerFailures{};
  uint64_t webSocketSessionsOpened{};
  uint64_t webSocketSessionsClosed{};
  uint64_t webSocketMessagesReceived{};
  uint64_t webSocketMessagesDropped{};
  // connections closed because their peer did not read its output
  uint64_t outboundOverflowCloses{};
  // high-water mark of the output queued on a single connection (aggregated as a max)
  uint64_t maxConnectionOutboundBuffer{};
};

}  // namespace turbonet
