#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "turbonet/connection.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/websocket-session.hpp"

namespace turbonet {

// Per client connection state of an event loop.
// A connection speaks HTTP/1.1 until it is upgraded: from then on 'session' is set and owns the framing.
struct ConnectionState {
  ConnectionState(Connection cnx, SteadyTimePoint now) noexcept : connection(std::move(cnx)), lastActivity(now) {}

  [[nodiscard]] bool hasPendingOutput() const noexcept {
    return outOffset < outBuffer.size() || (session && session->hasPendingOutput());
  }

  [[nodiscard]] std::size_t pendingOutputBytes() const noexcept {
    return outBuffer.size() - outOffset + (session ? session->pendingOutput().size() : 0U);
  }

  [[nodiscard]] bool isWebSocket() const noexcept { return static_cast<bool>(session); }

  Connection connection;
  std::string inBuffer;   // received bytes not yet parsed as a complete HTTP request
  std::string outBuffer;  // serialized HTTP responses, in request order
  std::size_t outOffset{0};
  std::string clientAddress;
  SteadyTimePoint lastActivity;
  uint32_t nbRequests{0};
  // stop reading and close once outBuffer is flushed
  bool closeAfterWrite{false};
  bool writableInterest{false};
  // EPOLLIN removed while the peer does not read its output
  bool readPaused{false};
  // complete requests left in inBuffer until the output drains
  bool requestsHeldBack{false};
  std::unique_ptr<websocket::WebSocketSession> session;
};

}  // namespace turbonet
