#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/handler-bridge.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/vector.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-constants.hpp"
#include "turbonet/websocket-session.hpp"

namespace turbonet::websocket {

// Message handling implemented by the server itself, without entering user code.
enum class NativeMode : uint8_t {
  Echo,        // every message is sent back unchanged
  PrefixEcho,  // text messages are sent back with a prefix, binary ones unchanged
  Broadcast,   // every message is sent to all open sessions of the endpoint in the same event loop
};

inline constexpr std::string_view kDefaultEchoPrefix = "Echo: ";

// User callbacks of a callback endpoint. Each call goes through the HandlerBridge (execution lock held, exceptions
// converted to HandlerFailure). A HandlerFailure closes the session with 1011 (internal error).
struct WebSocketHandlers {
  // Session opened, with the upgrade request.
  std::function<void(WebSocketSession&, const HttpRequest&)> onConnect;

  // Text message. A returned value is sent back as a text frame.
  std::function<std::optional<std::string>(WebSocketSession&, std::string_view)> onMessage;

  // Binary message. A returned value is sent back as a binary frame.
  std::function<std::optional<std::string>(WebSocketSession&, std::span<const std::byte>)> onBinary;

  // Session closed, for any reason.
  std::function<void(WebSocketSession&, CloseCode, std::string_view)> onDisconnect;
};

// A WebSocket route, as registered on the App.
struct WebSocketEndpoint {
  enum class Strategy : uint8_t { Callback, Native };

  static WebSocketEndpoint WithHandlers(WebSocketHandlers handlers,
                                        std::optional<WebSocketConfig> config = std::nullopt) {
    WebSocketEndpoint ep;
    ep.strategy = Strategy::Callback;
    ep.handlers = std::move(handlers);
    ep.config = std::move(config);
    return ep;
  }

  static WebSocketEndpoint Native(NativeMode mode, std::optional<WebSocketConfig> config = std::nullopt,
                                  std::string_view prefix = kDefaultEchoPrefix) {
    WebSocketEndpoint ep;
    ep.strategy = Strategy::Native;
    ep.nativeMode = mode;
    ep.config = std::move(config);
    ep.prefix = prefix;
    return ep;
  }

  WebSocketHandlers handlers;
  // Falls back to the server wide WebSocketConfig when not set.
  std::optional<WebSocketConfig> config;
  std::string prefix;
  Strategy strategy{Strategy::Native};
  NativeMode nativeMode{NativeMode::Echo};
};

// Open sessions of one endpoint in one event loop.
class BroadcastGroup {
 public:
  void join(WebSocketSession& session) { _sessions.push_back(&session); }

  void leave(WebSocketSession& session) noexcept;

  // Queues the message on every open member. Returns the number of recipients.
  std::size_t broadcast(std::span<const std::byte> payload, bool isBinary);

  [[nodiscard]] std::size_t size() const noexcept { return _sessions.size(); }

 private:
  vector<WebSocketSession*> _sessions;
};

// Runtime of an endpoint inside one event loop: resolved configuration, message rate limiter shared by its
// sessions, broadcast group and the session callbacks implementing the endpoint strategy.
// Must outlive the sessions it creates.
class WebSocketEndpointRuntime {
 public:
  // 'maxOutputBytes' is the output bound of each created session (0: unbounded).
  WebSocketEndpointRuntime(const WebSocketEndpoint& endpoint, const WebSocketConfig& defaultConfig,
                           HandlerBridge& bridge, std::size_t maxOutputBytes = 0);

  WebSocketEndpointRuntime(const WebSocketEndpointRuntime&) = delete;
  WebSocketEndpointRuntime(WebSocketEndpointRuntime&&) = delete;
  WebSocketEndpointRuntime& operator=(const WebSocketEndpointRuntime&) = delete;
  WebSocketEndpointRuntime& operator=(WebSocketEndpointRuntime&&) = delete;

  ~WebSocketEndpointRuntime() = default;

  // Creates an Open session for an accepted upgrade. For callback endpoints, onConnect has been called.
  [[nodiscard]] std::unique_ptr<WebSocketSession> createSession(WebSocketSession::Id id,
                                                                const HttpRequest& upgradeRequest,
                                                                SteadyTimePoint now);

  [[nodiscard]] const WebSocketConfig& config() const noexcept { return _config; }

  [[nodiscard]] const BroadcastGroup& group() const noexcept { return _group; }

  // nullptr when message rate limiting is disabled.
  [[nodiscard]] RateLimiter* messageLimiter() const noexcept { return _messageLimiter.get(); }

 private:
  WebSocketCallbacks makeCallbacks();

  void onCallbackMessage(WebSocketSession& session, std::span<const std::byte> payload, bool isBinary);

  void onNativeMessage(WebSocketSession& session, std::span<const std::byte> payload, bool isBinary);

  const WebSocketEndpoint* _endpoint;
  HandlerBridge* _bridge;
  WebSocketConfig _config;
  std::size_t _maxOutputBytes;
  std::unique_ptr<RateLimiter> _messageLimiter;
  BroadcastGroup _group;
  WebSocketCallbacks _callbacks;
};

}  // namespace turbonet::websocket
