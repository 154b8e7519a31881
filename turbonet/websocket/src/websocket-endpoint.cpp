#include "turbonet/websocket-endpoint.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "turbonet/handler-bridge.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/log.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-constants.hpp"
#include "turbonet/websocket-frame.hpp"
#include "turbonet/websocket-session.hpp"

namespace turbonet::websocket {

void BroadcastGroup::leave(WebSocketSession& session) noexcept {
  const auto it = std::find(_sessions.begin(), _sessions.end(), &session);
  if (it != _sessions.end()) {
    // order of members does not matter
    *it = _sessions.back();
    _sessions.pop_back();
  }
}

std::size_t BroadcastGroup::broadcast(std::span<const std::byte> payload, bool isBinary) {
  std::size_t nbRecipients = 0;
  for (WebSocketSession* session : _sessions) {
    const bool queued = isBinary ? session->sendBinary(payload) : session->sendText(AsStringView(payload));
    nbRecipients += queued ? 1U : 0U;
  }
  return nbRecipients;
}

WebSocketEndpointRuntime::WebSocketEndpointRuntime(const WebSocketEndpoint& endpoint,
                                                   const WebSocketConfig& defaultConfig, HandlerBridge& bridge,
                                                   std::size_t maxOutputBytes)
    : _endpoint(&endpoint),
      _bridge(&bridge),
      _config(endpoint.config.value_or(defaultConfig)),
      _maxOutputBytes(maxOutputBytes) {
  _config.validate();
  if (_config.rateLimit != 0) {
    // burst equal to the per second budget
    const auto rate = static_cast<double>(_config.rateLimit);
    _messageLimiter = std::make_unique<RateLimiter>(rate, rate);
  }
  _callbacks = makeCallbacks();
}

WebSocketCallbacks WebSocketEndpointRuntime::makeCallbacks() {
  WebSocketCallbacks callbacks;
  if (_endpoint->strategy == WebSocketEndpoint::Strategy::Callback) {
    callbacks.onMessage = [this](WebSocketSession& session, std::span<const std::byte> payload, bool isBinary) {
      onCallbackMessage(session, payload, isBinary);
    };
    if (_endpoint->handlers.onDisconnect) {
      callbacks.onClose = [this](WebSocketSession& session, CloseCode code, std::string_view reason) {
        try {
          _bridge->call([this, &session, code, reason] { _endpoint->handlers.onDisconnect(session, code, reason); });
        } catch (const HandlerFailure& ex) {
          log::error("WebSocket onDisconnect handler of session {} failed: {}", session.id(), ex.what());
        }
      };
    }
    return callbacks;
  }

  callbacks.onMessage = [this](WebSocketSession& session, std::span<const std::byte> payload, bool isBinary) {
    onNativeMessage(session, payload, isBinary);
  };
  if (_endpoint->nativeMode == NativeMode::Broadcast) {
    callbacks.onOpen = [this](WebSocketSession& session) { _group.join(session); };
    callbacks.onClose = [this](WebSocketSession& session, CloseCode, std::string_view) { _group.leave(session); };
  }
  return callbacks;
}

std::unique_ptr<WebSocketSession> WebSocketEndpointRuntime::createSession(WebSocketSession::Id id,
                                                                          const HttpRequest& upgradeRequest,
                                                                          SteadyTimePoint now) {
  auto session = std::make_unique<WebSocketSession>(id, _config, _callbacks, _messageLimiter.get(), _maxOutputBytes);
  session->open(now);
  if (_endpoint->strategy == WebSocketEndpoint::Strategy::Callback && _endpoint->handlers.onConnect) {
    try {
      _bridge->call([this, &session, &upgradeRequest] { _endpoint->handlers.onConnect(*session, upgradeRequest); });
    } catch (const HandlerFailure& ex) {
      log::error("WebSocket onConnect handler of session {} failed: {}", id, ex.what());
      session->close(CloseCode::InternalError, "Internal error");
    }
  }
  return session;
}

void WebSocketEndpointRuntime::onCallbackMessage(WebSocketSession& session, std::span<const std::byte> payload,
                                                 bool isBinary) {
  const WebSocketHandlers& handlers = _endpoint->handlers;
  try {
    if (isBinary) {
      if (handlers.onBinary) {
        auto reply = _bridge->call([&handlers, &session, payload] { return handlers.onBinary(session, payload); });
        if (reply) {
          session.sendBinary(AsBytes(*reply));
        }
      }
    } else if (handlers.onMessage) {
      auto reply = _bridge->call(
          [&handlers, &session, payload] { return handlers.onMessage(session, AsStringView(payload)); });
      if (reply) {
        session.sendText(*reply);
      }
    }
  } catch (const HandlerFailure& ex) {
    log::error("WebSocket message handler of session {} failed: {}", session.id(), ex.what());
    session.close(CloseCode::InternalError, "Internal error");
  }
}

void WebSocketEndpointRuntime::onNativeMessage(WebSocketSession& session, std::span<const std::byte> payload,
                                               bool isBinary) {
  switch (_endpoint->nativeMode) {
    case NativeMode::Echo:
      if (isBinary) {
        session.sendBinary(payload);
      } else {
        session.sendText(AsStringView(payload));
      }
      break;
    case NativeMode::PrefixEcho:
      if (isBinary) {
        session.sendBinary(payload);
      } else {
        std::string reply;
        reply.reserve(_endpoint->prefix.size() + payload.size());
        reply.append(_endpoint->prefix);
        reply.append(AsStringView(payload));
        session.sendText(reply);
      }
      break;
    case NativeMode::Broadcast:
      _group.broadcast(payload, isBinary);
      break;
    default:
      break;
  }
}

}  // namespace turbonet::websocket
