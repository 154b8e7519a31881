#include "turbonet/websocket-session.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "turbonet/log.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/stringconv.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-constants.hpp"
#include "turbonet/websocket-frame.hpp"

namespace turbonet::websocket {

namespace {

constexpr std::string_view kOutputOverflowReason = "Outbound buffer limit exceeded";

}  // namespace

WebSocketSession::WebSocketSession(Id id, const WebSocketConfig& config, WebSocketCallbacks callbacks,
                                   RateLimiter* messageLimiter, std::size_t maxOutputBytes)
    : _config(config),
      _callbacks(std::move(callbacks)),
      _messageLimiter(messageLimiter),
      _id(id),
      _maxOutputBytes(maxOutputBytes) {
  if (_messageLimiter != nullptr) {
    const auto idStr = IntegralToCharVector(id);
    _limiterKey.assign(idStr.data(), idStr.size());
  }
}

WebSocketSession::~WebSocketSession() {
  if (_state != State::Closed && _messageLimiter != nullptr) {
    _messageLimiter->erase(_limiterKey);
  }
}

void WebSocketSession::open(SteadyTimePoint now) {
  if (_state != State::Handshaking) {
    throw std::logic_error("WebSocket session already opened");
  }
  _state = State::Open;
  _now = now;
  _lastActivity = now;
  _lastPing = now;
  log::debug("WebSocket session {} open", _id);
  if (_callbacks.onOpen) {
    _callbacks.onOpen(*this);
  }
}

std::size_t WebSocketSession::dataPayloadBudget() const noexcept {
  if (_config.maxMessageSize == 0) {
    return kNoPayloadLimit;
  }
  return _messageInProgress ? _config.maxMessageSize - std::min(_message.size(), _config.maxMessageSize)
                            : _config.maxMessageSize;
}

std::size_t WebSocketSession::processInput(std::span<const std::byte> data, SteadyTimePoint now) {
  _now = now;
  if (_state != State::Open && _state != State::Closing) {
    return 0;
  }

  const bool fromBuffer = !_inputBuffer.empty();
  std::span<const std::byte> input = data;
  if (fromBuffer) {
    _inputBuffer.insert(_inputBuffer.end(), data.begin(), data.end());
    input = std::span<const std::byte>(_inputBuffer.data(), _inputBuffer.size());
  }

  std::size_t consumed = 0;
  bool stopped = false;
  while (!input.empty()) {
    const FrameParseResult frame = ParseFrame(input, dataPayloadBudget());
    if (frame.status == FrameParseResult::Status::Incomplete) {
      break;
    }
    if (frame.status == FrameParseResult::Status::ProtocolError) {
      failWith(CloseCode::ProtocolError, frame.errorMessage);
      stopped = true;
      break;
    }
    if (frame.status == FrameParseResult::Status::PayloadTooLarge) {
      // rejected on the announced length: no byte of the payload is buffered
      failWith(CloseCode::MessageTooBig, frame.errorMessage);
      stopped = true;
      break;
    }

    _lastActivity = now;
    const FrameAction action = processFrame(frame);
    consumed += frame.bytesConsumed;
    input = input.subspan(frame.bytesConsumed);
    if (action == FrameAction::Stop) {
      stopped = true;
      break;
    }
  }

  if (stopped || input.empty()) {
    _inputBuffer.clear();
  } else if (fromBuffer) {
    _inputBuffer.erase(_inputBuffer.begin(), _inputBuffer.begin() + static_cast<std::ptrdiff_t>(consumed));
  } else {
    _inputBuffer.assign(input.begin(), input.end());
  }
  return data.size();
}

WebSocketSession::FrameAction WebSocketSession::processFrame(const FrameParseResult& frame) {
  if (IsControlFrame(frame.header.opcode)) {
    // control payloads are at most 125 bytes, unmask them on the stack
    FixedCapacityVector<std::byte, kMaxControlFramePayload> payload(frame.payload.begin(), frame.payload.end());
    if (frame.header.masked) {
      ApplyMask(std::span<std::byte>(payload.data(), payload.size()), frame.header.maskingKey);
    }
    return handleControlFrame(frame.header, std::span<const std::byte>(payload.data(), payload.size()));
  }
  return handleDataFrame(frame.header, frame.payload);
}

WebSocketSession::FrameAction WebSocketSession::handleDataFrame(const FrameHeader& header,
                                                                std::span<const std::byte> payload) {
  if (_state != State::Open) {
    // data received after our Close frame is discarded
    return FrameAction::Continue;
  }
  if (header.opcode == Opcode::Continuation) {
    if (!_messageInProgress) {
      failWith(CloseCode::ProtocolError, "Unexpected continuation frame");
      return FrameAction::Stop;
    }
  } else {
    if (_messageInProgress) {
      failWith(CloseCode::ProtocolError, "Expected continuation frame");
      return FrameAction::Stop;
    }
    _messageOpcode = header.opcode;
    _messageInProgress = true;
    _message.clear();
  }

  const std::size_t fragmentStart = _message.size();
  _message.insert(_message.end(), payload.begin(), payload.end());
  if (header.masked) {
    ApplyMask(std::span<std::byte>(_message.data() + fragmentStart, payload.size()), header.maskingKey);
  }

  if (header.fin) {
    return completeMessage();
  }
  return FrameAction::Continue;
}

WebSocketSession::FrameAction WebSocketSession::handleControlFrame(const FrameHeader& header,
                                                                   std::span<const std::byte> payload) {
  switch (header.opcode) {
    case Opcode::Ping:
      sendPong(payload);
      return FrameAction::Continue;
    case Opcode::Pong:
      // activity already recorded
      return FrameAction::Continue;
    case Opcode::Close: {
      const ClosePayload closeInfo = ParseClosePayload(payload);
      if (_state == State::Open) {
        // peer initiated: echo its code and finish
        _closeCode = closeInfo.code;
        BuildCloseFrame(_outputBuffer, closeInfo.code);
        finish(closeInfo.code, closeInfo.reason);
      } else {
        finish(_closeCode, closeInfo.reason);
      }
      return FrameAction::Stop;
    }
    default:
      throw std::logic_error("unexpected control opcode");
  }
}

WebSocketSession::FrameAction WebSocketSession::completeMessage() {
  _messageInProgress = false;
  ++_nbMessagesReceived;

  if (_messageLimiter != nullptr && !_messageLimiter->tryAcquire(_limiterKey, _now).allowed) {
    ++_nbMessagesDropped;
    ++_consecutiveDrops;
    _message.clear();
    if (_config.maxRateViolations != 0 && _consecutiveDrops >= _config.maxRateViolations) {
      log::warn("WebSocket session {} closed after {} consecutive rate limited messages", _id, _consecutiveDrops);
      failWith(CloseCode::PolicyViolation, "Rate limit exceeded");
      return FrameAction::Stop;
    }
    return FrameAction::Continue;
  }
  _consecutiveDrops = 0;

  if (_callbacks.onMessage) {
    _callbacks.onMessage(*this, std::span<const std::byte>(_message.data(), _message.size()),
                         _messageOpcode == Opcode::Binary);
  }
  _message.clear();
  return _state == State::Open ? FrameAction::Continue : FrameAction::Stop;
}

void WebSocketSession::onTick(SteadyTimePoint now) {
  _now = now;
  if (_state == State::Open) {
    if (_config.timeout.count() != 0 && now - _lastActivity >= _config.timeout) {
      log::debug("WebSocket session {} idle for {} ms", _id,
                 std::chrono::duration_cast<std::chrono::milliseconds>(now - _lastActivity).count());
      close(CloseCode::GoingAway, "Idle timeout");
    } else if (_config.heartbeatInterval.count() != 0 &&
               now - std::max(_lastActivity, _lastPing) >= _config.heartbeatInterval) {
      sendPing();
      _lastPing = now;
    }
  } else if (_state == State::Closing) {
    if (_config.closeTimeout.count() != 0 && now - _closeSentAt >= _config.closeTimeout) {
      // a peer that did not answer may not read either: what it did not take is dropped with the transport
      _outputBuffer.clear();
      _outputOffset = 0;
      finish(_closeCode, "Close handshake timed out");
    }
  }
}

bool WebSocketSession::queueFrame(Opcode opcode, std::span<const std::byte> payload) {
  if (_maxOutputBytes != 0 && pendingOutput().size() + kMaxFrameHeaderSize + payload.size() > _maxOutputBytes) {
    onOutputOverflow(payload.size());
    return false;
  }
  BuildFrame(_outputBuffer, opcode, payload);
  return true;
}

void WebSocketSession::onOutputOverflow(std::size_t refusedPayloadSize) {
  if (_outputOverflowed) {
    return;
  }
  log::warn("WebSocket session {} does not read its output ({} bytes pending, {} more refused), closing", _id,
            pendingOutput().size(), refusedPayloadSize);
  _outputOverflowed = true;
  // Close frame beyond the bound, best effort. The callbacks run when the owner drops the transport.
  close(CloseCode::PolicyViolation, kOutputOverflowReason);
}

bool WebSocketSession::sendText(std::string_view text) {
  if (_state != State::Open) {
    return false;
  }
  return queueFrame(Opcode::Text, AsBytes(text));
}

bool WebSocketSession::sendBinary(std::span<const std::byte> data) {
  if (_state != State::Open) {
    return false;
  }
  return queueFrame(Opcode::Binary, data);
}

bool WebSocketSession::sendPing(std::span<const std::byte> payload) {
  if (_state != State::Open) {
    return false;
  }
  return queueFrame(Opcode::Ping, payload.first(std::min(payload.size(), kMaxControlFramePayload)));
}

bool WebSocketSession::sendPong(std::span<const std::byte> payload) {
  // allowed during the closing handshake
  if (_state != State::Open && _state != State::Closing) {
    return false;
  }
  return queueFrame(Opcode::Pong, payload.first(std::min(payload.size(), kMaxControlFramePayload)));
}

bool WebSocketSession::close(CloseCode code, std::string_view reason) {
  if (_state != State::Open) {
    return false;
  }
  BuildCloseFrame(_outputBuffer, code, reason);
  _state = State::Closing;
  _closeCode = code;
  _closeSentAt = _now;
  // a partial message will never complete, its buffer is released by completeMessage() or finish()
  _messageInProgress = false;
  return true;
}

void WebSocketSession::failWith(CloseCode code, std::string_view reason) {
  log::debug("WebSocket session {} failing with {}: {}", _id, static_cast<uint16_t>(code), reason);
  if (!close(code, reason)) {
    // already closing: the peer keeps misbehaving, stop waiting for its Close
    finish(_closeCode, reason);
  }
}

void WebSocketSession::onOutputWritten(std::size_t nbBytes) noexcept {
  _outputOffset += nbBytes;
  if (_outputOffset >= _outputBuffer.size()) {
    _outputBuffer.clear();
    _outputOffset = 0;
  }
}

void WebSocketSession::onTransportClosed() {
  _outputBuffer.clear();
  _outputOffset = 0;
  finish(_closeCode == CloseCode::NoStatusReceived ? CloseCode::AbnormalClosure : _closeCode, {});
}

void WebSocketSession::finish(CloseCode code, std::string_view reason) {
  if (_state == State::Closed) {
    return;
  }
  const bool wasOpened = _state != State::Handshaking;
  _state = State::Closed;
  _messageInProgress = false;
  _message.clear();
  _inputBuffer.clear();
  if (_messageLimiter != nullptr) {
    _messageLimiter->erase(_limiterKey);
  }
  log::debug("WebSocket session {} closed with {}", _id, static_cast<uint16_t>(code));
  if (wasOpened && _callbacks.onClose) {
    _callbacks.onClose(*this, code, reason);
  }
}

}  // namespace turbonet::websocket
