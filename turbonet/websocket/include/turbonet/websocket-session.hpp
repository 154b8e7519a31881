#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

#include "turbonet/rate-limiter.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/websocket-config.hpp"
#include "turbonet/websocket-constants.hpp"
#include "turbonet/websocket-frame.hpp"

namespace turbonet::websocket {

class WebSocketSession;

// Application callbacks of a session. They may be shared by all the sessions of an endpoint, the session is passed
// to each call so that replies can be queued on it.
struct WebSocketCallbacks {
  // Session switched to Open.
  std::function<void(WebSocketSession&)> onOpen;

  // A complete message (fragments reassembled) accepted by the size and rate checks.
  std::function<void(WebSocketSession&, std::span<const std::byte> payload, bool isBinary)> onMessage;

  // Session reached Closed. Called exactly once, whatever the reason.
  std::function<void(WebSocketSession&, CloseCode code, std::string_view reason)> onClose;
};

// Server side state of one upgraded connection, independent of the transport: received bytes are fed to
// processInput(), frames to send accumulate in an output buffer drained by the owner of the socket.
//
//   Handshaking -> Open -> Closing -> Closed
//
// Open -> Closing when we send a Close frame (protocol error, limit exceeded, idle timeout, shutdown).
// Closing -> Closed when the peer answers or after closeTimeout.
// Open -> Closed directly when the peer initiates the close (our Close reply is queued).
// Open -> Closing with outputOverflowed() when the peer stops reading: the owner drops the transport right away.
//
// Not thread safe: a session lives in a single event loop.
class WebSocketSession {
 public:
  using Id = uint64_t;

  enum class State : uint8_t { Handshaking, Open, Closing, Closed };

  // 'messageLimiter' is shared by the sessions of an endpoint (one bucket per session id). nullptr disables the
  // rate check.
  // 'maxOutputBytes' bounds the output not drained yet (0: unbounded). A frame that would exceed it is not queued,
  // a 1008 Close frame is queued instead and outputOverflowed() becomes true.
  WebSocketSession(Id id, const WebSocketConfig& config, WebSocketCallbacks callbacks,
                   RateLimiter* messageLimiter = nullptr, std::size_t maxOutputBytes = 0);

  WebSocketSession(const WebSocketSession&) = delete;
  WebSocketSession(WebSocketSession&&) = delete;
  WebSocketSession& operator=(const WebSocketSession&) = delete;
  WebSocketSession& operator=(WebSocketSession&&) = delete;

  ~WebSocketSession();

  // Handshake completed. Starts the liveness timers and calls onOpen.
  void open(SteadyTimePoint now);

  // Feeds bytes received from the peer. Complete frames are processed, an incomplete tail is kept.
  // Returns the number of bytes taken, 0 when the session does not read (Handshaking or Closed).
  std::size_t processInput(std::span<const std::byte> data, SteadyTimePoint now);

  // Periodic liveness checks: heartbeat ping, idle timeout and close handshake timeout.
  void onTick(SteadyTimePoint now);

  // Queue a data frame. Returns false if the session is not Open or the frame does not fit in the output bound.
  bool sendText(std::string_view text);
  bool sendBinary(std::span<const std::byte> data);

  // Payloads are truncated to 125 bytes.
  bool sendPing(std::span<const std::byte> payload = {});
  bool sendPong(std::span<const std::byte> payload);

  // Starts the closing handshake. Returns false if a Close frame was already sent.
  bool close(CloseCode code, std::string_view reason = {});

  // Transport is gone (peer reset, write failure, server stop).
  void onTransportClosed();

  [[nodiscard]] bool hasPendingOutput() const noexcept { return _outputOffset < _outputBuffer.size(); }

  [[nodiscard]] std::span<const std::byte> pendingOutput() const noexcept {
    return {_outputBuffer.data() + _outputOffset, _outputBuffer.size() - _outputOffset};
  }

  void onOutputWritten(std::size_t nbBytes) noexcept;

  // The owner may release the transport: session is Closed and its last frames were flushed, or the peer does not
  // read its output anymore.
  [[nodiscard]] bool canDropTransport() const noexcept {
    return _outputOverflowed || (_state == State::Closed && !hasPendingOutput());
  }

  // The output bound was hit. The session is Closing with 1008 and will not wait for the peer.
  [[nodiscard]] bool outputOverflowed() const noexcept { return _outputOverflowed; }

  [[nodiscard]] Id id() const noexcept { return _id; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] bool isOpen() const noexcept { return _state == State::Open; }

  // Code of the Close frame we sent (or echoed), NoStatusReceived if none.
  [[nodiscard]] CloseCode closeCode() const noexcept { return _closeCode; }

  // Bytes held for incomplete frames and messages.
  [[nodiscard]] std::size_t bufferedBytes() const noexcept { return _inputBuffer.size() + _message.size(); }

  [[nodiscard]] uint64_t nbMessagesReceived() const noexcept { return _nbMessagesReceived; }

  [[nodiscard]] uint64_t nbMessagesDropped() const noexcept { return _nbMessagesDropped; }

  [[nodiscard]] SteadyTimePoint lastActivity() const noexcept { return _lastActivity; }

  [[nodiscard]] const WebSocketConfig& config() const noexcept { return _config; }

 private:
  enum class FrameAction : uint8_t { Continue, Stop };

  [[nodiscard]] std::size_t dataPayloadBudget() const noexcept;

  FrameAction processFrame(const FrameParseResult& frame);
  FrameAction handleDataFrame(const FrameHeader& header, std::span<const std::byte> payload);
  FrameAction handleControlFrame(const FrameHeader& header, std::span<const std::byte> payload);
  FrameAction completeMessage();

  void failWith(CloseCode code, std::string_view reason);
  bool queueFrame(Opcode opcode, std::span<const std::byte> payload);
  void onOutputOverflow(std::size_t refusedPayloadSize);
  void finish(CloseCode code, std::string_view reason);

  WebSocketConfig _config;
  WebSocketCallbacks _callbacks;
  RateLimiter* _messageLimiter;
  std::string _limiterKey;
  Id _id;

  RawBytes _inputBuffer;
  RawBytes _message;
  RawBytes _outputBuffer;
  std::size_t _outputOffset{};
  std::size_t _maxOutputBytes;

  SteadyTimePoint _now{};
  SteadyTimePoint _lastActivity{};
  SteadyTimePoint _lastPing{};
  SteadyTimePoint _closeSentAt{};

  uint64_t _nbMessagesReceived{};
  uint64_t _nbMessagesDropped{};
  uint32_t _consecutiveDrops{};

  State _state{State::Handshaking};
  CloseCode _closeCode{CloseCode::NoStatusReceived};
  Opcode _messageOpcode{Opcode::Text};
  bool _messageInProgress{false};
  bool _outputOverflowed{false};
};

}  // namespace turbonet::websocket
