#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "turbonet/connection-state.hpp"
#include "turbonet/dispatch-engine.hpp"
#include "turbonet/event-fd.hpp"
#include "turbonet/event-loop.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/server-context.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/socket.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/timestring.hpp"
#include "turbonet/vector.hpp"
#include "turbonet/websocket-endpoint.hpp"

namespace turbonet {

// One epoll event loop serving HTTP/1.1 and WebSocket connections on its own listening socket.
//  - The socket is bound at construction (SO_REUSEPORT when several loops or workers share the address), so port()
//    is known before run().
//  - Single threaded: everything but stop() must be called from the thread running run().
//  - Requests of a connection are answered in order, including pipelined ones.
//  - Output queued on a connection is bounded by ServerConfig::maxOutboundBufferBytes: above half of it the
//    connection is not read and its pipelined requests wait, a WebSocket session exceeding it is dropped.
//  - A periodic tick (ServerContext::tickInterval()) drives keep-alive expiry, WebSocket heartbeats and timeouts,
//    and the purge of expired cache entries and idle rate limiter buckets.
class WorkerServer {
 public:
  // Binds and listens. 'port' overrides the configured port (used to bind several loops on an ephemeral port).
  // Throws std::system_error if the socket cannot be set up.
  explicit WorkerServer(ServerContext& context, std::optional<uint16_t> port = std::nullopt);

  WorkerServer(const WorkerServer&) = delete;
  WorkerServer(WorkerServer&&) = delete;
  WorkerServer& operator=(const WorkerServer&) = delete;
  WorkerServer& operator=(WorkerServer&&) = delete;

  ~WorkerServer();

  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  // Runs the event loop until stop() is called or a termination signal is received. Open WebSocket sessions are
  // sent a 1001 Close frame and all connections are closed before returning.
  void run();

  // Thread safe. Makes run() return as soon as possible.
  void stop() noexcept;

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_acquire); }

  // Counters of this loop. Only consistent when read from the loop thread or after run() returned.
  [[nodiscard]] const ServerStats& stats() const noexcept { return _stats; }

  [[nodiscard]] std::size_t nbConnections() const noexcept { return _connections.size(); }

 private:
  using ConnectionMap = std::unordered_map<int, std::unique_ptr<ConnectionState>>;
  using ConnectionMapIt = ConnectionMap::iterator;

  void processEvents(SteadyTimePoint now);

  void acceptNewConnections(SteadyTimePoint now);

  void handleReadableClient(int fd, SteadyTimePoint now);

  void handleWritableClient(int fd, SteadyTimePoint now);

  void processHttpRequests(ConnectionState& state, SteadyTimePoint now);

  // Returns true if the request upgraded the connection to WebSocket (or was rejected as such).
  bool tryUpgrade(ConnectionState& state, const HttpRequest& request, std::string_view leftover, SteadyTimePoint now);

  void queueResponse(ConnectionState& state, const HttpResponse& response, bool headRequest, bool keepAlive);

  void queueError(ConnectionState& state, http::StatusCode statusCode);

  // Writes as much pending output as the socket accepts, arming EPOLLOUT when it would block.
  // Returns false on a write error (the connection must be closed).
  bool flushOutput(int fd, ConnectionState& state);

  // Flushes the connection, serves the requests held back by a full output, applies read backpressure and closes
  // the connection once it is done (closeAfterWrite, WebSocket session closed or not reading its output).
  // 'cnxIt' may be invalidated.
  void afterIo(ConnectionMapIt cnxIt, SteadyTimePoint now);

  // Sends the frames queued on sessions by other connections (broadcast).
  void flushWebSocketSessions(SteadyTimePoint now);

  [[nodiscard]] std::size_t outputHighWaterMark() const noexcept;

  void onTick(SteadyTimePoint now);

  void enableWritableInterest(int fd, ConnectionState& state);

  void disableWritableInterest(int fd, ConnectionState& state);

  void setInterest(int fd, ConnectionState& state, bool readPaused, bool writable);

  ConnectionMapIt closeConnection(ConnectionMapIt cnxIt);

  void closeAllConnections();

  std::string_view currentDate();

  ServerContext* _context;
  uint16_t _port;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
  Socket _listenSocket;
  EventFd _wakeupFd;
  EventLoop _eventLoop;
  DispatchEngine _dispatchEngine;
  ServerStats _stats;
  // index aligned with ServerContext::webSocketRoutes(), must outlive the sessions in _connections
  vector<std::unique_ptr<websocket::WebSocketEndpointRuntime>> _webSocketRuntimes;
  ConnectionMap _connections;
  vector<char> _readBuffer;
  std::size_t _nbWebSocketSessions{0};
  uint64_t _nextSessionId{1};
  SteadyTimePoint _nextTick;
  SteadyTimePoint _lastPurge;
  std::time_t _dateSecond{};
  std::array<char, kRFC7231DateStrLen> _date{};
};

}  // namespace turbonet
