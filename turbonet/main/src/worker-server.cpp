#include "turbonet/worker-server.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/connection-state.hpp"
#include "turbonet/connection.hpp"
#include "turbonet/event.hpp"
#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/json-escape.hpp"
#include "turbonet/log.hpp"
#include "turbonet/signal-handler.hpp"
#include "turbonet/socket-ops.hpp"
#include "turbonet/socket.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/timestring.hpp"
#include "turbonet/websocket-constants.hpp"
#include "turbonet/websocket-endpoint.hpp"
#include "turbonet/websocket-frame.hpp"
#include "turbonet/websocket-session.hpp"
#include "turbonet/websocket-upgrade.hpp"

namespace turbonet {

namespace {

constexpr std::size_t kReadChunkBytes = std::size_t{16} << 10;

constexpr auto kPurgePeriod = std::chrono::seconds{1};

constexpr EventBmp kReadEvents = EventIn | EventRdHup;

constexpr std::string_view kShutdownReason = "Server shutdown";

bool WouldBlock(int err) noexcept { return err == EAGAIN || err == EWOULDBLOCK; }

http::StatusCode ParseErrorStatus(RequestParseResult::Status status) noexcept {
  switch (status) {
    case RequestParseResult::Status::HeadersTooLarge:
      return http::StatusCodeRequestHeaderFieldsTooLarge;
    case RequestParseResult::Status::BodyTooLarge:
      return http::StatusCodePayloadTooLarge;
    case RequestParseResult::Status::MethodNotImplemented:
      return http::StatusCodeNotImplemented;
    case RequestParseResult::Status::VersionNotSupported:
      return http::StatusCodeHTTPVersionNotSupported;
    default:
      return http::StatusCodeBadRequest;
  }
}

bool ListenersShareAddress(const ServerConfig& config) noexcept {
  return config.reusePort || config.eventLoopThreads > 1 || config.effectiveNbWorkers() > 1;
}

}  // namespace

WorkerServer::WorkerServer(ServerContext& context, std::optional<uint16_t> port)
    : _context(&context),
      _port(port.value_or(context.config().port)),
      _listenSocket(Socket::Type::StreamNonBlock),
      _eventLoop(std::chrono::duration_cast<SysDuration>(context.tickInterval())),
      _dispatchEngine(context.routeTable(), context.bridge(), context.cache(), context.rateLimiter(),
                      context.dispatchOptions()),
      _readBuffer(kReadChunkBytes) {
  const ServerConfig& config = context.config();
  _listenSocket.bindAndListen(config.host, _port, ListenersShareAddress(config), config.tcpNoDelay, config.backlog);
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _listenSocket.fd()});
  _eventLoop.addOrThrow(EventLoop::EventFd{EventIn, _wakeupFd.fd()});

  _webSocketRuntimes.reserve(context.webSocketRoutes().size());
  for (const WebSocketRoute& route : context.webSocketRoutes()) {
    _webSocketRuntimes.push_back(
        std::make_unique<websocket::WebSocketEndpointRuntime>(route.endpoint, config.webSocket, context.bridge(),
                                                               config.maxOutboundBufferBytes));
  }
  log::debug("Event loop bound to {}:{}", config.host, _port);
}

WorkerServer::~WorkerServer() { closeAllConnections(); }

void WorkerServer::stop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _wakeupFd.send();
}

void WorkerServer::run() {
  _running.store(true, std::memory_order_release);
  const auto tickInterval = _context->tickInterval();
  const auto startTime = SteadyClock::now();
  _nextTick = startTime + tickInterval;
  _lastPurge = startTime;

  while (!_stopRequested.load(std::memory_order_acquire)) {
    if (SignalHandler::IsStopRequested()) {
      log::info("Termination signal received, stopping event loop on port {}", _port);
      break;
    }
    processEvents(SteadyClock::now());

    // Under load epoll_wait may never time out, so the tick is driven by the clock rather than by poll timeouts.
    const auto now = SteadyClock::now();
    if (now >= _nextTick) {
      onTick(now);
      _nextTick = now + tickInterval;
    }
  }

  closeAllConnections();
  log::debug("Event loop on port {} stopped, stats: {}", _port, _stats.json_str());
  _running.store(false, std::memory_order_release);
}

void WorkerServer::processEvents(SteadyTimePoint now) {
  const auto events = _eventLoop.poll();
  for (const EventLoop::EventFd& event : events) {
    const int fd = event.fd;
    if (fd == _listenSocket.fd()) {
      acceptNewConnections(now);
    } else if (fd == _wakeupFd.fd()) {
      _wakeupFd.read();
    } else {
      if ((event.eventBmp & EventOut) != 0) {
        handleWritableClient(fd, now);
      }
      // EPOLLERR / EPOLLHUP / EPOLLRDHUP can come without EPOLLIN, the read observes EOF or the error.
      if ((event.eventBmp & (EventIn | EventErr | EventHup | EventRdHup)) != 0) {
        handleReadableClient(fd, now);
      }
    }
  }
  flushWebSocketSessions(now);
}

void WorkerServer::acceptNewConnections(SteadyTimePoint now) {
  while (true) {
    Connection cnx(_listenSocket);
    if (!cnx) {
      // no more waiting connections
      break;
    }
    const int cnxFd = cnx.fd();
    if (_context->config().tcpNoDelay && !SetTcpNoDelay(cnxFd)) {
      log::debug("Serving fd # {} with Nagle's algorithm enabled", cnxFd);
    }
    if (!_eventLoop.add(EventLoop::EventFd{kReadEvents, cnxFd})) {
      continue;
    }
    auto state = std::make_unique<ConnectionState>(std::move(cnx), now);
    state->clientAddress = PeerAddress(cnxFd);
    log::trace("Accepted fd # {} from {}", cnxFd, state->clientAddress);
    _connections.insert_or_assign(cnxFd, std::move(state));
    ++_stats.connectionsAccepted;
  }
}

void WorkerServer::handleReadableClient(int fd, SteadyTimePoint now) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt == _connections.end()) {
    return;
  }
  ConnectionState& state = *cnxIt->second;

  const auto nbRead = ::recv(fd, _readBuffer.data(), _readBuffer.size(), 0);
  if (nbRead < 0) {
    const int err = errno;
    if (WouldBlock(err) || err == EINTR) {
      return;
    }
    log::debug("recv failed on fd # {}: {}", fd, std::strerror(err));
    closeConnection(cnxIt);
    return;
  }
  if (nbRead == 0) {
    // peer closed its side: try to deliver what is already queued, then close
    log::trace("EOF on fd # {}", fd);
    if (!state.isWebSocket() && state.hasPendingOutput() && !flushOutput(fd, state)) {
      log::trace("Pending responses lost on fd # {}", fd);
    }
    closeConnection(cnxIt);
    return;
  }

  const std::string_view data(_readBuffer.data(), static_cast<std::size_t>(nbRead));
  state.lastActivity = now;
  if (state.isWebSocket()) {
    state.session->processInput(websocket::AsBytes(data), now);
  } else if (!state.closeAfterWrite) {
    state.inBuffer.append(data);
    processHttpRequests(state, now);
  }
  afterIo(cnxIt, now);
}

void WorkerServer::handleWritableClient(int fd, SteadyTimePoint now) {
  const auto cnxIt = _connections.find(fd);
  if (cnxIt != _connections.end()) {
    afterIo(cnxIt, now);
  }
}

void WorkerServer::processHttpRequests(ConnectionState& state, SteadyTimePoint now) {
  const ServerConfig& config = _context->config();
  const RequestParseLimits limits{config.maxHeaderBytes, config.maxBodyBytes};
  const std::size_t highWaterMark = outputHighWaterMark();

  std::size_t consumed = 0;
  while (!state.closeAfterWrite && !state.isWebSocket() && consumed < state.inBuffer.size()) {
    if (state.pendingOutputBytes() > highWaterMark) {
      // served by afterIo once the peer has read enough
      state.requestsHeldBack = true;
      break;
    }
    const std::string_view data = std::string_view(state.inBuffer).substr(consumed);
    HttpRequest request;
    const RequestParseResult result = ParseHttpRequest(data, limits, request);
    if (result.status == RequestParseResult::Status::Incomplete) {
      break;
    }
    if (result.status != RequestParseResult::Status::Complete) {
      log::debug("Malformed request from {}, closing", state.clientAddress);
      queueError(state, ParseErrorStatus(result.status));
      consumed = state.inBuffer.size();
      break;
    }
    consumed += result.bytesConsumed;
    ++state.nbRequests;
    request.setClientAddress(state.clientAddress);

    if (request.isWebSocketUpgrade() &&
        tryUpgrade(state, request, std::string_view(state.inBuffer).substr(consumed), now)) {
      consumed = state.inBuffer.size();
      break;
    }

    const bool keepAlive = config.enableKeepAlive && request.wantsKeepAlive() &&
                           state.nbRequests < config.maxRequestsPerConnection;
    HttpResponse response = _dispatchEngine.dispatch(request, now, _stats);
    queueResponse(state, response, request.method() == http::Method::HEAD, keepAlive);
    if (!keepAlive) {
      state.closeAfterWrite = true;
    }
  }
  state.inBuffer.erase(0, consumed);
}

bool WorkerServer::tryUpgrade(ConnectionState& state, const HttpRequest& request, std::string_view leftover,
                              SteadyTimePoint now) {
  const auto routeIdx = _context->findWebSocketRoute(request.path());
  if (!routeIdx) {
    // not a WebSocket endpoint, served as a plain HTTP request
    return false;
  }
  websocket::UpgradeResult upgrade = websocket::ProcessUpgradeRequest(request);
  queueResponse(state, upgrade.response, false, upgrade.accepted);
  if (!upgrade.accepted) {
    log::debug("Rejected WebSocket upgrade from {} with status {}", state.clientAddress, upgrade.response.status());
    state.closeAfterWrite = true;
    return true;
  }

  websocket::WebSocketEndpointRuntime& runtime = *_webSocketRuntimes[*routeIdx];
  state.session = runtime.createSession(_nextSessionId++, request, now);
  ++_nbWebSocketSessions;
  ++_stats.webSocketSessionsOpened;
  log::debug("WebSocket session {} opened on {} for {}", state.session->id(), request.path(), state.clientAddress);
  if (!leftover.empty()) {
    // frames sent right behind the handshake request
    state.session->processInput(websocket::AsBytes(leftover), now);
  }
  return true;
}

void WorkerServer::queueResponse(ConnectionState& state, const HttpResponse& response, bool headRequest,
                                 bool keepAlive) {
  HttpResponse::SerializeOptions options;
  options.date = currentDate();
  options.serverName = _context->config().serverName;
  options.keepAlive = keepAlive;
  options.headRequest = headRequest;
  response.appendTo(state.outBuffer, options);
  ++_stats.totalRequestsServed;
}

void WorkerServer::queueError(ConnectionState& state, http::StatusCode statusCode) {
  std::string body("{\"error\":");
  AppendJsonString(body, http::ReasonPhrase(statusCode));
  body.push_back('}');
  queueResponse(state, HttpResponse(statusCode, std::move(body), http::ContentTypeApplicationJson), false, false);
  state.closeAfterWrite = true;
}

bool WorkerServer::flushOutput(int fd, ConnectionState& state) {
  // the HTTP output (possibly a 101 response) always precedes the WebSocket frames
  while (state.outOffset < state.outBuffer.size()) {
    const auto nbWritten =
        SafeSend(fd, state.outBuffer.data() + state.outOffset, state.outBuffer.size() - state.outOffset);
    if (nbWritten < 0) {
      const int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (WouldBlock(err)) {
        enableWritableInterest(fd, state);
        return true;
      }
      log::debug("send failed on fd # {}: {}", fd, std::strerror(err));
      return false;
    }
    state.outOffset += static_cast<std::size_t>(nbWritten);
    _stats.totalBytesWritten += static_cast<uint64_t>(nbWritten);
  }
  state.outBuffer.clear();
  state.outOffset = 0;

  if (state.session) {
    websocket::WebSocketSession& session = *state.session;
    while (session.hasPendingOutput()) {
      const auto pending = session.pendingOutput();
      const auto nbWritten = SafeSend(fd, pending.data(), pending.size());
      if (nbWritten < 0) {
        const int err = errno;
        if (err == EINTR) {
          continue;
        }
        if (WouldBlock(err)) {
          enableWritableInterest(fd, state);
          return true;
        }
        log::debug("send failed on WebSocket fd # {}: {}", fd, std::strerror(err));
        return false;
      }
      session.onOutputWritten(static_cast<std::size_t>(nbWritten));
      _stats.totalBytesWritten += static_cast<uint64_t>(nbWritten);
    }
  }
  disableWritableInterest(fd, state);
  return true;
}

std::size_t WorkerServer::outputHighWaterMark() const noexcept {
  return _context->config().maxOutboundBufferBytes / 2;
}

void WorkerServer::afterIo(ConnectionMapIt cnxIt, SteadyTimePoint now) {
  const int fd = cnxIt->first;
  ConnectionState& state = *cnxIt->second;
  _stats.maxConnectionOutboundBuffer =
      std::max(_stats.maxConnectionOutboundBuffer, static_cast<uint64_t>(state.pendingOutputBytes()));
  if (!flushOutput(fd, state)) {
    closeConnection(cnxIt);
    return;
  }
  if (state.isWebSocket() && state.session->outputOverflowed()) {
    log::warn("Dropping WebSocket session {} of {}: outbound buffer limit of {} bytes exceeded",
              state.session->id(), state.clientAddress, _context->config().maxOutboundBufferBytes);
    ++_stats.outboundOverflowCloses;
    closeConnection(cnxIt);
    return;
  }

  const std::size_t highWaterMark = outputHighWaterMark();
  while (state.requestsHeldBack && state.pendingOutputBytes() <= highWaterMark) {
    state.requestsHeldBack = false;
    processHttpRequests(state, now);
    _stats.maxConnectionOutboundBuffer =
        std::max(_stats.maxConnectionOutboundBuffer, static_cast<uint64_t>(state.pendingOutputBytes()));
    if (!flushOutput(fd, state)) {
      closeConnection(cnxIt);
      return;
    }
  }

  // reading resumes once the output is back under half of the high-water mark
  const std::size_t pendingBytes = state.pendingOutputBytes();
  if (!state.readPaused && pendingBytes > highWaterMark) {
    log::debug("Pausing reads on fd # {}: {} bytes of output pending", fd, pendingBytes);
    setInterest(fd, state, true, state.writableInterest);
  } else if (state.readPaused && pendingBytes <= highWaterMark / 2) {
    setInterest(fd, state, false, state.writableInterest);
  }

  if (state.hasPendingOutput()) {
    return;
  }
  if (state.isWebSocket() ? state.session->canDropTransport() : state.closeAfterWrite) {
    closeConnection(cnxIt);
  }
}

void WorkerServer::flushWebSocketSessions(SteadyTimePoint now) {
  if (_nbWebSocketSessions == 0) {
    return;
  }
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    ConnectionState& state = *cnxIt->second;
    if (state.isWebSocket() && (state.session->outputOverflowed() ||
                                (!state.writableInterest &&
                                 (state.session->hasPendingOutput() || state.session->canDropTransport())))) {
      auto nextIt = std::next(cnxIt);
      afterIo(cnxIt, now);
      cnxIt = nextIt;
    } else {
      ++cnxIt;
    }
  }
}

void WorkerServer::onTick(SteadyTimePoint now) {
  const ServerConfig& config = _context->config();
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    ConnectionState& state = *cnxIt->second;
    if (state.isWebSocket()) {
      state.session->onTick(now);
      auto nextIt = std::next(cnxIt);
      afterIo(cnxIt, now);
      cnxIt = nextIt;
      continue;
    }
    // Idle HTTP connections (between requests, or stalled in the middle of one) are closed after the keep-alive
    // timeout. Connections still draining their output are left alone.
    if (!state.hasPendingOutput() && now - state.lastActivity >= config.keepAliveTimeout) {
      log::trace("Closing idle fd # {}", cnxIt->first);
      cnxIt = closeConnection(cnxIt);
      continue;
    }
    ++cnxIt;
  }

  if (now - _lastPurge >= kPurgePeriod) {
    _lastPurge = now;
    const auto nbPurgedEntries = _context->cache().purgeExpired(now);
    std::size_t nbPurgedBuckets = 0;
    if (RateLimiter* rateLimiter = _context->rateLimiter(); rateLimiter != nullptr) {
      nbPurgedBuckets += rateLimiter->purgeIdle(now);
    }
    for (const auto& runtime : _webSocketRuntimes) {
      if (RateLimiter* messageLimiter = runtime->messageLimiter(); messageLimiter != nullptr) {
        nbPurgedBuckets += messageLimiter->purgeIdle(now);
      }
    }
    if (nbPurgedEntries != 0 || nbPurgedBuckets != 0) {
      log::trace("Purged {} cache entries and {} rate limiter buckets", nbPurgedEntries, nbPurgedBuckets);
    }
  }
}

void WorkerServer::enableWritableInterest(int fd, ConnectionState& state) {
  setInterest(fd, state, state.readPaused, true);
}

void WorkerServer::disableWritableInterest(int fd, ConnectionState& state) {
  setInterest(fd, state, state.readPaused, false);
}

void WorkerServer::setInterest(int fd, ConnectionState& state, bool readPaused, bool writable) {
  if (state.readPaused == readPaused && state.writableInterest == writable) {
    return;
  }
  // errors and hang-ups are always reported by epoll, even with an empty mask
  const EventBmp events = (readPaused ? EventBmp{0} : kReadEvents) | (writable ? EventOut : EventBmp{0});
  if (_eventLoop.mod(EventLoop::EventFd{events, fd})) {
    state.readPaused = readPaused;
    state.writableInterest = writable;
  }
}

WorkerServer::ConnectionMapIt WorkerServer::closeConnection(ConnectionMapIt cnxIt) {
  const int fd = cnxIt->first;
  ConnectionState& state = *cnxIt->second;
  _eventLoop.del(fd);
  if (state.session) {
    websocket::WebSocketSession& session = *state.session;
    if (session.state() != websocket::WebSocketSession::State::Closed) {
      session.onTransportClosed();
    }
    _stats.webSocketMessagesReceived += session.nbMessagesReceived();
    _stats.webSocketMessagesDropped += session.nbMessagesDropped();
    ++_stats.webSocketSessionsClosed;
    --_nbWebSocketSessions;
  }
  log::trace("Closing fd # {}", fd);
  return _connections.erase(cnxIt);
}

void WorkerServer::closeAllConnections() {
  // best effort goodbye to WebSocket peers, without waiting for their answer
  for (auto& [fd, state] : _connections) {
    if (state->session && state->session->close(websocket::CloseCode::GoingAway, kShutdownReason)) {
      if (!flushOutput(fd, *state)) {
        log::debug("Unable to send the shutdown Close frame on fd # {}", fd);
      }
    }
  }
  for (auto cnxIt = _connections.begin(); cnxIt != _connections.end();) {
    cnxIt = closeConnection(cnxIt);
  }
}

std::string_view WorkerServer::currentDate() {
  const auto now = SysClock::now();
  const std::time_t nowSecond = SysClock::to_time_t(now);
  if (nowSecond != _dateSecond) {
    _dateSecond = nowSecond;
    TimeToStringRFC7231(now, _date.data());
  }
  return {_date.data(), _date.size()};
}

}  // namespace turbonet
