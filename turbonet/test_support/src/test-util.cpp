#include "turbonet/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "turbonet/log.hpp"
#include "turbonet/socket.hpp"
#include "turbonet/string-equal-ignore-case.hpp"

namespace turbonet::test {

namespace {

constexpr std::string_view kDoubleCRLF = "\r\n\r\n";

void connectLoop(int fd, uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    if (::connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) == 0) {
      return;
    }
    log::debug("connect failed for fd={}: {}", fd, std::strerror(errno));
  }
}

// Size of the complete response starting at raw[0], 0 if incomplete.
std::size_t completeResponseSize(std::string_view raw) {
  const auto headEnd = raw.find(kDoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return 0;
  }
  const std::size_t bodyStart = headEnd + kDoubleCRLF.size();
  const std::string_view head = raw.substr(0, headEnd);
  std::size_t contentLength = 0;
  std::size_t lineStart = head.find("\r\n");
  while (lineStart != std::string_view::npos) {
    lineStart += 2;
    const auto lineEnd = head.find("\r\n", lineStart);
    const std::string_view line = head.substr(lineStart, lineEnd - lineStart);
    const auto colonPos = line.find(':');
    if (colonPos != std::string_view::npos && CaseInsensitiveEqual(line.substr(0, colonPos), "Content-Length")) {
      std::string_view value = line.substr(colonPos + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      std::from_chars(value.data(), value.data() + value.size(), contentLength);
    }
    lineStart = lineEnd;
  }
  if (raw.size() < bodyStart + contentLength) {
    return 0;
  }
  return bodyStart + contentLength;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(Socket::Type::Stream) {
  const timeval recvTimeout{2, 0};
  if (::setsockopt(_socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &recvTimeout, sizeof(recvTimeout)) != 0) {
    log::warn("Unable to set the receive timeout of the test client: {}", std::strerror(errno));
  }
  connectLoop(_socket.fd(), port, timeout);
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const char *cursor = data.data();
  std::size_t remaining = data.size();
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (remaining > 0) {
    const auto sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
    if (sent <= 0) {
      log::error("sendAll failed with error {}", std::strerror(errno));
      if (std::chrono::steady_clock::now() >= maxTs) {
        log::error("sendAll timed out after {} ms", totalTimeout.count());
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

std::string recvUntil(int fd, const std::function<bool(std::string_view)> &isComplete,
                      std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  char buf[4096];
  while (!isComplete(out)) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= maxTs) {
      break;
    }
    pollfd pfd{fd, POLLIN, 0};
    const auto remainingMs = std::chrono::duration_cast<std::chrono::milliseconds>(maxTs - now).count();
    if (::poll(&pfd, 1, static_cast<int>(remainingMs)) <= 0) {
      continue;
    }
    const auto recvBytes = ::recv(fd, buf, sizeof(buf), 0);
    if (recvBytes <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(recvBytes));
  }
  return out;
}

std::string recvResponse(int fd, std::chrono::milliseconds totalTimeout) { return recvResponses(fd, 1, totalTimeout); }

std::string recvResponses(int fd, int nbResponses, std::chrono::milliseconds totalTimeout) {
  return recvUntil(
      fd, [nbResponses](std::string_view raw) { return countCompleteResponses(raw) >= nbResponses; }, totalTimeout);
}

std::string recvUntilClosed(int fd) {
  std::string out;
  char buf[4096];
  while (true) {
    const auto recvBytes = ::recv(fd, buf, sizeof(buf), 0);
    if (recvBytes <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(recvBytes));
  }
  return out;
}

bool waitForClose(int fd, std::chrono::milliseconds timeout) {
  const auto maxTs = std::chrono::steady_clock::now() + timeout;
  char buf[4096];
  while (std::chrono::steady_clock::now() < maxTs) {
    pollfd pfd{fd, POLLIN, 0};
    if (::poll(&pfd, 1, 10) <= 0) {
      continue;
    }
    const auto recvBytes = ::recv(fd, buf, sizeof(buf), 0);
    if (recvBytes == 0) {
      return true;
    }
    if (recvBytes < 0) {
      return errno == ECONNRESET;
    }
  }
  return false;
}

int countCompleteResponses(std::string_view raw) {
  int count = 0;
  for (std::size_t size = completeResponseSize(raw); size != 0; size = completeResponseSize(raw)) {
    ++count;
    raw.remove_prefix(size);
  }
  return count;
}

std::string simpleGet(uint16_t port, std::string_view path) {
  ClientConnection cnx(port);
  std::string req("GET ");
  req.append(path).append(" HTTP/1.1\r\nHost: 127.0.0.1\r\nConnection: close\r\n\r\n");
  if (!sendAll(cnx.fd(), req)) {
    return {};
  }
  return recvUntilClosed(cnx.fd());
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  std::size_t pos = 0;
  while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

int statusCode(std::string_view raw) {
  // "HTTP/1.1 200 OK"
  static constexpr std::size_t kStatusPos = 9;
  if (raw.size() < kStatusPos + 3) {
    return 0;
  }
  int status = 0;
  const auto [ptr, errc] = std::from_chars(raw.data() + kStatusPos, raw.data() + kStatusPos + 3, status);
  return errc == std::errc{} ? status : 0;
}

std::string_view responseBody(std::string_view raw) {
  const std::size_t size = completeResponseSize(raw);
  const auto headEnd = raw.find(kDoubleCRLF);
  if (size == 0 || headEnd == std::string_view::npos) {
    return {};
  }
  const std::size_t bodyStart = headEnd + kDoubleCRLF.size();
  return raw.substr(bodyStart, size - bodyStart);
}

}  // namespace turbonet::test
