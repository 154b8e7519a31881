#include "turbonet/connection.hpp"

#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "turbonet/base-fd.hpp"
#include "turbonet/log.hpp"
#include "turbonet/socket.hpp"

namespace turbonet {

namespace {

int AcceptConnectionFd(int socketFd) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  const int fd = ::accept4(socketFd, reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_NONBLOCK | SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (savedErr == EAGAIN || savedErr == EWOULDBLOCK) {
      log::trace("No more pending connection on socket fd # {}", socketFd);
    } else {
      log::error("Connection accept failed for socket fd # {}: {}", socketFd, std::strerror(savedErr));
    }
    return BaseFd::kClosedFd;
  }
  log::debug("Connection fd # {} opened", fd);
  return fd;
}

}  // namespace

Connection::Connection(const Socket& socket) : _baseFd(AcceptConnectionFd(socket.fd())) {}

Connection::Connection(BaseFd&& baseFd) noexcept : _baseFd(std::move(baseFd)) {}

}  // namespace turbonet
