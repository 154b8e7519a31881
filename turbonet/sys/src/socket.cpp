#include "turbonet/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "turbonet/errno-throw.hpp"
#include "turbonet/log.hpp"

namespace turbonet {

namespace {

int ToSysType(Socket::Type type) {
  switch (type) {
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      return SOCK_STREAM | SOCK_CLOEXEC;
  }
}

}  // namespace

Socket::Socket(Type type) : _baseFd(::socket(AF_INET, ToSysType(type), 0)) {
  if (!_baseFd) {
    ThrowSystemError("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(std::string_view host, uint16_t& port, bool reusePort, bool tcpNoDelay, int backlog) {
  const int fd = _baseFd.fd();
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) < 0) {
    ThrowSystemError("setsockopt(SO_REUSEADDR) failed");
  }
  if (reusePort && ::setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) < 0) {
    ThrowSystemError("setsockopt(SO_REUSEPORT) failed");
  }
  if (tcpNoDelay && ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) < 0) {
    ThrowSystemError("setsockopt(TCP_NODELAY) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string hostStr(host.empty() ? std::string_view("0.0.0.0") : host);
  if (::inet_pton(AF_INET, hostStr.c_str(), &addr.sin_addr) != 1) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            fmt::format("invalid IPv4 listen address '{}'", hostStr));
  }

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    ThrowSystemError("bind failed on {}:{}", hostStr, port);
  }
  if (::listen(fd, backlog) != 0) {
    ThrowSystemError("listen failed on {}:{}", hostStr, port);
  }
  if (port == 0) {
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&actual), &len) != 0) {
      ThrowSystemError("getsockname failed");
    }
    port = ntohs(actual.sin_port);
  }
  log::debug("Socket fd # {} listening on {}:{} (reusePort={})", fd, hostStr, port, reusePort);
}

}  // namespace turbonet
