#include "turbonet/socket-ops.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "turbonet/log.hpp"

namespace turbonet {

bool SetTcpNoDelay(int fd) noexcept {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) != 0) {
    log::warn("Unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
    return false;
  }
  return true;
}

std::string PeerAddress(int fd) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return {};
  }
  char buf[INET6_ADDRSTRLEN]{};
  const void* src = nullptr;
  if (addr.ss_family == AF_INET) {
    src = &reinterpret_cast<const sockaddr_in*>(&addr)->sin_addr;
  } else if (addr.ss_family == AF_INET6) {
    src = &reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_addr;
  } else {
    return {};
  }
  if (::inet_ntop(addr.ss_family, src, buf, sizeof(buf)) == nullptr) {
    return {};
  }
  return std::string(buf);
}

int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

}  // namespace turbonet
