#pragma once

#include <cstdint>
#include <string_view>

#include "turbonet/base-fd.hpp"

namespace turbonet {

// RAII IPv4 TCP listening socket.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Throws std::system_error on failure.
  explicit Socket(Type type);

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to 'host':'port' and start listening with the given backlog.
  // If port is 0, an ephemeral port is chosen and written back to 'port'.
  // SO_REUSEADDR is always set; SO_REUSEPORT when 'reusePort' is true, so that several processes can share the
  // same address and let the kernel balance accepted connections between them.
  // Throws std::system_error on failure.
  void bindAndListen(std::string_view host, uint16_t& port, bool reusePort, bool tcpNoDelay, int backlog);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace turbonet
