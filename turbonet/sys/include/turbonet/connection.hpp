#pragma once

#include "turbonet/base-fd.hpp"
#include "turbonet/socket.hpp"

namespace turbonet {

// RAII owner of a client socket accepted (non-blocking, close-on-exec) from a listening Socket.
class Connection {
 public:
  Connection() noexcept = default;

  // Accepts one pending connection. The resulting Connection is empty (operator bool false) when none is pending
  // or on accept failure (logged).
  explicit Connection(const Socket& socket);

  explicit Connection(BaseFd&& baseFd) noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace turbonet
