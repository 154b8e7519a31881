#pragma once

#include "turbonet/base-fd.hpp"

namespace turbonet {

// Non-blocking eventfd used to wake up an event loop blocked in epoll_wait from another thread.
class EventFd {
 public:
  // Throws std::system_error on failure.
  EventFd();

  // Safe to call from any thread.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace turbonet
