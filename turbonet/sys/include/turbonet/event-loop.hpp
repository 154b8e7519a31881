#pragma once

#include <cstdint>
#include <span>

#include "turbonet/base-fd.hpp"
#include "turbonet/event.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/vector.hpp"

namespace turbonet {

// Thin RAII wrapper over epoll (level-triggered).
//
// The event buffer starts with kInitialCapacity slots and doubles whenever a poll returns exactly capacity() events,
// so that a burst of ready descriptors is drained in fewer wake-ups. It never shrinks.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct EventFd {
    EventBmp eventBmp;
    int fd;
  };

  EventLoop() noexcept = default;

  // Throws std::system_error if the epoll instance cannot be created.
  explicit EventLoop(SysDuration pollTimeout, uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&& rhs) noexcept;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&& rhs) noexcept;

  ~EventLoop();

  // Register fd with given events. Throws std::system_error on failure.
  void addOrThrow(EventFd event) const;

  // Register fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool add(EventFd event) const;

  // Modify fd with given events. Returns false on failure (logged).
  [[nodiscard]] bool mod(EventFd event) const;

  // Remove fd from the interest list. Failures are logged at debug level (fd may already be closed).
  void del(int fd) const;

  // Waits for ready events up to the poll timeout.
  // Returns a span over an internal reusable buffer, empty on timeout or EINTR.
  [[nodiscard]] std::span<const EventFd> poll();

  [[nodiscard]] uint32_t capacity() const noexcept { return _nbAllocatedEvents; }

  void updatePollTimeout(SysDuration pollTimeout);

 private:
  uint32_t _nbAllocatedEvents{0};
  int _pollTimeoutMs{0};
  BaseFd _baseFd;
  void* _pEvents{nullptr};
  vector<EventFd> _readyEvents;
};

}  // namespace turbonet
