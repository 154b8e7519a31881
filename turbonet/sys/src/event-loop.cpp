#include "turbonet/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <utility>

#include "turbonet/base-fd.hpp"
#include "turbonet/errno-throw.hpp"
#include "turbonet/event.hpp"
#include "turbonet/log.hpp"
#include "turbonet/timedef.hpp"

namespace turbonet {

namespace {

static_assert(EventIn == EPOLLIN, "EventIn value mismatch");
static_assert(EventOut == EPOLLOUT, "EventOut value mismatch");
static_assert(EventErr == EPOLLERR, "EventErr value mismatch");
static_assert(EventHup == EPOLLHUP, "EventHup value mismatch");
static_assert(EventRdHup == EPOLLRDHUP, "EventRdHup value mismatch");

int ToTimeoutMs(SysDuration pollTimeout) {
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(pollTimeout).count());
}

}  // namespace

EventLoop::EventLoop(SysDuration pollTimeout, uint32_t initialCapacity)
    : _nbAllocatedEvents(std::max(1U, initialCapacity)),
      _pollTimeoutMs(ToTimeoutMs(pollTimeout)),
      _baseFd(::epoll_create1(EPOLL_CLOEXEC)),
      _pEvents(std::malloc(static_cast<std::size_t>(_nbAllocatedEvents) * sizeof(epoll_event))) {
  if (_pEvents == nullptr) {
    throw std::bad_alloc();
  }
  if (!_baseFd) {
    std::free(_pEvents);
    ThrowSystemError("epoll_create1 failed");
  }
  _readyEvents.reserve(_nbAllocatedEvents);
  log::debug("EventLoop fd # {} opened", _baseFd.fd());
}

EventLoop::EventLoop(EventLoop&& rhs) noexcept
    : _nbAllocatedEvents(std::exchange(rhs._nbAllocatedEvents, 0)),
      _pollTimeoutMs(rhs._pollTimeoutMs),
      _baseFd(std::move(rhs._baseFd)),
      _pEvents(std::exchange(rhs._pEvents, nullptr)),
      _readyEvents(std::move(rhs._readyEvents)) {}

EventLoop& EventLoop::operator=(EventLoop&& rhs) noexcept {
  if (this != &rhs) [[likely]] {
    std::free(_pEvents);
    _nbAllocatedEvents = std::exchange(rhs._nbAllocatedEvents, 0);
    _pollTimeoutMs = rhs._pollTimeoutMs;
    _baseFd = std::move(rhs._baseFd);
    _pEvents = std::exchange(rhs._pEvents, nullptr);
    _readyEvents = std::move(rhs._readyEvents);
  }
  return *this;
}

EventLoop::~EventLoop() { std::free(_pEvents); }

void EventLoop::addOrThrow(EventFd event) const {
  if (!add(event)) [[unlikely]] {
    ThrowSystemError("epoll_ctl ADD failed (fd # {}, events=0x{:x})", event.fd, event.eventBmp);
  }
}

bool EventLoop::add(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_ADD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("epoll_ctl ADD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
               std::strerror(err));
    return false;
  }
  return true;
}

bool EventLoop::mod(EventFd event) const {
  epoll_event ev{};
  ev.events = event.eventBmp;
  ev.data.fd = event.fd;
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_MOD, event.fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    // EBADF / ENOENT happen when the connection was concurrently closed; not worth an error.
    if (err == EBADF || err == ENOENT) {
      log::warn("epoll_ctl MOD benign failure (fd # {}, errno={}, msg={})", event.fd, err, std::strerror(err));
    } else {
      log::error("epoll_ctl MOD failed (fd # {}, events=0x{:x}, errno={}, msg={})", event.fd, event.eventBmp, err,
                 std::strerror(err));
    }
    return false;
  }
  return true;
}

void EventLoop::del(int fd) const {
  if (::epoll_ctl(_baseFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) [[unlikely]] {
    const auto err = errno;
    log::debug("epoll_ctl DEL failed (fd # {}, errno={}, msg={})", fd, err, std::strerror(err));
  }
}

std::span<const EventLoop::EventFd> EventLoop::poll() {
  const uint32_t capacityBeforePoll = _nbAllocatedEvents;
  auto* epollEvents = static_cast<epoll_event*>(_pEvents);

  const int nbReadyFds = ::epoll_wait(_baseFd.fd(), epollEvents, static_cast<int>(capacityBeforePoll), _pollTimeoutMs);

  _readyEvents.clear();
  if (nbReadyFds == -1) {
    if (errno != EINTR) {
      const auto err = errno;
      log::error("epoll_wait failed (timeout_ms={}, errno={}, msg={})", _pollTimeoutMs, err, std::strerror(err));
    }
    return {};
  }

  for (int idx = 0; idx < nbReadyFds; ++idx) {
    _readyEvents.push_back(EventFd{epollEvents[idx].events, epollEvents[idx].data.fd});
  }

  if (std::cmp_equal(nbReadyFds, capacityBeforePoll)) {
    const uint32_t newCapacity = capacityBeforePoll * 2U;
    void* newEvents = std::realloc(_pEvents, static_cast<std::size_t>(newCapacity) * sizeof(epoll_event));
    if (newEvents == nullptr) {
      log::error("Failed to grow epoll event buffer, keeping {} slots", _nbAllocatedEvents);
    } else {
      _pEvents = newEvents;
      _nbAllocatedEvents = newCapacity;
    }
  }

  return {_readyEvents.data(), _readyEvents.size()};
}

void EventLoop::updatePollTimeout(SysDuration pollTimeout) { _pollTimeoutMs = ToTimeoutMs(pollTimeout); }

}  // namespace turbonet
