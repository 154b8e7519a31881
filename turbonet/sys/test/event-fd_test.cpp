#include "turbonet/event-fd.hpp"

#include <gtest/gtest.h>
#include <poll.h>

#include <thread>

namespace turbonet {

namespace {

bool IsReadable(int fd) {
  pollfd pfd{fd, POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace

TEST(EventFd, SendMakesItReadableUntilDrained) {
  EventFd eventFd;
  EXPECT_GE(eventFd.fd(), 0);
  EXPECT_FALSE(IsReadable(eventFd.fd()));

  eventFd.send();
  eventFd.send();
  EXPECT_TRUE(IsReadable(eventFd.fd()));

  eventFd.read();
  EXPECT_FALSE(IsReadable(eventFd.fd()));
  // draining an empty eventfd is harmless
  eventFd.read();
}

TEST(EventFd, SendFromAnotherThread) {
  EventFd eventFd;
  std::thread([&eventFd] { eventFd.send(); }).join();
  EXPECT_TRUE(IsReadable(eventFd.fd()));
}

}  // namespace turbonet
