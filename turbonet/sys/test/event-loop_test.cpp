#include "turbonet/event-loop.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>

#include "turbonet/base-fd.hpp"
#include "turbonet/event.hpp"

namespace turbonet {

TEST(EventLoop, TimeoutReturnsEmpty) {
  EventLoop loop(std::chrono::milliseconds{1});
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, ReportsReadableFd) {
  EventLoop loop(std::chrono::milliseconds{50});
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  loop.addOrThrow(EventLoop::EventFd{EventIn, rd.fd()});
  ASSERT_EQ(::write(wr.fd(), "x", 1), 1);

  auto events = loop.poll();
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].fd, rd.fd());
  EXPECT_NE(events[0].eventBmp & EventIn, 0U);

  loop.del(rd.fd());
  EXPECT_TRUE(loop.poll().empty());
}

TEST(EventLoop, GrowsWhenSaturated) {
  EventLoop loop(std::chrono::milliseconds{10}, 1);
  int fds1[2];
  int fds2[2];
  ASSERT_EQ(::pipe(fds1), 0);
  ASSERT_EQ(::pipe(fds2), 0);
  BaseFd rd1(fds1[0]);
  BaseFd wr1(fds1[1]);
  BaseFd rd2(fds2[0]);
  BaseFd wr2(fds2[1]);
  loop.addOrThrow(EventLoop::EventFd{EventIn, rd1.fd()});
  loop.addOrThrow(EventLoop::EventFd{EventIn, rd2.fd()});
  ASSERT_EQ(::write(wr1.fd(), "a", 1), 1);
  ASSERT_EQ(::write(wr2.fd(), "b", 1), 1);

  EXPECT_EQ(loop.poll().size(), 1U);
  EXPECT_EQ(loop.capacity(), 2U);
  EXPECT_EQ(loop.poll().size(), 2U);
}

TEST(EventLoop, ModOnUnknownFdFails) {
  EventLoop loop(std::chrono::milliseconds{1});
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);
  EXPECT_FALSE(loop.mod(EventLoop::EventFd{EventIn, rd.fd()}));
}

}  // namespace turbonet
