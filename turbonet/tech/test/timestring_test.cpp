#include "turbonet/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string_view>

namespace turbonet {

TEST(TimeString, RFC7231) {
  using namespace std::chrono;
  // 1994-11-06 08:49:37 UTC
  const SysTimePoint tp = sys_days{year{1994} / November / 6} + hours{8} + minutes{49} + seconds{37};
  char buf[kRFC7231DateStrLen];
  const char* end = TimeToStringRFC7231(tp, buf);
  EXPECT_EQ(std::string_view(buf, end), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeString, RFC7231Y2K) {
  using namespace std::chrono;
  const SysTimePoint tp = sys_days{year{2000} / January / 1};
  char buf[kRFC7231DateStrLen];
  const char* end = TimeToStringRFC7231(tp, buf);
  EXPECT_EQ(std::string_view(buf, end), "Sat, 01 Jan 2000 00:00:00 GMT");
}

}  // namespace turbonet
