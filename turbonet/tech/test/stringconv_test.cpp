#include "turbonet/stringconv.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string_view>

namespace turbonet {

TEST(StringConv, ParseInt64Valid) {
  EXPECT_EQ(ParseInt64("42"), 42);
  EXPECT_EQ(ParseInt64("-17"), -17);
  EXPECT_EQ(ParseInt64("+8"), 8);
  EXPECT_EQ(ParseInt64("0"), 0);
  EXPECT_EQ(ParseInt64("9223372036854775807"), std::numeric_limits<int64_t>::max());
}

TEST(StringConv, ParseInt64Invalid) {
  EXPECT_FALSE(ParseInt64(""));
  EXPECT_FALSE(ParseInt64("abc"));
  EXPECT_FALSE(ParseInt64("12a"));
  EXPECT_FALSE(ParseInt64("1.5"));
  EXPECT_FALSE(ParseInt64("+"));
  EXPECT_FALSE(ParseInt64("+-3"));
  EXPECT_FALSE(ParseInt64(" 1"));
  EXPECT_FALSE(ParseInt64("9223372036854775808"));
}

TEST(StringConv, ParseDouble) {
  EXPECT_EQ(ParseDouble("3.5"), 3.5);
  EXPECT_EQ(ParseDouble("-0.25"), -0.25);
  EXPECT_EQ(ParseDouble("42"), 42.0);
  EXPECT_FALSE(ParseDouble(""));
  EXPECT_FALSE(ParseDouble("1.2.3"));
  EXPECT_FALSE(ParseDouble("x1"));
  EXPECT_FALSE(ParseDouble("inf"));
  EXPECT_FALSE(ParseDouble("nan"));
}

TEST(StringConv, ParseSize) {
  EXPECT_EQ(ParseSize("1024"), 1024U);
  EXPECT_EQ(ParseSize("1a", 16), 26U);
  EXPECT_FALSE(ParseSize("-1"));
  EXPECT_FALSE(ParseSize("12 "));
}

TEST(StringConv, IntegralToCharVector) {
  auto vec = IntegralToCharVector(int64_t{-1234});
  EXPECT_EQ(std::string_view(vec.data(), vec.size()), "-1234");
  auto maxVec = IntegralToCharVector(std::numeric_limits<uint64_t>::max());
  EXPECT_EQ(std::string_view(maxVec.data(), maxVec.size()), "18446744073709551615");
}

}  // namespace turbonet
