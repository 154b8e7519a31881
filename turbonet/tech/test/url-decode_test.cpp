#include "turbonet/url-decode.hpp"

#include <gtest/gtest.h>

namespace turbonet::url {

TEST(UrlDecode, Decode) {
  EXPECT_EQ(Decode("a%20b", false), "a b");
  EXPECT_EQ(Decode("a+b", false), "a+b");
  EXPECT_EQ(Decode("a+b", true), "a b");
  EXPECT_EQ(Decode("%2Fx%2f", false), "/x/");
  EXPECT_FALSE(Decode("bad%2", false));
  EXPECT_FALSE(Decode("bad%zz", false));
  EXPECT_FALSE(Decode("%", false));
}

TEST(UrlDecode, EncodePath) {
  EXPECT_EQ(EncodePath("/users/7"), "/users/7");
  EXPECT_EQ(EncodePath("/a b"), "/a%20b");
  EXPECT_EQ(EncodePath("/x\r\nSet-Cookie: y"), "/x%0D%0ASet-Cookie:%20y");
  EXPECT_EQ(EncodePath("/100%?#"), "/100%25%3F%23");
  EXPECT_EQ(EncodePath("/caf\xC3\xA9"), "/caf%C3%A9");
  EXPECT_EQ(EncodePath("/k=v;p@h:1,(x)*+$!'~._-"), "/k=v;p@h:1,(x)*+$!'~._-");
  EXPECT_EQ(Decode(EncodePath("/a b/%/\x01"), false), "/a b/%/\x01");
}

TEST(UrlDecode, QueryParams) {
  auto params = DecodeQueryParams("a=1&b=x%20y&flag&a=2&&c=");
  ASSERT_EQ(params.size(), 5U);
  EXPECT_EQ(params[0].first, "a");
  EXPECT_EQ(params[0].second, "1");
  EXPECT_EQ(params[1].second, "x y");
  EXPECT_EQ(params[2].first, "flag");
  EXPECT_EQ(params[2].second, "");
  EXPECT_EQ(params[3].second, "2");
  EXPECT_EQ(params[4].first, "c");
}

TEST(UrlDecode, QueryParamsKeepMalformedEscapes) {
  auto params = DecodeQueryParams("k=%zz");
  ASSERT_EQ(params.size(), 1U);
  EXPECT_EQ(params[0].second, "%zz");
}

}  // namespace turbonet::url
