#include "turbonet/json-escape.hpp"

#include <gtest/gtest.h>

#include <string>

namespace turbonet {

TEST(JsonEscape, Plain) {
  std::string out;
  AppendJsonString(out, "Not Found");
  EXPECT_EQ(out, "\"Not Found\"");
}

TEST(JsonEscape, SpecialChars) {
  std::string out = "x:";
  AppendJsonString(out, "a\"b\\c\nd\x01");
  EXPECT_EQ(out, "x:\"a\\\"b\\\\c\\nd\\u0001\"");
}

}  // namespace turbonet
