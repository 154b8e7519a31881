#include "turbonet/http-response.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "turbonet/http-header.hpp"
#include "turbonet/http-status-code.hpp"

using namespace turbonet;

TEST(HttpResponseTest, SerializeWithBody) {
  HttpResponse resp(http::StatusCodeOK, "hello", http::ContentTypeTextPlain);
  std::string out;
  resp.appendTo(out, {.date = "Sun, 06 Nov 1994 08:49:37 GMT", .serverName = "turbonet"});

  EXPECT_TRUE(out.starts_with("HTTP/1.1 200 OK\r\n"));
  EXPECT_NE(out.find("Content-Type: text/plain; charset=utf-8\r\n"), std::string::npos);
  EXPECT_NE(out.find("Content-Length: 5\r\n"), std::string::npos);
  EXPECT_NE(out.find("Date: Sun, 06 Nov 1994 08:49:37 GMT\r\n"), std::string::npos);
  EXPECT_NE(out.find("Server: turbonet\r\n"), std::string::npos);
  EXPECT_NE(out.find("Connection: keep-alive\r\n"), std::string::npos);
  EXPECT_TRUE(out.ends_with("\r\n\r\nhello"));
}

TEST(HttpResponseTest, HeadRequestOmitsBodyButKeepsLength) {
  HttpResponse resp(http::StatusCodeOK, "hello", http::ContentTypeTextPlain);
  std::string out;
  resp.appendTo(out, {.keepAlive = false, .headRequest = true});
  EXPECT_NE(out.find("Content-Length: 5\r\n"), std::string::npos);
  EXPECT_NE(out.find("Connection: close\r\n"), std::string::npos);
  EXPECT_TRUE(out.ends_with("\r\n\r\n"));
  EXPECT_EQ(out.find("Date:"), std::string::npos);
}

TEST(HttpResponseTest, NoContentHasNoLengthNorBody) {
  HttpResponse resp(http::StatusCodeNoContent);
  resp.body("ignored");
  std::string out;
  resp.appendTo(out, {});
  EXPECT_TRUE(out.starts_with("HTTP/1.1 204 No Content\r\n"));
  EXPECT_EQ(out.find("Content-Length"), std::string::npos);
  EXPECT_TRUE(out.ends_with("\r\n\r\n"));
}

TEST(HttpResponseTest, HeaderReplacesCaseInsensitively) {
  HttpResponse resp;
  resp.addHeader("X-A", "1").addHeader("x-a", "2").header("X-a", "3");
  ASSERT_EQ(resp.headers().size(), 1U);
  EXPECT_EQ(resp.headerValue("x-A"), "3");

  resp.addHeader("Set-Cookie", "a=1").addHeader("Set-Cookie", "b=2");
  EXPECT_EQ(resp.headers().size(), 3U);
}

TEST(HttpResponseTest, ManagedHeadersAreNotDuplicated) {
  HttpResponse resp(http::StatusCodeOK, "abc", http::ContentTypeTextPlain);
  resp.header(http::ContentLength, "999").header(http::Server, "custom");
  std::string out;
  resp.appendTo(out, {.serverName = "turbonet"});
  EXPECT_NE(out.find("Content-Length: 3\r\n"), std::string::npos);
  EXPECT_EQ(out.find("999"), std::string::npos);
  EXPECT_NE(out.find("Server: custom\r\n"), std::string::npos);
  EXPECT_EQ(out.find("Server: turbonet"), std::string::npos);
}

TEST(HttpResponseTest, TakeBody) {
  HttpResponse resp(http::StatusCodeOK, "payload", http::ContentTypeApplicationJson);
  EXPECT_EQ(std::move(resp).takeBody(), "payload");
}
