#include "turbonet/handler-bridge.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "turbonet/execution-lock.hpp"
#include "turbonet/handler-result.hpp"
#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"

using namespace turbonet;

namespace {

class RecordingLock final : public ExecutionLock {
 public:
  void lock() override {
    locked = true;
    ++nbLocks;
  }

  void unlock() noexcept override { locked = false; }

  [[nodiscard]] bool serializes() const noexcept override { return true; }

  bool locked{false};
  int nbLocks{0};
};

}  // namespace

class HandlerBridgeTest : public ::testing::Test {
 protected:
  HttpRequest request{http::Method::GET, "/test?q=1"};
};

TEST_F(HandlerBridgeTest, SniffsStringBodies) {
  HandlerBridge bridge;
  auto resp = bridge.invoke([](const HttpRequest&) { return HandlerResult("<p>hi</p>"); }, request);
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextHtml);

  resp = bridge.invoke([](const HttpRequest&) { return HandlerResult(std::string("  {\"a\":1}")); }, request);
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationJson);

  resp = bridge.invoke([](const HttpRequest&) { return HandlerResult("[1,2]"); }, request);
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationJson);

  resp = bridge.invoke([](const HttpRequest& req) { return HandlerResult(std::string(req.path())); }, request);
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlain);
  EXPECT_EQ(resp.body(), "/test");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
}

TEST_F(HandlerBridgeTest, RawAndExplicitResults) {
  HandlerBridge bridge;
  auto resp = bridge.invoke(
      [](const HttpRequest&) { return HandlerResult(HandlerResult::Raw{"\x01\x02", "application/octet-stream"}); },
      request);
  EXPECT_EQ(resp.headerValue(http::ContentType), "application/octet-stream");
  EXPECT_EQ(resp.body(), "\x01\x02");

  resp = bridge.invoke(
      [](const HttpRequest&) {
        return HandlerResult(HandlerResult::Explicit{"{\"id\":3}", http::StatusCodeCreated, {{"X-Id", "3"}}});
      },
      request);
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.headerValue("x-id"), "3");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationJson);

  resp = bridge.invoke(
      [](const HttpRequest&) {
        return HandlerResult(
            HandlerResult::Explicit{"plain", http::StatusCodeAccepted, {{"content-type", "text/csv"}}});
      },
      request);
  EXPECT_EQ(resp.headerValue(http::ContentType), "text/csv");
  EXPECT_EQ(resp.headers().size(), 1U);
}

TEST_F(HandlerBridgeTest, HttpResponsePassesThrough) {
  HandlerBridge bridge;
  auto resp = bridge.invoke(
      [](const HttpRequest&) {
        return HandlerResult(HttpResponse(http::StatusCodeNotFound, "nope", http::ContentTypeTextPlain));
      },
      request);
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.body(), "nope");
}

TEST_F(HandlerBridgeTest, StructuredValueSerializedUnderLock) {
  auto lock = std::make_unique<RecordingLock>();
  RecordingLock& recording = *lock;
  HandlerBridge bridge(std::move(lock));

  bool serializedWhileLocked = false;
  auto resp = bridge.invoke(
      [&](const HttpRequest&) {
        return HandlerResult(StructuredValue([&] {
          serializedWhileLocked = recording.locked;
          return std::string("{\"ok\":true}");
        }));
      },
      request);
  EXPECT_TRUE(serializedWhileLocked);
  EXPECT_FALSE(recording.locked);
  EXPECT_EQ(recording.nbLocks, 1);
  EXPECT_EQ(resp.body(), "{\"ok\":true}");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationJson);
}

TEST_F(HandlerBridgeTest, ExceptionsBecomeHandlerFailure) {
  HandlerBridge bridge;
  try {
    (void)bridge.invoke([](const HttpRequest&) -> HandlerResult { throw std::runtime_error("db down"); }, request);
    FAIL() << "expected HandlerFailure";
  } catch (const HandlerFailure& failure) {
    EXPECT_STREQ(failure.what(), "db down");
  }
  EXPECT_THROW((void)bridge.invoke([](const HttpRequest&) -> HandlerResult { throw 42; }, request), HandlerFailure);

  // the lock is released after a failure
  EXPECT_NO_THROW((void)bridge.invoke([](const HttpRequest&) { return HandlerResult("fine"); }, request));
}

TEST_F(HandlerBridgeTest, GlobalLockSerializesHandlers) {
  static constexpr int kNbThreads = 8;
  static constexpr int kNbCallsPerThread = 50;
  HandlerBridge bridge(false);
  EXPECT_TRUE(bridge.executionLock().serializes());

  std::atomic<int> inside{0};
  std::atomic<int> maxInside{0};
  RequestHandler handler = [&](const HttpRequest&) {
    const int now = inside.fetch_add(1) + 1;
    int expected = maxInside.load();
    while (now > expected && !maxInside.compare_exchange_weak(expected, now)) {
    }
    std::this_thread::sleep_for(std::chrono::microseconds(10));
    inside.fetch_sub(1);
    return HandlerResult("ok");
  };

  std::vector<std::jthread> threads;
  for (int threadIdx = 0; threadIdx < kNbThreads; ++threadIdx) {
    threads.emplace_back([&] {
      HttpRequest req(http::Method::GET, "/");
      for (int idx = 0; idx < kNbCallsPerThread; ++idx) {
        (void)bridge.invoke(handler, req);
      }
    });
  }
  threads.clear();
  EXPECT_EQ(maxInside.load(), 1);
}

TEST(ExecutionLockTest, Factory) {
  EXPECT_TRUE(MakeExecutionLock(false)->serializes());
  EXPECT_FALSE(MakeExecutionLock(true)->serializes());
}

TEST(SniffContentTypeTest, Cases) {
  EXPECT_EQ(SniffContentType(""), http::ContentTypeTextPlain);
  EXPECT_EQ(SniffContentType("\n  <html>"), http::ContentTypeTextHtml);
  EXPECT_EQ(SniffContentType("{}"), http::ContentTypeApplicationJson);
  EXPECT_EQ(SniffContentType("hello"), http::ContentTypeTextPlain);
}
