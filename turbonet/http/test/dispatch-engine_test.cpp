#include "turbonet/dispatch-engine.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/handler-bridge.hpp"
#include "turbonet/handler-result.hpp"
#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/middleware.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/response-cache.hpp"
#include "turbonet/router-config.hpp"
#include "turbonet/router.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/timedef.hpp"

using namespace turbonet;
using namespace std::chrono_literals;

namespace {

const SteadyTimePoint kT0 = SteadyClock::now();

}  // namespace

class DispatchEngineTest : public ::testing::Test {
 protected:
  RouteId addRoute(std::string_view pattern, http::MethodBmp methods, RequestHandler handler,
                   RouteMode mode = RouteMode::Standard, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
    const RouteId routeId = table->router.add(pattern, methods, mode, ttl);
    table->targets.push_back(RouteTarget{std::move(handler), nullptr});
    return routeId;
  }

  RouteId addRoute(std::string_view pattern, http::Method method, RequestHandler handler,
                   RouteMode mode = RouteMode::Standard, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
    return addRoute(pattern, static_cast<http::MethodBmp>(method), std::move(handler), mode, ttl);
  }

  DispatchEngine& engine(RateLimiter* rateLimiter = nullptr) {
    _engine.emplace(table, bridge, cache, rateLimiter, options);
    return *_engine;
  }

  HttpResponse get(std::string_view target, SteadyTimePoint now = kT0, http::Method method = http::Method::GET) {
    HttpRequest request(method, target);
    request.setClientAddress("10.0.0.1");
    return _engine->dispatch(request, now, stats);
  }

  std::shared_ptr<RouteTable> table = std::make_shared<RouteTable>();
  HandlerBridge bridge;
  ResponseCache cache;
  ServerStats stats;
  DispatchEngine::Options options;

 private:
  std::optional<DispatchEngine> _engine;
};

TEST_F(DispatchEngineTest, StandardRouteWithCaptures) {
  addRoute("/users/<int:id>", http::Method::GET, [](const HttpRequest& req) {
    return HandlerResult(std::string("user ") + std::to_string(*req.pathParams().get<int64_t>("id")));
  });
  engine();

  auto resp = get("/users/42");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "user 42");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlain);
}

TEST_F(DispatchEngineTest, NotFoundBody) {
  engine();
  auto resp = get("/nothing");
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.body(), R"({"error":"Not Found"})");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationJson);
}

TEST_F(DispatchEngineTest, MethodNotAllowed) {
  addRoute("/items", http::Method::GET | http::Method::POST, [](const HttpRequest&) { return HandlerResult("x"); });
  engine();
  auto resp = get("/items", kT0, http::Method::DELETE);
  EXPECT_EQ(resp.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp.headerValue(http::Allow), "GET, HEAD, POST");
}

TEST_F(DispatchEngineTest, TrailingSlashRedirectKeepsQuery) {
  table->router = Router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect));
  addRoute("/docs", http::Method::GET, [](const HttpRequest&) { return HandlerResult("docs"); });
  engine();
  auto resp = get("/docs/?page=2");
  EXPECT_EQ(resp.status(), http::StatusCodeMovedPermanently);
  EXPECT_EQ(resp.headerValue(http::Location), "/docs?page=2");
}

TEST_F(DispatchEngineTest, TrailingSlashRedirectLocationIsEncoded) {
  table->router = Router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect));
  addRoute("/files/<name>", http::Method::GET, [](const HttpRequest&) { return HandlerResult("file"); });
  engine();

  auto resp = get("/files/a%20b/");
  EXPECT_EQ(resp.status(), http::StatusCodeMovedPermanently);
  EXPECT_EQ(resp.headerValue(http::Location), "/files/a%20b");

  resp = get("/files/x%0D%0ASet-Cookie:%20y/?q=1");
  EXPECT_EQ(resp.status(), http::StatusCodeMovedPermanently);
  EXPECT_EQ(resp.headerValue(http::Location), "/files/x%0D%0ASet-Cookie:%20y?q=1");
}

TEST_F(DispatchEngineTest, BuiltinHealthCheck) {
  engine();
  auto resp = get("/health");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "OK");

  options.enableHealthCheck = false;
  engine();
  EXPECT_EQ(get("/health").status(), http::StatusCodeNotFound);
}

TEST_F(DispatchEngineTest, HealthRouteOverridesBuiltinCheck) {
  addRoute("/health", http::Method::GET, [](const HttpRequest&) { return HandlerResult("{\"db\":\"up\"}"); });
  engine();
  EXPECT_EQ(get("/health").body(), "{\"db\":\"up\"}");
}

TEST_F(DispatchEngineTest, StaticRouteDoesNotCallBridge) {
  table->router.add("/robots.txt", http::Method::GET);
  table->targets.push_back(RouteTarget{
      {}, std::make_shared<const HttpResponse>(http::StatusCodeOK, "User-agent: *", http::ContentTypeTextPlain)});
  bool hookCalled = false;
  table->requestMiddlewares.emplace_back([&hookCalled](HttpRequest&) {
    hookCalled = true;
    return MiddlewareResult::Continue();
  });
  engine();
  auto resp = get("/robots.txt");
  EXPECT_EQ(resp.body(), "User-agent: *");
  EXPECT_FALSE(hookCalled);
}

TEST_F(DispatchEngineTest, HooksOrderAndShortCircuit) {
  std::string trace;
  addRoute("/h", http::Method::GET, [&trace](const HttpRequest&) {
    trace += "handler,";
    return HandlerResult("body");
  });
  table->requestMiddlewares.emplace_back([&trace](HttpRequest& req) {
    trace += "pre1,";
    if (req.queryParamValue("deny")) {
      return MiddlewareResult::ShortCircuit(HttpResponse(http::StatusCodeForbidden, "denied", "text/plain"));
    }
    return MiddlewareResult::Continue();
  });
  table->requestMiddlewares.emplace_back([&trace](HttpRequest&) {
    trace += "pre2,";
    return MiddlewareResult::Continue();
  });
  table->responseMiddlewares.emplace_back([&trace](const HttpRequest&, HttpResponse& resp) {
    trace += "post1,";
    resp.header("X-Post", "1");
  });
  table->responseMiddlewares.emplace_back([&trace](const HttpRequest&, HttpResponse&) { trace += "post2,"; });
  engine();

  auto resp = get("/h");
  EXPECT_EQ(trace, "pre1,pre2,handler,post2,post1,");
  EXPECT_EQ(resp.headerValue("X-Post"), "1");

  trace.clear();
  resp = get("/h?deny=1");
  EXPECT_EQ(trace, "pre1,post2,post1,");
  EXPECT_EQ(resp.status(), http::StatusCodeForbidden);
  EXPECT_EQ(resp.body(), "denied");
}

TEST_F(DispatchEngineTest, TurboRouteSkipsHooks) {
  bool hookCalled = false;
  addRoute("/fast", http::Method::GET, [](const HttpRequest&) { return HandlerResult("fast"); }, RouteMode::Turbo);
  table->requestMiddlewares.emplace_back([&hookCalled](HttpRequest&) {
    hookCalled = true;
    return MiddlewareResult::Continue();
  });
  engine();
  auto resp = get("/fast");
  EXPECT_EQ(resp.body(), "fast");
  EXPECT_FALSE(hookCalled);
  EXPECT_FALSE(resp.headerValue(http::XCache).has_value());
}

TEST_F(DispatchEngineTest, TurboRouteCaching) {
  int nbCalls = 0;
  addRoute(
      "/items/<int:id>", http::Method::GET,
      [&nbCalls](const HttpRequest& req) {
        ++nbCalls;
        return HandlerResult(std::to_string(*req.pathParams().get<int64_t>("id")) + "#" + std::to_string(nbCalls));
      },
      RouteMode::Turbo, std::chrono::milliseconds{60s});
  engine();

  auto resp = get("/items/1");
  EXPECT_EQ(resp.body(), "1#1");
  EXPECT_EQ(resp.headerValue(http::XCache), "MISS");

  resp = get("/items/1", kT0 + 10s);
  EXPECT_EQ(resp.body(), "1#1");
  EXPECT_EQ(resp.headerValue(http::XCache), "HIT");
  EXPECT_EQ(resp.headerValue(http::Age), "10");

  // other captures, other entry
  EXPECT_EQ(get("/items/2", kT0 + 10s).body(), "2#2");

  // expired
  resp = get("/items/1", kT0 + 61s);
  EXPECT_EQ(resp.body(), "1#3");
  EXPECT_EQ(resp.headerValue(http::XCache), "MISS");

  EXPECT_EQ(nbCalls, 3);
  EXPECT_EQ(stats.cacheHits, 1U);
  EXPECT_EQ(stats.cacheMisses, 3U);
}

TEST_F(DispatchEngineTest, TurboDefaultTtlUsesServerDefault) {
  int nbCalls = 0;
  addRoute(
      "/d", http::Method::GET,
      [&nbCalls](const HttpRequest&) {
        ++nbCalls;
        return HandlerResult("d");
      },
      RouteMode::Turbo, kDefaultCacheTtl);
  options.defaultCacheTtl = 5s;
  engine();

  (void)get("/d");
  (void)get("/d", kT0 + 4s);
  EXPECT_EQ(nbCalls, 1);
  (void)get("/d", kT0 + 5s);
  EXPECT_EQ(nbCalls, 2);
}

TEST_F(DispatchEngineTest, TurboZeroTtlIsNotCached) {
  int nbCalls = 0;
  addRoute(
      "/z", http::Method::GET,
      [&nbCalls](const HttpRequest&) {
        ++nbCalls;
        return HandlerResult("z");
      },
      RouteMode::Turbo, std::chrono::milliseconds{0});
  engine();

  const auto first = get("/z");
  const auto second = get("/z");
  EXPECT_EQ(second.body(), "z");
  EXPECT_FALSE(first.headerValue(http::XCache));
  EXPECT_FALSE(second.headerValue(http::XCache));
  EXPECT_EQ(nbCalls, 2);
  EXPECT_EQ(stats.cacheHits + stats.cacheMisses, 0U);
}

TEST_F(DispatchEngineTest, TurboFailureIsNotCached) {
  int nbCalls = 0;
  addRoute(
      "/flaky", http::Method::GET,
      [&nbCalls](const HttpRequest&) -> HandlerResult {
        if (++nbCalls == 1) {
          throw std::runtime_error("first call fails");
        }
        return HandlerResult("ok");
      },
      RouteMode::Turbo, std::chrono::milliseconds{60s});
  engine();

  EXPECT_EQ(get("/flaky").status(), http::StatusCodeInternalServerError);
  auto resp = get("/flaky");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "ok");
}

TEST_F(DispatchEngineTest, HandlerFailureMapsTo500) {
  addRoute("/boom", http::Method::GET,
           [](const HttpRequest&) -> HandlerResult { throw std::runtime_error("secret detail"); });
  engine();

  auto resp = get("/boom");
  EXPECT_EQ(resp.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.body(), R"({"error":"Internal Server Error"})");
  EXPECT_EQ(stats.handlerFailures, 1U);

  options.debugMode = true;
  engine();
  resp = get("/boom");
  EXPECT_EQ(resp.body(), R"({"error":"Internal Server Error","detail":"secret detail"})");
}

TEST_F(DispatchEngineTest, HookFailureMapsTo500) {
  addRoute("/p", http::Method::GET, [](const HttpRequest&) { return HandlerResult("p"); });
  table->requestMiddlewares.emplace_back([](HttpRequest&) -> MiddlewareResult { throw std::logic_error("hook"); });
  engine();
  EXPECT_EQ(get("/p").status(), http::StatusCodeInternalServerError);
}

TEST_F(DispatchEngineTest, RateLimitedRequestsGet429) {
  addRoute("/r", http::Method::GET, [](const HttpRequest&) { return HandlerResult("r"); });
  RateLimiter limiter(1.0, 0.5);
  engine(&limiter);

  EXPECT_EQ(get("/r").status(), http::StatusCodeOK);
  auto resp = get("/r");
  EXPECT_EQ(resp.status(), http::StatusCodeTooManyRequests);
  EXPECT_EQ(resp.headerValue(http::RetryAfter), "2");
  EXPECT_EQ(stats.rateLimitedRequests, 1U);

  EXPECT_EQ(get("/r", kT0 + 2s).status(), http::StatusCodeOK);
}

TEST_F(DispatchEngineTest, RetryAfterIsAtLeastOneSecond) {
  addRoute("/r", http::Method::GET, [](const HttpRequest&) { return HandlerResult("r"); });
  RateLimiter limiter(1.0, 1000.0);
  engine(&limiter);
  (void)get("/r");
  auto resp = get("/r");
  EXPECT_EQ(resp.status(), http::StatusCodeTooManyRequests);
  EXPECT_EQ(resp.headerValue(http::RetryAfter), "1");
}

TEST(DispatchEngineCacheKeyTest, DistinguishesCaptureValuesAndTypes) {
  PathParams intParams;
  intParams.add("id", int64_t{1});
  PathParams strParams;
  strParams.add("id", std::string("1"));
  PathParams twoParams;
  twoParams.add("a", std::string("x"));
  twoParams.add("b", std::string("y"));
  PathParams joinedParams;
  joinedParams.add("a", std::string("x/1:y"));

  EXPECT_NE(DispatchEngine::CacheKey(1, intParams), DispatchEngine::CacheKey(1, strParams));
  EXPECT_NE(DispatchEngine::CacheKey(1, intParams), DispatchEngine::CacheKey(2, intParams));
  EXPECT_NE(DispatchEngine::CacheKey(1, twoParams), DispatchEngine::CacheKey(1, joinedParams));
  EXPECT_EQ(DispatchEngine::CacheKey(3, intParams), DispatchEngine::CacheKey(3, intParams));
}
