#include "turbonet/router.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "turbonet/http-method.hpp"
#include "turbonet/router-config.hpp"

using namespace turbonet;

class RouterTest : public ::testing::Test {
 protected:
  Router router;
};

TEST_F(RouterTest, LiteralRoute) {
  const RouteId id = router.add("/hello", http::Method::GET);

  auto res = router.match(http::Method::GET, "/hello");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, id);
  EXPECT_TRUE(res.pathParams.empty());

  EXPECT_EQ(router.match(http::Method::GET, "/hell").status, RoutingResult::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/hello/world").status, RoutingResult::Status::NotFound);
}

TEST_F(RouterTest, RootRoute) {
  const RouteId id = router.add("/", http::Method::GET);
  auto res = router.match(http::Method::GET, "/");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, id);
  EXPECT_FALSE(router.match(http::Method::GET, "//").matched());
}

TEST_F(RouterTest, EmptyRouterMatchesNothing) {
  EXPECT_EQ(router.match(http::Method::GET, "/").status, RoutingResult::Status::NotFound);
}

TEST_F(RouterTest, TypedCaptures) {
  router.add("/users/<int:id>/posts/<slug>", http::Method::GET);

  auto res = router.match(http::Method::GET, "/users/42/posts/hello-world");
  ASSERT_TRUE(res.matched());
  ASSERT_EQ(res.pathParams.size(), 2U);
  EXPECT_EQ(res.pathParams.get<int64_t>("id"), 42);
  EXPECT_EQ(res.pathParams.get<std::string>("slug"), "hello-world");
  // typed access to the wrong alternative gives nothing
  EXPECT_FALSE(res.pathParams.get<std::string>("id").has_value());
}

TEST_F(RouterTest, NegativeIntAndFloatCaptures) {
  router.add("/int/<int:val>", http::Method::GET);
  router.add("/float/<float:val>", http::Method::GET);

  auto res = router.match(http::Method::GET, "/int/-17");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.pathParams.get<int64_t>("val"), -17);

  res = router.match(http::Method::GET, "/float/3.25");
  ASSERT_TRUE(res.matched());
  EXPECT_DOUBLE_EQ(*res.pathParams.get<double>("val"), 3.25);
}

TEST_F(RouterTest, ConversionFailureIsNonMatch) {
  router.add("/items/<int:id>", http::Method::GET);
  router.add("/ratio/<float:x>", http::Method::GET);

  EXPECT_EQ(router.match(http::Method::GET, "/items/abc").status, RoutingResult::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/items/12abc").status, RoutingResult::Status::NotFound);
  // overflows int64
  EXPECT_EQ(router.match(http::Method::GET, "/items/99999999999999999999").status, RoutingResult::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/ratio/inf").status, RoutingResult::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/ratio/nan").status, RoutingResult::Status::NotFound);
  EXPECT_EQ(router.match(http::Method::GET, "/ratio/1e999").status, RoutingResult::Status::NotFound);
}

TEST_F(RouterTest, OverflowingIntFallsBackToStringCapture) {
  const RouteId intId = router.add("/n/<int:i>", http::Method::GET);
  const RouteId stringId = router.add("/n/<s>", http::Method::GET);

  EXPECT_EQ(router.match(http::Method::GET, "/n/9223372036854775807").routeId, intId);
  const auto res = router.match(http::Method::GET, "/n/9223372036854775808");
  EXPECT_EQ(res.routeId, stringId);
  EXPECT_EQ(res.pathParams.get<std::string>("s"), "9223372036854775808");
}

TEST_F(RouterTest, PriorityLiteralIntFloatString) {
  const RouteId literalId = router.add("/v/me", http::Method::GET);
  const RouteId intId = router.add("/v/<int:i>", http::Method::GET);
  const RouteId floatId = router.add("/v/<float:f>", http::Method::GET);
  const RouteId stringId = router.add("/v/<string:s>", http::Method::GET);

  EXPECT_EQ(router.match(http::Method::GET, "/v/me").routeId, literalId);
  EXPECT_EQ(router.match(http::Method::GET, "/v/12").routeId, intId);
  EXPECT_EQ(router.match(http::Method::GET, "/v/1.5").routeId, floatId);
  EXPECT_EQ(router.match(http::Method::GET, "/v/abc").routeId, stringId);
}

TEST_F(RouterTest, BacktracksWhenHigherPriorityBranchFailsDeeper) {
  const RouteId intId = router.add("/a/<int:id>/x", http::Method::GET);
  const RouteId stringId = router.add("/a/<name>/y", http::Method::GET);

  auto res = router.match(http::Method::GET, "/a/5/y");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, stringId);
  ASSERT_EQ(res.pathParams.size(), 1U);
  EXPECT_EQ(res.pathParams.get<std::string>("name"), "5");

  res = router.match(http::Method::GET, "/a/5/x");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, intId);
  EXPECT_EQ(res.pathParams.get<int64_t>("id"), 5);
}

TEST_F(RouterTest, BacktracksFromLiteralToCapture) {
  const RouteId literalId = router.add("/files/static/index", http::Method::GET);
  const RouteId captureId = router.add("/files/<dir>/list", http::Method::GET);

  EXPECT_EQ(router.match(http::Method::GET, "/files/static/index").routeId, literalId);
  auto res = router.match(http::Method::GET, "/files/static/list");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, captureId);
  EXPECT_EQ(res.pathParams.get<std::string>("dir"), "static");
}

TEST_F(RouterTest, PathCaptureSwallowsRemainder) {
  const RouteId pathId = router.add("/static/<path:rest>", http::Method::GET);
  const RouteId specificId = router.add("/static/<name>", http::Method::GET);

  auto res = router.match(http::Method::GET, "/static/css/site/main.css");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, pathId);
  EXPECT_EQ(res.pathParams.get<std::string>("rest"), "css/site/main.css");

  // single segment prefers the string capture
  EXPECT_EQ(router.match(http::Method::GET, "/static/app.js").routeId, specificId);

  // nothing to capture
  EXPECT_FALSE(router.match(http::Method::GET, "/static/").matched());
}

TEST_F(RouterTest, CaptureNamesComeFromWinningRoute) {
  const RouteId getId = router.add("/items/<int:itemId>", http::Method::GET);
  const RouteId putId = router.add("/items/<int:key>", http::Method::PUT);

  auto res = router.match(http::Method::GET, "/items/3");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, getId);
  EXPECT_EQ(res.pathParams.get<int64_t>("itemId"), 3);

  res = router.match(http::Method::PUT, "/items/3");
  ASSERT_TRUE(res.matched());
  EXPECT_EQ(res.routeId, putId);
  EXPECT_EQ(res.pathParams.get<int64_t>("key"), 3);
}

TEST_F(RouterTest, MethodNotAllowedListsAllowedMethods) {
  router.add("/res", http::Method::GET | http::Method::POST);

  auto res = router.match(http::Method::DELETE, "/res");
  EXPECT_EQ(res.status, RoutingResult::Status::MethodNotAllowed);
  EXPECT_TRUE(http::IsMethodSet(res.allowedMethods, http::Method::GET));
  EXPECT_TRUE(http::IsMethodSet(res.allowedMethods, http::Method::POST));
  EXPECT_TRUE(http::IsMethodSet(res.allowedMethods, http::Method::HEAD));
  EXPECT_FALSE(http::IsMethodSet(res.allowedMethods, http::Method::DELETE));
}

TEST_F(RouterTest, HeadFallsBackToGet) {
  const RouteId getId = router.add("/doc", http::Method::GET);
  EXPECT_EQ(router.match(http::Method::HEAD, "/doc").routeId, getId);

  const RouteId headId = router.add("/doc", http::Method::HEAD);
  EXPECT_EQ(router.match(http::Method::HEAD, "/doc").routeId, headId);
}

TEST_F(RouterTest, ConflictOnSameShapeAndMethod) {
  router.add("/users/<int:id>", http::Method::GET);
  EXPECT_THROW(router.add("/users/<int:userId>", http::Method::GET), RouteConflictError);
  EXPECT_THROW(router.add("/users/<int:userId>", http::Method::GET | http::Method::POST), RouteConflictError);
  // different method, different kind or different trailing slash are not conflicts
  EXPECT_NO_THROW(router.add("/users/<int:userId>", http::Method::POST));
  EXPECT_NO_THROW(router.add("/users/<name>", http::Method::GET));
  EXPECT_NO_THROW(router.add("/users/<int:id>/", http::Method::GET));
  EXPECT_EQ(router.size(), 4U);
}

TEST_F(RouterTest, RouteConflictIsLogicError) {
  router.add("/a", http::Method::GET);
  EXPECT_THROW(router.add("/a", http::Method::GET), std::logic_error);
}

TEST_F(RouterTest, MalformedPatterns) {
  EXPECT_THROW(router.add("", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("no-slash", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/a//b", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/<int:>", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/<uuid:id>", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/x<int:id>", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/<a>/<a>", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/<path:p>/tail", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/<path:p>/", http::Method::GET), std::invalid_argument);
  EXPECT_THROW(router.add("/ok", http::MethodBmp{0}), std::invalid_argument);
  EXPECT_TRUE(router.empty());
}

TEST_F(RouterTest, CacheTtlOnlyForTurboRoutes) {
  EXPECT_THROW(router.add("/a", http::Method::GET, RouteMode::Standard, std::chrono::seconds{1}), std::invalid_argument);
  const RouteId id = router.add("/a", http::Method::GET, RouteMode::Turbo, std::chrono::seconds{1});
  const RouteInfo& info = router.route(id);
  EXPECT_EQ(info.mode, RouteMode::Turbo);
  ASSERT_TRUE(info.cacheTtl.has_value());
  EXPECT_EQ(*info.cacheTtl, std::chrono::seconds{1});
  EXPECT_EQ(info.pattern.str(), "/a");

  EXPECT_FALSE(router.route(router.add("/zero", http::Method::GET, RouteMode::Turbo, std::chrono::seconds{0}))
                   .cacheTtl.has_value());
  EXPECT_EQ(router.route(router.add("/default", http::Method::GET, RouteMode::Turbo, kDefaultCacheTtl)).cacheTtl,
            kDefaultCacheTtl);
  EXPECT_THROW(router.add("/neg", http::Method::GET, RouteMode::Turbo, std::chrono::milliseconds{-5}),
               std::invalid_argument);
}

TEST(RouterTrailingSlashTest, Normalize) {
  Router router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Normalize));
  const RouteId noSlash = router.add("/a", http::Method::GET);
  const RouteId withSlash = router.add("/b/", http::Method::GET);

  EXPECT_EQ(router.match(http::Method::GET, "/a").routeId, noSlash);
  EXPECT_EQ(router.match(http::Method::GET, "/a/").routeId, noSlash);
  EXPECT_EQ(router.match(http::Method::GET, "/b/").routeId, withSlash);
  EXPECT_EQ(router.match(http::Method::GET, "/b").routeId, withSlash);
}

TEST(RouterTrailingSlashTest, Strict) {
  Router router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Strict));
  const RouteId noSlash = router.add("/a", http::Method::GET);

  EXPECT_EQ(router.match(http::Method::GET, "/a").routeId, noSlash);
  EXPECT_EQ(router.match(http::Method::GET, "/a/").status, RoutingResult::Status::NotFound);
}

TEST(RouterTrailingSlashTest, RedirectRemovesSlash) {
  Router router(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect));
  router.add("/users/<int:id>", http::Method::GET);
  router.add("/dir/", http::Method::GET);

  auto res = router.match(http::Method::GET, "/users/7/");
  EXPECT_EQ(res.status, RoutingResult::Status::Redirect);
  EXPECT_EQ(res.redirectPath, "/users/7");

  EXPECT_TRUE(router.match(http::Method::GET, "/dir/").matched());
  EXPECT_EQ(router.match(http::Method::GET, "/dir").status, RoutingResult::Status::NotFound);
}

TEST(RoutePatternTest, ShapeIgnoresCaptureNames) {
  const auto lhs = RoutePattern::Parse("/a/<int:x>/<y>");
  const auto rhs = RoutePattern::Parse("/a/<int:other>/<string:z>");
  const auto diff = RoutePattern::Parse("/a/<float:x>/<y>");
  EXPECT_TRUE(lhs.sameShape(rhs));
  EXPECT_FALSE(lhs.sameShape(diff));
  EXPECT_EQ(lhs.nbCaptures(), 2U);
  EXPECT_FALSE(lhs.hasTrailingSlash());
}
