#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "turbonet/handler-bridge.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/middleware.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/rate-limiter.hpp"
#include "turbonet/response-cache.hpp"
#include "turbonet/router.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/vector.hpp"

namespace turbonet {

// What is executed for a matched route.
struct RouteTarget {
  // Handler of standard and turbo routes.
  RequestHandler handler;
  // Prebuilt response of static routes, served without calling any user code.
  std::shared_ptr<const HttpResponse> staticResponse;
};

// Immutable routing snapshot, shared by all event loops of a worker once the server runs.
struct RouteTable {
  Router router;
  vector<RouteTarget> targets;  // indexed by RouteId
  vector<RequestMiddleware> requestMiddlewares;
  vector<ResponseMiddleware> responseMiddlewares;
};

// Turns a parsed HTTP request into a response:
//  1. rate limiting by client address (429)
//  2. routing (404, 405, 301 trailing slash redirect)
//  3. static routes, then standard routes (hooks + handler) or turbo routes (handler, optionally cached)
// Handler failures become 500 responses here. The engine is thread safe: the route table is immutable, the cache,
// the rate limiter and the bridge are synchronized.
class DispatchEngine {
 public:
  struct Options {
    // TTL of turbo routes registered with kDefaultCacheTtl.
    std::chrono::milliseconds defaultCacheTtl{std::chrono::seconds{60}};
    // Include exception messages in 500 responses.
    bool debugMode{false};
    // Answer GET /health when no route is registered for it.
    bool enableHealthCheck{true};
  };

  // 'rateLimiter' may be null (no HTTP rate limiting). Referenced objects must outlive the engine.
  DispatchEngine(std::shared_ptr<const RouteTable> routeTable, HandlerBridge& bridge, ResponseCache& cache,
                 RateLimiter* rateLimiter, Options options);

  // Builds the response of 'request'. Captures of the matched route are stored into the request.
  [[nodiscard]] HttpResponse dispatch(HttpRequest& request, SteadyTimePoint now, ServerStats& stats);

  [[nodiscard]] const RouteTable& routeTable() const noexcept { return *_routeTable; }

  // Key of a turbo route response: the route identity and its captured values, in order.
  [[nodiscard]] static std::string CacheKey(RouteId routeId, const PathParams& pathParams);

 private:
  HttpResponse runStandard(const RouteTarget& target, HttpRequest& request);

  HttpResponse runTurbo(RouteId routeId, const RouteTarget& target, const HttpRequest& request, SteadyTimePoint now,
                        ServerStats& stats);

  HttpResponse internalError(const HandlerFailure& failure, const HttpRequest& request, ServerStats& stats) const;

  std::shared_ptr<const RouteTable> _routeTable;
  HandlerBridge* _bridge;
  ResponseCache* _cache;
  RateLimiter* _rateLimiter;
  Options _options;
};

}  // namespace turbonet
