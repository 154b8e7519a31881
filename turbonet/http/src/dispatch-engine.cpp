#include "turbonet/dispatch-engine.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include "turbonet/handler-bridge.hpp"
#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/json-escape.hpp"
#include "turbonet/log.hpp"
#include "turbonet/middleware.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/response-cache.hpp"
#include "turbonet/router.hpp"
#include "turbonet/server-stats.hpp"
#include "turbonet/stringconv.hpp"
#include "turbonet/timedef.hpp"
#include "turbonet/url-decode.hpp"

namespace turbonet {

namespace {

constexpr std::string_view kHealthPath = "/health";

HttpResponse JsonError(http::StatusCode statusCode) {
  std::string body("{\"error\":");
  AppendJsonString(body, http::ReasonPhrase(statusCode));
  body.push_back('}');
  return {statusCode, std::move(body), http::ContentTypeApplicationJson};
}

std::string AllowHeaderValue(http::MethodBmp methods) {
  std::string ret;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (http::IsMethodSet(methods, http::MethodFromIdx(methodIdx))) {
      if (!ret.empty()) {
        ret.append(", ");
      }
      ret.append(http::kMethodStrings[methodIdx]);
    }
  }
  return ret;
}

}  // namespace

DispatchEngine::DispatchEngine(std::shared_ptr<const RouteTable> routeTable, HandlerBridge& bridge,
                               ResponseCache& cache, RateLimiter* rateLimiter, Options options)
    : _routeTable(std::move(routeTable)),
      _bridge(&bridge),
      _cache(&cache),
      _rateLimiter(rateLimiter),
      _options(options) {}

std::string DispatchEngine::CacheKey(RouteId routeId, const PathParams& pathParams) {
  std::string key;
  const auto idStr = IntegralToCharVector(routeId);
  key.append(idStr.data(), idStr.size());
  for (const PathParam& param : pathParams) {
    key.push_back('/');
    std::visit(
        [&key](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::string>) {
            // length prefixed, as string captures may contain any byte
            const auto sizeStr = IntegralToCharVector(value.size());
            key.append(sizeStr.data(), sizeStr.size());
            key.push_back(':');
            key.append(value);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            const auto valueStr = IntegralToCharVector(value);
            key.append(valueStr.data(), valueStr.size());
          } else {
            key.append(fmt::format("{}", value));
          }
        },
        param.value);
  }
  return key;
}

HttpResponse DispatchEngine::dispatch(HttpRequest& request, SteadyTimePoint now, ServerStats& stats) {
  if (_rateLimiter != nullptr) {
    const auto decision = _rateLimiter->tryAcquire(request.clientAddress(), now);
    if (!decision.allowed) {
      ++stats.rateLimitedRequests;
      const auto retryAfterSec = std::max<std::chrono::seconds::rep>(
          1, std::chrono::ceil<std::chrono::seconds>(decision.retryAfter).count());
      HttpResponse response = JsonError(http::StatusCodeTooManyRequests);
      const auto retryAfterStr = IntegralToCharVector(retryAfterSec);
      response.header(http::RetryAfter, std::string_view(retryAfterStr.data(), retryAfterStr.size()));
      return response;
    }
  }

  RoutingResult routingResult = _routeTable->router.match(request.method(), request.path());
  switch (routingResult.status) {
    case RoutingResult::Status::Matched:
      break;
    case RoutingResult::Status::NotFound:
      if (_options.enableHealthCheck && request.path() == kHealthPath &&
          (request.method() == http::Method::GET || request.method() == http::Method::HEAD)) {
        return {http::StatusCodeOK, "OK", http::ContentTypeTextPlain};
      }
      return JsonError(http::StatusCodeNotFound);
    case RoutingResult::Status::MethodNotAllowed: {
      HttpResponse response = JsonError(http::StatusCodeMethodNotAllowed);
      response.header(http::Allow, AllowHeaderValue(routingResult.allowedMethods));
      return response;
    }
    case RoutingResult::Status::Redirect: {
      // the routed path is decoded, it must not reach the header as is
      std::string location = url::EncodePath(routingResult.redirectPath);
      if (!request.rawQuery().empty()) {
        location.push_back('?');
        location.append(request.rawQuery());
      }
      HttpResponse response(http::StatusCodeMovedPermanently);
      response.header(http::Location, location);
      return response;
    }
  }

  const RouteId routeId = routingResult.routeId;
  const RouteTarget& target = _routeTable->targets[routeId];
  if (target.staticResponse) {
    return *target.staticResponse;
  }

  request.setPathParams(std::move(routingResult.pathParams));

  try {
    if (_routeTable->router.route(routeId).mode == RouteMode::Turbo) {
      return runTurbo(routeId, target, request, now, stats);
    }
    return runStandard(target, request);
  } catch (const HandlerFailure& failure) {
    return internalError(failure, request, stats);
  }
}

HttpResponse DispatchEngine::runStandard(const RouteTarget& target, HttpRequest& request) {
  const auto& requestMiddlewares = _routeTable->requestMiddlewares;
  const auto& responseMiddlewares = _routeTable->responseMiddlewares;

  HttpResponse response;
  bool shortCircuited = false;
  for (const RequestMiddleware& middleware : requestMiddlewares) {
    MiddlewareResult result = _bridge->call([&middleware, &request] { return middleware(request); });
    if (result.shouldShortCircuit()) {
      response = std::move(result).takeResponse();
      shortCircuited = true;
      break;
    }
  }
  if (!shortCircuited) {
    response = _bridge->invoke(target.handler, request);
  }
  for (auto it = responseMiddlewares.rbegin(); it != responseMiddlewares.rend(); ++it) {
    const ResponseMiddleware& middleware = *it;
    _bridge->call([&middleware, &request, &response] { middleware(request, response); });
  }
  return response;
}

HttpResponse DispatchEngine::runTurbo(RouteId routeId, const RouteTarget& target, const HttpRequest& request,
                                      SteadyTimePoint now, ServerStats& stats) {
  const auto& cacheTtl = _routeTable->router.route(routeId).cacheTtl;
  if (!cacheTtl) {
    return _bridge->invoke(target.handler, request);
  }
  const std::chrono::milliseconds ttl = *cacheTtl == kDefaultCacheTtl ? _options.defaultCacheTtl : *cacheTtl;

  const auto populate = [this, &target, &request] { return _bridge->invoke(target.handler, request); };
  const auto lookup = _cache->getOrPopulate(CacheKey(routeId, request.pathParams()), populate, ttl, now);

  HttpResponse response = *lookup.response;
  switch (lookup.outcome) {
    case ResponseCache::Outcome::Miss:
      ++stats.cacheMisses;
      response.header(http::XCache, "MISS");
      return response;
    case ResponseCache::Outcome::Stale:
      ++stats.cacheStaleServed;
      response.header(http::XCache, "STALE");
      break;
    default:
      ++stats.cacheHits;
      response.header(http::XCache, "HIT");
      break;
  }
  const auto ageStr = IntegralToCharVector(std::chrono::duration_cast<std::chrono::seconds>(lookup.age).count());
  response.header(http::Age, std::string_view(ageStr.data(), ageStr.size()));
  return response;
}

HttpResponse DispatchEngine::internalError(const HandlerFailure& failure, const HttpRequest& request,
                                           ServerStats& stats) const {
  ++stats.handlerFailures;
  log::error("Handler failure on {} {}: {}", http::MethodToStr(request.method()), request.path(), failure.what());
  if (!_options.debugMode) {
    return JsonError(http::StatusCodeInternalServerError);
  }
  std::string body("{\"error\":");
  AppendJsonString(body, http::ReasonPhrase(http::StatusCodeInternalServerError));
  body.append(",\"detail\":");
  AppendJsonString(body, failure.what());
  body.push_back('}');
  return {http::StatusCodeInternalServerError, std::move(body), http::ContentTypeApplicationJson};
}

}  // namespace turbonet
