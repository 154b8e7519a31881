#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"

namespace turbonet {

// Outcome of a before hook: let the request through, or answer it directly.
// A short-circuit response skips the remaining before hooks and the handler, but still goes through the after hooks.
class MiddlewareResult {
 public:
  MiddlewareResult() noexcept = default;

  static MiddlewareResult Continue() noexcept { return {}; }

  static MiddlewareResult ShortCircuit(HttpResponse response) noexcept {
    MiddlewareResult result;
    result._response.emplace(std::move(response));
    return result;
  }

  [[nodiscard]] bool shouldShortCircuit() const noexcept { return _response.has_value(); }

  // Only valid when shouldShortCircuit() is true.
  [[nodiscard]] HttpResponse takeResponse() && noexcept { return std::move(*_response); }

 private:
  std::optional<HttpResponse> _response;
};

// Runs before the handler of a standard route, in registration order.
using RequestMiddleware = std::function<MiddlewareResult(HttpRequest&)>;

// Runs after the handler of a standard route, in reverse registration order.
using ResponseMiddleware = std::function<void(const HttpRequest&, HttpResponse&)>;

}  // namespace turbonet
