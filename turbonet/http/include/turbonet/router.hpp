#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbonet/http-method.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/route-pattern.hpp"
#include "turbonet/router-config.hpp"
#include "turbonet/vector.hpp"

namespace turbonet {

using RouteId = std::uint32_t;

inline constexpr RouteId kInvalidRouteId = std::numeric_limits<RouteId>::max();

// Standard routes run the hook chain around their handler, turbo routes skip hooks and may be cached.
enum class RouteMode : std::uint8_t { Standard, Turbo };

// Thrown when a route is registered twice for the same shape and method.
class RouteConflictError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// Turbo route cache TTL resolved at dispatch time to the server default (ServerConfig::defaultCacheTtl).
inline constexpr std::chrono::milliseconds kDefaultCacheTtl = std::chrono::milliseconds::min();

// Registration data of a route. Immutable once added.
struct RouteInfo {
  RoutePattern pattern;
  http::MethodBmp methods{};
  RouteMode mode{RouteMode::Standard};
  // Only meaningful for turbo routes. std::nullopt means no caching, kDefaultCacheTtl the server default TTL.
  std::optional<std::chrono::milliseconds> cacheTtl;
};

struct RoutingResult {
  enum class Status : std::uint8_t {
    Matched,           // routeId and pathParams are set
    NotFound,          // no route matches the path
    MethodNotAllowed,  // path matches but not for this method, allowedMethods is set
    Redirect           // path matches once its trailing slash removed, redirectPath is set
  };

  [[nodiscard]] bool matched() const noexcept { return status == Status::Matched; }

  Status status{Status::NotFound};
  RouteId routeId{kInvalidRouteId};
  http::MethodBmp allowedMethods{};
  PathParams pathParams;
  std::string redirectPath;
};

// Maps (method, path) to a route identifier, extracting typed captures.
//
// Routes are stored in a segment trie. At each position the children are tried by priority:
// literal > int > float > string > path, backtracking to the next candidate when a branch fails deeper in the path.
// Matching is const and allocation-light, so a single Router can be shared by several threads once built.
class Router {
 public:
  Router() = default;

  explicit Router(RouterConfig config);

  Router(const Router&) = delete;
  Router(Router&&) noexcept = default;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) noexcept = default;

  ~Router();

  // Registers a route for given methods.
  // Throws std::invalid_argument for a malformed pattern or an empty method set, and RouteConflictError if a route
  // with the same shape already holds one of the requested methods.
  RouteId add(std::string_view pattern, http::MethodBmp methods, RouteMode mode = RouteMode::Standard,
              std::optional<std::chrono::milliseconds> cacheTtl = std::nullopt);

  RouteId add(std::string_view pattern, http::Method method, RouteMode mode = RouteMode::Standard,
              std::optional<std::chrono::milliseconds> cacheTtl = std::nullopt) {
    return add(pattern, static_cast<http::MethodBmp>(method), mode, cacheTtl);
  }

  // Matches a decoded request path.
  // HEAD requests fall back to the GET route of the matched path when no explicit HEAD route exists.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  [[nodiscard]] const RouteInfo& route(RouteId routeId) const { return _routes[routeId]; }

  [[nodiscard]] std::size_t size() const noexcept { return _routes.size(); }

  [[nodiscard]] bool empty() const noexcept { return _routes.empty(); }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

 private:
  struct Terminal {
    Terminal() noexcept { routeIds.fill(kInvalidRouteId); }

    [[nodiscard]] http::MethodBmp methods() const noexcept;

    [[nodiscard]] bool empty() const noexcept { return methods() == 0; }

    std::array<RouteId, http::kNbMethods> routeIds;
  };

  struct Node {
    Node* literalChild(std::string_view literal) const noexcept;

    vector<std::pair<std::string, std::unique_ptr<Node>>> literalChildren;
    std::array<std::unique_ptr<Node>, kNbCaptureKinds> captureChildren;
    // [0]: registered without trailing slash, [1]: with trailing slash
    std::array<Terminal, 2> terminals;
  };

  struct MatchState;

  const Node* matchNode(const Node& node, std::size_t segmentIdx, MatchState& state) const;

  [[nodiscard]] bool isCandidate(const Node& node, bool requestHasTrailingSlash) const noexcept;

  RouterConfig _config;
  std::unique_ptr<Node> _root;
  vector<RouteInfo> _routes;
};

}  // namespace turbonet
