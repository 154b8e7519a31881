#include "turbonet/router.hpp"

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "turbonet/http-method.hpp"
#include "turbonet/log.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/route-pattern.hpp"
#include "turbonet/router-config.hpp"
#include "turbonet/vector.hpp"

namespace turbonet {

namespace {

constexpr auto kGetIdx = http::MethodToIdx(http::Method::GET);
constexpr auto kHeadIdx = http::MethodToIdx(http::Method::HEAD);

}  // namespace

struct Router::MatchState {
  std::string_view fullPath;
  SmallVector<std::string_view, 16> segments;
  SmallVector<CaptureValue, 8> captures;
  bool hasTrailingSlash{false};
  bool pathCaptured{false};
};

Router::Router(RouterConfig config) : _config(config) {}

Router::~Router() = default;

http::MethodBmp Router::Terminal::methods() const noexcept {
  http::MethodBmp bmp{};
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (routeIds[methodIdx] != kInvalidRouteId) {
      bmp = bmp | http::MethodFromIdx(methodIdx);
    }
  }
  return bmp;
}

Router::Node* Router::Node::literalChild(std::string_view literal) const noexcept {
  for (const auto& [childLiteral, child] : literalChildren) {
    if (childLiteral == literal) {
      return child.get();
    }
  }
  return nullptr;
}

RouteId Router::add(std::string_view pattern, http::MethodBmp methods, RouteMode mode,
                    std::optional<std::chrono::milliseconds> cacheTtl) {
  if (methods == 0 || (methods & ~http::kAllMethods) != 0) {
    throw std::invalid_argument(fmt::format("Invalid method set for route {}", pattern));
  }
  if (cacheTtl) {
    if (mode != RouteMode::Turbo) {
      throw std::invalid_argument(fmt::format("Cache TTL is only supported on turbo routes ({})", pattern));
    }
    if (cacheTtl->count() < 0 && *cacheTtl != kDefaultCacheTtl) {
      throw std::invalid_argument(fmt::format("Negative cache TTL for route {}", pattern));
    }
    if (cacheTtl->count() == 0) {
      // a zero TTL disables caching
      cacheTtl.reset();
    }
  }

  RoutePattern compiled = RoutePattern::Parse(pattern);

  if (!_root) {
    _root = std::make_unique<Node>();
  }
  Node* node = _root.get();
  for (const RoutePattern::Segment& segment : compiled.segments()) {
    if (segment.isCapture()) {
      auto& child = node->captureChildren[static_cast<std::size_t>(segment.kind)];
      if (!child) {
        child = std::make_unique<Node>();
      }
      node = child.get();
    } else {
      Node* child = node->literalChild(segment.literal);
      if (child == nullptr) {
        child = node->literalChildren.emplace_back(segment.literal, std::make_unique<Node>()).second.get();
      }
      node = child;
    }
  }

  Terminal& terminal = node->terminals[compiled.hasTrailingSlash() ? 1 : 0];
  const auto conflicting = static_cast<http::MethodBmp>(terminal.methods() & methods);
  if (conflicting != 0) {
    for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
      if (http::IsMethodSet(conflicting, http::MethodFromIdx(methodIdx))) {
        throw RouteConflictError(fmt::format("Route {} {} conflicts with already registered route {}",
                                             http::kMethodStrings[methodIdx], pattern,
                                             _routes[terminal.routeIds[methodIdx]].pattern.str()));
      }
    }
  }

  const auto routeId = static_cast<RouteId>(_routes.size());
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (http::IsMethodSet(methods, http::MethodFromIdx(methodIdx))) {
      terminal.routeIds[methodIdx] = routeId;
    }
  }
  log::debug("Registered route #{} {} ({})", routeId, compiled.str(), mode == RouteMode::Turbo ? "turbo" : "standard");
  _routes.push_back(RouteInfo{std::move(compiled), methods, mode, cacheTtl});
  return routeId;
}

bool Router::isCandidate(const Node& node, bool requestHasTrailingSlash) const noexcept {
  const Terminal& sameForm = node.terminals[requestHasTrailingSlash ? 1 : 0];
  const Terminal& otherForm = node.terminals[requestHasTrailingSlash ? 0 : 1];
  switch (_config.trailingSlashPolicy) {
    case RouterConfig::TrailingSlashPolicy::Strict:
      return !sameForm.empty();
    case RouterConfig::TrailingSlashPolicy::Redirect:
      // only the removal of a trailing slash is redirected
      return !sameForm.empty() || (requestHasTrailingSlash && !otherForm.empty());
    default:
      return !sameForm.empty() || !otherForm.empty();
  }
}

const Router::Node* Router::matchNode(const Node& node, std::size_t segmentIdx, MatchState& state) const {
  if (segmentIdx == state.segments.size()) {
    return isCandidate(node, state.hasTrailingSlash) ? &node : nullptr;
  }

  const std::string_view segment = state.segments[segmentIdx];

  if (const Node* child = node.literalChild(segment); child != nullptr) {
    if (const Node* matched = matchNode(*child, segmentIdx + 1, state); matched != nullptr) {
      return matched;
    }
  }

  for (CaptureKind kind : {CaptureKind::Int, CaptureKind::Float, CaptureKind::String}) {
    const Node* child = node.captureChildren[static_cast<std::size_t>(kind)].get();
    if (child == nullptr) {
      continue;
    }
    CaptureValue value;
    if (!ConvertCapture(kind, segment, value)) {
      continue;
    }
    state.captures.push_back(std::move(value));
    if (const Node* matched = matchNode(*child, segmentIdx + 1, state); matched != nullptr) {
      return matched;
    }
    state.captures.pop_back();
  }

  // a path capture swallows the remainder, trailing slash included
  const Node* pathChild = node.captureChildren[static_cast<std::size_t>(CaptureKind::Path)].get();
  if (pathChild != nullptr && !pathChild->terminals[0].empty()) {
    const auto offset = static_cast<std::size_t>(segment.data() - state.fullPath.data());
    CaptureValue value;
    if (ConvertCapture(CaptureKind::Path, state.fullPath.substr(offset), value)) {
      state.captures.push_back(std::move(value));
      state.pathCaptured = true;
      return pathChild;
    }
  }
  return nullptr;
}

RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  if (_root == nullptr || path.empty() || path.front() != '/') {
    return result;
  }

  MatchState state;
  state.fullPath = path;
  std::string_view remaining = path.substr(1);
  if (!remaining.empty() && remaining.back() == '/') {
    state.hasTrailingSlash = true;
    remaining.remove_suffix(1);
  }
  if (!remaining.empty() || state.hasTrailingSlash) {
    while (true) {
      const auto slashPos = remaining.find('/');
      state.segments.push_back(remaining.substr(0, slashPos));
      if (slashPos == std::string_view::npos) {
        break;
      }
      remaining.remove_prefix(slashPos + 1);
    }
  }

  const Node* node = matchNode(*_root, 0, state);
  if (node == nullptr) {
    return result;
  }

  const Terminal* terminal = &node->terminals[0];
  if (!state.pathCaptured) {
    const Terminal& sameForm = node->terminals[state.hasTrailingSlash ? 1 : 0];
    const Terminal& otherForm = node->terminals[state.hasTrailingSlash ? 0 : 1];
    if (!sameForm.empty()) {
      terminal = &sameForm;
    } else if (_config.trailingSlashPolicy == RouterConfig::TrailingSlashPolicy::Redirect) {
      result.status = RoutingResult::Status::Redirect;
      result.redirectPath.assign(path.substr(0, path.size() - 1));
      return result;
    } else {
      terminal = &otherForm;
    }
  }

  auto methodIdx = http::MethodToIdx(method);
  if (terminal->routeIds[methodIdx] == kInvalidRouteId && methodIdx == kHeadIdx) {
    methodIdx = kGetIdx;
  }
  const RouteId routeId = terminal->routeIds[methodIdx];
  if (routeId == kInvalidRouteId) {
    result.status = RoutingResult::Status::MethodNotAllowed;
    result.allowedMethods = terminal->methods();
    if (http::IsMethodSet(result.allowedMethods, http::Method::GET)) {
      result.allowedMethods = result.allowedMethods | http::Method::HEAD;
    }
    return result;
  }

  result.status = RoutingResult::Status::Matched;
  result.routeId = routeId;
  std::size_t captureIdx = 0;
  for (const RoutePattern::Segment& segment : _routes[routeId].pattern.segments()) {
    if (segment.isCapture()) {
      result.pathParams.add(segment.captureName, std::move(state.captures[captureIdx++]));
    }
  }
  return result;
}

}  // namespace turbonet
