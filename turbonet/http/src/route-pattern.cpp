#include "turbonet/route-pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>

#include "turbonet/stringconv.hpp"

namespace turbonet {

namespace {

constexpr bool IsCaptureNameChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
}

CaptureKind ParseCaptureKind(std::string_view kindStr, std::string_view pattern) {
  if (kindStr == "int") {
    return CaptureKind::Int;
  }
  if (kindStr == "float") {
    return CaptureKind::Float;
  }
  if (kindStr == "string") {
    return CaptureKind::String;
  }
  if (kindStr == "path") {
    return CaptureKind::Path;
  }
  throw std::invalid_argument(std::string("Unknown capture type '") + std::string(kindStr) + "' in route pattern " +
                              std::string(pattern));
}

}  // namespace

bool ConvertCapture(CaptureKind kind, std::string_view raw, CaptureValue& out) {
  if (raw.empty()) {
    return false;
  }
  switch (kind) {
    case CaptureKind::Int: {
      // out of int64_t range is a non-match, not a string value
      const auto val = ParseInt64(raw);
      if (!val) {
        return false;
      }
      out = *val;
      return true;
    }
    case CaptureKind::Float: {
      const auto val = ParseDouble(raw);
      if (!val) {
        return false;
      }
      out = *val;
      return true;
    }
    case CaptureKind::String:
      if (raw.find('/') != std::string_view::npos) {
        return false;
      }
      [[fallthrough]];
    case CaptureKind::Path:
      out = std::string(raw);
      return true;
    default:
      return false;
  }
}

RoutePattern RoutePattern::Parse(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw std::invalid_argument(std::string("Route pattern should start with '/': ") + std::string(pattern));
  }

  RoutePattern ret;
  ret._str.assign(pattern);

  std::string_view remaining = pattern.substr(1);
  if (!remaining.empty() && remaining.back() == '/') {
    ret._hasTrailingSlash = true;
    remaining.remove_suffix(1);
  }
  if (remaining.empty()) {
    if (ret._hasTrailingSlash) {
      throw std::invalid_argument("Route pattern '//' is invalid");
    }
    // root path
    return ret;
  }

  while (true) {
    const auto slashPos = remaining.find('/');
    const std::string_view segmentStr = remaining.substr(0, slashPos);
    if (segmentStr.empty()) {
      throw std::invalid_argument(std::string("Empty segment in route pattern ") + std::string(pattern));
    }
    if (!ret._segments.empty() && ret._segments.back().isCapture() && ret._segments.back().kind == CaptureKind::Path) {
      throw std::invalid_argument(std::string("A path capture should be the last segment of ") + std::string(pattern));
    }

    Segment& segment = ret._segments.emplace_back();
    if (segmentStr.front() == '<') {
      if (segmentStr.back() != '>') {
        throw std::invalid_argument(std::string("Capture should span a whole segment in ") + std::string(pattern));
      }
      const std::string_view inner = segmentStr.substr(1, segmentStr.size() - 2);
      const auto colonPos = inner.find(':');
      std::string_view name = inner;
      if (colonPos != std::string_view::npos) {
        segment.kind = ParseCaptureKind(inner.substr(0, colonPos), pattern);
        name = inner.substr(colonPos + 1);
      }
      if (name.empty() || !std::ranges::all_of(name, IsCaptureNameChar)) {
        throw std::invalid_argument(std::string("Invalid capture name in route pattern ") + std::string(pattern));
      }
      const bool duplicate = std::any_of(ret._segments.begin(), std::prev(ret._segments.end()),
                                         [name](const Segment& other) { return other.captureName == name; });
      if (duplicate) {
        throw std::invalid_argument(std::string("Duplicated capture name '") + std::string(name) + "' in " +
                                    std::string(pattern));
      }
      segment.captureName.assign(name);
    } else {
      if (segmentStr.find_first_of("<>") != std::string_view::npos) {
        throw std::invalid_argument(std::string("Capture should span a whole segment in ") + std::string(pattern));
      }
      segment.literal.assign(segmentStr);
    }

    if (slashPos == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(slashPos + 1);
  }

  if (ret._hasTrailingSlash && ret._segments.back().isCapture() && ret._segments.back().kind == CaptureKind::Path) {
    throw std::invalid_argument(std::string("A path capture cannot be followed by a slash in ") +
                                std::string(pattern));
  }
  return ret;
}

std::size_t RoutePattern::nbCaptures() const noexcept {
  return static_cast<std::size_t>(
      std::ranges::count_if(_segments, [](const Segment& segment) { return segment.isCapture(); }));
}

bool RoutePattern::sameShape(const RoutePattern& other) const noexcept {
  if (_hasTrailingSlash != other._hasTrailingSlash || _segments.size() != other._segments.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < _segments.size(); ++pos) {
    const Segment& lhs = _segments[pos];
    const Segment& rhs = other._segments[pos];
    if (lhs.isCapture() != rhs.isCapture()) {
      return false;
    }
    if (lhs.isCapture() ? lhs.kind != rhs.kind : lhs.literal != rhs.literal) {
      return false;
    }
  }
  return true;
}

}  // namespace turbonet
