#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "turbonet/path-params.hpp"
#include "turbonet/vector.hpp"

namespace turbonet {

// Ordered by match priority, from the most specific to the least specific capture.
enum class CaptureKind : std::uint8_t { Int, Float, String, Path };

inline constexpr std::uint8_t kNbCaptureKinds = 4;

// Converts a raw path segment according to the capture kind.
// Returns false (non-match) for values that cannot be represented: 'abc' or an overflowing value for Int, a
// non-finite or malformed value for Float, an empty value for any kind.
// Int captures are always int64_t: values that do not fit int64_t are a non-match rather than being passed through
// as strings, so that a route may fall back to a string capture for them.
[[nodiscard]] bool ConvertCapture(CaptureKind kind, std::string_view raw, CaptureValue& out);

// Compiled form of a route pattern such as "/users/<int:id>/files/<path:rest>".
//
// Syntax, segment by segment:
//   - literal text              matches the segment exactly (case-sensitive)
//   - <name> or <string:name>   captures one non-empty segment as a string
//   - <int:name>                captures a base 10 signed 64 bits integer
//   - <float:name>              captures a finite decimal number
//   - <path:name>               captures the remainder of the path, slashes included (last segment only)
// A capture must span a whole segment. A trailing slash is significant and recorded separately.
class RoutePattern {
 public:
  struct Segment {
    bool operator==(const Segment&) const noexcept = default;

    [[nodiscard]] bool isCapture() const noexcept { return !captureName.empty(); }

    std::string literal;      // set for literal segments
    std::string captureName;  // set for capture segments
    CaptureKind kind{CaptureKind::String};
  };

  // Compiles 'pattern'. Throws std::invalid_argument if the pattern is malformed.
  static RoutePattern Parse(std::string_view pattern);

  [[nodiscard]] const vector<Segment>& segments() const noexcept { return _segments; }

  [[nodiscard]] bool hasTrailingSlash() const noexcept { return _hasTrailingSlash; }

  [[nodiscard]] std::string_view str() const noexcept { return _str; }

  [[nodiscard]] std::size_t nbCaptures() const noexcept;

  // Two patterns have the same shape when they have the same literals and the same capture kinds at the same
  // positions, whatever the capture names.
  [[nodiscard]] bool sameShape(const RoutePattern& other) const noexcept;

 private:
  std::string _str;
  vector<Segment> _segments;
  bool _hasTrailingSlash{false};
};

}  // namespace turbonet
