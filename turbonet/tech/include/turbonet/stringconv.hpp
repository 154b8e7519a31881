#pragma once

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

#include "turbonet/vector.hpp"

namespace turbonet {

// Strictly parses a base-10 signed integer spanning the whole string.
// Returns std::nullopt on empty input, trailing garbage or overflow.
[[nodiscard]] inline std::optional<int64_t> ParseInt64(std::string_view str) noexcept {
  if (str.empty()) {
    return std::nullopt;
  }
  const char* beg = str.data();
  const char* end = beg + str.size();
  if (*beg == '+') {
    // from_chars does not accept a leading '+'
    ++beg;
    if (beg == end || *beg == '-') {
      return std::nullopt;
    }
  }
  int64_t ret;
  const auto [ptr, errc] = std::from_chars(beg, end, ret);
  if (errc != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return ret;
}

// Strictly parses a decimal floating point number spanning the whole string.
// Infinity / NaN spellings and out of range values are rejected.
[[nodiscard]] inline std::optional<double> ParseDouble(std::string_view str) noexcept {
  if (str.empty()) {
    return std::nullopt;
  }
  const char* beg = str.data();
  const char* end = beg + str.size();
  if (*beg == '+') {
    ++beg;
    if (beg == end || *beg == '-') {
      return std::nullopt;
    }
  }
  double ret;
  const auto [ptr, errc] = std::from_chars(beg, end, ret, std::chars_format::fixed);
  if (errc != std::errc() || ptr != end || !std::isfinite(ret)) {
    return std::nullopt;
  }
  return ret;
}

// Strictly parses an unsigned size (used for Content-Length and chunk sizes).
[[nodiscard]] inline std::optional<std::size_t> ParseSize(std::string_view str, int base = 10) noexcept {
  if (str.empty()) {
    return std::nullopt;
  }
  std::size_t ret;
  const auto [ptr, errc] = std::from_chars(str.data(), str.data() + str.size(), ret, base);
  if (errc != std::errc() || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return ret;
}

// Converts an integral to its decimal representation stored inline, without any allocation.
template <class Int>
auto IntegralToCharVector(Int val) {
  static constexpr std::size_t kMaxSize =
      static_cast<std::size_t>(std::numeric_limits<Int>::digits10) + 2U;  // sign + partial digit

  FixedCapacityVector<char, kMaxSize> ret(kMaxSize);

  // cannot fail as the buffer is sized for the largest value of Int
  const char* endPtr = std::to_chars(ret.data(), ret.data() + ret.size(), val).ptr;
  ret.resize(static_cast<std::size_t>(endPtr - ret.data()));
  return ret;
}

}  // namespace turbonet
