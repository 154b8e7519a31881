#pragma once

#include <cstddef>
#include <string_view>

namespace turbonet {

constexpr char AsciiToLower(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch | 0x20);
  }
  return ch;
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (AsciiToLower(lhs[pos]) != AsciiToLower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// Tells whether a comma separated header value (e.g. "keep-alive, Upgrade") contains 'token', ignoring case and
// optional whitespace around list elements.
constexpr bool HeaderListContainsToken(std::string_view listValue, std::string_view token) noexcept {
  while (!listValue.empty()) {
    const auto commaPos = listValue.find(',');
    std::string_view elem = listValue.substr(0, commaPos);
    while (!elem.empty() && (elem.front() == ' ' || elem.front() == '\t')) {
      elem.remove_prefix(1);
    }
    while (!elem.empty() && (elem.back() == ' ' || elem.back() == '\t')) {
      elem.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(elem, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    listValue.remove_prefix(commaPos + 1);
  }
  return false;
}

struct CaseInsensitiveHashFunc {
  using is_transparent = void;

  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    for (char ch : str) {
      hash ^= static_cast<std::size_t>(AsciiToLower(ch)) + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) +
              (hash << 6) + (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace turbonet
