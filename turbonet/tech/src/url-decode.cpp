#include "turbonet/url-decode.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/vector.hpp"

namespace turbonet::url {

namespace {

constexpr int FromHexDigit(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

constexpr bool IsPathChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '-':
    case '.':
    case '_':
    case '~':
    case '!':
    case '$':
    case '&':
    case '\'':
    case '(':
    case ')':
    case '*':
    case '+':
    case ',':
    case ';':
    case '=':
    case ':':
    case '@':
    case '/':
      return true;
    default:
      return false;
  }
}

std::string DecodeLenient(std::string_view data) {
  auto decoded = Decode(data, true);
  if (decoded) {
    return std::move(*decoded);
  }
  return std::string(data);
}

}  // namespace

std::optional<std::string> Decode(std::string_view data, bool plusAsSpace) {
  std::string out;
  out.reserve(data.size());
  for (std::size_t pos = 0; pos < data.size(); ++pos) {
    const char ch = data[pos];
    if (ch == '%') {
      if (pos + 2 >= data.size()) {
        return std::nullopt;
      }
      const int hi = FromHexDigit(data[pos + 1]);
      const int lo = FromHexDigit(data[pos + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      pos += 2;
    } else if (ch == '+' && plusAsSpace) {
      out.push_back(' ');
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

std::string EncodePath(std::string_view path) {
  static constexpr char kHexDigits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(path.size());
  for (char ch : path) {
    if (IsPathChar(ch)) {
      out.push_back(ch);
    } else {
      const auto byte = static_cast<unsigned char>(ch);
      out.push_back('%');
      out.push_back(kHexDigits[byte >> 4]);
      out.push_back(kHexDigits[byte & 0x0F]);
    }
  }
  return out;
}

vector<std::pair<std::string, std::string>> DecodeQueryParams(std::string_view query) {
  vector<std::pair<std::string, std::string>> params;
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    if (!pair.empty()) {
      const auto eqPos = pair.find('=');
      if (eqPos == std::string_view::npos) {
        params.emplace_back(DecodeLenient(pair), std::string{});
      } else {
        params.emplace_back(DecodeLenient(pair.substr(0, eqPos)), DecodeLenient(pair.substr(eqPos + 1)));
      }
    }
    if (ampPos == std::string_view::npos) {
      break;
    }
    query.remove_prefix(ampPos + 1);
  }
  return params;
}

}  // namespace turbonet::url
