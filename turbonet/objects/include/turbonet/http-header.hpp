#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "turbonet/string-equal-ignore-case.hpp"
#include "turbonet/vector.hpp"

namespace turbonet::http {

struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const = default;
};

// Ordered header multimap: insertion order is kept and names may repeat.
using Headers = vector<Header>;

inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view RetryAfter = "Retry-After";
inline constexpr std::string_view Upgrade = "Upgrade";
inline constexpr std::string_view Age = "Age";
inline constexpr std::string_view XCache = "X-Cache";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeTextHtml = "text/html; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

// Value of the first header named 'name' (case-insensitive), if any.
[[nodiscard]] inline std::optional<std::string_view> FindHeaderValue(const Headers& headers, std::string_view name) {
  for (const Header& header : headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return std::string_view(header.value);
    }
  }
  return std::nullopt;
}

}  // namespace turbonet::http
