#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/vector.hpp"

namespace turbonet::url {

// Decodes percent-encoded sequences of 'data'. When 'plusAsSpace' is true, '+' is decoded as a space
// (application/x-www-form-urlencoded semantics, used for query strings).
// Returns std::nullopt if a '%' is not followed by two hexadecimal digits.
[[nodiscard]] std::optional<std::string> Decode(std::string_view data, bool plusAsSpace);

// Percent-encodes a decoded path so that it can be sent back in a header (e.g. Location). '/' and the RFC 3986 pchar
// set are kept, every other byte (spaces, controls, '%', '?', '#', non-ASCII) becomes an uppercase %XX escape.
[[nodiscard]] std::string EncodePath(std::string_view path);

// Splits and decodes a raw query string ("a=1&b=x%20y&flag") into ordered (key, value) pairs.
// Keys may repeat. Malformed escapes are kept verbatim.
[[nodiscard]] vector<std::pair<std::string, std::string>> DecodeQueryParams(std::string_view query);

}  // namespace turbonet::url
