#include "turbonet/websocket-upgrade.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/websocket-constants.hpp"

namespace turbonet::websocket {

namespace {

constexpr bool IsBase64Char(char ch) noexcept {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '+' || ch == '/';
}

UpgradeResult Reject(http::StatusCode statusCode, std::string_view reason) {
  UpgradeResult result;
  result.response = HttpResponse(statusCode, std::string(reason), http::ContentTypeTextPlain);
  return result;
}

}  // namespace

bool IsValidWebSocketKey(std::string_view key) noexcept {
  if (key.size() != 24 || key[22] != '=' || key[23] != '=') {
    return false;
  }
  return std::all_of(key.begin(), key.begin() + 22, IsBase64Char);
}

std::string ComputeWebSocketAccept(std::string_view key) {
  std::string concat;
  concat.reserve(key.size() + kGUID.size());
  concat.append(key);
  concat.append(kGUID);

  std::array<unsigned char, SHA_DIGEST_LENGTH> digest;
  SHA1(reinterpret_cast<const unsigned char*>(concat.data()), concat.size(), digest.data());

  // 20 bytes -> 28 base64 characters, EVP_EncodeBlock also writes a terminating NUL
  std::array<unsigned char, 4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1> encoded;
  const int encodedLen = EVP_EncodeBlock(encoded.data(), digest.data(), static_cast<int>(digest.size()));
  return {reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(encodedLen)};
}

UpgradeResult ProcessUpgradeRequest(const HttpRequest& request) {
  if (request.method() != http::Method::GET) {
    return Reject(http::StatusCodeBadRequest, "WebSocket upgrade requires GET");
  }
  if (!request.isWebSocketUpgrade()) {
    return Reject(http::StatusCodeBadRequest, "Missing 'Upgrade: websocket' or 'Connection: Upgrade'");
  }
  const auto version = request.headerValue(SecWebSocketVersion);
  if (!version || *version != kVersion) {
    UpgradeResult result = Reject(http::StatusCodeUpgradeRequired, "Unsupported WebSocket version");
    result.response.header(SecWebSocketVersion, kVersion);
    return result;
  }
  const auto key = request.headerValue(SecWebSocketKey);
  if (!key || !IsValidWebSocketKey(*key)) {
    return Reject(http::StatusCodeBadRequest, "Invalid Sec-WebSocket-Key");
  }

  UpgradeResult result;
  result.accepted = true;
  result.response.status(http::StatusCodeSwitchingProtocols);
  result.response.header(http::Upgrade, UpgradeValue);
  result.response.header(SecWebSocketAccept, ComputeWebSocketAccept(*key));
  return result;
}

}  // namespace turbonet::websocket
