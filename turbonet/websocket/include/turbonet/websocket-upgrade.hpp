#pragma once

#include <string>
#include <string_view>

#include "turbonet/http-request.hpp"
#include "turbonet/http-response.hpp"

namespace turbonet::websocket {

// A Sec-WebSocket-Key is the base64 encoding of 16 bytes: 24 characters ending with "==".
[[nodiscard]] bool IsValidWebSocketKey(std::string_view key) noexcept;

// base64(SHA-1(key + GUID)), the expected Sec-WebSocket-Accept value for 'key'.
[[nodiscard]] std::string ComputeWebSocketAccept(std::string_view key);

struct UpgradeResult {
  // 101 Switching Protocols when accepted, otherwise the error response to send before closing.
  HttpResponse response;
  bool accepted{false};
};

// Validates an opening handshake request.
//  - method must be GET, with 'Upgrade: websocket' and 'Connection: Upgrade'
//  - Sec-WebSocket-Version must be 13, otherwise 426 advertising the supported version
//  - Sec-WebSocket-Key must be a valid key, otherwise 400
[[nodiscard]] UpgradeResult ProcessUpgradeRequest(const HttpRequest& request);

}  // namespace turbonet::websocket
