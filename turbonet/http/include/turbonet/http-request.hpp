#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/path-params.hpp"
#include "turbonet/vector.hpp"

namespace turbonet {

// A fully received HTTP/1.x request. It owns its data: the connection input buffer can be reused as soon as the
// request has been parsed.
class HttpRequest {
 public:
  using QueryParams = vector<std::pair<std::string, std::string>>;

  HttpRequest() noexcept = default;

  // Builds a request from a method and a request target ("/path?query"). The path is percent-decoded, the query
  // string is split and decoded into key/value pairs.
  // Throws std::invalid_argument if the target is not an origin-form target or contains invalid escapes.
  HttpRequest(http::Method method, std::string_view target, http::Headers headers = {}, std::string body = {});

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Decoded path, without the query string.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw (still encoded) query string, without the '?'.
  [[nodiscard]] std::string_view rawQuery() const noexcept { return _rawQuery; }

  [[nodiscard]] const QueryParams& queryParams() const noexcept { return _queryParams; }

  // Value of the first query parameter named 'key', if any.
  [[nodiscard]] std::optional<std::string_view> queryParamValue(std::string_view key) const noexcept;

  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  // Value of the first header named 'name' (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return http::FindHeaderValue(_headers, name);
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Captured path parameters, set once the request has been matched against a route.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  // Identity of the remote peer (its IP address), used as rate limiting key.
  [[nodiscard]] std::string_view clientAddress() const noexcept { return _clientAddress; }

  // "HTTP/1.1" or "HTTP/1.0"
  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  // Whether the client allows the connection to be reused after this request.
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

  // Whether this request asks for a protocol upgrade to WebSocket.
  [[nodiscard]] bool isWebSocketUpgrade() const noexcept;

  void setPathParams(PathParams pathParams) noexcept { _pathParams = std::move(pathParams); }

  void setClientAddress(std::string clientAddress) noexcept { _clientAddress = std::move(clientAddress); }

  void setVersion(std::string_view version) { _version = version; }

  void setBody(std::string body) noexcept { _body = std::move(body); }

 private:
  http::Method _method{http::Method::GET};
  std::string _path;
  std::string _rawQuery;
  std::string _version{"HTTP/1.1"};
  QueryParams _queryParams;
  http::Headers _headers;
  std::string _body;
  PathParams _pathParams;
  std::string _clientAddress;
};

// Outcome of an attempt to parse one request from the head of a connection input buffer.
struct RequestParseResult {
  enum class Status : uint8_t {
    Complete,             // a full request was parsed, 'bytesConsumed' bytes can be dropped from the buffer
    Incomplete,           // more bytes are needed
    BadRequest,           // malformed request line / headers / framing (400)
    HeadersTooLarge,      // request head exceeds maxHeaderBytes (431)
    BodyTooLarge,         // declared or decoded body exceeds maxBodyBytes (413)
    MethodNotImplemented, // unknown method or transfer coding (501)
    VersionNotSupported   // not HTTP/1.0 nor HTTP/1.1 (505)
  };

  Status status{Status::Incomplete};
  std::size_t bytesConsumed{0};
};

struct RequestParseLimits {
  std::size_t maxHeaderBytes;
  std::size_t maxBodyBytes;
};

// Parses one HTTP/1.x request from the beginning of 'data' into 'out'.
// Bodies framed with Content-Length and 'chunked' Transfer-Encoding are supported.
[[nodiscard]] RequestParseResult ParseHttpRequest(std::string_view data, RequestParseLimits limits, HttpRequest& out);

}  // namespace turbonet
