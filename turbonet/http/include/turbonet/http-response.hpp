#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/http-header.hpp"
#include "turbonet/http-status-code.hpp"

namespace turbonet {

// An HTTP response under construction. Headers managed by the server (Content-Length, Connection, Date and Server
// when not already set) are added at serialization time.
class HttpResponse {
 public:
  explicit HttpResponse(http::StatusCode statusCode = http::StatusCodeOK) noexcept : _statusCode(statusCode) {}

  HttpResponse(http::StatusCode statusCode, std::string body, std::string_view contentType)
      : _statusCode(statusCode) {
    this->body(std::move(body), contentType);
  }

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  HttpResponse& status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Sets header 'name' to 'value', replacing any existing header with the same name (case-insensitive).
  HttpResponse& header(std::string_view name, std::string_view value);

  // Appends a header, keeping any existing header with the same name.
  HttpResponse& addHeader(std::string_view name, std::string_view value);

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return http::FindHeaderValue(_headers, name);
  }

  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  HttpResponse& body(std::string body) noexcept {
    _body = std::move(body);
    return *this;
  }

  // Sets the body along with its Content-Type.
  HttpResponse& body(std::string body, std::string_view contentType) {
    _body = std::move(body);
    return header(http::ContentType, contentType);
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::string takeBody() && noexcept { return std::move(_body); }

  struct SerializeOptions {
    std::string_view date;        // preformatted RFC7231 date, empty to omit
    std::string_view serverName;  // value of the Server header, empty to omit
    bool keepAlive{true};
    bool headRequest{false};  // emit headers only (Content-Length still reflects the body)
  };

  // Appends the wire representation of this response to 'out'.
  void appendTo(std::string& out, const SerializeOptions& options) const;

 private:
  http::StatusCode _statusCode;
  http::Headers _headers;
  std::string _body;
};

}  // namespace turbonet
