#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "turbonet/http-header.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"

#ifdef TURBONET_ENABLE_GLAZE
#include "turbonet/json-serializer.hpp"
#endif

namespace turbonet {

// A value serialized to JSON only when the response is built, inside the execution lock of the handler that
// produced it (the value may reference state protected by that lock).
class StructuredValue {
 public:
  using Serializer = std::function<std::string()>;

  explicit StructuredValue(Serializer serializer) noexcept : _serializer(std::move(serializer)) {}

#ifdef TURBONET_ENABLE_GLAZE
  // Wraps any object that glaze can reflect.
  template <class T>
  static StructuredValue Json(T value) {
    return StructuredValue([value = std::move(value)] { return SerializeToJson(value); });
  }
#endif

  [[nodiscard]] std::string serialize() const { return _serializer ? _serializer() : std::string("null"); }

 private:
  Serializer _serializer;
};

// What a handler returns. Converted to an HttpResponse by the HandlerBridge.
class HandlerResult {
 public:
  // Bytes with an explicit content type.
  struct Raw {
    std::string body;
    std::string contentType;
  };

  // Full control over the response. The content type defaults to application/json unless given in 'headers'.
  struct Explicit {
    std::string body;
    http::StatusCode status{http::StatusCodeOK};
    http::Headers headers;
  };

  // Empty 200 response.
  HandlerResult() noexcept = default;

  // A body whose content type is guessed from its first non blank character:
  // '<' -> text/html, '{' or '[' -> application/json, text/plain otherwise.
  HandlerResult(std::string body) noexcept : _value(std::move(body)) {}

  HandlerResult(const char* body) : _value(std::string(body)) {}

  HandlerResult(std::string_view body) : _value(std::string(body)) {}

  HandlerResult(Raw raw) noexcept : _value(std::move(raw)) {}

  HandlerResult(StructuredValue value) noexcept : _value(std::move(value)) {}

  HandlerResult(Explicit explicitResult) noexcept : _value(std::move(explicitResult)) {}

  HandlerResult(HttpResponse response) noexcept : _value(std::move(response)) {}

  // Builds the response. May run the serializer of a StructuredValue.
  [[nodiscard]] HttpResponse toResponse() &&;

 private:
  std::variant<HttpResponse, std::string, Raw, StructuredValue, Explicit> _value;
};

// Content type guessed from the first non blank character of 'body'.
[[nodiscard]] std::string_view SniffContentType(std::string_view body) noexcept;

}  // namespace turbonet
