#include "turbonet/handler-result.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "turbonet/http-header.hpp"
#include "turbonet/http-response.hpp"
#include "turbonet/http-status-code.hpp"

namespace turbonet {

std::string_view SniffContentType(std::string_view body) noexcept {
  const auto firstPos = body.find_first_not_of(" \t\r\n");
  if (firstPos == std::string_view::npos) {
    return http::ContentTypeTextPlain;
  }
  switch (body[firstPos]) {
    case '<':
      return http::ContentTypeTextHtml;
    case '{':
    case '[':
      return http::ContentTypeApplicationJson;
    default:
      return http::ContentTypeTextPlain;
  }
}

HttpResponse HandlerResult::toResponse() && {
  return std::visit(
      [](auto&& value) -> HttpResponse {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, HttpResponse>) {
          return std::move(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
          const std::string_view contentType = SniffContentType(value);
          return {http::StatusCodeOK, std::move(value), contentType};
        } else if constexpr (std::is_same_v<T, Raw>) {
          return {http::StatusCodeOK, std::move(value.body), value.contentType};
        } else if constexpr (std::is_same_v<T, StructuredValue>) {
          return {http::StatusCodeOK, value.serialize(), http::ContentTypeApplicationJson};
        } else {
          HttpResponse response(value.status);
          for (const http::Header& header : value.headers) {
            response.addHeader(header.name, header.value);
          }
          if (!response.headerValue(http::ContentType)) {
            response.header(http::ContentType, http::ContentTypeApplicationJson);
          }
          response.body(std::move(value.body));
          return response;
        }
      },
      std::move(_value));
}

}  // namespace turbonet
