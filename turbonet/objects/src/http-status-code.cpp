#include "turbonet/http-status-code.hpp"

#include <string_view>

namespace turbonet::http {

std::string_view ReasonPhrase(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeSwitchingProtocols:
      return "Switching Protocols";
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeConflict:
      return "Conflict";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeUpgradeRequired:
      return "Upgrade Required";
    case StatusCodeTooManyRequests:
      return "Too Many Requests";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return "Unknown";
  }
}

}  // namespace turbonet::http
