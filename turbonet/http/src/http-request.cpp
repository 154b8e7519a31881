#include "turbonet/http-request.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "turbonet/http-header.hpp"
#include "turbonet/http-method.hpp"
#include "turbonet/string-equal-ignore-case.hpp"
#include "turbonet/stringconv.hpp"
#include "turbonet/url-decode.hpp"

namespace turbonet {

namespace {

constexpr std::string_view kCRLF = "\r\n";
constexpr std::string_view kHeadTerminator = "\r\n\r\n";

constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr std::string_view TrimOws(std::string_view str) noexcept {
  while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
    str.remove_prefix(1);
  }
  while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) {
    str.remove_suffix(1);
  }
  return str;
}

using Status = RequestParseResult::Status;

struct ChunkedDecodeResult {
  Status status;
  std::size_t consumed;
};

// Decodes a chunked body starting at data[0]. On Complete, 'consumed' includes the last chunk and trailers.
// Chunk size lines (with their extensions) and the trailer section are bounded by 'maxFramingBytes', and the whole
// encoded body by maxBodyBytes + maxFramingBytes, so that a peer cannot make the input grow without limit.
ChunkedDecodeResult DecodeChunkedBody(std::string_view data, std::size_t maxBodyBytes, std::size_t maxFramingBytes,
                                      std::string& body) {
  const std::size_t maxEncodedBytes = maxBodyBytes + maxFramingBytes;
  std::size_t pos = 0;
  while (true) {
    if (pos > maxEncodedBytes) {
      return {Status::BodyTooLarge, 0};
    }
    const auto lineEnd = data.find(kCRLF, pos);
    if (lineEnd == std::string_view::npos) {
      return {data.size() - pos > maxFramingBytes ? Status::BodyTooLarge : Status::Incomplete, 0};
    }
    if (lineEnd - pos > maxFramingBytes) {
      return {Status::BodyTooLarge, 0};
    }
    std::string_view sizeLine = data.substr(pos, lineEnd - pos);
    // chunk extensions are ignored
    sizeLine = TrimOws(sizeLine.substr(0, sizeLine.find(';')));
    const auto chunkSize = ParseSize(sizeLine, 16);
    if (!chunkSize) {
      return {Status::BadRequest, 0};
    }
    pos = lineEnd + kCRLF.size();
    if (*chunkSize == 0) {
      // trailer section, terminated by an empty line
      const std::size_t trailerStart = pos;
      while (true) {
        const auto trailerEnd = data.find(kCRLF, pos);
        if (trailerEnd == std::string_view::npos) {
          return {data.size() - trailerStart > maxFramingBytes ? Status::HeadersTooLarge : Status::Incomplete, 0};
        }
        if (trailerEnd + kCRLF.size() - trailerStart > maxFramingBytes) {
          return {Status::HeadersTooLarge, 0};
        }
        const bool emptyLine = trailerEnd == pos;
        pos = trailerEnd + kCRLF.size();
        if (emptyLine) {
          return {Status::Complete, pos};
        }
      }
    }
    if (*chunkSize > maxBodyBytes || body.size() + *chunkSize > maxBodyBytes) {
      return {Status::BodyTooLarge, 0};
    }
    if (data.size() < pos + *chunkSize + kCRLF.size()) {
      return {Status::Incomplete, 0};
    }
    body.append(data.substr(pos, *chunkSize));
    pos += *chunkSize;
    if (data.substr(pos, kCRLF.size()) != kCRLF) {
      return {Status::BadRequest, 0};
    }
    pos += kCRLF.size();
  }
}

}  // namespace

HttpRequest::HttpRequest(http::Method method, std::string_view target, http::Headers headers, std::string body)
    : _method(method), _headers(std::move(headers)), _body(std::move(body)) {
  if (target.empty() || target.front() != '/') {
    throw std::invalid_argument("request target must be in origin-form");
  }
  const auto queryPos = target.find('?');
  auto decodedPath = url::Decode(target.substr(0, queryPos), false);
  if (!decodedPath) {
    throw std::invalid_argument("invalid percent-encoding in request path");
  }
  _path = std::move(*decodedPath);
  if (queryPos != std::string_view::npos) {
    _rawQuery = target.substr(queryPos + 1);
    _queryParams = url::DecodeQueryParams(_rawQuery);
  }
}

std::optional<std::string_view> HttpRequest::queryParamValue(std::string_view key) const noexcept {
  for (const auto& [paramKey, paramValue] : _queryParams) {
    if (paramKey == key) {
      return std::string_view(paramValue);
    }
  }
  return std::nullopt;
}

bool HttpRequest::wantsKeepAlive() const noexcept {
  const auto connection = headerValue(http::Connection);
  if (_version == "HTTP/1.0") {
    return connection && HeaderListContainsToken(*connection, "keep-alive");
  }
  return !connection || !HeaderListContainsToken(*connection, "close");
}

bool HttpRequest::isWebSocketUpgrade() const noexcept {
  const auto upgrade = headerValue(http::Upgrade);
  const auto connection = headerValue(http::Connection);
  return upgrade && connection && HeaderListContainsToken(*upgrade, "websocket") &&
         HeaderListContainsToken(*connection, "upgrade");
}

RequestParseResult ParseHttpRequest(std::string_view data, RequestParseLimits limits, HttpRequest& out) {
  const auto headEnd = data.find(kHeadTerminator);
  if (headEnd == std::string_view::npos) {
    return {data.size() > limits.maxHeaderBytes ? Status::HeadersTooLarge : Status::Incomplete, 0};
  }
  const std::size_t headSize = headEnd + kHeadTerminator.size();
  if (headSize > limits.maxHeaderBytes) {
    return {Status::HeadersTooLarge, 0};
  }

  // Request line: METHOD SP request-target SP HTTP-version
  const auto requestLineEnd = data.find(kCRLF);
  const std::string_view requestLine = data.substr(0, requestLineEnd);
  const auto firstSp = requestLine.find(' ');
  const auto lastSp = requestLine.rfind(' ');
  if (firstSp == std::string_view::npos || firstSp == lastSp || firstSp == 0) {
    return {Status::BadRequest, 0};
  }
  const std::string_view methodStr = requestLine.substr(0, firstSp);
  const std::string_view target = requestLine.substr(firstSp + 1, lastSp - firstSp - 1);
  const std::string_view version = requestLine.substr(lastSp + 1);

  if (version != "HTTP/1.1" && version != "HTTP/1.0") {
    if (version.starts_with("HTTP/")) {
      return {Status::VersionNotSupported, 0};
    }
    return {Status::BadRequest, 0};
  }
  for (char ch : methodStr) {
    if (!IsTokenChar(ch)) {
      return {Status::BadRequest, 0};
    }
  }
  const auto method = http::MethodFromStr(methodStr);
  if (!method) {
    return {Status::MethodNotImplemented, 0};
  }
  if (target.empty() || target.front() != '/' || target.find(' ') != std::string_view::npos) {
    return {Status::BadRequest, 0};
  }

  // Header fields
  http::Headers headers;
  std::size_t pos = requestLineEnd + kCRLF.size();
  while (pos < headEnd + kCRLF.size()) {
    const auto lineEnd = data.find(kCRLF, pos);
    const std::string_view line = data.substr(pos, lineEnd - pos);
    pos = lineEnd + kCRLF.size();
    if (line.empty()) {
      break;
    }
    if (line.front() == ' ' || line.front() == '\t') {
      // obsolete line folding
      return {Status::BadRequest, 0};
    }
    const auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos || colonPos == 0) {
      return {Status::BadRequest, 0};
    }
    const std::string_view name = line.substr(0, colonPos);
    for (char ch : name) {
      if (!IsTokenChar(ch)) {
        return {Status::BadRequest, 0};
      }
    }
    headers.push_back(http::Header{std::string(name), std::string(TrimOws(line.substr(colonPos + 1)))});
  }

  // Body framing
  std::string body;
  std::size_t bodyConsumed = 0;
  const auto transferEncoding = http::FindHeaderValue(headers, http::TransferEncoding);
  const auto contentLength = http::FindHeaderValue(headers, http::ContentLength);
  if (transferEncoding) {
    if (contentLength) {
      // ambiguous framing, a classic request smuggling vector
      return {Status::BadRequest, 0};
    }
    // only a single 'chunked' coding is supported
    if (!CaseInsensitiveEqual(TrimOws(*transferEncoding), "chunked")) {
      return {Status::MethodNotImplemented, 0};
    }
    const auto chunked = DecodeChunkedBody(data.substr(headSize), limits.maxBodyBytes, limits.maxHeaderBytes, body);
    if (chunked.status != Status::Complete) {
      return {chunked.status, 0};
    }
    bodyConsumed = chunked.consumed;
  } else if (contentLength) {
    const auto length = ParseSize(*contentLength);
    if (!length) {
      return {Status::BadRequest, 0};
    }
    if (*length > limits.maxBodyBytes) {
      return {Status::BodyTooLarge, 0};
    }
    if (data.size() - headSize < *length) {
      return {Status::Incomplete, 0};
    }
    body.assign(data.substr(headSize, *length));
    bodyConsumed = *length;
  }

  try {
    out = HttpRequest(*method, target, std::move(headers), std::move(body));
  } catch (const std::invalid_argument&) {
    return {Status::BadRequest, 0};
  }
  out.setVersion(version);
  return {Status::Complete, headSize + bodyConsumed};
}

}  // namespace turbonet
