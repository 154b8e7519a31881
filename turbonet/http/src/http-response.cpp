#include "turbonet/http-response.hpp"

#include <algorithm>
#include <string>
#include <string_view>

#include "turbonet/http-header.hpp"
#include "turbonet/http-status-code.hpp"
#include "turbonet/string-equal-ignore-case.hpp"
#include "turbonet/stringconv.hpp"

namespace turbonet {

namespace {

// Headers computed at serialization time; user supplied values are ignored.
bool IsManagedHeader(std::string_view name) noexcept {
  return CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::Connection) ||
         CaseInsensitiveEqual(name, http::TransferEncoding);
}

bool HasNoBody(http::StatusCode statusCode) noexcept {
  return statusCode < 200 || statusCode == http::StatusCodeNoContent || statusCode == http::StatusCodeNotModified;
}

void AppendHeader(std::string& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(": ");
  out.append(value);
  out.append("\r\n");
}

}  // namespace

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_headers, [name](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, name); });
  if (it == _headers.end()) {
    return addHeader(name, value);
  }
  it->value.assign(value);
  // drop duplicates so that the header holds a single value
  auto dupIt = std::remove_if(std::next(it), _headers.end(),
                              [name](const http::Header& hdr) { return CaseInsensitiveEqual(hdr.name, name); });
  _headers.erase(dupIt, _headers.end());
  return *this;
}

HttpResponse& HttpResponse::addHeader(std::string_view name, std::string_view value) {
  _headers.push_back(http::Header{std::string(name), std::string(value)});
  return *this;
}

void HttpResponse::appendTo(std::string& out, const SerializeOptions& options) const {
  const bool noBody = HasNoBody(_statusCode);

  out.append("HTTP/1.1 ");
  const auto statusStr = IntegralToCharVector(_statusCode);
  out.append(statusStr.data(), statusStr.size());
  out.push_back(' ');
  out.append(http::ReasonPhrase(_statusCode));
  out.append("\r\n");

  bool hasDate = false;
  bool hasServer = false;
  for (const http::Header& hdr : _headers) {
    if (IsManagedHeader(hdr.name)) {
      continue;
    }
    hasDate = hasDate || CaseInsensitiveEqual(hdr.name, http::Date);
    hasServer = hasServer || CaseInsensitiveEqual(hdr.name, http::Server);
    AppendHeader(out, hdr.name, hdr.value);
  }
  if (!hasDate && !options.date.empty()) {
    AppendHeader(out, http::Date, options.date);
  }
  if (!hasServer && !options.serverName.empty()) {
    AppendHeader(out, http::Server, options.serverName);
  }
  if (!noBody) {
    const auto lenStr = IntegralToCharVector(_body.size());
    AppendHeader(out, http::ContentLength, std::string_view(lenStr.data(), lenStr.size()));
  }
  if (_statusCode == http::StatusCodeSwitchingProtocols) {
    AppendHeader(out, http::Connection, "Upgrade");
  } else {
    AppendHeader(out, http::Connection, options.keepAlive ? "keep-alive" : "close");
  }
  out.append("\r\n");

  if (!noBody && !options.headRequest) {
    out.append(_body);
  }
}

}  // namespace turbonet
