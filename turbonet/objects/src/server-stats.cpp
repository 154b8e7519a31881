#include "turbonet/server-stats.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include "turbonet/stringconv.hpp"

namespace turbonet {

std::string ServerStats::json_str() const {
  std::string out;
  out.reserve(384UL);
  out.push_back('{');
  for_each_field([&out](std::string_view name, uint64_t value) {
    if (out.size() > 1U) {
      out.push_back(',');
    }
    out.push_back('"');
    out.append(name);
    out.append("\":");
    const auto digits = IntegralToCharVector(value);
    out.append(digits.data(), digits.size());
  });
  out.push_back('}');
  return out;
}

ServerStats& ServerStats::operator+=(const ServerStats& other) noexcept {
  connectionsAccepted += other.connectionsAccepted;
  totalRequestsServed += other.totalRequestsServed;
  totalBytesWritten += other.totalBytesWritten;
  cacheHits += other.cacheHits;
  cacheMisses += other.cacheMisses;
  cacheStaleServed += other.cacheStaleServed;
  rateLimitedRequests += other.rateLimitedRequests;
  handlerFailures += other.handlerFailures;
  webSocketSessionsOpened += other.webSocketSessionsOpened;
  webSocketSessionsClosed += other.webSocketSessionsClosed;
  webSocketMessagesReceived += other.webSocketMessagesReceived;
  webSocketMessagesDropped += other.webSocketMessagesDropped;
  outboundOverflowCloses += other.outboundOverflowCloses;
  maxConnectionOutboundBuffer = std::max(maxConnectionOutboundBuffer, other.maxConnectionOutboundBuffer);
  return *this;
}

}  // namespace turbonet
