#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace turbonet {

// Disable Nagle's algorithm on a connected TCP socket.
bool SetTcpNoDelay(int fd) noexcept;

// Textual peer address (IPv4 "a.b.c.d" or IPv6) of a connected socket, used as the client identity key of the
// rate limiter. Returns an empty string if it cannot be determined.
std::string PeerAddress(int fd);

// send() that never raises SIGPIPE. Returns the number of bytes written or -1 (errno set).
int64_t SafeSend(int fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(int fd, std::string_view data) noexcept { return SafeSend(fd, data.data(), data.size()); }

}  // namespace turbonet
