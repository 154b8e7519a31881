#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "turbonet/socket.hpp"

namespace turbonet::test {

using namespace std::chrono_literals;

// Blocking loopback client socket, with a receive timeout so that a misbehaving server cannot hang a test.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  void close() noexcept { _socket.close(); }

 private:
  Socket _socket;
};

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until 'isComplete' returns true for the received bytes, the peer closes or the timeout expires.
std::string recvUntil(int fd, const std::function<bool(std::string_view)>& isComplete,
                      std::chrono::milliseconds totalTimeout = 2000ms);

// Reads one complete HTTP response (head + Content-Length bytes of body).
std::string recvResponse(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads 'nbResponses' complete HTTP responses.
std::string recvResponses(int fd, int nbResponses, std::chrono::milliseconds totalTimeout = 2000ms);

std::string recvUntilClosed(int fd);

// Whether the peer closed the connection (recv returned 0) within 'timeout'.
bool waitForClose(int fd, std::chrono::milliseconds timeout = 2000ms);

// Number of complete HTTP responses at the beginning of 'raw'.
int countCompleteResponses(std::string_view raw);

// GET 'path' with Connection: close, returning the raw response.
std::string simpleGet(uint16_t port, std::string_view path);

int countOccurrences(std::string_view haystack, std::string_view needle);

// Status code of the first response of 'raw', 0 if it cannot be parsed.
int statusCode(std::string_view raw);

// Body of the first response of 'raw'.
std::string_view responseBody(std::string_view raw);

}  // namespace turbonet::test
