#include "turbonet/socket.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <system_error>

#include "turbonet/socket-ops.hpp"

namespace turbonet {

TEST(Socket, BindEphemeralPort) {
  Socket sock(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  sock.bindAndListen("127.0.0.1", port, false, true, 16);
  EXPECT_NE(port, 0);
}

TEST(Socket, ReusePortAllowsSharedBind) {
  Socket first(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  first.bindAndListen("127.0.0.1", port, true, false, 16);

  Socket second(Socket::Type::StreamNonBlock);
  uint16_t samePort = port;
  EXPECT_NO_THROW(second.bindAndListen("127.0.0.1", samePort, true, false, 16));
  EXPECT_EQ(samePort, port);
}

TEST(Socket, BindWithoutReusePortConflicts) {
  Socket first(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  first.bindAndListen("127.0.0.1", port, false, false, 16);

  Socket second(Socket::Type::StreamNonBlock);
  uint16_t samePort = port;
  EXPECT_THROW(second.bindAndListen("127.0.0.1", samePort, false, false, 16), std::system_error);
}

TEST(Socket, InvalidAddressThrows) {
  Socket sock(Socket::Type::Stream);
  uint16_t port = 0;
  EXPECT_THROW(sock.bindAndListen("not-an-ip", port, false, false, 16), std::system_error);
}

TEST(SocketOps, PeerAddressOfLoopbackClient) {
  Socket listener(Socket::Type::Stream);
  uint16_t port = 0;
  listener.bindAndListen("127.0.0.1", port, false, false, 16);

  const int client = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(client, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  ASSERT_EQ(::connect(client, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);

  const int accepted = ::accept(listener.fd(), nullptr, nullptr);
  ASSERT_GE(accepted, 0);
  EXPECT_EQ(PeerAddress(accepted), "127.0.0.1");
  EXPECT_EQ(SafeSend(accepted, "hi"), 2);

  ::close(accepted);
  ::close(client);
}

}  // namespace turbonet
