#include "quay/socket.hpp"

#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <string>
#include <system_error>

#include "quay/base-fd.hpp"

using namespace quay;

namespace {
BaseFd ConnectLoopback(uint16_t port) {
  BaseFd client(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(client.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    client.close();
  }
  return client;
}
}  // namespace

TEST(SocketTest, ListenOnEphemeralPort) {
  Socket listener = Socket::Listen("0", 16);
  ASSERT_TRUE(listener);
  EXPECT_NE(listener.localPort(), 0);
}

TEST(SocketTest, AcceptConnection) {
  Socket listener = Socket::Listen("0", 16);
  BaseFd client = ConnectLoopback(listener.localPort());
  ASSERT_TRUE(client);

  Socket accepted;
  for (int attempt = 0; attempt < 100 && !accepted; ++attempt) {
    accepted = listener.accept();
    if (!accepted) {
      ASSERT_EQ(errno, EAGAIN);
      ::usleep(1000);
    }
  }
  ASSERT_TRUE(accepted);
  EXPECT_EQ(::write(client.fd(), "x", 1), 1);
  char ch = 0;
  EXPECT_EQ(::read(accepted.fd(), &ch, 1), 1);
  EXPECT_EQ(ch, 'x');
}

TEST(SocketTest, AcceptWithoutPendingConnection) {
  Socket listener = Socket::Listen("0", 16);
  Socket accepted = listener.accept();
  EXPECT_FALSE(accepted);
  EXPECT_TRUE(IsTransientAcceptError(errno));
}

TEST(SocketTest, PortAlreadyInUse) {
  Socket listener = Socket::Listen("0", 16);
  const std::string port = std::to_string(listener.localPort());
  try {
    Socket second = Socket::Listen(port, 16);
    FAIL() << "second listen on the same port should fail";
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), EADDRINUSE);
    EXPECT_NE(std::string(ex.what()).find(port), std::string::npos);
  }
}

TEST(SocketTest, InvalidPort) {
  EXPECT_THROW(Socket::Listen("not-a-port-at-all", 16), std::system_error);
  EXPECT_THROW(Socket::Listen("70000", 16), std::system_error);
}

TEST(SocketTest, TransientAcceptErrors) {
  EXPECT_TRUE(IsTransientAcceptError(EINTR));
  EXPECT_TRUE(IsTransientAcceptError(ECONNABORTED));
  EXPECT_TRUE(IsTransientAcceptError(EMFILE));
  EXPECT_FALSE(IsTransientAcceptError(EBADF));
  EXPECT_FALSE(IsTransientAcceptError(EINVAL));
}
