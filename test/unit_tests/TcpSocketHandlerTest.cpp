#include "TcpSocketHandler.hpp"

#include "TestHeaders.hpp"

using namespace dbridge;

namespace {
class AcceptedTcpSocketHandler : public TcpSocketHandler {
 public:
  void adopt(int fd) {
    addToActiveSockets(fd);
    initSocket(fd);
  }
};

int listenOnLoopback(int* port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  FATAL_FAIL(::bind(fd, (sockaddr*)&addr, sizeof(addr)));
  FATAL_FAIL(::listen(fd, 1));
  socklen_t len = sizeof(addr);
  FATAL_FAIL(::getsockname(fd, (sockaddr*)&addr, &len));
  *port = ntohs(addr.sin_port);
  return fd;
}
}  // namespace

TEST_CASE("TcpSocketHandler connects and frames packets",
          "[TcpSocketHandler]") {
  int port;
  int listenFd = listenOnLoopback(&port);
  TcpSocketHandler handler(1000);

  int clientFd = handler.connect(SocketEndpoint("127.0.0.1", port));
  REQUIRE(clientFd != -1);
  REQUIRE(handler.getActiveSockets().size() == 1);

  int serverFd = ::accept(listenFd, NULL, NULL);
  FATAL_FAIL(serverFd);

  AcceptedTcpSocketHandler serverHandler;
  serverHandler.adopt(serverFd);
  serverHandler.writePacket(serverFd, Packet(RESPONSE_ENVELOPE, "{}"));

  REQUIRE(waitUntil([&]() { return handler.hasData(clientFd); }));
  Packet packet;
  REQUIRE(handler.readPacket(clientFd, &packet));
  REQUIRE(packet.getHeader() == RESPONSE_ENVELOPE);
  REQUIRE(packet.getPayload() == "{}");

  handler.close(clientFd);
  REQUIRE(handler.getActiveSockets().empty());
  // The peer sees the hangup as an error, not as an empty read.
  REQUIRE_THROWS_AS(serverHandler.readPacket(serverFd, &packet),
                    std::runtime_error);
  serverHandler.close(serverFd);
  ::close(listenFd);
}

TEST_CASE("TcpSocketHandler reports unreachable endpoints",
          "[TcpSocketHandler]") {
  int port;
  int listenFd = listenOnLoopback(&port);
  ::close(listenFd);

  TcpSocketHandler handler(500);
  REQUIRE(handler.connect(SocketEndpoint("127.0.0.1", port)) == -1);
  REQUIRE(handler.getActiveSockets().empty());
}
