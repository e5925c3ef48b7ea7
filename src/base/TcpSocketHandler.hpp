#ifndef __DBRIDGE_TCP_SOCKET_HANDLER__
#define __DBRIDGE_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace dbridge {
/**
 * @brief Opens IPv4/IPv6 client connections on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  explicit TcpSocketHandler(int64_t _connectTimeoutMs = 3000);
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the
   * remote, waiting at most the connect timeout for each address.
   * @return The connected fd or -1 when no address accepted the connection.
   */
  virtual int connect(const SocketEndpoint& endpoint);

 protected:
  int64_t connectTimeoutMs;

  /**
   * @brief Adds TCP_NODELAY on top of the unix socket setup.
   */
  virtual void initSocket(int fd);
};
}  // namespace dbridge

#endif  // __DBRIDGE_TCP_SOCKET_HANDLER__
