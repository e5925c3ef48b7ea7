#ifndef __DBRIDGE_SOCKET_ENDPOINT__
#define __DBRIDGE_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace dbridge {
/**
 * @brief Host, port and path of the remote control endpoint.
 *
 * The path is not part of the TCP address; it is presented to the remote
 * during the handshake so one listener can serve several bridges.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1), path(DEFAULT_BRIDGE_PATH) {}

  explicit SocketEndpoint(const string &_name)
      : name(_name), port(-1), path(DEFAULT_BRIDGE_PATH) {}

  SocketEndpoint(const string &_name, int _port)
      : name(_name), port(_port), path(DEFAULT_BRIDGE_PATH) {}

  SocketEndpoint(const string &_name, int _port, const string &_path)
      : name(_name), port(_port), path(_path) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  const string &getPath() const { return path; }

 protected:
  string name;
  int port;
  string path;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  os << self.getName();
  if (self.getPort() >= 0) {
    os << ":" << self.getPort();
  }
  if (!self.getPath().empty() && self.getPath() != "/") {
    os << self.getPath();
  }
  return os;
}
}  // namespace dbridge

#endif  // __DBRIDGE_SOCKET_ENDPOINT__
