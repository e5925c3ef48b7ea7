#include "TcpSocketHandler.hpp"

namespace dbridge {
TcpSocketHandler::TcpSocketHandler(int64_t _connectTimeoutMs)
    : connectTimeoutMs(_connectTimeoutMs) {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = (AI_CANONNAME | AI_V4MAPPED | AI_ADDRCONFIG);
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname = endpoint.getName();

  // (re)initialize the DNS system
  ::res_init();
  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);

  if (rc == EAI_NONAME) {
    VLOG_EVERY_N(10, 1) << "Cannot resolve hostname: " << gai_strerror(rc);
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }

    // Nonblocking for the connect phase so the timeout can be enforced
    setBlocking(sockFd, false);
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1 &&
        errno != EINPROGRESS) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    fd_set fdset;
    FD_ZERO(&fdset);
    FD_SET(sockFd, &fdset);
    timeval tv;
    tv.tv_sec = connectTimeoutMs / 1000;
    tv.tv_usec = (connectTimeoutMs % 1000) * 1000;
    VLOG(4) << "Before selecting sockFd";
    if (select(sockFd + 1, NULL, &fdset, NULL, &tv) > 0 &&
        FD_ISSET(sockFd, &fdset)) {
      int so_error;
      socklen_t len = sizeof so_error;

      FATAL_FAIL(::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, &so_error, &len));

      if (so_error == 0) {
        LOG(INFO) << "Connected to bridge: " << endpoint << " using fd "
                  << sockFd;
        break;  // if we get here, we must have connected successfully
      }
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
                << strerror(so_error);
    } else {
      LOG(INFO) << "Timed out connecting to " << endpoint;
    }
    ::close(sockFd);
    sockFd = -1;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(WARNING) << "Could not reach bridge at " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace dbridge
