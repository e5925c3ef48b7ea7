#include "UnixSocketHandler.hpp"

namespace dbridge {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n <= 0) {
    // -1 usually means the fd was closed underneath us.
    return false;
  }
  return FD_ISSET(fd, &input);
}

bool UnixSocketHandler::hasData(int fd) { return waitForData(fd, 0, 0); }

shared_ptr<recursive_mutex> UnixSocketHandler::getSocketMutex(int fd) {
  if (fd <= 0) {
    STFATAL << "Invalid socket: " << fd;
  }
  lock_guard<std::recursive_mutex> guard(globalMutex);
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    return nullptr;
  }
  return it->second;
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Read from closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Read from " << fd << " failed: " << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  auto socketMutex = getSocketMutex(fd);
  if (!socketMutex) {
    VLOG(1) << "Write to closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  // A full send buffer gets a few seconds to drain
  int64_t deadline = millisecondsSinceEpoch() + 5000;
  size_t written = 0;
  lock_guard<recursive_mutex> guard(*socketMutex);
  while (written < count) {
    const char *start = ((const char *)buf) + written;
#ifdef MSG_NOSIGNAL
    ssize_t w = ::send(fd, start, count - written, MSG_NOSIGNAL);
#else
    ssize_t w = ::write(fd, start, count - written);
#endif
    if (w >= 0) {
      written += w;
      continue;
    }
    if ((errno != EAGAIN && errno != EWOULDBLOCK) ||
        millisecondsSinceEpoch() > deadline) {
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return count;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Socket " << fd << " is already tracked";
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

void UnixSocketHandler::close(int fd) {
  if (fd == -1) {
    return;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> globalGuard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      VLOG(1) << "Socket " << fd << " is already closed";
      return;
    }
    socketMutex = it->second;
    activeSocketMutexes.erase(it);
  }
  // Wake up anyone blocked in select() before releasing the descriptor.
  ::shutdown(fd, SHUT_RDWR);
  lock_guard<std::recursive_mutex> guard(*socketMutex);
  VLOG(1) << "Closing socket " << fd;
  FATAL_FAIL(::close(fd));
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (auto it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  setBlocking(fd, false);
}

void UnixSocketHandler::setBlocking(int sockFd, bool blocking) {
  int opts;
  opts = fcntl(sockFd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  if (blocking) {
    opts &= (~O_NONBLOCK);
  } else {
    opts |= O_NONBLOCK;
  }
  FATAL_FAIL_UNLESS_EINVAL(fcntl(sockFd, F_SETFL, opts));
}
}  // namespace dbridge
