#include "SocketHandler.hpp"

namespace dbridge {
void SocketHandler::readAll(int fd, void* buf, size_t count,
                            int64_t timeoutMs) {
  int64_t lastProgress = millisecondsSinceEpoch();
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd, timeoutMs > 0 ? min<int64_t>(timeoutMs, 1000)
                                            : 1000)) {
      if (timeoutMs > 0 &&
          millisecondsSinceEpoch() > lastProgress + timeoutMs) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // The peer hung up.  Report it the same way as a broken pipe.
      errno = EPIPE;
      bytesRead = -1;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
      } else {
        VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to readAll");
      }
    } else {
      pos += bytesRead;
      lastProgress = millisecondsSinceEpoch();
    }
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    int64_t timeoutMs) {
  int64_t lastProgress = millisecondsSinceEpoch();
  size_t pos = 0;
  while (pos < count) {
    int64_t now = millisecondsSinceEpoch();
    if (timeoutMs > 0 && now > lastProgress + timeoutMs) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
        // Keep retrying at 10hz
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      lastProgress = now;
    }
  }
}
}  // namespace dbridge
