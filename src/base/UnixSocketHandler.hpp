#ifndef __DBRIDGE_UNIX_SOCKET_HANDLER__
#define __DBRIDGE_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace dbridge {
/**
 * @brief SocketHandler implementation using POSIX sockets with a mutex per
 * tracked descriptor.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  /** @brief Queries whether the descriptor currently has readable bytes. */
  virtual bool hasData(int fd);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying until completion or timeout. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Shuts down and closes the descriptor, then stops tracking it.
   */
  virtual void close(int fd);
  virtual vector<int> getActiveSockets();

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, SIGPIPE).
   */
  virtual void initSocket(int fd);
  void setBlocking(int sockFd, bool blocking);
  /** @return nullptr if @p fd is not tracked (never opened or closed). */
  shared_ptr<recursive_mutex> getSocketMutex(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace dbridge

#endif  // __DBRIDGE_UNIX_SOCKET_HANDLER__
