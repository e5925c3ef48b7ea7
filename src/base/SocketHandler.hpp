#ifndef __DBRIDGE_SOCKET_HANDLER__
#define __DBRIDGE_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"
#include "SocketEndpoint.hpp"

namespace dbridge {
/** Largest frame accepted in either direction. */
const int64_t MAX_FRAME_LENGTH = 128 * 1024 * 1024;

/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeoutMs Maximum idle time between bytes, or 0 to wait forever.
   * @throws std::runtime_error when the peer closes or the timeout expires.
   */
  void readAll(int fd, void* buf, size_t count, int64_t timeoutMs);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count,
                       int64_t timeoutMs);

  /**
   * @brief Reads a length-prefixed protobuf from the socket.
   * @tparam T Protobuf message type.
   * @throws std::runtime_error on invalid length or parse failure.
   */
  template <typename T>
  inline T readProto(int fd, int64_t timeoutMs) {
    T t;
    int64_t length;
    readAll(fd, &length, sizeof(int64_t), timeoutMs);
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      string s = string("Invalid size (<0 or >128 MB): ") + to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return t;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeoutMs);
    if (!t.ParseFromString(s)) {
      throw std::runtime_error("Invalid proto");
    }
    return t;
  }

  /**
   * @brief Serializes and writes a length-prefixed protobuf message.
   */
  template <typename T>
  inline void writeProto(int fd, const T& t, int64_t timeoutMs) {
    string s;
    if (!t.SerializeToString(&s)) {
      throw std::runtime_error(string("Serialization of ") + t.GetTypeName() +
                               " failed");
    }
    int64_t length = s.length();
    writeAllOrThrow(fd, &length, sizeof(int64_t), timeoutMs);
    if (length > 0) {
      writeAllOrThrow(fd, &s[0], length, timeoutMs);
    }
  }

  /**
   * @brief Reads a length-prefixed packet and deserializes it.
   * @returns false when the frame length is zero (keepalive).
   */
  inline bool readPacket(int fd, Packet* packet) {
    int64_t length;
    readAll(fd, (char*)&length, sizeof(int64_t), 0);
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      string s("Invalid size (<0 or >128 MB): ");
      s += std::to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, 0);
    *packet = Packet(s);
    return true;
  }

  /**
   * @brief Serializes and writes a packet with a leading length prefix.
   */
  inline void writePacket(int fd, const Packet& packet) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length > MAX_FRAME_LENGTH) {
      throw std::runtime_error(string("Invalid message length: ") +
                               to_string(length));
    }
    writeAllOrThrow(fd, (const char*)&length, sizeof(int64_t),
                    SOCKET_WRITE_TIMEOUT_MS);
    if (length) {
      writeAllOrThrow(fd, &s[0], length, SOCKET_WRITE_TIMEOUT_MS);
    }
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;

 protected:
  static const int64_t SOCKET_WRITE_TIMEOUT_MS = 10 * 1000;
};
}  // namespace dbridge

#endif  // __DBRIDGE_SOCKET_HANDLER__
