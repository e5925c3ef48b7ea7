#ifndef __DBRIDGE_BRIDGE_ERRORS__
#define __DBRIDGE_BRIDGE_ERRORS__

#include "Headers.hpp"

namespace dbridge {
/**
 * @brief Root of every error raised by the bridge client.
 */
class BridgeError : public std::runtime_error {
 public:
  explicit BridgeError(const string& what) : std::runtime_error(what) {}
};

/** @brief The transport failed, closed, or could not be opened. */
class ConnectionError : public BridgeError {
 public:
  explicit ConnectionError(const string& what) : BridgeError(what) {}
};

/** @brief No response or open arrived before the deadline. */
class TimeoutError : public BridgeError {
 public:
  explicit TimeoutError(const string& what) : BridgeError(what) {}
};

/**
 * @brief The remote answered with success=false, or with a body that does
 * not contain what the caller asked for.
 */
class ProtocolError : public BridgeError {
 public:
  ProtocolError(const string& what, const string& _remoteError = "")
      : BridgeError(what), remoteError(_remoteError) {}

  /** @brief The error string sent by the remote, empty if it sent none. */
  const string& getRemoteError() const { return remoteError; }

 protected:
  string remoteError;
};

/** @brief Automatic reconnection gave up after the configured attempts. */
class ExhaustedRetriesError : public BridgeError {
 public:
  explicit ExhaustedRetriesError(const string& what) : BridgeError(what) {}
};

/** @brief The caller abandoned the request through its handle. */
class CancelledError : public BridgeError {
 public:
  explicit CancelledError(const string& what) : BridgeError(what) {}
};
}  // namespace dbridge

#endif  // __DBRIDGE_BRIDGE_ERRORS__
