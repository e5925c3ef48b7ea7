#ifndef __DBRIDGE_CONNECTION_MANAGER__
#define __DBRIDGE_CONNECTION_MANAGER__

#include "BackoffPolicy.hpp"
#include "BridgeConfig.hpp"
#include "BridgeErrors.hpp"
#include "Envelope.hpp"
#include "Headers.hpp"
#include "OutboundQueue.hpp"
#include "SocketHandler.hpp"

namespace dbridge {
enum class ConnectionState {
  DISCONNECTED,
  CONNECTING,
  CONNECTED,
  RECONNECTING,
  FAILED,
};

string connectionStateToString(ConnectionState state);
ostream& operator<<(ostream& os, ConnectionState state);

struct ReconnectionState {
  int attemptCount = 0;
  int maxAttempts = 0;
  int64_t currentDelay = 0;
  int64_t maxDelay = 0;
};

/** @brief Outcome of ConnectionManager::send(). */
enum class SendResult {
  SENT,
  QUEUED,
  FAILED,
};

/**
 * @brief Receives everything the connection produces.  All methods except
 * onConnectionError are called on the lifecycle thread.
 */
class ConnectionListener {
 public:
  virtual ~ConnectionListener() {}

  virtual void onResponse(const ResponseEnvelope& response) = 0;
  virtual void onBroadcast(const Packet& packet) = 0;
  /**
   * @brief The transport was lost (ConnectionError) or reconnection gave up
   * (ExhaustedRetriesError).  A write failure reports from the writing thread.
   */
  virtual void onConnectionError(const BridgeError& error) = 0;
  /** @brief A connection was re-established after a RECONNECTING phase. */
  virtual void onReconnect() = 0;
  /**
   * @brief Whether a caller still waits on @p correlationId.  Queued requests
   * that were cancelled or timed out are dropped instead of replayed.
   */
  virtual bool isPending(const string& correlationId) = 0;
};

/**
 * @brief Owns the transport to the bridge: opens it with a handshake, reads
 * from it, reconnects with backoff when it drops and replays requests that
 * were queued while it was down.
 *
 * One lifecycle thread runs the read loop, the backoff waits and the
 * reconnect attempts.  It only exists between connect() (or a send() that
 * triggers a connection) and disconnect() / FAILED.
 */
class ConnectionManager {
 public:
  ConnectionManager(shared_ptr<SocketHandler> _socketHandler,
                    const BridgeConfig& _config, ConnectionListener* _listener);
  ~ConnectionManager();

  /**
   * @brief Returns once the connection is open.
   *
   * Joins an attempt that is already in progress.  From RECONNECTING or
   * FAILED the reconnection budget is reset and an attempt starts right away.
   * @throws TimeoutError if nothing opened within the connect timeout.
   * @throws ConnectionError if the attempt failed first.
   */
  void connect();

  /**
   * @brief Closes the transport, stops the lifecycle thread and drops every
   * queued request.  Calling it while disconnected does nothing.
   * @return The number of queued requests that were dropped.
   */
  int disconnect();

  /**
   * @brief Writes @p request now when connected, otherwise queues it and, if
   * the manager is DISCONNECTED or FAILED, starts connecting with a fresh
   * reconnection budget.
   *
   * A FAILED result means the write broke the connection; the request is not
   * retried.
   */
  SendResult send(const RequestEnvelope& request);

  bool isConnected();
  ConnectionState getState();
  ReconnectionState getReconnectionState();
  size_t getQueuedCount() { return outboundQueue.size(); }

 protected:
  void run(int64_t generation);
  void readLoop(int fd);
  void waitAndRetry();
  void attemptOpen();
  /**
   * @brief TCP connect plus handshake.
   * @return The ready socket.
   * @throws ConnectionError on any failure; the socket is closed.
   */
  int openTransport();
  void onOpen(int fd);
  void flushQueue(int fd);
  bool writeEnvelope(int fd, const RequestEnvelope& request);
  void handlePacket(const Packet& packet);
  void handleTransportClosed(int fd, const string& reason);

  // Must hold connectionMutex
  void beginConnectingLocked();
  void ensureLifecycleThreadLocked();

  /** @brief Longest single wait for inbound data in the read loop. */
  static const int64_t READ_WAIT_MS = 250;

  shared_ptr<SocketHandler> socketHandler;
  BridgeConfig config;
  SocketEndpoint remoteEndpoint;
  BackoffPolicy backoffPolicy;
  ConnectionListener* listener;
  OutboundQueue outboundQueue;

  std::mutex connectionMutex;
  std::condition_variable stateChanged;
  ConnectionState state;
  ReconnectionState reconnectionState;
  /** @brief Fd of the open transport, -1 when none. */
  int socketFd;
  /** @brief True from open until the queue has been fully replayed. */
  bool flushing;
  /** @brief Set when the current RECONNECTING phase began. */
  bool reconnectPhase;
  bool stopRequested;
  std::exception_ptr lastOpenError;

  /** @brief Serializes every frame written after the handshake. */
  std::mutex writeMutex;

  shared_ptr<thread> lifecycleThread;
  bool lifecycleRunning;
  int64_t lifecycleGeneration;
};
}  // namespace dbridge

#endif  // __DBRIDGE_CONNECTION_MANAGER__
