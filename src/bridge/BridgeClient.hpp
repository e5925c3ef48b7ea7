#ifndef __DBRIDGE_BRIDGE_CLIENT__
#define __DBRIDGE_BRIDGE_CLIENT__

#include "BridgeConfig.hpp"
#include "BridgeErrors.hpp"
#include "BroadcastRouter.hpp"
#include "CallbackList.hpp"
#include "ConnectionManager.hpp"
#include "Envelope.hpp"
#include "Headers.hpp"
#include "PendingRequestTable.hpp"
#include "SocketHandler.hpp"

namespace dbridge {
typedef function<void(const BridgeError&)> ErrorCallback;
typedef function<void()> ReconnectCallback;

/**
 * @brief A request that is in flight.  get() blocks until it settles.
 */
class RequestHandle {
 public:
  RequestHandle(const string& _correlationId,
                shared_future<ResponseEnvelope> _response,
                weak_ptr<PendingRequestTable> _table)
      : correlationId(_correlationId), response(_response), table(_table) {}

  const string& getCorrelationId() const { return correlationId; }

  /**
   * @brief Waits for the response.
   * @throws TimeoutError, ProtocolError, ConnectionError or CancelledError.
   */
  ResponseEnvelope get() const { return response.get(); }

  /** @return true if the request settled within @p timeoutMs. */
  bool waitFor(int64_t timeoutMs) const {
    return response.wait_for(std::chrono::milliseconds(timeoutMs)) ==
           std::future_status::ready;
  }

  /**
   * @brief Abandons the request locally; get() then throws CancelledError.
   * If it is still queued it is never written, and a late response is
   * discarded.
   * @return false if it had already settled.
   */
  bool cancel() {
    auto t = table.lock();
    return t && t->cancel(correlationId);
  }

  shared_future<ResponseEnvelope> getFuture() const { return response; }

 protected:
  string correlationId;
  shared_future<ResponseEnvelope> response;
  weak_ptr<PendingRequestTable> table;
};

/**
 * @brief Request/response client for a device bridge reached over one
 * persistent connection.
 *
 * Requests sent while the connection is down are queued and replayed in order
 * once it comes back.  Unsolicited messages from the bridge are delivered to
 * subscribers of their kind on the lifecycle thread.
 */
class BridgeClient : public ConnectionListener {
 public:
  explicit BridgeClient(const BridgeConfig& _config);
  BridgeClient(shared_ptr<SocketHandler> _socketHandler,
               const BridgeConfig& _config);
  virtual ~BridgeClient();

  void connect();
  /**
   * @brief Closes the connection and rejects every pending request with
   * ConnectionError("Connection closed").  Does nothing when already
   * disconnected.
   */
  void disconnect();
  bool isConnected();
  ConnectionState getConnectionState();

  /**
   * @brief Registers and sends @p request, assigning a correlation id if it
   * has none.
   * @throws std::invalid_argument if its correlation id is already in flight.
   */
  RequestHandle sendAsync(RequestEnvelope request);

  /** @brief sendAsync() followed by get(). */
  ResponseEnvelope send(const RequestEnvelope& request);

  /**
   * Broadcast, error and reconnect callbacks run on the lifecycle thread,
   * which is also the only reader.  A callback that blocks on send(), a
   * helper or connect() stalls until that call times out; use sendAsync()
   * there and wait elsewhere.
   */
  SubscriptionId subscribe(MessageKind kind, BroadcastCallback callback);
  bool unsubscribe(MessageKind kind, SubscriptionId id);
  SubscriptionId onError(ErrorCallback callback);
  bool offError(SubscriptionId id);
  SubscriptionId onReconnect(ReconnectCallback callback);
  bool offReconnect(SubscriptionId id);

  /** @brief Milliseconds since the epoch, '-', nine random characters. */
  string newCorrelationId();

  size_t getPendingRequestCount();
  size_t getQueuedRequestCount();
  ReconnectionState getReconnectionState();
  int64_t getUnroutedBroadcastCount();

  // Terminal sessions
  json createTerminalSession(const string& deviceId, const string& platform);
  json executeTerminalCommand(const string& sessionId, const string& command);
  void sendTerminalInput(const string& sessionId, const string& input);
  void interruptTerminalCommand(const string& sessionId);
  void closeTerminalSession(const string& sessionId);
  json getTerminalHistory(const string& sessionId);
  void clearTerminalHistory(const string& sessionId);
  void changeTerminalDirectory(const string& sessionId,
                               const string& directory);
  json listTerminalSessions();

  // App permissions.  Every call targets @p deviceId.
  json listPermissions(const string& deviceId, const string& appId = "");
  string getPermissionStatus(const string& deviceId, const string& appId,
                             const string& permission);
  json requestPermission(const string& deviceId, const string& appId,
                         const string& permission);
  json requestMultiplePermissions(const string& deviceId, const string& appId,
                                  const vector<string>& permissions);
  bool revokePermission(const string& deviceId, const string& appId,
                        const string& permission);

  json discoverDevices();

  virtual void onResponse(const ResponseEnvelope& response);
  virtual void onBroadcast(const Packet& packet);
  virtual void onConnectionError(const BridgeError& error);
  virtual void onReconnect();
  virtual bool isPending(const string& correlationId);

 protected:
  /**
   * @brief Sends one action and waits for it.
   * @param failureMessage Used when the remote fails without an error string.
   */
  ResponseEnvelope invoke(MessageKind kind, const string& targetId,
                          const json& payload, const string& failureMessage);

  /**
   * @brief Returns data[@p field].
   * @throws ProtocolError if the response does not carry it.
   */
  static json extractField(const ResponseEnvelope& response,
                           const string& field);

  BridgeConfig config;
  shared_ptr<PendingRequestTable> pendingRequests;
  BroadcastRouter router;
  CallbackList<const BridgeError&> errorCallbacks;
  CallbackList<> reconnectCallbacks;
  shared_ptr<ConnectionManager> connectionManager;
};
}  // namespace dbridge

#endif  // __DBRIDGE_BRIDGE_CLIENT__
