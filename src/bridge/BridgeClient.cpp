#include "BridgeClient.hpp"

#include "TcpSocketHandler.hpp"

namespace dbridge {
BridgeClient::BridgeClient(const BridgeConfig& _config)
    : BridgeClient(shared_ptr<SocketHandler>(
                       new TcpSocketHandler(_config.connectTimeoutMs)),
                   _config) {}

BridgeClient::BridgeClient(shared_ptr<SocketHandler> _socketHandler,
                           const BridgeConfig& _config)
    : config(_config), pendingRequests(new PendingRequestTable()) {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
  config.validate();
  connectionManager.reset(
      new ConnectionManager(_socketHandler, config, this));
}

BridgeClient::~BridgeClient() {
  disconnect();
  connectionManager.reset();
}

void BridgeClient::connect() { connectionManager->connect(); }

void BridgeClient::disconnect() {
  int dropped = connectionManager->disconnect();
  size_t pending = pendingRequests->size();
  if (pending) {
    LOG(INFO) << "Rejecting " << pending << " pending requests ("
              << dropped << " never sent)";
  }
  pendingRequests->teardownAll(
      std::make_exception_ptr(ConnectionError("Connection closed")));
}

bool BridgeClient::isConnected() { return connectionManager->isConnected(); }

ConnectionState BridgeClient::getConnectionState() {
  return connectionManager->getState();
}

RequestHandle BridgeClient::sendAsync(RequestEnvelope request) {
  if (request.correlationId.empty()) {
    request.correlationId = newCorrelationId();
  }
  shared_future<ResponseEnvelope> response = pendingRequests->registerRequest(
      request.correlationId, config.requestTimeoutMs);
  if (connectionManager->send(request) == SendResult::FAILED) {
    pendingRequests->reject(
        request.correlationId,
        std::make_exception_ptr(ConnectionError(
            "Failed to send request " + request.correlationId)));
  }
  return RequestHandle(request.correlationId, response, pendingRequests);
}

ResponseEnvelope BridgeClient::send(const RequestEnvelope& request) {
  return sendAsync(request).get();
}

SubscriptionId BridgeClient::subscribe(MessageKind kind,
                                       BroadcastCallback callback) {
  return router.subscribe(kind, callback);
}

bool BridgeClient::unsubscribe(MessageKind kind, SubscriptionId id) {
  return router.unsubscribe(kind, id);
}

SubscriptionId BridgeClient::onError(ErrorCallback callback) {
  return errorCallbacks.add(callback);
}

bool BridgeClient::offError(SubscriptionId id) {
  return errorCallbacks.remove(id);
}

SubscriptionId BridgeClient::onReconnect(ReconnectCallback callback) {
  return reconnectCallbacks.add(callback);
}

bool BridgeClient::offReconnect(SubscriptionId id) {
  return reconnectCallbacks.remove(id);
}

string BridgeClient::newCorrelationId() {
  return to_string(millisecondsSinceEpoch()) + "-" + genRandomAlphaNum(9);
}

size_t BridgeClient::getPendingRequestCount() {
  return pendingRequests->size();
}

size_t BridgeClient::getQueuedRequestCount() {
  return connectionManager->getQueuedCount();
}

ReconnectionState BridgeClient::getReconnectionState() {
  return connectionManager->getReconnectionState();
}

int64_t BridgeClient::getUnroutedBroadcastCount() {
  return router.getUnroutedCount();
}

void BridgeClient::onResponse(const ResponseEnvelope& response) {
  pendingRequests->settle(response);
}

void BridgeClient::onBroadcast(const Packet& packet) { router.route(packet); }

void BridgeClient::onConnectionError(const BridgeError& error) {
  if (!errorCallbacks.invoke(error)) {
    VLOG(1) << "No error subscribers for: " << error.what();
  }
}

void BridgeClient::onReconnect() {
  LOG(INFO) << "Reconnected to bridge";
  reconnectCallbacks.invoke();
}

bool BridgeClient::isPending(const string& correlationId) {
  return pendingRequests->contains(correlationId);
}

ResponseEnvelope BridgeClient::invoke(MessageKind kind, const string& targetId,
                                      const json& payload,
                                      const string& failureMessage) {
  RequestEnvelope request;
  request.kind = kind;
  request.targetId = targetId;
  request.payload = payload;
  try {
    return send(request);
  } catch (const ProtocolError& pe) {
    if (pe.getRemoteError().empty()) {
      throw ProtocolError(failureMessage);
    }
    throw;
  }
}

json BridgeClient::extractField(const ResponseEnvelope& response,
                                const string& field) {
  if (!response.data.is_object() || !response.data.contains(field)) {
    throw ProtocolError("Response " + response.correlationId +
                        " has no data." + field);
  }
  return response.data.at(field);
}

json BridgeClient::createTerminalSession(const string& deviceId,
                                         const string& platform) {
  json payload = {
      {"action", "create"}, {"deviceId", deviceId}, {"platform", platform}};
  return extractField(invoke(MessageKind::TERMINAL, deviceId, payload,
                             "Failed to create terminal session"),
                      "session");
}

json BridgeClient::executeTerminalCommand(const string& sessionId,
                                          const string& command) {
  json payload = {
      {"action", "execute"}, {"sessionId", sessionId}, {"command", command}};
  return extractField(
      invoke(MessageKind::TERMINAL, "", payload, "Failed to execute command"),
      "result");
}

void BridgeClient::sendTerminalInput(const string& sessionId,
                                     const string& input) {
  json payload = {
      {"action", "input"}, {"sessionId", sessionId}, {"input", input}};
  invoke(MessageKind::TERMINAL, "", payload, "Failed to send input");
}

void BridgeClient::interruptTerminalCommand(const string& sessionId) {
  json payload = {{"action", "interrupt"}, {"sessionId", sessionId}};
  invoke(MessageKind::TERMINAL, "", payload, "Failed to interrupt command");
}

void BridgeClient::closeTerminalSession(const string& sessionId) {
  json payload = {{"action", "close"}, {"sessionId", sessionId}};
  invoke(MessageKind::TERMINAL, "", payload, "Failed to close session");
}

json BridgeClient::getTerminalHistory(const string& sessionId) {
  json payload = {{"action", "history"}, {"sessionId", sessionId}};
  return extractField(
      invoke(MessageKind::TERMINAL, "", payload, "Failed to get history"),
      "history");
}

void BridgeClient::clearTerminalHistory(const string& sessionId) {
  json payload = {{"action", "clear-history"}, {"sessionId", sessionId}};
  invoke(MessageKind::TERMINAL, "", payload, "Failed to clear history");
}

void BridgeClient::changeTerminalDirectory(const string& sessionId,
                                           const string& directory) {
  json payload = {{"action", "change-directory"},
                  {"sessionId", sessionId},
                  {"directory", directory}};
  invoke(MessageKind::TERMINAL, "", payload, "Failed to change directory");
}

json BridgeClient::listTerminalSessions() {
  json payload = {{"action", "list-sessions"}};
  return extractField(
      invoke(MessageKind::TERMINAL, "", payload, "Failed to list sessions"),
      "sessions");
}

json BridgeClient::listPermissions(const string& deviceId,
                                   const string& appId) {
  json payload = {{"action", "list"}, {"deviceId", deviceId}};
  if (!appId.empty()) {
    payload["appId"] = appId;
  }
  return extractField(invoke(MessageKind::PERMISSION, deviceId, payload,
                             "Failed to list permissions"),
                      "permissions");
}

string BridgeClient::getPermissionStatus(const string& deviceId,
                                         const string& appId,
                                         const string& permission) {
  json payload = {{"action", "get-status"},
                  {"deviceId", deviceId},
                  {"appId", appId},
                  {"permission", permission}};
  json status = extractField(invoke(MessageKind::PERMISSION, deviceId, payload,
                                    "Failed to get permission status"),
                             "status");
  if (!status.is_string()) {
    throw ProtocolError("Permission status is not a string: " + status.dump());
  }
  return status.get<string>();
}

json BridgeClient::requestPermission(const string& deviceId,
                                     const string& appId,
                                     const string& permission) {
  json payload = {{"action", "request"},
                  {"deviceId", deviceId},
                  {"appId", appId},
                  {"permission", permission}};
  return extractField(invoke(MessageKind::PERMISSION, deviceId, payload,
                             "Failed to request permission"),
                      "result");
}

json BridgeClient::requestMultiplePermissions(
    const string& deviceId, const string& appId,
    const vector<string>& permissions) {
  json payload = {{"action", "request-multiple"},
                  {"deviceId", deviceId},
                  {"appId", appId},
                  {"permissions", permissions}};
  return extractField(invoke(MessageKind::PERMISSION, deviceId, payload,
                             "Failed to request permissions"),
                      "results");
}

bool BridgeClient::revokePermission(const string& deviceId,
                                    const string& appId,
                                    const string& permission) {
  json payload = {{"action", "revoke"},
                  {"deviceId", deviceId},
                  {"appId", appId},
                  {"permission", permission}};
  json revoked = extractField(invoke(MessageKind::PERMISSION, deviceId, payload,
                                     "Failed to revoke permission"),
                              "revoked");
  if (!revoked.is_boolean()) {
    throw ProtocolError("Revoke result is not a boolean: " + revoked.dump());
  }
  return revoked.get<bool>();
}

json BridgeClient::discoverDevices() {
  json payload = {{"action", "discover"}};
  return extractField(
      invoke(MessageKind::DISCOVERY, "", payload, "Failed to discover devices"),
      "devices");
}
}  // namespace dbridge
