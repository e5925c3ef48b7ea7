#include "ConnectionManager.hpp"

namespace dbridge {
string connectionStateToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::DISCONNECTED:
      return "DISCONNECTED";
    case ConnectionState::CONNECTING:
      return "CONNECTING";
    case ConnectionState::CONNECTED:
      return "CONNECTED";
    case ConnectionState::RECONNECTING:
      return "RECONNECTING";
    case ConnectionState::FAILED:
      return "FAILED";
  }
  STFATAL << "Invalid connection state: " << int(state);
  return "";
}

ostream& operator<<(ostream& os, ConnectionState state) {
  os << connectionStateToString(state);
  return os;
}

ConnectionManager::ConnectionManager(shared_ptr<SocketHandler> _socketHandler,
                                     const BridgeConfig& _config,
                                     ConnectionListener* _listener)
    : socketHandler(_socketHandler),
      config(_config),
      remoteEndpoint(_config.getEndpoint()),
      backoffPolicy(_config.initialBackoffMs, _config.backoffMultiplier,
                    _config.maxBackoffMs),
      listener(_listener),
      state(ConnectionState::DISCONNECTED),
      socketFd(-1),
      flushing(false),
      reconnectPhase(false),
      stopRequested(false),
      lifecycleRunning(false),
      lifecycleGeneration(0) {
  reconnectionState.maxAttempts = config.maxReconnectAttempts;
  reconnectionState.currentDelay = backoffPolicy.delay(0);
  reconnectionState.maxDelay = config.maxBackoffMs;
}

ConnectionManager::~ConnectionManager() { disconnect(); }

void ConnectionManager::connect() {
  unique_lock<std::mutex> lock(connectionMutex);
  if (state == ConnectionState::CONNECTED) {
    return;
  }
  if (state != ConnectionState::CONNECTING) {
    if (state == ConnectionState::RECONNECTING ||
        state == ConnectionState::FAILED) {
      LOG(INFO) << "Resetting reconnection budget from state " << state;
    }
    beginConnectingLocked();
  } else {
    VLOG(1) << "Joining connection attempt already in progress";
  }
  bool settled = stateChanged.wait_for(
      lock, std::chrono::milliseconds(config.connectTimeoutMs),
      [this]() { return state != ConnectionState::CONNECTING; });
  if (!settled) {
    throw TimeoutError("Connection timeout after " +
                       to_string(config.connectTimeoutMs) + "ms");
  }
  if (state == ConnectionState::CONNECTED) {
    return;
  }
  if (state == ConnectionState::DISCONNECTED) {
    throw ConnectionError("Connection closed");
  }
  if (lastOpenError) {
    std::rethrow_exception(lastOpenError);
  }
  throw ConnectionError("Connection failed");
}

int ConnectionManager::disconnect() {
  shared_ptr<thread> t;
  int fd;
  deque<RequestEnvelope> dropped;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (state == ConnectionState::DISCONNECTED && !lifecycleThread &&
        socketFd == -1) {
      return 0;
    }
    LOG(INFO) << "Disconnecting from " << remoteEndpoint << " (state "
              << state << ")";
    stopRequested = true;
    state = ConnectionState::DISCONNECTED;
    reconnectPhase = false;
    flushing = false;
    fd = socketFd;
    socketFd = -1;
    dropped = outboundQueue.clear();
    lifecycleGeneration++;
    lifecycleRunning = false;
    t.swap(lifecycleThread);
    stateChanged.notify_all();
  }
  if (fd != -1) {
    socketHandler->close(fd);
  }
  if (t) {
    if (t->get_id() == std::this_thread::get_id()) {
      // Called from a listener callback; the thread sees its generation is
      // stale and exits on its own.
      t->detach();
    } else {
      t->join();
    }
  }
  if (!dropped.empty()) {
    LOG(INFO) << "Dropped " << dropped.size() << " queued requests";
  }
  return int(dropped.size());
}

SendResult ConnectionManager::send(const RequestEnvelope& request) {
  int fd;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (state != ConnectionState::CONNECTED || flushing) {
      // Queue while a flush is running too, so replay order is kept.
      outboundQueue.enqueue(request);
      if (state == ConnectionState::DISCONNECTED ||
          state == ConnectionState::FAILED) {
        // From FAILED this counts as an explicit connect with a fresh budget.
        LOG(INFO) << "Request queued while " << state << ", connecting";
        beginConnectingLocked();
      }
      return SendResult::QUEUED;
    }
    fd = socketFd;
  }
  if (writeEnvelope(fd, request)) {
    return SendResult::SENT;
  }
  handleTransportClosed(fd, "write failed");
  return SendResult::FAILED;
}

bool ConnectionManager::isConnected() {
  lock_guard<std::mutex> guard(connectionMutex);
  return state == ConnectionState::CONNECTED;
}

ConnectionState ConnectionManager::getState() {
  lock_guard<std::mutex> guard(connectionMutex);
  return state;
}

ReconnectionState ConnectionManager::getReconnectionState() {
  lock_guard<std::mutex> guard(connectionMutex);
  return reconnectionState;
}

void ConnectionManager::beginConnectingLocked() {
  stopRequested = false;
  reconnectionState.attemptCount = 0;
  reconnectionState.currentDelay = backoffPolicy.delay(0);
  lastOpenError = nullptr;
  state = ConnectionState::CONNECTING;
  ensureLifecycleThreadLocked();
  stateChanged.notify_all();
}

void ConnectionManager::ensureLifecycleThreadLocked() {
  if (lifecycleThread && !lifecycleRunning) {
    // The previous thread already gave up (FAILED) and is on its way out.
    if (lifecycleThread->get_id() == std::this_thread::get_id()) {
      lifecycleThread->detach();
    } else {
      lifecycleThread->join();
    }
    lifecycleThread.reset();
  }
  if (!lifecycleThread) {
    lifecycleGeneration++;
    lifecycleRunning = true;
    lifecycleThread.reset(
        new thread(&ConnectionManager::run, this, lifecycleGeneration));
  }
}

void ConnectionManager::run(int64_t generation) {
  el::Helpers::setThreadName("bridge-lifecycle");
  while (true) {
    ConnectionState currentState;
    int fd;
    {
      lock_guard<std::mutex> guard(connectionMutex);
      if (generation != lifecycleGeneration) {
        return;
      }
      if (stopRequested || state == ConnectionState::DISCONNECTED ||
          state == ConnectionState::FAILED) {
        lifecycleRunning = false;
        VLOG(1) << "Lifecycle thread exiting in state " << state;
        return;
      }
      currentState = state;
      fd = socketFd;
    }
    switch (currentState) {
      case ConnectionState::CONNECTING:
        attemptOpen();
        break;
      case ConnectionState::CONNECTED:
        readLoop(fd);
        break;
      case ConnectionState::RECONNECTING:
        waitAndRetry();
        break;
      case ConnectionState::DISCONNECTED:
      case ConnectionState::FAILED:
        break;
    }
  }
}

void ConnectionManager::readLoop(int fd) {
  while (true) {
    {
      lock_guard<std::mutex> guard(connectionMutex);
      if (stopRequested || socketFd != fd) {
        return;
      }
    }
    Packet packet;
    try {
      // Bounded so a stop request is noticed even on a silent link.
      if (!waitOnSocketData(fd, READ_WAIT_MS)) {
        continue;
      }
      if (!socketHandler->readPacket(fd, &packet)) {
        VLOG(3) << "Got keepalive";
        continue;
      }
    } catch (const std::runtime_error& re) {
      handleTransportClosed(fd, re.what());
      return;
    }
    handlePacket(packet);
  }
}

void ConnectionManager::handlePacket(const Packet& packet) {
  switch (packet.getHeader()) {
    case RESPONSE_ENVELOPE: {
      ResponseEnvelope response;
      if (EnvelopeCodec::decodeResponse(packet, &response)) {
        listener->onResponse(response);
      }
      break;
    }
    case BROADCAST_ENVELOPE:
      listener->onBroadcast(packet);
      break;
    default:
      LOG(WARNING) << "Ignoring packet with unexpected header "
                   << int(packet.getHeader());
      break;
  }
}

void ConnectionManager::waitAndRetry() {
  {
    unique_lock<std::mutex> lock(connectionMutex);
    if (stopRequested || state != ConnectionState::RECONNECTING) {
      return;
    }
    if (reconnectionState.attemptCount >= reconnectionState.maxAttempts) {
      state = ConnectionState::FAILED;
      reconnectPhase = false;
      stateChanged.notify_all();
      int attempts = reconnectionState.attemptCount;
      lock.unlock();
      LOG(ERROR) << "Giving up on " << remoteEndpoint << " after " << attempts
                 << " reconnection attempts";
      listener->onConnectionError(ExhaustedRetriesError(
          "Max reconnection attempts (" + to_string(attempts) + ") reached"));
      return;
    }
    int64_t delay = backoffPolicy.delay(reconnectionState.attemptCount);
    reconnectionState.currentDelay = delay;
    reconnectionState.attemptCount++;
    LOG(INFO) << "Reconnecting to " << remoteEndpoint << " in " << delay
              << " ms (attempt " << reconnectionState.attemptCount << "/"
              << reconnectionState.maxAttempts << ")";
    bool interrupted =
        stateChanged.wait_for(lock, std::chrono::milliseconds(delay), [this]() {
          return stopRequested || state != ConnectionState::RECONNECTING;
        });
    if (interrupted) {
      // disconnect() or connect() took over.
      return;
    }
  }
  attemptOpen();
}

void ConnectionManager::attemptOpen() {
  int fd;
  try {
    fd = openTransport();
  } catch (const BridgeError& be) {
    lock_guard<std::mutex> guard(connectionMutex);
    lastOpenError = std::current_exception();
    if (stopRequested) {
      return;
    }
    LOG(INFO) << "Connection attempt failed: " << be.what();
    if (state == ConnectionState::CONNECTING ||
        state == ConnectionState::RECONNECTING) {
      state = ConnectionState::RECONNECTING;
      reconnectPhase = true;
      stateChanged.notify_all();
    }
    return;
  }
  onOpen(fd);
}

int ConnectionManager::openTransport() {
  VLOG(1) << "Connecting to " << remoteEndpoint;
  int fd = socketHandler->connect(remoteEndpoint);
  if (fd == -1) {
    throw ConnectionError("Connection failed: could not reach " +
                          remoteEndpoint.getName() + ":" +
                          to_string(remoteEndpoint.getPort()));
  }
  ConnectResponse response;
  try {
    ConnectRequest request;
    request.set_clientid(config.clientId);
    request.set_version(PROTOCOL_VERSION);
    request.set_path(remoteEndpoint.getPath());
    if (!config.authToken.empty()) {
      request.set_token(config.authToken);
    }
    socketHandler->writeProto(fd, request, config.connectTimeoutMs);
    response =
        socketHandler->readProto<ConnectResponse>(fd, config.connectTimeoutMs);
  } catch (const std::runtime_error& re) {
    socketHandler->close(fd);
    throw ConnectionError(string("Handshake failed: ") + re.what());
  }
  if (response.status() != ACCEPTED) {
    socketHandler->close(fd);
    string s = string("Handshake rejected: ") +
               ConnectStatus_Name(response.status());
    if (!response.error().empty()) {
      s += ": " + response.error();
    }
    STERROR << s;
    throw ConnectionError(s);
  }
  VLOG(1) << "Handshake accepted";
  return fd;
}

void ConnectionManager::onOpen(int fd) {
  bool wasReconnecting;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (stopRequested) {
      VLOG(1) << "Opened after disconnect, closing";
      socketHandler->close(fd);
      return;
    }
    socketFd = fd;
    state = ConnectionState::CONNECTED;
    flushing = true;
    wasReconnecting = reconnectPhase;
    reconnectPhase = false;
    lastOpenError = nullptr;
    reconnectionState.attemptCount = 0;
    reconnectionState.currentDelay = backoffPolicy.delay(0);
    stateChanged.notify_all();
  }
  LOG(INFO) << "Connected to " << remoteEndpoint;
  flushQueue(fd);
  if (wasReconnecting) {
    listener->onReconnect();
  }
}

void ConnectionManager::flushQueue(int fd) {
  while (true) {
    bool writeFailed = false;
    outboundQueue.flush(
        [this, fd, &writeFailed](const RequestEnvelope& request) {
          if (!listener->isPending(request.correlationId)) {
            VLOG(1) << "Dropping abandoned request " << request.correlationId;
            return true;
          }
          if (!writeEnvelope(fd, request)) {
            writeFailed = true;
            return false;
          }
          return true;
        });
    if (writeFailed) {
      // The unsent requests are back at the head of the queue and go out on
      // the next open.
      handleTransportClosed(fd, "write failed during flush");
      return;
    }
    lock_guard<std::mutex> guard(connectionMutex);
    if (socketFd != fd) {
      return;
    }
    if (outboundQueue.empty()) {
      flushing = false;
      return;
    }
    // More requests were queued while this generation was being written.
  }
}

bool ConnectionManager::writeEnvelope(int fd, const RequestEnvelope& request) {
  lock_guard<std::mutex> guard(writeMutex);
  try {
    socketHandler->writePacket(fd, EnvelopeCodec::encodeRequest(request));
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Failed to write request " << request.correlationId << ": "
                 << re.what();
    return false;
  }
  VLOG(2) << "Sent " << request.kind << " request " << request.correlationId;
  return true;
}

void ConnectionManager::handleTransportClosed(int fd, const string& reason) {
  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (socketFd != fd || fd == -1) {
      // Already handled, or disconnect() got here first.
      return;
    }
    socketHandler->close(fd);
    socketFd = -1;
    flushing = false;
    if (stopRequested) {
      return;
    }
    state = ConnectionState::RECONNECTING;
    reconnectPhase = true;
    stateChanged.notify_all();
  }
  LOG(WARNING) << "Connection to " << remoteEndpoint << " lost: " << reason;
  listener->onConnectionError(ConnectionError("Connection lost: " + reason));
}
}  // namespace dbridge
