#ifndef __DBRIDGE_FAKE_BRIDGE_REMOTE__
#define __DBRIDGE_FAKE_BRIDGE_REMOTE__

#include <queue>

#include "BridgeConfig.hpp"
#include "Envelope.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

namespace dbridge {
/**
 * Socket handler backed by socketpairs.  connect() hands out the fds queued
 * with queueConnectFd() and fails with -1 when there are none.
 */
class SocketPairHandler : public UnixSocketHandler {
 public:
  SocketPairHandler() : connectAttempts(0) {}

  void queueConnectFd(int fd) {
    lock_guard<std::mutex> guard(pairMutex);
    connectQueue.push(fd);
  }

  /** Tracks an fd created outside of connect(). */
  void adopt(int fd) {
    addToActiveSockets(fd);
    initSocket(fd);
  }

  int connect(const SocketEndpoint&) override {
    int fd;
    {
      lock_guard<std::mutex> guard(pairMutex);
      connectAttempts++;
      if (connectQueue.empty()) {
        return -1;
      }
      fd = connectQueue.front();
      connectQueue.pop();
    }
    adopt(fd);
    return fd;
  }

  int getConnectAttempts() {
    lock_guard<std::mutex> guard(pairMutex);
    return connectAttempts;
  }

  /** The next write whose bytes contain @p marker fails with EPIPE. */
  void failNextWriteContaining(const string& marker) {
    lock_guard<std::mutex> guard(pairMutex);
    failMarker = marker;
  }

  /** Writes whose bytes contain @p marker first sleep for @p delayMs. */
  void delayWritesContaining(const string& marker, int64_t delayMs) {
    lock_guard<std::mutex> guard(pairMutex);
    delayMarker = marker;
    writeDelayMs = delayMs;
  }

  ssize_t write(int fd, const void* buf, size_t count) override {
    string bytes((const char*)buf, count);
    int64_t delayMs = 0;
    {
      lock_guard<std::mutex> guard(pairMutex);
      if (!failMarker.empty() && bytes.find(failMarker) != string::npos) {
        failMarker.clear();
        errno = EPIPE;
        return -1;
      }
      if (!delayMarker.empty() && bytes.find(delayMarker) != string::npos) {
        delayMs = writeDelayMs;
      }
    }
    if (delayMs) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }
    return UnixSocketHandler::write(fd, buf, count);
  }

 protected:
  std::mutex pairMutex;
  std::queue<int> connectQueue;
  int connectAttempts;
  string failMarker;
  string delayMarker;
  int64_t writeDelayMs = 0;
};

/**
 * In-process stand-in for a bridge: answers the handshake, records every
 * request it receives and replies through a pluggable responder.
 */
class FakeBridgeRemote {
 public:
  /**
   * Fills @p response for @p request.  Returning false leaves the request
   * unanswered.
   */
  typedef function<bool(const RequestEnvelope& request,
                        ResponseEnvelope* response)>
      Responder;

  explicit FakeBridgeRemote(shared_ptr<SocketPairHandler> _clientHandler)
      : clientHandler(_clientHandler),
        remoteHandler(new SocketPairHandler()),
        currentFd(-1) {
    // Echo the payload back by default
    responder = [](const RequestEnvelope& request,
                   ResponseEnvelope* response) {
      response->success = true;
      response->data = request.payload;
      return true;
    };
  }

  ~FakeBridgeRemote() { stop(); }

  /**
   * Lets the next client connect() succeed and answers its handshake with
   * @p status.
   */
  void acceptNextConnection(ConnectStatus status = ACCEPTED,
                            const string& error = "") {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    remoteHandler->adopt(fds[1]);
    lock_guard<std::mutex> guard(remoteMutex);
    openFds.insert(fds[1]);
    threads.push_back(shared_ptr<thread>(
        new thread(&FakeBridgeRemote::serve, this, fds[1], status, error)));
    clientHandler->queueConnectFd(fds[0]);
  }

  void setResponder(Responder _responder) {
    lock_guard<std::mutex> guard(remoteMutex);
    responder = _responder;
  }

  void sendBroadcast(const string& type, const json& data) {
    writeToClient(EnvelopeCodec::encodeBroadcast(type, data));
  }

  void sendResponse(const ResponseEnvelope& response) {
    writeToClient(EnvelopeCodec::encodeResponse(response));
  }

  void sendPacket(const Packet& packet) { writeToClient(packet); }

  /**
   * Hangs up the live connection.  The serving thread owns the fd and
   * closes it, so the number cannot be reused while it still reads.
   */
  void dropConnection() {
    lock_guard<std::mutex> guard(remoteMutex);
    if (currentFd != -1) {
      ::shutdown(currentFd, SHUT_RDWR);
      currentFd = -1;
    }
  }

  bool isConnected() {
    lock_guard<std::mutex> guard(remoteMutex);
    return currentFd != -1;
  }

  vector<RequestEnvelope> getRequests() {
    lock_guard<std::mutex> guard(remoteMutex);
    return requests;
  }

  size_t getRequestCount() {
    lock_guard<std::mutex> guard(remoteMutex);
    return requests.size();
  }

  vector<ConnectRequest> getHandshakes() {
    lock_guard<std::mutex> guard(remoteMutex);
    return handshakeRequests;
  }

  void stop() {
    vector<shared_ptr<thread>> toJoin;
    {
      lock_guard<std::mutex> guard(remoteMutex);
      currentFd = -1;
      // Also ends handshakes that no client ever picked up.
      for (int fd : openFds) {
        ::shutdown(fd, SHUT_RDWR);
      }
      toJoin.swap(threads);
    }
    for (auto& t : toJoin) {
      t->join();
    }
  }

 protected:
  void serve(int fd, ConnectStatus status, string error) {
    el::Helpers::setThreadName("fake-remote");
    try {
      ConnectRequest request =
          remoteHandler->readProto<ConnectRequest>(fd, 5000);
      {
        lock_guard<std::mutex> guard(remoteMutex);
        handshakeRequests.push_back(request);
      }
      ConnectResponse response;
      response.set_status(status);
      if (!error.empty()) {
        response.set_error(error);
      }
      if (status == ACCEPTED) {
        // Live before the client can see the answer, so tests may push
        // broadcasts as soon as connect() returns.
        lock_guard<std::mutex> guard(remoteMutex);
        currentFd = fd;
      }
      {
        lock_guard<std::mutex> guard(writeMutex);
        remoteHandler->writeProto(fd, response, 5000);
      }
      if (status == ACCEPTED) {
        readRequests(fd);
      }
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Fake remote connection ended: " << re.what();
    }
    {
      lock_guard<std::mutex> guard(remoteMutex);
      if (currentFd == fd) {
        currentFd = -1;
      }
      openFds.erase(fd);
    }
    remoteHandler->close(fd);
  }

  void readRequests(int fd) {
    while (true) {
      {
        lock_guard<std::mutex> guard(remoteMutex);
        if (currentFd != fd) {
          return;
        }
      }
      if (!remoteHandler->hasData(fd)) {
        usleep(1000);
        continue;
      }
      Packet packet;
      if (!remoteHandler->readPacket(fd, &packet)) {
        continue;
      }
      RequestEnvelope envelope;
      if (!EnvelopeCodec::decodeRequest(packet, &envelope)) {
        continue;
      }
      Responder r;
      {
        lock_guard<std::mutex> guard(remoteMutex);
        requests.push_back(envelope);
        r = responder;
      }
      ResponseEnvelope reply;
      reply.correlationId = envelope.correlationId;
      if (r(envelope, &reply)) {
        lock_guard<std::mutex> guard(writeMutex);
        remoteHandler->writePacket(fd, EnvelopeCodec::encodeResponse(reply));
      }
    }
  }

  void writeToClient(const Packet& packet) {
    lock_guard<std::mutex> guard(remoteMutex);
    if (currentFd == -1) {
      throw std::runtime_error("Fake remote has no live connection");
    }
    lock_guard<std::mutex> writeGuard(writeMutex);
    remoteHandler->writePacket(currentFd, packet);
  }

  shared_ptr<SocketPairHandler> clientHandler;
  shared_ptr<SocketPairHandler> remoteHandler;
  std::mutex remoteMutex;
  std::mutex writeMutex;
  int currentFd;
  set<int> openFds;
  Responder responder;
  vector<RequestEnvelope> requests;
  vector<ConnectRequest> handshakeRequests;
  vector<shared_ptr<thread>> threads;
};

/** Short timeouts so failure paths finish quickly. */
inline BridgeConfig makeTestConfig() {
  BridgeConfig config;
  config.host = "fake-bridge";
  config.port = 3001;
  config.clientId = "test-client";
  config.connectTimeoutMs = 2000;
  config.requestTimeoutMs = 2000;
  config.maxReconnectAttempts = 5;
  config.initialBackoffMs = 20;
  config.backoffMultiplier = 2.0;
  config.maxBackoffMs = 100;
  return config;
}
}  // namespace dbridge

#endif  // __DBRIDGE_FAKE_BRIDGE_REMOTE__
