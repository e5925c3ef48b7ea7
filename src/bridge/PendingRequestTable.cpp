#include "PendingRequestTable.hpp"

namespace dbridge {
PendingRequestTable::PendingRequestTable() : timers("request-timer") {}

PendingRequestTable::~PendingRequestTable() {
  timers.shutdown();
  teardownAll(
      std::make_exception_ptr(ConnectionError("Request table destroyed")));
}

shared_future<ResponseEnvelope> PendingRequestTable::registerRequest(
    const string& correlationId, int64_t timeoutMs) {
  lock_guard<std::mutex> guard(tableMutex);
  if (requests.find(correlationId) != requests.end()) {
    throw std::invalid_argument("Duplicate correlation id: " + correlationId);
  }
  PendingRequest pending;
  pending.correlationId = correlationId;
  pending.result.reset(new promise<ResponseEnvelope>());
  pending.createdAt = millisecondsSinceEpoch();
  // The timer thread blocks on tableMutex before it can touch this entry, so
  // arming it while the lock is held is safe.
  pending.timeoutTimer =
      timers.schedule(timeoutMs, [this, correlationId, timeoutMs]() {
        onTimeout(correlationId, timeoutMs);
      });
  shared_future<ResponseEnvelope> f = pending.result->get_future().share();
  requests.insert(make_pair(correlationId, pending));
  VLOG(2) << "Registered request " << correlationId;
  return f;
}

bool PendingRequestTable::take(const string& correlationId,
                               PendingRequest* pending) {
  {
    lock_guard<std::mutex> guard(tableMutex);
    auto it = requests.find(correlationId);
    if (it == requests.end()) {
      return false;
    }
    *pending = it->second;
    requests.erase(it);
  }
  timers.cancel(pending->timeoutTimer);
  return true;
}

bool PendingRequestTable::settle(const ResponseEnvelope& response) {
  PendingRequest pending;
  if (!take(response.correlationId, &pending)) {
    VLOG(1) << "Discarding response for unknown request "
            << response.correlationId;
    return false;
  }
  VLOG(2) << "Request " << response.correlationId << " settled after "
          << (millisecondsSinceEpoch() - pending.createdAt) << " ms";
  if (response.success) {
    pending.result->set_value(response);
  } else {
    string message =
        response.error.empty() ? string("Request failed") : response.error;
    pending.result->set_exception(
        std::make_exception_ptr(ProtocolError(message, response.error)));
  }
  return true;
}

bool PendingRequestTable::reject(const string& correlationId,
                                 std::exception_ptr error) {
  PendingRequest pending;
  if (!take(correlationId, &pending)) {
    return false;
  }
  pending.result->set_exception(error);
  return true;
}

bool PendingRequestTable::cancel(const string& correlationId) {
  return reject(correlationId, std::make_exception_ptr(CancelledError(
                                   "Request cancelled: " + correlationId)));
}

void PendingRequestTable::teardownAll(std::exception_ptr error) {
  unordered_map<string, PendingRequest> drained;
  {
    lock_guard<std::mutex> guard(tableMutex);
    drained.swap(requests);
  }
  if (!drained.empty()) {
    VLOG(1) << "Rejecting " << drained.size() << " pending requests";
  }
  for (auto& it : drained) {
    timers.cancel(it.second.timeoutTimer);
    it.second.result->set_exception(error);
  }
}

bool PendingRequestTable::contains(const string& correlationId) {
  lock_guard<std::mutex> guard(tableMutex);
  return requests.find(correlationId) != requests.end();
}

size_t PendingRequestTable::size() {
  lock_guard<std::mutex> guard(tableMutex);
  return requests.size();
}

void PendingRequestTable::onTimeout(const string& correlationId,
                                    int64_t timeoutMs) {
  PendingRequest pending;
  {
    lock_guard<std::mutex> guard(tableMutex);
    auto it = requests.find(correlationId);
    if (it == requests.end()) {
      return;
    }
    pending = it->second;
    requests.erase(it);
  }
  LOG(INFO) << "Request " << correlationId << " timed out after " << timeoutMs
            << " ms";
  pending.result->set_exception(std::make_exception_ptr(TimeoutError(
      "Request timeout after " + to_string(timeoutMs) + "ms")));
}
}  // namespace dbridge
