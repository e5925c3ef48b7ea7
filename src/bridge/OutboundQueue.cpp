#include "OutboundQueue.hpp"

namespace dbridge {
void OutboundQueue::enqueue(const RequestEnvelope& request) {
  lock_guard<std::mutex> guard(queueMutex);
  entries.push_back(request);
  VLOG(2) << "Queued " << request.kind << " request " << request.correlationId
          << " (" << entries.size() << " waiting)";
}

int OutboundQueue::flush(function<bool(const RequestEnvelope&)> send) {
  deque<RequestEnvelope> snapshot;
  {
    lock_guard<std::mutex> guard(queueMutex);
    snapshot.swap(entries);
  }
  int sent = 0;
  while (!snapshot.empty()) {
    bool ok;
    try {
      ok = send(snapshot.front());
    } catch (const std::exception& e) {
      LOG(WARNING) << "Error while flushing: " << e.what();
      ok = false;
    }
    if (!ok) {
      LOG(WARNING) << "Flush stopped at " << snapshot.front().correlationId
                   << ", requeueing " << snapshot.size() << " requests";
      lock_guard<std::mutex> guard(queueMutex);
      entries.insert(entries.begin(), snapshot.begin(), snapshot.end());
      return sent;
    }
    snapshot.pop_front();
    sent++;
  }
  if (sent) {
    VLOG(1) << "Flushed " << sent << " queued requests";
  }
  return sent;
}

deque<RequestEnvelope> OutboundQueue::clear() {
  lock_guard<std::mutex> guard(queueMutex);
  deque<RequestEnvelope> dropped;
  dropped.swap(entries);
  return dropped;
}

size_t OutboundQueue::size() {
  lock_guard<std::mutex> guard(queueMutex);
  return entries.size();
}

bool OutboundQueue::empty() {
  lock_guard<std::mutex> guard(queueMutex);
  return entries.empty();
}
}  // namespace dbridge
