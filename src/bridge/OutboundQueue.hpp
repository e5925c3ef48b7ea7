#ifndef __DBRIDGE_OUTBOUND_QUEUE__
#define __DBRIDGE_OUTBOUND_QUEUE__

#include "Envelope.hpp"
#include "Headers.hpp"

namespace dbridge {
/**
 * @brief Unbounded FIFO of requests waiting for a live connection.
 *
 * Entries are replayed strictly in enqueue order.  flush() takes a snapshot,
 * so anything enqueued while a flush runs waits for the next flush.
 */
class OutboundQueue {
 public:
  OutboundQueue() {}

  /** @brief Appends @p request to the tail. */
  void enqueue(const RequestEnvelope& request);

  /**
   * @brief Sends every queued entry, in order, through @p send.
   *
   * When @p send returns false the failed entry and the rest of the snapshot
   * are put back at the head of the queue, ahead of entries enqueued during
   * the flush.
   * @return The number of entries sent.
   */
  int flush(function<bool(const RequestEnvelope&)> send);

  /** @brief Drops everything and returns what was dropped. */
  deque<RequestEnvelope> clear();

  size_t size();
  bool empty();

 protected:
  std::mutex queueMutex;
  deque<RequestEnvelope> entries;
};
}  // namespace dbridge

#endif  // __DBRIDGE_OUTBOUND_QUEUE__
