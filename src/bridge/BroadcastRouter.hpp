#ifndef __DBRIDGE_BROADCAST_ROUTER__
#define __DBRIDGE_BROADCAST_ROUTER__

#include "CallbackList.hpp"
#include "Envelope.hpp"
#include "Headers.hpp"

namespace dbridge {
typedef function<void(const BroadcastMessage&)> BroadcastCallback;

/**
 * @brief Fans unsolicited messages out to the subscribers of their kind.
 */
class BroadcastRouter {
 public:
  BroadcastRouter();

  SubscriptionId subscribe(MessageKind kind, BroadcastCallback callback);
  bool unsubscribe(MessageKind kind, SubscriptionId id);

  /**
   * @brief Synchronously invokes every subscriber of @p message.kind.
   * @return The number of subscribers reached.
   */
  int dispatch(const BroadcastMessage& message);

  /**
   * @brief Decodes a broadcast packet and dispatches it.  Packets whose type
   * names no known kind are logged and counted as unrouted.
   */
  void route(const Packet& packet);

  size_t subscriberCount(MessageKind kind);
  int64_t getUnroutedCount() const { return unroutedCount; }

 protected:
  map<MessageKind, shared_ptr<CallbackList<const BroadcastMessage&>>>
      subscribers;
  std::atomic<int64_t> unroutedCount;
};
}  // namespace dbridge

#endif  // __DBRIDGE_BROADCAST_ROUTER__
