#include "BroadcastRouter.hpp"

namespace dbridge {
BroadcastRouter::BroadcastRouter() : unroutedCount(0) {
  // The kind set is closed, so every list exists up front and the map itself
  // never changes after construction.
  for (auto kind : ALL_MESSAGE_KINDS) {
    subscribers[kind].reset(new CallbackList<const BroadcastMessage&>());
  }
}

SubscriptionId BroadcastRouter::subscribe(MessageKind kind,
                                          BroadcastCallback callback) {
  return subscribers.at(kind)->add(callback);
}

bool BroadcastRouter::unsubscribe(MessageKind kind, SubscriptionId id) {
  return subscribers.at(kind)->remove(id);
}

int BroadcastRouter::dispatch(const BroadcastMessage& message) {
  int reached = subscribers.at(message.kind)->invoke(message);
  VLOG(2) << "Broadcast " << message.kind << ":" << message.event
          << " reached " << reached << " subscribers";
  return reached;
}

void BroadcastRouter::route(const Packet& packet) {
  string type;
  json data;
  if (!EnvelopeCodec::decodeBroadcastType(packet, &type, &data)) {
    unroutedCount++;
    return;
  }
  BroadcastMessage message;
  if (!EnvelopeCodec::parseBroadcastType(type, &message.kind,
                                         &message.event)) {
    LOG(WARNING) << "Unroutable broadcast type: " << type;
    unroutedCount++;
    return;
  }
  message.data = data;
  dispatch(message);
}

size_t BroadcastRouter::subscriberCount(MessageKind kind) {
  return subscribers.at(kind)->size();
}
}  // namespace dbridge
