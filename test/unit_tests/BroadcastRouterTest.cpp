#include "BroadcastRouter.hpp"

#include "TestHeaders.hpp"

using namespace dbridge;

TEST_CASE("Broadcasts reach only subscribers of their kind",
          "[BroadcastRouter]") {
  BroadcastRouter router;
  vector<string> terminalEvents;
  int screenEvents = 0;
  router.subscribe(MessageKind::TERMINAL,
                   [&terminalEvents](const BroadcastMessage& message) {
                     terminalEvents.push_back(message.event);
                   });
  router.subscribe(MessageKind::SCREEN,
                   [&screenEvents](const BroadcastMessage&) { screenEvents++; });

  router.route(EnvelopeCodec::encodeBroadcast(
      "terminal:output", {{"sessionId", "s1"}, {"output", "ls\n"}}));
  router.route(EnvelopeCodec::encodeBroadcast("terminal:session:closed",
                                              {{"sessionId", "s1"}}));

  REQUIRE(terminalEvents == vector<string>({"output", "session:closed"}));
  REQUIRE(screenEvents == 0);
  REQUIRE(router.getUnroutedCount() == 0);
}

TEST_CASE("Unknown broadcast kinds are counted, not delivered",
          "[BroadcastRouter]") {
  BroadcastRouter router;
  int delivered = 0;
  for (auto kind : ALL_MESSAGE_KINDS) {
    router.subscribe(kind,
                     [&delivered](const BroadcastMessage&) { delivered++; });
  }
  router.route(EnvelopeCodec::encodeBroadcast("weather:update", json::object()));
  router.route(Packet(uint8_t(BROADCAST_ENVELOPE), "not json"));
  REQUIRE(delivered == 0);
  REQUIRE(router.getUnroutedCount() == 2);
}

TEST_CASE("A throwing subscriber does not stop delivery",
          "[BroadcastRouter]") {
  BroadcastRouter router;
  int reached = 0;
  router.subscribe(MessageKind::DEVICE_LOG, [](const BroadcastMessage&) {
    throw std::runtime_error("subscriber bug");
  });
  router.subscribe(MessageKind::DEVICE_LOG,
                   [&reached](const BroadcastMessage& message) {
                     REQUIRE(message.data["line"] == "boot");
                     reached++;
                   });
  BroadcastMessage message;
  message.kind = MessageKind::DEVICE_LOG;
  message.event = "entry";
  message.data = {{"line", "boot"}};
  REQUIRE(router.dispatch(message) == 2);
  REQUIRE(reached == 1);
}

TEST_CASE("Unsubscribed callbacks stop receiving", "[BroadcastRouter]") {
  BroadcastRouter router;
  int first = 0;
  int second = 0;
  SubscriptionId id = router.subscribe(
      MessageKind::PERMISSION, [&first](const BroadcastMessage&) { first++; });
  router.subscribe(MessageKind::PERMISSION,
                   [&second](const BroadcastMessage&) { second++; });
  REQUIRE(router.subscriberCount(MessageKind::PERMISSION) == 2);

  BroadcastMessage message;
  message.kind = MessageKind::PERMISSION;
  router.dispatch(message);
  REQUIRE(router.unsubscribe(MessageKind::PERMISSION, id));
  REQUIRE_FALSE(router.unsubscribe(MessageKind::PERMISSION, id));
  // Ids are scoped to their kind
  REQUIRE_FALSE(router.unsubscribe(MessageKind::SCREEN, id + 1));
  router.dispatch(message);

  REQUIRE(first == 1);
  REQUIRE(second == 2);
  REQUIRE(router.subscriberCount(MessageKind::PERMISSION) == 1);
}

TEST_CASE("Callback lists tolerate removal from inside a callback",
          "[CallbackList]") {
  CallbackList<int> callbacks;
  int total = 0;
  SubscriptionId self = 0;
  self = callbacks.add([&](int n) {
    total += n;
    callbacks.remove(self);
  });
  callbacks.add([&total](int n) { total += 10 * n; });
  REQUIRE(callbacks.invoke(1) == 2);
  REQUIRE(callbacks.invoke(1) == 1);
  REQUIRE(total == 21);
}
