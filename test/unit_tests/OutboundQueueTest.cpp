#include "OutboundQueue.hpp"

#include "TestHeaders.hpp"

using namespace dbridge;

namespace {
RequestEnvelope makeRequest(const string& id) {
  RequestEnvelope request;
  request.kind = MessageKind::TERMINAL;
  request.correlationId = id;
  request.payload = {{"action", "input"}};
  return request;
}
}  // namespace

TEST_CASE("Flush replays in enqueue order", "[OutboundQueue]") {
  OutboundQueue queue;
  queue.enqueue(makeRequest("a"));
  queue.enqueue(makeRequest("b"));
  queue.enqueue(makeRequest("c"));
  REQUIRE(queue.size() == 3);

  vector<string> sent;
  int count = queue.flush([&sent](const RequestEnvelope& request) {
    sent.push_back(request.correlationId);
    return true;
  });
  REQUIRE(count == 3);
  REQUIRE(sent == vector<string>({"a", "b", "c"}));
  REQUIRE(queue.empty());
}

TEST_CASE("Failed send requeues the rest at the head", "[OutboundQueue]") {
  OutboundQueue queue;
  queue.enqueue(makeRequest("a"));
  queue.enqueue(makeRequest("b"));
  queue.enqueue(makeRequest("c"));

  vector<string> sent;
  int count = queue.flush([&](const RequestEnvelope& request) {
    if (request.correlationId == "b") {
      // Arrives during the flush, so it must stay behind b and c
      queue.enqueue(makeRequest("d"));
      return false;
    }
    sent.push_back(request.correlationId);
    return true;
  });
  REQUIRE(count == 1);
  REQUIRE(sent == vector<string>({"a"}));
  REQUIRE(queue.size() == 3);

  sent.clear();
  queue.flush([&sent](const RequestEnvelope& request) {
    sent.push_back(request.correlationId);
    return true;
  });
  REQUIRE(sent == vector<string>({"b", "c", "d"}));
}

TEST_CASE("A throwing sender counts as a failed send", "[OutboundQueue]") {
  OutboundQueue queue;
  queue.enqueue(makeRequest("a"));
  queue.enqueue(makeRequest("b"));
  int count = queue.flush([](const RequestEnvelope&) -> bool {
    throw std::runtime_error("socket gone");
  });
  REQUIRE(count == 0);
  REQUIRE(queue.size() == 2);
}

TEST_CASE("Entries enqueued during a flush wait for the next one",
          "[OutboundQueue]") {
  OutboundQueue queue;
  queue.enqueue(makeRequest("a"));
  vector<string> sent;
  queue.flush([&](const RequestEnvelope& request) {
    sent.push_back(request.correlationId);
    queue.enqueue(makeRequest("late"));
    return true;
  });
  REQUIRE(sent == vector<string>({"a"}));
  REQUIRE(queue.size() == 1);
}

TEST_CASE("Clear returns what was dropped", "[OutboundQueue]") {
  OutboundQueue queue;
  queue.enqueue(makeRequest("a"));
  queue.enqueue(makeRequest("b"));
  auto dropped = queue.clear();
  REQUIRE(dropped.size() == 2);
  REQUIRE(dropped.front().correlationId == "a");
  REQUIRE(queue.empty());
  REQUIRE(queue.flush([](const RequestEnvelope&) { return true; }) == 0);
}
