#include "Envelope.hpp"

#include "TestHeaders.hpp"

using namespace dbridge;

TEST_CASE("Message kinds use their wire names", "[Envelope]") {
  REQUIRE(messageKindToString(MessageKind::APP_INSTALLATION) ==
          "app-installation");
  REQUIRE(messageKindToString(MessageKind::DEVICE_LOG) == "log");
  REQUIRE(messageKindToString(MessageKind::FILESYSTEM) == "file");
  for (auto kind : ALL_MESSAGE_KINDS) {
    MessageKind parsed;
    REQUIRE(parseMessageKind(messageKindToString(kind), &parsed));
    REQUIRE(parsed == kind);
  }
  MessageKind unused;
  REQUIRE_FALSE(parseMessageKind("Terminal", &unused));
  REQUIRE_FALSE(parseMessageKind("", &unused));
}

TEST_CASE("Requests are framed as JSON request envelopes", "[Envelope]") {
  RequestEnvelope request;
  request.kind = MessageKind::PERMISSION;
  request.targetId = "emulator-5554";
  request.payload = {{"action", "list"}, {"deviceId", "emulator-5554"}};
  request.correlationId = "1700000000000-abcdefghi";

  Packet packet = EnvelopeCodec::encodeRequest(request);
  REQUIRE(packet.getHeader() == REQUEST_ENVELOPE);
  json j = json::parse(packet.getPayload());
  REQUIRE(j["kind"] == "permission");
  REQUIRE(j["targetId"] == "emulator-5554");
  REQUIRE(j["payload"]["action"] == "list");
  REQUIRE(j["correlationId"] == "1700000000000-abcdefghi");
}

TEST_CASE("Responses decode with optional fields", "[Envelope]") {
  ResponseEnvelope response;
  REQUIRE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE),
             R"({"correlationId":"r1","success":true,"data":{"session":{"id":"s1"}}})"),
      &response));
  REQUIRE(response.correlationId == "r1");
  REQUIRE(response.success);
  REQUIRE(response.data["session"]["id"] == "s1");
  REQUIRE(response.error.empty());

  REQUIRE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE),
             R"({"correlationId":"r2","success":false,"error":"no device"})"),
      &response));
  REQUIRE_FALSE(response.success);
  REQUIRE(response.error == "no device");
}

TEST_CASE("Malformed responses are rejected", "[Envelope]") {
  ResponseEnvelope response;
  REQUIRE_FALSE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE), "{"), &response));
  REQUIRE_FALSE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE), R"({"success":true})"), &response));
}

TEST_CASE("Loosely typed responses still settle as failures", "[Envelope]") {
  ResponseEnvelope response;
  REQUIRE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE),
             R"({"correlationId":"r1","success":false,"error":null,"data":null})"),
      &response));
  REQUIRE(response.correlationId == "r1");
  REQUIRE_FALSE(response.success);
  REQUIRE(response.error.empty());
  REQUIRE(response.data.is_object());

  REQUIRE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE),
             R"({"correlationId":"r2","success":"yes","error":42})"),
      &response));
  REQUIRE(response.correlationId == "r2");
  REQUIRE_FALSE(response.success);
  REQUIRE(response.error.empty());

  REQUIRE(EnvelopeCodec::decodeResponse(
      Packet(uint8_t(RESPONSE_ENVELOPE), R"({"correlationId":"r3"})"),
      &response));
  REQUIRE_FALSE(response.success);
}

TEST_CASE("Broadcast types split on the first colon", "[Envelope]") {
  MessageKind kind;
  string event;
  REQUIRE(EnvelopeCodec::parseBroadcastType("terminal:session:created", &kind,
                                            &event));
  REQUIRE(kind == MessageKind::TERMINAL);
  REQUIRE(event == "session:created");

  REQUIRE(EnvelopeCodec::parseBroadcastType("discovery", &kind, &event));
  REQUIRE(kind == MessageKind::DISCOVERY);
  REQUIRE(event.empty());

  REQUIRE_FALSE(
      EnvelopeCodec::parseBroadcastType("telemetry:tick", &kind, &event));
}

TEST_CASE("Packets survive serialization", "[Envelope]") {
  Packet packet(uint8_t(BROADCAST_ENVELOPE), R"({"type":"log:entry"})");
  Packet copy(packet.serialize());
  REQUIRE(copy.getHeader() == BROADCAST_ENVELOPE);
  REQUIRE(copy.getPayload() == packet.getPayload());
  REQUIRE(copy.length() == packet.length());
  REQUIRE_THROWS_AS(Packet(string()), std::runtime_error);
}
