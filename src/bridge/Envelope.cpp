#include "Envelope.hpp"

namespace dbridge {
const vector<MessageKind> ALL_MESSAGE_KINDS = {
    MessageKind::TERMINAL,   MessageKind::PERMISSION,
    MessageKind::COMMAND,    MessageKind::FILESYSTEM,
    MessageKind::SCREEN,     MessageKind::DEVICE_LOG,
    MessageKind::DISCOVERY,  MessageKind::APP_INSTALLATION,
};

string messageKindToString(MessageKind kind) {
  switch (kind) {
    case MessageKind::TERMINAL:
      return "terminal";
    case MessageKind::PERMISSION:
      return "permission";
    case MessageKind::COMMAND:
      return "command";
    case MessageKind::FILESYSTEM:
      return "file";
    case MessageKind::SCREEN:
      return "screen";
    case MessageKind::DEVICE_LOG:
      return "log";
    case MessageKind::DISCOVERY:
      return "discovery";
    case MessageKind::APP_INSTALLATION:
      return "app-installation";
  }
  STFATAL << "Invalid message kind: " << int(kind);
  return "";
}

bool parseMessageKind(const string& s, MessageKind* kind) {
  for (auto k : ALL_MESSAGE_KINDS) {
    if (messageKindToString(k) == s) {
      *kind = k;
      return true;
    }
  }
  return false;
}

ostream& operator<<(ostream& os, MessageKind kind) {
  os << messageKindToString(kind);
  return os;
}

Packet EnvelopeCodec::encodeRequest(const RequestEnvelope& request) {
  json j;
  j["kind"] = messageKindToString(request.kind);
  j["targetId"] = request.targetId;
  j["payload"] = request.payload;
  j["correlationId"] = request.correlationId;
  return Packet(uint8_t(REQUEST_ENVELOPE), j.dump());
}

Packet EnvelopeCodec::encodeResponse(const ResponseEnvelope& response) {
  json j;
  j["correlationId"] = response.correlationId;
  j["success"] = response.success;
  if (!response.data.is_null()) {
    j["data"] = response.data;
  }
  if (!response.error.empty()) {
    j["error"] = response.error;
  }
  return Packet(uint8_t(RESPONSE_ENVELOPE), j.dump());
}

Packet EnvelopeCodec::encodeBroadcast(const string& type, const json& data) {
  json j;
  j["type"] = type;
  j["data"] = data;
  return Packet(uint8_t(BROADCAST_ENVELOPE), j.dump());
}

bool EnvelopeCodec::decodeRequest(const Packet& packet,
                                  RequestEnvelope* request) {
  try {
    json j = json::parse(packet.getPayload());
    if (!parseMessageKind(j.at("kind").get<string>(), &request->kind)) {
      LOG(WARNING) << "Request with unknown kind: " << j.at("kind");
      return false;
    }
    request->targetId = j.value("targetId", string());
    request->payload = j.value("payload", json::object());
    request->correlationId = j.at("correlationId").get<string>();
  } catch (const json::exception& e) {
    LOG(WARNING) << "Malformed request envelope: " << e.what();
    return false;
  }
  return true;
}

bool EnvelopeCodec::decodeResponse(const Packet& packet,
                                   ResponseEnvelope* response) {
  try {
    json j = json::parse(packet.getPayload());
    response->correlationId = j.at("correlationId").get<string>();
    // Anything but an explicit true is a failure, so the caller still settles.
    auto success = j.find("success");
    response->success =
        success != j.end() && success->is_boolean() && success->get<bool>();
    auto data = j.find("data");
    response->data =
        (data == j.end() || data->is_null()) ? json::object() : *data;
    auto error = j.find("error");
    response->error = (error != j.end() && error->is_string())
                          ? error->get<string>()
                          : string();
  } catch (const json::exception& e) {
    LOG(WARNING) << "Malformed response envelope: " << e.what();
    return false;
  }
  return true;
}

bool EnvelopeCodec::decodeBroadcastType(const Packet& packet, string* type,
                                        json* data) {
  try {
    json j = json::parse(packet.getPayload());
    *type = j.at("type").get<string>();
    *data = j.value("data", json::object());
  } catch (const json::exception& e) {
    LOG(WARNING) << "Malformed broadcast envelope: " << e.what();
    return false;
  }
  return true;
}

bool EnvelopeCodec::parseBroadcastType(const string& type, MessageKind* kind,
                                       string* event) {
  auto colon = type.find(':');
  string kindName = type.substr(0, colon);
  if (!parseMessageKind(kindName, kind)) {
    return false;
  }
  *event = (colon == string::npos) ? string() : type.substr(colon + 1);
  return true;
}
}  // namespace dbridge
