#ifndef __DBRIDGE_ENVELOPE__
#define __DBRIDGE_ENVELOPE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Packet.hpp"

namespace dbridge {
/**
 * @brief The logical sub-protocols multiplexed over one bridge connection.
 */
enum class MessageKind {
  TERMINAL,
  PERMISSION,
  COMMAND,
  FILESYSTEM,
  SCREEN,
  DEVICE_LOG,
  DISCOVERY,
  APP_INSTALLATION,
};

/** @brief Every kind, in declaration order. */
extern const vector<MessageKind> ALL_MESSAGE_KINDS;

/** @brief Wire name of a kind, e.g. "app-installation". */
string messageKindToString(MessageKind kind);

/**
 * @brief Parses a wire name into a kind.
 * @return false if the name is not a known kind.
 */
bool parseMessageKind(const string& s, MessageKind* kind);

ostream& operator<<(ostream& os, MessageKind kind);

struct RequestEnvelope {
  MessageKind kind = MessageKind::COMMAND;
  // Remote device the request is aimed at.  Empty for session scoped calls.
  string targetId;
  // Always a JSON object carrying an "action" discriminator.
  json payload = json::object();
  string correlationId;
};

struct ResponseEnvelope {
  string correlationId;
  bool success = false;
  json data = json::object();
  string error;
};

/**
 * @brief An unsolicited message pushed by the remote.
 */
struct BroadcastMessage {
  MessageKind kind = MessageKind::COMMAND;
  string event;
  json data = json::object();
};

/**
 * @brief Serializes request, response and broadcast envelopes to and from
 * typed packets.
 */
class EnvelopeCodec {
 public:
  static Packet encodeRequest(const RequestEnvelope& request);
  static Packet encodeResponse(const ResponseEnvelope& response);
  static Packet encodeBroadcast(const string& type, const json& data);

  /**
   * @brief Decodes a request packet.
   * @return false (and logs) when the payload is malformed.
   */
  static bool decodeRequest(const Packet& packet, RequestEnvelope* request);
  static bool decodeResponse(const Packet& packet, ResponseEnvelope* response);

  /**
   * @brief Splits a broadcast packet into its raw "type" string and data.
   * @return false (and logs) when the payload is not a JSON object with a
   * string "type".
   */
  static bool decodeBroadcastType(const Packet& packet, string* type,
                                  json* data);

  /**
   * @brief Splits "kind:event" and resolves the kind.
   * @return false if there is no known kind before the first ':'.
   */
  static bool parseBroadcastType(const string& type, MessageKind* kind,
                                 string* event);
};
}  // namespace dbridge

#endif  // __DBRIDGE_ENVELOPE__
