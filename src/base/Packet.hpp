#ifndef __DBRIDGE_PACKET_H__
#define __DBRIDGE_PACKET_H__

#include "Headers.hpp"

namespace dbridge {
/**
 * @brief One framed message: a type byte followed by an opaque payload.
 *
 * After the handshake every packet's header is an EnvelopeType and its payload
 * is a JSON document.
 */
class Packet {
 public:
  /** @brief Constructs an empty packet with an invalid header. */
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Tried to deserialize an empty packet");
    }
    header = uint8_t(serializedPacket[0]);
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = char(header);
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace dbridge

#endif  // __DBRIDGE_PACKET_H__
