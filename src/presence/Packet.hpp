#ifndef __DRP_PACKET_H__
#define __DRP_PACKET_H__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PresenceError.hpp"

namespace drp {
/**
 * @brief Operation codes carried in the first header word of every frame.
 *
 * PING and PONG are reserved; the client never issues them.
 */
enum class Opcode : int32_t {
  HANDSHAKE = 0,
  FRAME = 1,
  CLOSE = 2,
  PING = 3,
  PONG = 4,
};

inline ostream& operator<<(ostream& os, Opcode opcode) {
  switch (opcode) {
    case Opcode::HANDSHAKE:
      return os << "HANDSHAKE";
    case Opcode::FRAME:
      return os << "FRAME";
    case Opcode::CLOSE:
      return os << "CLOSE";
    case Opcode::PING:
      return os << "PING";
    case Opcode::PONG:
      return os << "PONG";
  }
  return os << "OPCODE(" << int32_t(opcode) << ")";
}

/** @brief Decoded 8-byte frame header. */
struct FrameHeader {
  Opcode opcode;
  int32_t length;
};

/**
 * @brief One IPC frame: an opcode and a UTF-8 JSON payload.
 *
 * Wire format is two little-endian int32 words (opcode, payload length)
 * followed by exactly `length` payload bytes.
 */
class Packet {
 public:
  /** @brief Size of the non-payload portion of the serialized frame. */
  static const int HEADER_SIZE = 8;

  Packet(Opcode _opcode, const string& _payload)
      : opcode(_opcode), payload(_payload) {}

  /**
   * @brief Builds a frame whose payload is the compact JSON dump of `body`.
   * @throws MalformedFrameError if the body holds strings that are not UTF-8.
   */
  static Packet fromJson(Opcode opcode, const json& body) {
    try {
      return Packet(opcode, body.dump());
    } catch (const json::exception& e) {
      throw MalformedFrameError(string("Cannot encode frame payload: ") +
                                e.what());
    }
  }

  /**
   * @brief Decodes the 8 header bytes.
   * @throws MalformedFrameError on a negative or oversized length.
   */
  static FrameHeader parseHeader(const char* header) {
    FrameHeader result;
    result.opcode = Opcode(readInt32(header));
    result.length = readInt32(header + 4);
    if (result.length < 0 || result.length > MAX_FRAME_PAYLOAD) {
      throw MalformedFrameError("Invalid frame length: " +
                                std::to_string(result.length));
    }
    return result;
  }

  Opcode getOpcode() const { return opcode; }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  size_t length() const { return HEADER_SIZE + payload.length(); }

  /**
   * @brief Parses the payload as JSON.
   * @throws MalformedFrameError on invalid UTF-8 or invalid JSON.
   */
  json parsePayload() const {
    try {
      return json::parse(payload);
    } catch (const json::exception& e) {
      throw MalformedFrameError(string("Cannot decode frame payload: ") +
                                e.what());
    }
  }

  /**
   * @brief Serializes the header and payload into the wire format.
   */
  string serialize() const {
    if (payload.length() > size_t(MAX_FRAME_PAYLOAD)) {
      throw MalformedFrameError("Frame payload too large: " +
                                std::to_string(payload.length()));
    }
    string s(HEADER_SIZE, '\0');
    writeInt32(&s[0], int32_t(opcode));
    writeInt32(&s[4], int32_t(payload.length()));
    s.append(payload);
    return s;
  }

 protected:
  static void writeInt32(char* out, int32_t value) {
    uint32_t v = uint32_t(value);
    for (int i = 0; i < 4; i++) {
      out[i] = char((v >> (8 * i)) & 0xff);
    }
  }

  static int32_t readInt32(const char* in) {
    uint32_t v = 0;
    for (int i = 0; i < 4; i++) {
      v |= uint32_t(uint8_t(in[i])) << (8 * i);
    }
    return int32_t(v);
  }

  Opcode opcode;
  string payload;
};
}  // namespace drp

#endif  // __DRP_PACKET_H__
