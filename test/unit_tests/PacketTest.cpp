#include "Packet.hpp"
#include "TestHeaders.hpp"

using namespace drp;

TEST_CASE("Opcodes have their wire values", "[Packet]") {
  REQUIRE(int32_t(Opcode::HANDSHAKE) == 0);
  REQUIRE(int32_t(Opcode::FRAME) == 1);
  REQUIRE(int32_t(Opcode::CLOSE) == 2);
  REQUIRE(int32_t(Opcode::PING) == 3);
  REQUIRE(int32_t(Opcode::PONG) == 4);
}

TEST_CASE("Header is two little endian int32 words", "[Packet]") {
  Packet packet(Opcode::CLOSE, "{}");
  string s = packet.serialize();
  REQUIRE(s.length() == 10);
  REQUIRE(packet.length() == 10);
  const string expectedHeader("\x02\x00\x00\x00\x02\x00\x00\x00", 8);
  REQUIRE(s.substr(0, 8) == expectedHeader);
  REQUIRE(s.substr(8) == "{}");
}

TEST_CASE("Header decodes what serialize wrote", "[Packet]") {
  const string payload(300, 'x');
  Packet packet(Opcode::FRAME, payload);
  string s = packet.serialize();

  FrameHeader header = Packet::parseHeader(s.data());
  REQUIRE(header.opcode == Opcode::FRAME);
  REQUIRE(header.length == 300);
  // 300 = 0x012c spans two bytes
  REQUIRE(uint8_t(s[4]) == 0x2c);
  REQUIRE(uint8_t(s[5]) == 0x01);
  REQUIRE(s.substr(Packet::HEADER_SIZE) == payload);
}

TEST_CASE("Empty payload has a zero length header", "[Packet]") {
  Packet packet(Opcode::HANDSHAKE, "");
  string s = packet.serialize();
  REQUIRE(s.length() == size_t(Packet::HEADER_SIZE));
  FrameHeader header = Packet::parseHeader(s.data());
  REQUIRE(header.opcode == Opcode::HANDSHAKE);
  REQUIRE(header.length == 0);
}

TEST_CASE("Negative lengths are malformed", "[Packet]") {
  const string header("\x01\x00\x00\x00\xff\xff\xff\xff", 8);
  REQUIRE_THROWS_AS(Packet::parseHeader(header.data()), MalformedFrameError);
}

TEST_CASE("Oversized lengths are malformed", "[Packet]") {
  const string header("\x01\x00\x00\x00\x00\x00\x00\x7f", 8);
  REQUIRE_THROWS_AS(Packet::parseHeader(header.data()), MalformedFrameError);
}

TEST_CASE("fromJson dumps the body as the payload", "[Packet]") {
  json body;
  body["v"] = 1;
  body["client_id"] = "123";
  Packet packet = Packet::fromJson(Opcode::HANDSHAKE, body);
  REQUIRE(packet.getOpcode() == Opcode::HANDSHAKE);
  REQUIRE(json::parse(packet.getPayload()) == body);
  REQUIRE(packet.parsePayload() == body);
}

TEST_CASE("Multi-byte UTF-8 is counted in bytes", "[Packet]") {
  json body;
  body["state"] = "caf\xc3\xa9";
  Packet packet = Packet::fromJson(Opcode::FRAME, body);
  string s = packet.serialize();
  FrameHeader header = Packet::parseHeader(s.data());
  REQUIRE(size_t(header.length) == packet.getPayload().length());
  REQUIRE(packet.parsePayload()["state"] == "caf\xc3\xa9");
}

TEST_CASE("Bodies that are not UTF-8 cannot be encoded", "[Packet]") {
  json body;
  body["state"] = string("\xff\xfe", 2);
  REQUIRE_THROWS_AS(Packet::fromJson(Opcode::FRAME, body),
                    MalformedFrameError);
}

TEST_CASE("Invalid payloads fail to parse", "[Packet]") {
  SECTION("Truncated JSON") {
    Packet packet(Opcode::FRAME, "{\"evt\":");
    REQUIRE_THROWS_AS(packet.parsePayload(), MalformedFrameError);
  }
  SECTION("Not UTF-8") {
    Packet packet(Opcode::FRAME, string("{\"evt\":\"\xc3\x28\"}"));
    REQUIRE_THROWS_AS(packet.parsePayload(), MalformedFrameError);
  }
  SECTION("Empty") {
    Packet packet(Opcode::FRAME, "");
    REQUIRE_THROWS_AS(packet.parsePayload(), MalformedFrameError);
  }
}
