#include "Presence.hpp"

namespace drp {
namespace {
const string ACTIVITY_ERROR_PREFIX = "child \"activity\" fails because [";
const string ACTIVITY_ERROR_SUFFIX = "]";

struct RemoteError {
  string message;
  int code;
};

// Pulls data.message and data.code out of an ERROR reply.  Missing or
// mistyped fields, and codes that do not fit an int, fall back to the
// defaults.
RemoteError GetRemoteError(const json& reply, const string& defaultMessage) {
  RemoteError error{defaultMessage, 0};
  auto dataIt = reply.find("data");
  if (dataIt == reply.end() || !dataIt->is_object()) {
    return error;
  }
  auto messageIt = dataIt->find("message");
  if (messageIt != dataIt->end() && messageIt->is_string()) {
    error.message = messageIt->get<string>();
  }
  auto codeIt = dataIt->find("code");
  if (codeIt != dataIt->end()) {
    if (codeIt->is_number_unsigned()) {
      uint64_t code = codeIt->get<uint64_t>();
      if (code <= uint64_t(std::numeric_limits<int>::max())) {
        error.code = int(code);
      }
    } else if (codeIt->is_number_integer()) {
      int64_t code = codeIt->get<int64_t>();
      if (code >= std::numeric_limits<int>::min() &&
          code <= std::numeric_limits<int>::max()) {
        error.code = int(code);
      }
    }
  }
  return error;
}

bool IsEvent(const json& reply, const string& evt) {
  auto it = reply.find("evt");
  return it != reply.end() && it->is_string() && it->get<string>() == evt;
}
}  // namespace

Presence::Presence(const string& _clientId)
    : Presence(IpcTransport::createPlatformSocketHandler(), _clientId) {}

Presence::Presence(shared_ptr<SocketHandler> socketHandler,
                   const string& _clientId)
    : clientId(_clientId), transport(socketHandler), state(State::CONNECTING) {
  transport.connect();
  handshake();
}

Presence::~Presence() { close(); }

void Presence::handshake() {
  json body;
  body["v"] = 1;
  body["client_id"] = clientId;
  transport.writePacket(Packet::fromJson(Opcode::HANDSHAKE, body));

  json reply = readReply();
  if (IsEvent(reply, "READY")) {
    state = State::READY;
    LOG(INFO) << "Handshake with " << transport.getEndpoint()
              << " complete for client " << clientId;
    return;
  }

  RemoteError error = GetRemoteError(
      reply, "Discord returned an error response after a handshake request");
  LOG(WARNING) << "Handshake rejected (" << error.code << "): "
               << error.message;
  if (error.code == INVALID_PAYLOAD_CODE) {
    throw ClientIdError(error.message, error.code);
  }
  throw ProtocolError(error.message, error.code);
}

void Presence::set(const json& activity) {
  if (state != State::READY) {
    throw std::logic_error("Tried to set an activity on a presence that is " +
                           string(state == State::CLOSED ? "closed"
                                                         : "not ready"));
  }

  json args;
  args["pid"] = GetPid();
  args["activity"] = activity;
  json body;
  body["cmd"] = "SET_ACTIVITY";
  body["args"] = args;
  body["nonce"] = sole::uuid4().str();
  // Encoding errors are the caller's and leave the session intact.
  Packet packet = Packet::fromJson(Opcode::FRAME, body);

  json reply;
  try {
    transport.writePacket(packet);
    reply = readReply();
  } catch (const ConnectionClosedError& e) {
    abandon(e.what());
    throw;
  } catch (const MalformedFrameError& e) {
    abandon(e.what());
    throw;
  }

  if (!IsEvent(reply, "ERROR")) {
    VLOG(1) << "Activity accepted";
    return;
  }

  RemoteError error = GetRemoteError(reply, "Discord rejected the activity");
  if (error.code == INVALID_PAYLOAD_CODE) {
    throw ActivityError(unwrapActivityError(error.message), error.code);
  }
  throw ProtocolError(error.message, error.code);
}

void Presence::clear() { set(json(nullptr)); }

void Presence::close() {
  if (state == State::CLOSED) {
    return;
  }
  state = State::CLOSED;
  try {
    transport.writePacket(Packet::fromJson(Opcode::CLOSE, json::object()));
  } catch (const PresenceError& e) {
    LOG(WARNING) << "Could not send the close frame: " << e.what();
  }
  transport.close();
  LOG(INFO) << "Presence session for client " << clientId << " closed";
}

string Presence::unwrapActivityError(const string& message) {
  if (message.length() >=
          ACTIVITY_ERROR_PREFIX.length() + ACTIVITY_ERROR_SUFFIX.length() &&
      message.compare(0, ACTIVITY_ERROR_PREFIX.length(),
                      ACTIVITY_ERROR_PREFIX) == 0 &&
      message.compare(message.length() - ACTIVITY_ERROR_SUFFIX.length(),
                      ACTIVITY_ERROR_SUFFIX.length(),
                      ACTIVITY_ERROR_SUFFIX) == 0) {
    return message.substr(ACTIVITY_ERROR_PREFIX.length(),
                          message.length() - ACTIVITY_ERROR_PREFIX.length() -
                              ACTIVITY_ERROR_SUFFIX.length());
  }
  return message;
}

json Presence::readReply() {
  Packet packet = transport.readPacket();
  json reply = packet.parsePayload();
  if (!reply.is_object()) {
    throw MalformedFrameError("Expected a JSON object, got: " +
                              packet.getPayload());
  }
  if (packet.getOpcode() == Opcode::CLOSE) {
    // The remote hangs up with {"code": ..., "message": ...} at the top level
    json data = json::object();
    auto codeIt = reply.find("code");
    if (codeIt != reply.end()) {
      data["code"] = *codeIt;
    }
    auto messageIt = reply.find("message");
    if (messageIt != reply.end()) {
      data["message"] = *messageIt;
    }
    json error;
    error["evt"] = "ERROR";
    error["data"] = data;
    return error;
  }
  return reply;
}

void Presence::abandon(const string& reason) {
  STERROR << "Presence session is no longer usable: " << reason;
  state = State::CLOSED;
  transport.close();
}
}  // namespace drp
