#ifndef __DRP_PRESENCE_ERROR__
#define __DRP_PRESENCE_ERROR__

#include "Headers.hpp"

namespace drp {
/**
 * @brief Base class for every error raised by the presence client.
 */
class PresenceError : public std::runtime_error {
 public:
  explicit PresenceError(const string& message)
      : std::runtime_error(message) {}
};

/** @brief No discord-ipc-{0..9} endpoint accepted a connection. */
class DiscoveryError : public PresenceError {
 public:
  explicit DiscoveryError(const string& message) : PresenceError(message) {}
};

/** @brief The peer hung up (or the OS failed the I/O) mid-operation. */
class ConnectionClosedError : public PresenceError {
 public:
  explicit ConnectionClosedError(const string& message)
      : PresenceError(message) {}
};

/** @brief A frame header or JSON body could not be decoded or encoded. */
class MalformedFrameError : public PresenceError {
 public:
  explicit MalformedFrameError(const string& message)
      : PresenceError(message) {}
};

/**
 * @brief An error reply sent by the remote application.
 *
 * Carries the remote message and code verbatim.
 */
class ProtocolError : public PresenceError {
 public:
  ProtocolError(const string& message, int _code)
      : PresenceError(message), code(_code) {}

  int getCode() const { return code; }

 protected:
  int code;
};

/** @brief The handshake was rejected because of the client id. */
class ClientIdError : public ProtocolError {
 public:
  ClientIdError(const string& message, int _code)
      : ProtocolError(message, _code) {}
};

/**
 * @brief The activity was rejected by the remote schema check. The session
 * stays usable.
 */
class ActivityError : public ProtocolError {
 public:
  ActivityError(const string& message, int _code)
      : ProtocolError(message, _code) {}
};

/** @brief An activity config file could not be loaded or is invalid. */
class ConfigError : public PresenceError {
 public:
  explicit ConfigError(const string& message) : PresenceError(message) {}
};
}  // namespace drp

#endif  // __DRP_PRESENCE_ERROR__
