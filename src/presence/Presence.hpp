#ifndef __DRP_PRESENCE__
#define __DRP_PRESENCE__

#include "Headers.hpp"
#include "IpcTransport.hpp"
#include "JsonLib.hpp"
#include "PresenceError.hpp"

namespace drp {
/**
 * @brief A rich presence session with the local Discord client.
 *
 * Construction connects to the first live discord-ipc-{0..9} endpoint and
 * performs the handshake; a constructed Presence is always ready.  Every
 * set()/clear() is one blocking request/reply round trip.  The session is
 * closed by close() or by the destructor, whichever comes first.
 *
 * Not thread safe: a Presence must only be used from one thread at a time.
 *
 * Example:
 *   Presence presence("123456789012345678");
 *   presence.set({{"state", "In Game"}, {"details", "Summoner's Rift"}});
 */
class Presence {
 public:
  enum class State { CONNECTING, READY, CLOSED };

  /** @brief Error code the remote uses for a payload that fails validation. */
  static const int INVALID_PAYLOAD_CODE = 4000;

  /**
   * @brief Connects with the platform socket handler and shakes hands.
   * @throws DiscoveryError, ClientIdError, ProtocolError,
   * ConnectionClosedError, MalformedFrameError
   */
  explicit Presence(const string& _clientId);
  /** @brief Same as above, over a caller supplied socket handler. */
  Presence(shared_ptr<SocketHandler> socketHandler, const string& _clientId);
  virtual ~Presence();

  Presence(const Presence&) = delete;
  Presence& operator=(const Presence&) = delete;

  /**
   * @brief Replaces the displayed activity.  `activity` is passed through
   * untouched; JSON null removes it.
   * @throws ActivityError when the remote rejects the payload (the session
   * stays usable), ProtocolError for other rejections.
   */
  void set(const json& activity);

  /** @brief Equivalent to set(nullptr). */
  void clear();

  /**
   * @brief Sends the CLOSE frame and releases the endpoint.  The endpoint is
   * released even if the CLOSE frame cannot be sent.  Idempotent.
   */
  void close();

  State getState() const { return state; }
  bool isReady() const { return state == State::READY; }
  const string& getClientId() const { return clientId; }
  const SocketEndpoint& getEndpoint() const { return transport.getEndpoint(); }

  /**
   * @brief Strips the `child "activity" fails because [...]` wrapping from a
   * validation message.  Messages without it are returned unchanged.
   */
  static string unwrapActivityError(const string& message);

 protected:
  void handshake();
  json readReply();
  void abandon(const string& reason);

  string clientId;
  IpcTransport transport;
  State state;
};

inline ostream& operator<<(ostream& os, Presence::State state) {
  switch (state) {
    case Presence::State::CONNECTING:
      return os << "CONNECTING";
    case Presence::State::READY:
      return os << "READY";
    case Presence::State::CLOSED:
      return os << "CLOSED";
  }
  return os;
}
}  // namespace drp

#endif  // __DRP_PRESENCE__
