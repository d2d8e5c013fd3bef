#ifndef __DRP_IPC_TRANSPORT__
#define __DRP_IPC_TRANSPORT__

#include "Headers.hpp"
#include "Packet.hpp"
#include "SocketHandler.hpp"

namespace drp {
/**
 * @brief Owns the single descriptor connected to the discord IPC endpoint and
 * moves whole frames over it.
 *
 * The descriptor is released by close() or by the destructor, exactly once.
 */
class IpcTransport {
 public:
  /** @brief Returns the handler for this platform (unix socket or pipe). */
  static shared_ptr<SocketHandler> createPlatformSocketHandler();

  explicit IpcTransport(shared_ptr<SocketHandler> _socketHandler);
  virtual ~IpcTransport();

  IpcTransport(const IpcTransport&) = delete;
  IpcTransport& operator=(const IpcTransport&) = delete;

  /**
   * @brief Scans discord-ipc-0 through discord-ipc-9 and keeps the first
   * endpoint that accepts a connection.
   * @throws DiscoveryError if none does.
   */
  void connect();

  /** @brief Writes the full serialized frame. */
  void writePacket(const Packet& packet);

  /**
   * @brief Reads one complete frame.
   * @throws ConnectionClosedError, MalformedFrameError
   */
  Packet readPacket();

  /** @brief Releases the descriptor.  Safe to call more than once. */
  void close();

  bool isOpen() const { return fd >= 0; }
  const SocketEndpoint& getEndpoint() const { return endpoint; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  int fd;
  SocketEndpoint endpoint;
};
}  // namespace drp

#endif  // __DRP_IPC_TRANSPORT__
