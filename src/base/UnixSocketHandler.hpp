#ifndef __DRP_UNIX_SOCKET_HANDLER__
#define __DRP_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace drp {
/**
 * @brief SocketHandler over blocking AF_UNIX stream sockets.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler();

  /**
   * @brief Connects a stream socket to the filesystem path named by the
   * endpoint.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /** @brief Reads up to `count` bytes, blocking until some arrive. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes up to `count` bytes without raising SIGPIPE. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  /** @brief Returns all descriptors opened by this handler and not closed. */
  vector<int> getActiveSockets();

 protected:
  /** @brief Per-socket setup (SIGPIPE suppression where MSG_NOSIGNAL is
   * missing). */
  virtual void initSocket(int fd);

  set<int> activeSockets;
};
}  // namespace drp

#endif  // __DRP_UNIX_SOCKET_HANDLER__
