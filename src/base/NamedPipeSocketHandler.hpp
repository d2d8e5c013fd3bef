#ifndef __DRP_NAMED_PIPE_SOCKET_HANDLER__
#define __DRP_NAMED_PIPE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

#ifdef WIN32
namespace drp {
/**
 * @brief SocketHandler over windows named pipes (`\\.\pipe\...`).
 *
 * Pipe HANDLEs are mapped to small int descriptors so the rest of the client
 * stays platform neutral.
 */
class NamedPipeSocketHandler : public SocketHandler {
 public:
  NamedPipeSocketHandler();
  virtual ~NamedPipeSocketHandler();

  /** @brief Opens the pipe named by the endpoint for duplex byte access. */
  virtual int connect(const SocketEndpoint& endpoint);
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes and flushes up to `count` bytes. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  virtual void close(int fd);

 protected:
  HANDLE getHandle(int fd);

  map<int, HANDLE> pipeHandles;
  int nextFd;
};
}  // namespace drp
#endif

#endif  // __DRP_NAMED_PIPE_SOCKET_HANDLER__
