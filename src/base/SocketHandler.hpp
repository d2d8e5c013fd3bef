#ifndef __DRP_SOCKET_HANDLER__
#define __DRP_SOCKET_HANDLER__

#include "Headers.hpp"
#include "PresenceError.hpp"
#include "SocketEndpoint.hpp"

namespace drp {
/**
 * @brief Provides an abstract API for blocking local IPC reads/writes and
 * lifecycle management.
 *
 * Descriptors are plain ints on every platform; handlers that sit on top of
 * non-int OS handles keep their own mapping.  A handler is not thread safe:
 * callers must not share a descriptor across threads.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.
   * @return Bytes read, 0 on end-of-stream, -1 on error (errno is set).
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   * @return Bytes written or -1 on error (errno is set).
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return Descriptor for the connection, or -1 with errno set.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied descriptor. */
  virtual void close(int fd) = 0;

  /**
   * @brief Reads exactly `count` bytes, accumulating short reads.
   * @throws ConnectionClosedError when the stream ends or fails before
   * `count` bytes arrive.
   */
  void readAll(int fd, void* buf, size_t count);
  /**
   * @brief Writes the full buffer, looping over partial writes.
   * @throws ConnectionClosedError when the write fails.
   */
  void writeAll(int fd, const void* buf, size_t count);
};
}  // namespace drp

#endif  // __DRP_SOCKET_HANDLER__
