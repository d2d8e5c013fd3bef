#include "SocketHandler.hpp"

namespace drp {
void SocketHandler::readAll(int fd, void* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      VLOG(1) << "Stream on fd " << fd << " ended after " << pos << " of "
              << count << " bytes";
      throw ConnectionClosedError("Connection closed prematurely");
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR) {
        continue;
      }
      VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
      throw ConnectionClosedError(string("Failed a call to readAll: ") +
                                  strerror(localErrno));
    }
    pos += bytesRead;
  }
}

void SocketHandler::writeAll(int fd, const void* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    if (bytesWritten < 0) {
      auto localErrno = errno;
      if (localErrno == EINTR) {
        continue;
      }
      LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
      throw ConnectionClosedError(string("Failed a call to writeAll: ") +
                                  strerror(localErrno));
    } else if (bytesWritten == 0) {
      throw ConnectionClosedError("Socket closed during writeAll");
    }
    pos += bytesWritten;
  }
}
}  // namespace drp
