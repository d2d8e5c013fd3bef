#ifndef WIN32
#include "UnixSocketHandler.hpp"

namespace drp {
UnixSocketHandler::UnixSocketHandler() {}

UnixSocketHandler::~UnixSocketHandler() {
  // Copy since close() erases from the set
  auto fds = activeSockets;
  for (int fd : fds) {
    LOG(WARNING) << "Closing leaked socket " << fd;
    close(fd);
  }
}

int UnixSocketHandler::connect(const SocketEndpoint& endpoint) {
  const string& socketPath = endpoint.getName();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(remote));
  if (socketPath.length() >= sizeof(remote.sun_path)) {
    VLOG(2) << "Socket path is too long: " << endpoint;
    errno = ENAMETOOLONG;
    return -1;
  }
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, socketPath.c_str(), sizeof(remote.sun_path) - 1);

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  if (sockFd < 0) {
    auto localErrno = errno;
    STERROR << "Cannot create unix socket: " << strerror(localErrno);
    errno = localErrno;
    return -1;
  }
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result;
  do {
    result = ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  } while (result < 0 && errno == EINTR);
  if (result < 0) {
    auto localErrno = errno;
    VLOG(2) << "Connection to " << endpoint << " failed: ("
            << localErrno << ") " << strerror(localErrno);
    ::close(sockFd);
    errno = localErrno;
    return -1;
  }

  LOG(INFO) << "Connected to endpoint " << endpoint;
  activeSockets.insert(sockFd);
  return sockFd;
}

ssize_t UnixSocketHandler::read(int fd, void* buf, size_t count) {
  if (activeSockets.find(fd) == activeSockets.end()) {
    LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EINTR) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void* buf, size_t count) {
  if (activeSockets.find(fd) == activeSockets.end()) {
    LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

void UnixSocketHandler::close(int fd) {
  auto it = activeSockets.find(fd);
  if (it == activeSockets.end()) {
    // Connection was already closed.
    VLOG(1) << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing connection: " << fd;
  activeSockets.erase(it);
  if (::close(fd) == -1) {
    LOG(WARNING) << "Error closing fd " << fd << ": " << strerror(errno);
  }
}

vector<int> UnixSocketHandler::getActiveSockets() {
  return vector<int>(activeSockets.begin(), activeSockets.end());
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void*)&val, sizeof(val)) ==
        -1) {
      // If this fails, just ignore SIGPIPE globally
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
}
}  // namespace drp
#endif
