#ifdef WIN32
#include "NamedPipeSocketHandler.hpp"

namespace drp {
namespace {
int TranslateWinError(DWORD error) {
  switch (error) {
    case ERROR_FILE_NOT_FOUND:
    case ERROR_PATH_NOT_FOUND:
      return ENOENT;
    case ERROR_ACCESS_DENIED:
      return EACCES;
    case ERROR_PIPE_BUSY:
      return EBUSY;
    case ERROR_BROKEN_PIPE:
    case ERROR_NO_DATA:
    case ERROR_PIPE_NOT_CONNECTED:
      return EPIPE;
    default:
      return EIO;
  }
}
}  // namespace

NamedPipeSocketHandler::NamedPipeSocketHandler() : nextFd(1) {}

NamedPipeSocketHandler::~NamedPipeSocketHandler() {
  for (auto& it : pipeHandles) {
    LOG(WARNING) << "Closing leaked pipe " << it.first;
    ::CloseHandle(it.second);
  }
  pipeHandles.clear();
}

int NamedPipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  HANDLE pipe = ::CreateFileA(endpoint.getName().c_str(),
                              GENERIC_READ | GENERIC_WRITE, 0, NULL,
                              OPEN_EXISTING, 0, NULL);
  if (pipe == INVALID_HANDLE_VALUE) {
    DWORD error = ::GetLastError();
    VLOG(2) << "Connection to " << endpoint << " failed: (" << error << ") "
            << WinErrnoToString(error);
    errno = TranslateWinError(error);
    return -1;
  }

  int fd = nextFd++;
  pipeHandles[fd] = pipe;
  LOG(INFO) << "Connected to endpoint " << endpoint;
  return fd;
}

HANDLE NamedPipeSocketHandler::getHandle(int fd) {
  auto it = pipeHandles.find(fd);
  if (it == pipeHandles.end()) {
    return INVALID_HANDLE_VALUE;
  }
  return it->second;
}

ssize_t NamedPipeSocketHandler::read(int fd, void* buf, size_t count) {
  HANDLE pipe = getHandle(fd);
  if (pipe == INVALID_HANDLE_VALUE) {
    LOG(INFO) << "Tried to read from a pipe that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  DWORD bytesRead = 0;
  if (!::ReadFile(pipe, buf, DWORD(count), &bytesRead, NULL)) {
    DWORD error = ::GetLastError();
    if (error == ERROR_BROKEN_PIPE) {
      // Server hung up, report end-of-stream
      return 0;
    }
    if (error != ERROR_MORE_DATA) {
      LOG(WARNING) << "Error reading pipe: " << WinErrnoToString(error);
      errno = TranslateWinError(error);
      return -1;
    }
  }
  return ssize_t(bytesRead);
}

ssize_t NamedPipeSocketHandler::write(int fd, const void* buf, size_t count) {
  HANDLE pipe = getHandle(fd);
  if (pipe == INVALID_HANDLE_VALUE) {
    LOG(INFO) << "Tried to write to a pipe that has been closed: " << fd;
    errno = EPIPE;
    return -1;
  }
  DWORD bytesWritten = 0;
  if (!::WriteFile(pipe, buf, DWORD(count), &bytesWritten, NULL) ||
      !::FlushFileBuffers(pipe)) {
    DWORD error = ::GetLastError();
    LOG(WARNING) << "Error writing pipe: " << WinErrnoToString(error);
    errno = TranslateWinError(error);
    return -1;
  }
  return ssize_t(bytesWritten);
}

void NamedPipeSocketHandler::close(int fd) {
  auto it = pipeHandles.find(fd);
  if (it == pipeHandles.end()) {
    VLOG(1) << "Tried to close a pipe that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing pipe: " << fd;
  if (!::CloseHandle(it->second)) {
    LOG(WARNING) << "Error closing pipe " << fd << ": "
                 << WinErrnoToString(::GetLastError());
  }
  pipeHandles.erase(it);
}
}  // namespace drp
#endif
