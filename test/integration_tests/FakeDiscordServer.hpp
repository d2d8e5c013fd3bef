#ifndef __DRP_FAKE_DISCORD_SERVER__
#define __DRP_FAKE_DISCORD_SERVER__

#include <functional>

#include "Headers.hpp"
#include "Packet.hpp"

namespace drp {
/**
 * @brief Listens on a real unix socket and answers one client with a
 * scripted conversation on a background thread.
 */
class FakeDiscordServer {
 public:
  typedef std::function<void(FakeDiscordServer&, int)> Script;

  explicit FakeDiscordServer(const string& _path) : path(_path), listenFd(-1) {
    sockaddr_un local;
    memset(&local, 0, sizeof(local));
    local.sun_family = AF_UNIX;
    strncpy(local.sun_path, path.c_str(), sizeof(local.sun_path) - 1);

    listenFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (listenFd < 0 ||
        ::bind(listenFd, (struct sockaddr*)&local, sizeof(sockaddr_un)) < 0 ||
        ::listen(listenFd, 1) < 0) {
      throw std::runtime_error("Cannot listen on " + path + ": " +
                               strerror(errno));
    }
  }

  ~FakeDiscordServer() {
    stop();
    ::close(listenFd);
    ::unlink(path.c_str());
  }

  void start(Script script) {
    serverThread = std::thread([this, script]() {
      int fd = ::accept(listenFd, NULL, NULL);
      if (fd < 0) {
        error = string("accept failed: ") + strerror(errno);
        return;
      }
      try {
        script(*this, fd);
      } catch (const std::exception& e) {
        error = e.what();
      }
      ::close(fd);
    });
  }

  void join() {
    if (serverThread.joinable()) {
      serverThread.join();
    }
  }

  /**
   * @brief Wakes a script still waiting for a client and joins it.  The
   * script records an accept failure in `error`.
   */
  void stop() {
    ::shutdown(listenFd, SHUT_RDWR);
    join();
  }

  Packet readFrame(int fd) {
    char header[Packet::HEADER_SIZE];
    readExactly(fd, header, sizeof(header));
    FrameHeader frameHeader = Packet::parseHeader(header);
    string payload(frameHeader.length, '\0');
    readExactly(fd, &payload[0], payload.length());
    Packet packet(frameHeader.opcode, payload);
    received.push_back(packet);
    return packet;
  }

  void writeFrame(int fd, Opcode opcode, const json& body) {
    string s = Packet::fromJson(opcode, body).serialize();
    size_t pos = 0;
    while (pos < s.length()) {
      ssize_t n = ::write(fd, s.data() + pos, s.length() - pos);
      if (n <= 0) {
        throw std::runtime_error("Fake server write failed");
      }
      pos += n;
    }
  }

  /** @brief Frames the server read, in order.  Read only after join(). */
  vector<Packet> received;
  /** @brief Set when the script failed.  Read only after join(). */
  string error;

 protected:
  void readExactly(int fd, char* buf, size_t count) {
    size_t pos = 0;
    while (pos < count) {
      ssize_t n = ::read(fd, buf + pos, count - pos);
      if (n <= 0) {
        throw std::runtime_error("Client hung up");
      }
      pos += n;
    }
  }

  string path;
  int listenFd;
  std::thread serverThread;
};
}  // namespace drp

#endif  // __DRP_FAKE_DISCORD_SERVER__
