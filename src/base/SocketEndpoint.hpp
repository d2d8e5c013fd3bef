#ifndef __DRP_SOCKET_ENDPOINT__
#define __DRP_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace drp {
/**
 * @brief Names a local IPC endpoint: a unix socket path or a windows pipe
 * path.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name("") {}

  explicit SocketEndpoint(const string &_name) : name(_name) {}

  const string &getName() const { return name; }

  bool operator==(const SocketEndpoint &other) const {
    return name == other.name;
  }

 protected:
  string name;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.getName();
}
}  // namespace drp

#endif  // __DRP_SOCKET_ENDPOINT__
