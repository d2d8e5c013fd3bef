#include "IpcTransport.hpp"

#include "IpcPath.hpp"
#ifdef WIN32
#include "NamedPipeSocketHandler.hpp"
#else
#include "UnixSocketHandler.hpp"
#endif

namespace drp {
shared_ptr<SocketHandler> IpcTransport::createPlatformSocketHandler() {
#ifdef WIN32
  return shared_ptr<SocketHandler>(new NamedPipeSocketHandler());
#else
  return shared_ptr<SocketHandler>(new UnixSocketHandler());
#endif
}

IpcTransport::IpcTransport(shared_ptr<SocketHandler> _socketHandler)
    : socketHandler(_socketHandler), fd(-1) {}

IpcTransport::~IpcTransport() { close(); }

void IpcTransport::connect() {
  if (fd >= 0) {
    throw std::logic_error("IpcTransport is already connected to " +
                           endpoint.getName());
  }
  for (const auto& candidate : IpcPath::getCandidateEndpoints()) {
    int candidateFd = socketHandler->connect(candidate);
    if (candidateFd >= 0) {
      fd = candidateFd;
      endpoint = candidate;
      VLOG(1) << "Using ipc endpoint " << endpoint << " (fd " << fd << ")";
      return;
    }
    auto localErrno = errno;
    VLOG(2) << "Skipping " << candidate << ": " << strerror(localErrno);
  }
  throw DiscoveryError("Cannot find an ipc endpoint to connect to Discord");
}

void IpcTransport::writePacket(const Packet& packet) {
  if (fd < 0) {
    throw ConnectionClosedError("Tried to write to a closed ipc transport");
  }
  string s = packet.serialize();
  VLOG(2) << "Sending " << packet.getOpcode() << " frame: "
          << packet.getPayload();
  socketHandler->writeAll(fd, s.data(), s.length());
}

Packet IpcTransport::readPacket() {
  if (fd < 0) {
    throw ConnectionClosedError("Tried to read from a closed ipc transport");
  }
  char header[Packet::HEADER_SIZE];
  socketHandler->readAll(fd, header, Packet::HEADER_SIZE);
  FrameHeader frameHeader = Packet::parseHeader(header);
  string payload(frameHeader.length, '\0');
  if (frameHeader.length > 0) {
    socketHandler->readAll(fd, &payload[0], payload.length());
  }
  VLOG(2) << "Received " << frameHeader.opcode << " frame: " << payload;
  return Packet(frameHeader.opcode, payload);
}

void IpcTransport::close() {
  if (fd < 0) {
    return;
  }
  VLOG(1) << "Closing ipc transport to " << endpoint;
  socketHandler->close(fd);
  fd = -1;
}
}  // namespace drp
