#include "FakeDiscordServer.hpp"
#include "Presence.hpp"
#include "TestHeaders.hpp"
#include "UnixSocketHandler.hpp"

using namespace drp;

namespace {
const string CLIENT_ID = "123456789012345678";

string useTempRuntimeDir(TestEnvironment& env) {
  const string dir = env.createTempDir();
  env.setEnv("XDG_RUNTIME_DIR", dir);
  return dir;
}
}  // namespace

TEST_CASE("Rejected activity over a unix socket", "[PresenceUnixSocket]") {
  TestEnvironment env;
  const string dir = useTempRuntimeDir(env);

  FakeDiscordServer server(dir + "/discord-ipc-0");
  server.start([](FakeDiscordServer& s, int fd) {
    s.readFrame(fd);
    s.writeFrame(fd, Opcode::FRAME, {{"cmd", "DISPATCH"}, {"evt", "READY"}});
    s.readFrame(fd);
    json error;
    error["evt"] = "ERROR";
    error["data"] = {
        {"message",
         "child \"activity\" fails because [\"details\" is required]"},
        {"code", 4000}};
    s.writeFrame(fd, Opcode::FRAME, error);
    s.readFrame(fd);
  });

  {
    Presence presence(CLIENT_ID);
    REQUIRE(presence.isReady());
    try {
      presence.set({{"state", "x"}});
      FAIL("set should have been rejected");
    } catch (const ActivityError& ae) {
      REQUIRE(string(ae.what()) == "\"details\" is required");
    }
  }

  server.join();
  REQUIRE(server.error.empty());
  REQUIRE(server.received.size() == 3);
  REQUIRE(server.received[0].getOpcode() == Opcode::HANDSHAKE);
  REQUIRE(server.received[0].parsePayload()["client_id"] == CLIENT_ID);
  REQUIRE(server.received[1].getOpcode() == Opcode::FRAME);
  REQUIRE(server.received[1].parsePayload()["args"]["activity"] ==
          json({{"state", "x"}}));
  REQUIRE(server.received[2].getOpcode() == Opcode::CLOSE);
  REQUIRE(server.received[2].parsePayload() == json::object());
}

TEST_CASE("Discovery skips dead endpoints", "[PresenceUnixSocket]") {
  TestEnvironment env;
  const string dir = useTempRuntimeDir(env);

  // A leftover regular file is not a socket and refuses connections
  { std::ofstream stale(dir + "/discord-ipc-0"); }

  FakeDiscordServer server(dir + "/discord-ipc-2");
  server.start([](FakeDiscordServer& s, int fd) {
    s.readFrame(fd);
    s.writeFrame(fd, Opcode::FRAME, {{"evt", "READY"}});
    s.readFrame(fd);
    s.writeFrame(fd, Opcode::FRAME, {{"cmd", "SET_ACTIVITY"}, {"evt", nullptr}});
    s.readFrame(fd);
  });

  Presence presence(CLIENT_ID);
  REQUIRE(presence.getEndpoint().getName() == dir + "/discord-ipc-2");
  presence.clear();
  presence.close();

  server.join();
  REQUIRE(server.error.empty());
  REQUIRE(server.received.size() == 3);
  REQUIRE(server.received[1].parsePayload()["args"]["activity"].is_null());
}

TEST_CASE("No endpoint present fails discovery", "[PresenceUnixSocket]") {
  TestEnvironment env;
  useTempRuntimeDir(env);

  auto handler = make_shared<UnixSocketHandler>();
  REQUIRE_THROWS_AS(Presence(handler, CLIENT_ID), DiscoveryError);
  REQUIRE(handler->getActiveSockets().empty());
}

TEST_CASE("Endpoint hanging up mid handshake", "[PresenceUnixSocket]") {
  TestEnvironment env;
  const string dir = useTempRuntimeDir(env);

  FakeDiscordServer server(dir + "/discord-ipc-0");
  server.start([](FakeDiscordServer& s, int fd) {
    s.readFrame(fd);
    // Half a header, then hang up
    const char partial[] = {1, 0, 0};
    if (::write(fd, partial, sizeof(partial)) != ssize_t(sizeof(partial))) {
      throw std::runtime_error("short write");
    }
  });

  auto handler = make_shared<UnixSocketHandler>();
  REQUIRE_THROWS_AS(Presence(handler, CLIENT_ID), ConnectionClosedError);
  REQUIRE(handler->getActiveSockets().empty());
  server.join();
  REQUIRE(server.error.empty());
}

TEST_CASE("Handshake rejected over a unix socket", "[PresenceUnixSocket]") {
  TestEnvironment env;
  const string dir = useTempRuntimeDir(env);

  FakeDiscordServer server(dir + "/discord-ipc-0");
  server.start([](FakeDiscordServer& s, int fd) {
    s.readFrame(fd);
    s.writeFrame(fd, Opcode::CLOSE,
                 {{"code", 4000}, {"message", "Invalid Client ID"}});
  });

  REQUIRE_THROWS_AS(Presence("0"), ClientIdError);
  server.join();
  REQUIRE(server.error.empty());
}

TEST_CASE("Fake server stops without a client", "[PresenceUnixSocket]") {
  TestEnvironment env;
  const string dir = env.createTempDir();

  FakeDiscordServer server(dir + "/discord-ipc-0");
  bool scriptRan = false;
  server.start([&scriptRan](FakeDiscordServer&, int) { scriptRan = true; });
  server.stop();

  REQUIRE(!scriptRan);
  REQUIRE(server.error.rfind("accept failed", 0) == 0);
}
