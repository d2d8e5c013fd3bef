#include "IpcPath.hpp"
#include "TestHeaders.hpp"

using namespace drp;

namespace {
void clearBaseDirectoryEnv(TestEnvironment& env) {
  for (const auto& name : IpcPath::BASE_DIRECTORY_ENV_VARS) {
    env.unsetEnv(name.c_str());
  }
}
}  // namespace

TEST_CASE("Base directory falls back to /tmp/", "[IpcPath]") {
  TestEnvironment env;
  clearBaseDirectoryEnv(env);

  REQUIRE(IpcPath::getBaseDirectory() == "/tmp/");
  REQUIRE(IpcPath::getEndpoint(0).getName() == "/tmp/discord-ipc-0");
}

TEST_CASE("Base directory environment precedence", "[IpcPath]") {
  TestEnvironment env;
  clearBaseDirectoryEnv(env);

  env.setEnv("TEMP", "/temp");
  REQUIRE(IpcPath::getBaseDirectory() == "/temp");

  env.setEnv("TMP", "/tmp-dir");
  REQUIRE(IpcPath::getBaseDirectory() == "/tmp-dir");

  env.setEnv("TMPDIR", "/tmpdir");
  REQUIRE(IpcPath::getBaseDirectory() == "/tmpdir");

  env.setEnv("XDG_RUNTIME_DIR", "/run/user/1000");
  REQUIRE(IpcPath::getBaseDirectory() == "/run/user/1000");
  REQUIRE(IpcPath::getEndpoint(7).getName() ==
          "/run/user/1000/discord-ipc-7");
}

TEST_CASE("A set but empty variable still wins", "[IpcPath]") {
  TestEnvironment env;
  clearBaseDirectoryEnv(env);
  env.setEnv("XDG_RUNTIME_DIR", "");
  env.setEnv("TMPDIR", "/tmpdir");

  REQUIRE(IpcPath::getBaseDirectory() == "");
  REQUIRE(IpcPath::getEndpoint(2).getName() == "discord-ipc-2");
}

TEST_CASE("joinPath only adds a separator when needed", "[IpcPath]") {
  REQUIRE(IpcPath::joinPath("/run/user/1000", "discord-ipc-0") ==
          "/run/user/1000/discord-ipc-0");
  REQUIRE(IpcPath::joinPath("/run/user/1000/", "discord-ipc-0") ==
          "/run/user/1000/discord-ipc-0");
  REQUIRE(IpcPath::joinPath("", "discord-ipc-0") == "discord-ipc-0");
}

TEST_CASE("Candidates are indices 0 through 9 in order", "[IpcPath]") {
  TestEnvironment env;
  clearBaseDirectoryEnv(env);
  env.setEnv("TMPDIR", "/var/folders/xy/");

  auto endpoints = IpcPath::getCandidateEndpoints();
  REQUIRE(endpoints.size() == 10);
  for (int a = 0; a < 10; a++) {
    REQUIRE(endpoints[a].getName() ==
            "/var/folders/xy/discord-ipc-" + std::to_string(a));
  }
}
