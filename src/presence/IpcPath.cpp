#include "IpcPath.hpp"

namespace drp {
const vector<string> IpcPath::BASE_DIRECTORY_ENV_VARS = {
    "XDG_RUNTIME_DIR", "TMPDIR", "TMP", "TEMP"};

string IpcPath::getBaseDirectory() {
  for (const auto& name : BASE_DIRECTORY_ENV_VARS) {
    const char* value = ::getenv(name.c_str());
    if (value != NULL) {
      VLOG(3) << "Using " << name << " for the ipc directory: " << value;
      return string(value);
    }
  }
  return "/tmp/";
}

string IpcPath::joinPath(const string& directory, const string& filename) {
  if (directory.empty() || directory.back() == '/') {
    return directory + filename;
  }
  return directory + "/" + filename;
}

SocketEndpoint IpcPath::getEndpoint(int index) {
#ifdef WIN32
  return makeEndpoint("", index);
#else
  return makeEndpoint(getBaseDirectory(), index);
#endif
}

vector<SocketEndpoint> IpcPath::getCandidateEndpoints() {
#ifdef WIN32
  const string baseDirectory = "";
#else
  const string baseDirectory = getBaseDirectory();
#endif
  vector<SocketEndpoint> endpoints;
  for (int index = 0; index < IPC_MAX_SOCKET_INDEX; index++) {
    endpoints.push_back(makeEndpoint(baseDirectory, index));
  }
  return endpoints;
}

SocketEndpoint IpcPath::makeEndpoint(const string& baseDirectory, int index) {
  string filename = IPC_SOCKET_PREFIX + std::to_string(index);
#ifdef WIN32
  return SocketEndpoint(string("\\\\.\\pipe\\") + filename);
#else
  return SocketEndpoint(joinPath(baseDirectory, filename));
#endif
}
}  // namespace drp
