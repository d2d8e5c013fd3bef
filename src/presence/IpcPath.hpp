#ifndef __DRP_IPC_PATH__
#define __DRP_IPC_PATH__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace drp {
/**
 * @brief Computes the candidate discord-ipc-{index} endpoints for this
 * platform.
 *
 * On unix the sockets live in the first directory named by XDG_RUNTIME_DIR,
 * TMPDIR, TMP or TEMP that is set, falling back to /tmp/.  On windows they are
 * named pipes under \\.\pipe\.
 */
class IpcPath {
 public:
  /** @brief Environment variables consulted, in order, for the base dir. */
  static const vector<string> BASE_DIRECTORY_ENV_VARS;

  /**
   * @brief Returns the directory holding the unix sockets.  A variable that
   * is set wins even if it is empty or points nowhere.
   */
  static string getBaseDirectory();

  /** @brief Joins a directory and a file name like a shell would. */
  static string joinPath(const string& directory, const string& filename);

  /** @brief Returns the endpoint for a single index. */
  static SocketEndpoint getEndpoint(int index);

  /** @brief Returns the endpoints for index 0 through 9, in scan order. */
  static vector<SocketEndpoint> getCandidateEndpoints();

 protected:
  static SocketEndpoint makeEndpoint(const string& baseDirectory, int index);
};
}  // namespace drp

#endif  // __DRP_IPC_PATH__
