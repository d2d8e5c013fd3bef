#ifndef __DRP_STOP_HANDLER__
#define __DRP_STOP_HANDLER__

#include "Headers.hpp"

namespace drp {
/**
 * @brief SIGINT/SIGTERM handling for the presence tool.
 *
 * Until armKeepAlive() is called a stop signal ends the process with the
 * signal's default action, so a stalled connect or handshake can still be
 * interrupted.  Once armed, a stop signal only clears keepRunning() and the
 * caller closes the session itself.
 */
class StopHandler {
 public:
  /** @brief Installs the handler for SIGINT and SIGTERM. */
  static void install();

  static void armKeepAlive();

  static bool keepRunning();
};
}  // namespace drp

#endif  // __DRP_STOP_HANDLER__
