#include "StopHandler.hpp"

namespace drp {
namespace {
volatile sig_atomic_t keepAliveArmed = 0;
volatile sig_atomic_t stopRequested = 0;

void StopSignalHandler(int signum) {
  if (!keepAliveArmed) {
    // Nothing to tear down yet; die the way an unhandled signal would.
    // The signal stays blocked until the handler returns.
    ::signal(signum, SIG_DFL);
    ::raise(signum);
    return;
  }
  stopRequested = 1;
}
}  // namespace

void StopHandler::install() {
#ifdef WIN32
  ::signal(SIGINT, StopSignalHandler);
  ::signal(SIGTERM, StopSignalHandler);
#else
  // No SA_RESTART: a blocking call in progress sees EINTR
  struct sigaction action;
  memset(&action, 0, sizeof(struct sigaction));
  action.sa_handler = StopSignalHandler;
  sigemptyset(&action.sa_mask);
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
#endif
}

void StopHandler::armKeepAlive() { keepAliveArmed = 1; }

bool StopHandler::keepRunning() { return !stopRequested; }
}  // namespace drp
