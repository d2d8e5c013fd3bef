#ifndef __DRP_HEADERS__
#define __DRP_HEADERS__

#if defined(_MSC_VER) || defined(WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <process.h>
#include <signal.h>
#include <windows.h>
#include <winerror.h>
#else
#include <signal.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

#if defined(_MSC_VER)
/* ssize_t is not defined on Windows */
#include <BaseTsd.h>
#define ssize_t SSIZE_T
#endif

using namespace std;
namespace fs = std::filesystem;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#ifndef DRP_VERSION
#define DRP_VERSION "unknown"
#endif

namespace drp {
// Name of the IPC endpoint, {index} is 0 through 9
const string IPC_SOCKET_PREFIX = "discord-ipc-";
const int IPC_MAX_SOCKET_INDEX = 10;

// Frames larger than this are assumed to be garbage
const int64_t MAX_FRAME_PAYLOAD = 128 * 1024 * 1024;

#ifdef WIN32
inline string WinErrnoToString(DWORD error) {
  const int BUFSIZE = 4096;
  char buf[BUFSIZE];
  auto charsWritten = FormatMessageA(
      FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL, error,
      MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), buf, BUFSIZE, NULL);
  if (charsWritten) {
    return string(buf, charsWritten);
  }
  return "Unknown Error";
}
#endif

inline int64_t GetPid() {
#ifdef WIN32
  return int64_t(GetCurrentProcessId());
#else
  return int64_t(::getpid());
#endif
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace drp

#endif  // __DRP_HEADERS__
