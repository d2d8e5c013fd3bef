#ifndef __DRP_LOG_HANDLER__
#define __DRP_LOG_HANDLER__

#include "Headers.hpp"

namespace drp {
/**
 * @brief Configures easylogging++ for the presence tool and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the default configuration, which
   * callers can further customize before reconfiguring the default logger.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file under `path`.
   * @param logToStdout Keep echoing log lines on stdout as well.
   * @return Full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              const string &maxlogsize = "20971520");

  /**
   * @brief Reconfigures the easylogging `stdout` logger so it only writes the
   * message, for user-facing output.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new, empty log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace drp
#endif  // __DRP_LOG_HANDLER__
