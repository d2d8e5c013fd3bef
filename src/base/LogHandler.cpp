#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace drp {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.setGlobally(el::ConfigurationType::ToFile, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %fbase:%line] %msg");
  el::Loggers::reconfigureLogger("default", defaultConf);
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &path,
                                 const string &filenamePrefix, bool logToStdout,
                                 const string &maxlogsize) {
  time_t rawtime;
  struct tm *timeinfo;
  char buffer[80];
  time(&rawtime);
  timeinfo = localtime(&rawtime);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", timeinfo);
  string logFilename = filenamePrefix + "-" + string(buffer) + "_" +
                       std::to_string(GetPid()) + ".log";
  string fullFname = createLogFile(path, logFilename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  return fullFname;
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  // Values are always std::string
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  fs::path fullPath = fs::path(path) / filename;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + path + ": " +
                             ec.message());
  }
  std::ofstream touch(fullPath.string(), std::ios::out | std::ios::app);
  if (!touch) {
    throw std::runtime_error("Cannot create log file " + fullPath.string());
  }
  return fullPath.string();
}
}  // namespace drp
