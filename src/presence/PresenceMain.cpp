#include <cxxopts.hpp>

#include "ActivityConfig.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "Presence.hpp"
#include "StopHandler.hpp"

using namespace drp;

namespace {
void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

ActivityConfig::Button parseButton(const string& value) {
  auto split = value.find('=');
  if (split == string::npos || split == 0 || split + 1 == value.length()) {
    throw ConfigError("Button must look like label=url, got: " + value);
  }
  return ActivityConfig::Button{value.substr(0, split), value.substr(split + 1)};
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  drp::HandleTerminate();

  StopHandler::install();

  cxxopts::Options options("drp-presence",
                           "Show a rich presence activity on the local Discord "
                           "client");
  ActivityConfig config;
  bool clearOnly = false;
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("c,client-id", "Discord application (client) id",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Load client id, activity and debug settings from an INI "
                    "file",
         cxxopts::value<std::string>())                                  //
        ("s,state", "Activity state line", cxxopts::value<std::string>())  //
        ("d,details", "Activity details line",
         cxxopts::value<std::string>())  //
        ("large-image", "Asset key of the large image",
         cxxopts::value<std::string>())  //
        ("large-text", "Hover text of the large image",
         cxxopts::value<std::string>())  //
        ("small-image", "Asset key of the small image",
         cxxopts::value<std::string>())  //
        ("small-text", "Hover text of the small image",
         cxxopts::value<std::string>())  //
        ("button", "Button as label=url (at most two)",
         cxxopts::value<std::vector<std::string>>())                   //
        ("start-now", "Show elapsed time starting now")                //
        ("duration", "Show remaining time, in seconds from start",
         cxxopts::value<int64_t>())                                    //
        ("clear", "Clear the current activity and exit")               //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("l,logdir", "Write the log to a file in this directory",
         cxxopts::value<std::string>())  //
        ("logtostdout", "Write log to stdout");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "drp-presence version " << DRP_VERSION << endl;
      exit(0);
    }

    if (result.count("cfgfile")) {
      config = ActivityConfig::loadFile(result["cfgfile"].as<string>());
    }

    // Command line values win over the config file
    if (result.count("client-id")) {
      config.clientId = result["client-id"].as<string>();
    }
    if (result.count("state")) {
      config.state = result["state"].as<string>();
    }
    if (result.count("details")) {
      config.details = result["details"].as<string>();
    }
    if (result.count("large-image")) {
      config.largeImage = result["large-image"].as<string>();
    }
    if (result.count("large-text")) {
      config.largeText = result["large-text"].as<string>();
    }
    if (result.count("small-image")) {
      config.smallImage = result["small-image"].as<string>();
    }
    if (result.count("small-text")) {
      config.smallText = result["small-text"].as<string>();
    }
    if (result.count("button")) {
      config.buttons.clear();
      for (const auto& buttonValue : result["button"].as<vector<string>>()) {
        config.buttons.push_back(parseButton(buttonValue));
      }
      if (int(config.buttons.size()) > ActivityConfig::MAX_BUTTONS) {
        throw ConfigError("At most two buttons are allowed");
      }
    }
    if (result.count("start-now") || result.count("duration")) {
      if (!config.start) {
        config.start = int64_t(time(NULL));
      }
      if (result.count("duration")) {
        config.end = *config.start + result["duration"].as<int64_t>();
      }
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      config.logdir = result["logdir"].as<string>();
    }
    clearOnly = result.count("clear") > 0;

    if (config.clientId.empty()) {
      CLOG(INFO, "stdout") << "A client id is required (--client-id or "
                              "[Presence] client_id)\n"
                           << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    el::Loggers::setVerboseLevel(config.verbose.value_or(0));
    if (!config.logdir.empty()) {
      string logFile = LogHandler::setupLogFiles(
          &defaultConf, config.logdir, "drp-presence",
          result.count("logtostdout") > 0);
      CLOG(INFO, "stdout") << "Writing log to " << logFile << endl;
    } else {
      defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput,
                              result.count("logtostdout") ? "true" : "false");
    }
    el::Loggers::reconfigureLogger("default", defaultConf);
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (ConfigError& ce) {
    handleParseException(ce, options);
  } catch (const std::runtime_error& re) {
    // Log directory or file could not be created
    CLOG(ERROR, "stdout") << re.what() << endl;
    exit(1);
  }

  try {
    Presence presence(config.clientId);
    if (clearOnly) {
      presence.clear();
      CLOG(INFO, "stdout") << "Activity cleared" << endl;
      return 0;
    }

    json activity = config.toActivity();
    presence.set(activity);
    CLOG(INFO, "stdout") << "Activity set on " << presence.getEndpoint()
                         << ", press ctrl+c to stop" << endl;
    LOG(INFO) << "Activity: " << activity.dump();

    StopHandler::armKeepAlive();
    while (StopHandler::keepRunning()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    CLOG(INFO, "stdout") << "Stopping" << endl;
  } catch (const ActivityError& ae) {
    CLOG(INFO, "stdout") << "Discord rejected the activity: " << ae.what()
                         << endl;
    return 1;
  } catch (const ClientIdError& ce) {
    CLOG(INFO, "stdout") << "Discord rejected client id " << config.clientId
                         << ": " << ce.what() << endl;
    return 1;
  } catch (const PresenceError& pe) {
    CLOG(INFO, "stdout") << "Error: " << pe.what() << endl;
    return 1;
  }
  return 0;
}
