#include "ActivityConfig.hpp"

#include "SimpleIni.h"

namespace drp {
namespace {
string GetString(const CSimpleIniA& ini, const char* section, const char* key) {
  const char* value = ini.GetValue(section, key, NULL);
  return value ? string(value) : string();
}

optional<int64_t> GetInteger(const CSimpleIniA& ini, const char* section,
                             const char* key) {
  string value = GetString(ini, section, key);
  if (value.empty()) {
    return std::nullopt;
  }
  size_t parsed = 0;
  int64_t result = 0;
  try {
    result = std::stoll(value, &parsed);
  } catch (const std::logic_error&) {
    parsed = 0;
  }
  if (parsed == 0 || parsed != value.length()) {
    throw ConfigError(string("[") + section + "] " + key +
                      " must be an integer, got: " + value);
  }
  return result;
}

ActivityConfig Parse(const CSimpleIniA& ini) {
  ActivityConfig config;
  config.clientId = GetString(ini, "Presence", "client_id");

  config.state = GetString(ini, "Activity", "state");
  config.details = GetString(ini, "Activity", "details");
  config.start = GetInteger(ini, "Activity", "start");
  config.end = GetInteger(ini, "Activity", "end");
  config.largeImage = GetString(ini, "Activity", "large_image");
  config.largeText = GetString(ini, "Activity", "large_text");
  config.smallImage = GetString(ini, "Activity", "small_image");
  config.smallText = GetString(ini, "Activity", "small_text");

  for (int a = 1; a <= ActivityConfig::MAX_BUTTONS; a++) {
    string prefix = "button" + std::to_string(a);
    string label = GetString(ini, "Activity", (prefix + "_label").c_str());
    string url = GetString(ini, "Activity", (prefix + "_url").c_str());
    if (label.empty() && url.empty()) {
      continue;
    }
    if (label.empty() || url.empty()) {
      throw ConfigError("[Activity] " + prefix +
                        " needs both a label and a url");
    }
    config.buttons.push_back(ActivityConfig::Button{label, url});
  }

  auto verbose = GetInteger(ini, "Debug", "verbose");
  if (verbose) {
    config.verbose = int(*verbose);
  }
  config.logdir = GetString(ini, "Debug", "logdir");
  return config;
}
}  // namespace

ActivityConfig ActivityConfig::loadFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw ConfigError("Invalid config file: " + filename);
  }
  LOG(INFO) << "Loaded presence config from " << filename;
  return Parse(ini);
}

ActivityConfig ActivityConfig::loadString(const string& data) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(data);
  if (rc < 0) {
    throw ConfigError("Invalid config data");
  }
  return Parse(ini);
}

json ActivityConfig::toActivity() const {
  json activity = json::object();
  if (!state.empty()) {
    activity["state"] = state;
  }
  if (!details.empty()) {
    activity["details"] = details;
  }
  if (start || end) {
    json timestamps = json::object();
    if (start) {
      timestamps["start"] = *start;
    }
    if (end) {
      timestamps["end"] = *end;
    }
    activity["timestamps"] = timestamps;
  }

  json assets = json::object();
  if (!largeImage.empty()) {
    assets["large_image"] = largeImage;
  }
  if (!largeText.empty()) {
    assets["large_text"] = largeText;
  }
  if (!smallImage.empty()) {
    assets["small_image"] = smallImage;
  }
  if (!smallText.empty()) {
    assets["small_text"] = smallText;
  }
  if (!assets.empty()) {
    activity["assets"] = assets;
  }

  if (!buttons.empty()) {
    json buttonArray = json::array();
    for (const auto& button : buttons) {
      buttonArray.push_back({{"label", button.label}, {"url", button.url}});
    }
    activity["buttons"] = buttonArray;
  }

  if (activity.empty()) {
    return json(nullptr);
  }
  return activity;
}
}  // namespace drp
