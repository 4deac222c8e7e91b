#include "AgentConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace sta {
namespace {
const char* CONNECTION_SECTION = "connection";
const char* TUNNELS_SECTION = "tunnels";
const char* DEBUG_SECTION = "Debug";

// Returns the value with surrounding whitespace removed, or nullopt when the
// key is absent or blank.
optional<string> readValue(const CSimpleIniA& ini, const char* section,
                           const char* key) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return nullopt;
  }
  string trimmed = trim(value);
  if (trimmed.empty()) {
    return nullopt;
  }
  return trimmed;
}

int parseIntValue(const string& path, const string& key, const string& value,
                  int minValue, int maxValue) {
  if (value.find_first_not_of("0123456789") != string::npos) {
    throw ConfigException("Invalid config file " + path + ": " + key + " '" +
                          value + "' is not a number");
  }
  long parsed = -1;
  try {
    parsed = stol(value);
  } catch (const std::out_of_range&) {
    parsed = -1;
  }
  if (parsed < minValue || parsed > maxValue) {
    throw ConfigException("Invalid config file " + path + ": " + key + " '" +
                          value + "' must be between " + to_string(minValue) +
                          " and " + to_string(maxValue));
  }
  return static_cast<int>(parsed);
}
}  // namespace

ConnectionSettings ConnectionSettings::defaults() {
  ConnectionSettings settings;
  settings.user = GetOsUserName();
  return settings;
}

vector<string> defaultConfigCandidates() {
  vector<string> candidates;
  candidates.push_back(sago::getConfigHome() + "/" + AGENT_NAME + "/config");
  string home = GetHomeDirectory();
  if (!home.empty()) {
    candidates.push_back(home + "/.local/etc/" + AGENT_NAME + "/config");
  }
  candidates.push_back("/etc/" + AGENT_NAME + "/config");
  return candidates;
}

AgentConfig loadAgentConfig(const vector<string>& candidates) {
  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return loadAgentConfigFile(candidate);
    }
    VLOG(1) << "No config at " << candidate;
  }
  LOG(INFO) << "No config file found, using built-in defaults";
  AgentConfig config;
  config.connection = ConnectionSettings::defaults();
  return config;
}

AgentConfig loadAgentConfigFile(const string& path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw ConfigException("Config file not found: " + path);
  }

  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw ConfigException("Invalid config file: " + path);
  }

  AgentConfig config;
  config.connection = ConnectionSettings::defaults();
  config.source = path;

  auto host = readValue(ini, CONNECTION_SECTION, "host");
  if (host) {
    if (host->find(':') != string::npos) {
      throw ConfigException("Invalid config file " + path + ": host '" +
                            *host + "' must not contain ':', use port");
    }
    config.connection.host = *host;
  }
  auto port = readValue(ini, CONNECTION_SECTION, "port");
  if (port) {
    config.connection.port = parseIntValue(path, "port", *port, 1, 65535);
  }
  auto user = readValue(ini, CONNECTION_SECTION, "user");
  if (user) {
    config.connection.user = *user;
  }
  auto term = readValue(ini, CONNECTION_SECTION, "term");
  if (term) {
    config.connection.terminalType = *term;
  }

  CSimpleIniA::TNamesDepend keys;
  ini.GetAllKeys(TUNNELS_SECTION, keys);
  for (const auto& key : keys) {
    string name = trim(key.pItem);
    const char* value = ini.GetValue(TUNNELS_SECTION, key.pItem, "");
    config.tunnels[name] = trim(value);
  }

  auto vlevel = readValue(ini, DEBUG_SECTION, "verbose");
  if (vlevel) {
    config.verbose = parseIntValue(path, "verbose", *vlevel, 0, 9);
  }
  auto silent = readValue(ini, DEBUG_SECTION, "silent");
  if (silent) {
    config.silent = parseIntValue(path, "silent", *silent, 0, 1) != 0;
  }

  LOG(INFO) << "Loaded config " << path << ": " << config.tunnels.size()
            << " tunnel group(s), destination " << config.connection.user
            << "@" << config.connection.host << ":" << config.connection.port;
  return config;
}
}  // namespace sta
