#ifndef __STA_AGENT_CONFIG__
#define __STA_AGENT_CONFIG__

#include "Headers.hpp"

namespace sta {
/**
 * @brief Where and as whom the ssh client connects.
 */
struct ConnectionSettings {
  string host = "localhost";
  int port = 22;
  string user;
  string terminalType = "xterm-256color";

  /** @brief Built-in defaults; the user is the current OS login. */
  static ConnectionSettings defaults();
};

/**
 * @brief Everything read from the configuration file, merged over the
 * built-in defaults. Built once in main and passed down by reference.
 */
struct AgentConfig {
  ConnectionSettings connection;
  /** Tunnel group name -> raw forward spec text. Sorted by name. */
  map<string, string> tunnels;
  /** Path of the file that was loaded, empty when only defaults apply. */
  string source;
  int verbose = 0;
  bool silent = false;
};

/**
 * @brief Config file locations in lookup order.
 *
 * `<config home>/ssh-tunnel-agent/config`, then
 * `$HOME/.local/etc/ssh-tunnel-agent/config`, then
 * `/etc/ssh-tunnel-agent/config`.
 */
vector<string> defaultConfigCandidates();

/**
 * @brief Loads the first existing file among `candidates`.
 *
 * If none exists the defaults are returned with an empty tunnel map.
 * @throws ConfigException if the chosen file cannot be parsed or holds an
 * invalid value.
 */
AgentConfig loadAgentConfig(const vector<string>& candidates);

/**
 * @brief Loads one specific file, which must exist.
 * @throws ConfigException
 */
AgentConfig loadAgentConfigFile(const string& path);

/**
 * @brief Thrown when the configuration file is unreadable or invalid.
 */
class ConfigException : public std::exception {
 public:
  explicit ConfigException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};
}  // namespace sta

#endif  // __STA_AGENT_CONFIG__
