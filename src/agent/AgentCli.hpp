#ifndef __STA_AGENT_CLI__
#define __STA_AGENT_CLI__

#include <cxxopts.hpp>

#include "Headers.hpp"

namespace sta {
/**
 * @brief A validated command line.
 */
struct AgentCommandLine {
  /** One of start, stop, restart, status, list, attach, help, version. */
  string command;
  bool attach = false;
  optional<string> configFile;
  optional<int> verbose;
  string logDirectory;
  bool logToStdout = false;
};

/** Commands accepted as the single positional argument. */
extern const set<string> AGENT_COMMANDS;

/** Highest accepted --verbose level, same range as `[Debug] verbose`. */
const int MAX_VERBOSE_LEVEL = 9;

/**
 * @brief Options and help text of the agent.
 */
cxxopts::Options buildAgentOptions();

/**
 * @brief Parses and validates argv.
 *
 * `--help` and `--version` are folded into the `help` and `version`
 * commands.
 * @throws CommandLineException on any usage error, including errors raised
 * by cxxopts itself.
 */
AgentCommandLine parseAgentCommandLine(cxxopts::Options& options, int argc,
                                       const char* const* argv);

/**
 * @brief Writes the usage error and the help text to `err`.
 * @return The process exit code for a usage error.
 */
int reportUsageError(const string& message, const cxxopts::Options& options,
                     std::ostream& err);

/**
 * @brief Thrown when the command line is invalid.
 */
class CommandLineException : public std::exception {
 public:
  explicit CommandLineException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};
}  // namespace sta

#endif  // __STA_AGENT_CLI__
