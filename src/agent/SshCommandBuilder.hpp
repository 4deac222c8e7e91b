#ifndef __STA_SSH_COMMAND_BUILDER__
#define __STA_SSH_COMMAND_BUILDER__

#include "AgentConfig.hpp"
#include "Headers.hpp"
#include "TunnelUtils.hpp"

namespace sta {
/**
 * @brief ssh arguments for one tunnel group, with the specs they came from.
 *
 * `args` does not include the program name. When no spec parsed, `args` is
 * empty and `errors` explains why.
 */
struct SshCommand {
  vector<string> args;
  vector<ForwardSpec> specs;
  vector<string> errors;

  bool ok() const { return !specs.empty(); }
};

/** Seconds between ssh keep-alive messages. */
const int SSH_SERVER_ALIVE_INTERVAL = 30;
/** Unanswered keep-alive messages before ssh gives up and exits. */
const int SSH_SERVER_ALIVE_COUNT_MAX = 3;

/**
 * @brief Turns a tunnel group into an ssh invocation.
 *
 * Pure: nothing is executed here.
 */
SshCommand buildSshArguments(const ConnectionSettings& settings,
                             const string& groupName,
                             const string& rawSpecText);

/**
 * @brief Same as buildSshArguments but fails when no spec parsed.
 * @throws TunnelBuildException listing every rejected token.
 */
SshCommand buildSshArgumentsOrThrow(const ConnectionSettings& settings,
                                    const string& groupName,
                                    const string& rawSpecText);

/** @brief The ssh flag pair for one forward, e.g. {"-D", "1080"}. */
vector<string> forwardFlag(const ForwardSpec& spec);

/**
 * @brief Thrown when a tunnel group has no usable forward spec.
 */
class TunnelBuildException : public std::exception {
 public:
  explicit TunnelBuildException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};
}  // namespace sta

#endif  // __STA_SSH_COMMAND_BUILDER__
