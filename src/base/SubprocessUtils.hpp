#ifndef __STA_SUBPROCESS_UTILS__
#define __STA_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace sta {
/**
 * @brief Outcome of a finished child process.
 *
 * `exitCode` is the process exit status, or 128 + signal number when the
 * child was killed by a signal.
 */
struct SubprocessResult {
  int exitCode = -1;
  string output;
  string error;

  bool ok() const { return exitCode == 0; }
};

/**
 * @brief Utility class for executing subprocesses without a shell.
 *
 * All methods are virtual so tests can substitute a recording fake.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments, capturing stdout and stderr
   * separately. Stdin is connected to /dev/null.
   */
  virtual SubprocessResult Run(const string& command,
                               const vector<string>& args);

  /**
   * @brief Runs a command attached to the caller's terminal and blocks until
   * it exits.
   * @return The exit status, as in SubprocessResult::exitCode.
   */
  virtual int RunInteractive(const string& command, const vector<string>& args);

  /**
   * @brief Resolves a binary name against $PATH.
   *
   * Names containing a '/' are checked as-is.
   */
  virtual optional<string> FindOnPath(const string& binary);
};
}  // namespace sta

#endif  // __STA_SUBPROCESS_UTILS__
