#ifndef __STA_LOG_HANDLER__
#define __STA_LOG_HANDLER__

#include "Headers.hpp"

namespace sta {
/**
 * @brief Configures easylogging++ so the agent can control its log file.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fixed, append-only log file.
   *
   * The file is reused across invocations and never rotated.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @return Full path of the log file.
   */
  static string setupLogFile(el::Configurations *defaultConf,
                             const string &path, const string &filename,
                             bool logToStdout = false);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Enables DEBUG lines and sets the VLOG level.
   */
  static void setVerbosity(el::Configurations *defaultConf, int level);

  /** @brief Default directory holding the agent's log file. */
  static string defaultLogDirectory();

 private:
  /**
   * @brief Ensures the directory exists and the log file can be appended to.
   */
  static string openLogFile(const string &path, const string &filename);
};
}  // namespace sta
#endif  // __STA_LOG_HANDLER__
