#ifndef __STA_SECURE_TRANSPORT_LAUNCHER__
#define __STA_SECURE_TRANSPORT_LAUNCHER__

#include "Headers.hpp"

namespace sta {
/**
 * @brief Knows how to run the secure transport client (ssh) and how to tell
 * whether one of its processes is still around.
 */
class SecureTransportLauncher {
 public:
  virtual ~SecureTransportLauncher() {}

  /** @brief True if the client binary can be found. */
  virtual bool isAvailable() = 0;

  /**
   * @brief Full argv (client binary first) for the given client arguments.
   */
  virtual vector<string> launchCommand(const vector<string>& args) = 0;

  /** @brief True if a process with this pid still exists. */
  virtual bool isAlive(pid_t pid) = 0;
};
}  // namespace sta

#endif  // __STA_SECURE_TRANSPORT_LAUNCHER__
