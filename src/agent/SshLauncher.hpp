#ifndef __STA_SSH_LAUNCHER__
#define __STA_SSH_LAUNCHER__

#include "Headers.hpp"
#include "SecureTransportLauncher.hpp"
#include "SubprocessUtils.hpp"

namespace sta {
/**
 * @brief Launches OpenSSH's `ssh` client found on $PATH.
 */
class SshLauncher : public SecureTransportLauncher {
 public:
  explicit SshLauncher(shared_ptr<SubprocessUtils> subprocessUtils)
      : subprocessUtils_(subprocessUtils) {}
  virtual ~SshLauncher() {}

  virtual bool isAvailable();
  virtual vector<string> launchCommand(const vector<string>& args);
  virtual bool isAlive(pid_t pid);

  static const string SSH_BIN;

 private:
  /** @brief Resolved path of the ssh binary, cached after the first lookup. */
  optional<string> resolve();

  shared_ptr<SubprocessUtils> subprocessUtils_;
  optional<string> sshPath_;
};
}  // namespace sta

#endif  // __STA_SSH_LAUNCHER__
