#include "SshLauncher.hpp"

namespace sta {
const string SshLauncher::SSH_BIN = "ssh";

optional<string> SshLauncher::resolve() {
  if (!sshPath_) {
    sshPath_ = subprocessUtils_->FindOnPath(SSH_BIN);
    if (sshPath_) {
      VLOG(1) << "Using ssh at " << *sshPath_;
    }
  }
  return sshPath_;
}

bool SshLauncher::isAvailable() { return resolve().has_value(); }

vector<string> SshLauncher::launchCommand(const vector<string>& args) {
  auto path = resolve();
  vector<string> argv;
  // Fall back to the bare name and let the pane report the exec failure.
  argv.push_back(path ? *path : SSH_BIN);
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

bool SshLauncher::isAlive(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  // EPERM means the process exists but belongs to someone else.
  return errno == EPERM;
}
}  // namespace sta
