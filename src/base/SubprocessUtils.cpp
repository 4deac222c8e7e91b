#include "SubprocessUtils.hpp"

namespace sta {
namespace {
vector<char*> buildArgv(const string& command, vector<string>& storage) {
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (auto& arg : storage) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(NULL);
  return argv;
}

int decodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

int waitForChild(pid_t pid) {
  int status = 0;
  while (true) {
    pid_t rc = waitpid(pid, &status, 0);
    if (rc == -1 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(rc);
    break;
  }
  return decodeWaitStatus(status);
}

[[noreturn]] void execOrDie(const string& command, vector<char*>& argv) {
  execvp(command.c_str(), argv.data());
  // Only reached if exec failed.  Report on the (possibly redirected) stderr
  // and use the shell's "command not found" convention.
  string message = "execvp " + command + ": " + strerror(errno) + "\n";
  ssize_t ignored = ::write(STDERR_FILENO, message.c_str(), message.length());
  (void)ignored;
  _exit(127);
}
}  // namespace

SubprocessResult SubprocessUtils::Run(const string& command,
                                      const vector<string>& args) {
  int outPipe[2];
  int errPipe[2];
  FATAL_FAIL(pipe(outPipe));
  FATAL_FAIL(pipe(errPipe));

  vector<string> argStorage = args;
  vector<char*> argv = buildArgv(command, argStorage);

  VLOG(2) << "Running: " << command << " " << joinArgs(args);
  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid == 0) {
    // child process
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      close(devNull);
    }
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);
    close(outPipe[0]);
    close(outPipe[1]);
    close(errPipe[0]);
    close(errPipe[1]);
    execOrDie(command, argv);
  }

  // parent process
  close(outPipe[1]);
  close(errPipe[1]);

  SubprocessResult result;
  array<char, 4096> buf;
  pollfd fds[2];
  fds[0].fd = outPipe[0];
  fds[0].events = POLLIN;
  fds[1].fd = errPipe[0];
  fds[1].events = POLLIN;
  int openFds = 2;
  while (openFds > 0) {
    int rc = poll(fds, 2, -1);
    if (rc == -1 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(rc);
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || fds[i].revents == 0) {
        continue;
      }
      ssize_t nbytes = read(fds[i].fd, buf.data(), buf.size());
      if (nbytes == -1 && errno == EINTR) {
        continue;
      }
      if (nbytes <= 0) {
        close(fds[i].fd);
        fds[i].fd = -1;
        openFds--;
        continue;
      }
      string& target = (i == 0) ? result.output : result.error;
      target.append(buf.data(), nbytes);
    }
  }

  result.exitCode = waitForChild(pid);
  VLOG(2) << command << " exited with " << result.exitCode;
  return result;
}

int SubprocessUtils::RunInteractive(const string& command,
                                    const vector<string>& args) {
  vector<string> argStorage = args;
  vector<char*> argv = buildArgv(command, argStorage);

  VLOG(1) << "Running interactively: " << command << " " << joinArgs(args);
  pid_t pid = fork();
  FATAL_FAIL(pid);
  if (pid == 0) {
    execOrDie(command, argv);
  }
  return waitForChild(pid);
}

optional<string> SubprocessUtils::FindOnPath(const string& binary) {
  if (binary.empty()) {
    return nullopt;
  }
  if (binary.find('/') != string::npos) {
    if (::access(binary.c_str(), X_OK) == 0) {
      return binary;
    }
    return nullopt;
  }
  const char* pathEnv = ::getenv("PATH");
  string path = pathEnv ? string(pathEnv) : string("/usr/bin:/bin");
  for (auto dir : split(path, ':')) {
    if (dir.empty()) {
      dir = ".";
    }
    string candidate = dir + "/" + binary;
    struct stat st;
    if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
        ::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return nullopt;
}

}  // namespace sta
