#ifndef __STA_HEADERS__
#define __STA_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <fcntl.h>
#include <paths.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <ctype.h>
#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#if __has_include(<filesystem>)
#include <filesystem>
namespace fs = std::filesystem;
#else
#include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#endif

#include "easylogging++.h"
#include "ust.hpp"

using namespace std;

// Name used for the binary, the tmux session, the config directory and the
// log directory.
const string AGENT_NAME = "ssh-tunnel-agent";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef STA_VERSION
#define STA_VERSION "unknown"
#endif

namespace sta {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

/**
 * @brief Splits on runs of whitespace, dropping empty tokens.
 */
inline std::vector<std::string> splitWhitespace(const std::string &s) {
  std::vector<std::string> elems;
  std::istringstream ss(s);
  std::string item;
  while (ss >> item) {
    elems.push_back(item);
  }
  return elems;
}

inline std::string trim(const std::string &s) {
  const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == std::string::npos) return "";
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

inline string joinArgs(const vector<string> &args) {
  string joined;
  for (const auto &arg : args) {
    if (!joined.empty()) joined += " ";
    joined += arg;
  }
  return joined;
}

inline string GetTempDirectory() {
  const char *tmpDir = ::getenv("TMPDIR");
  if (tmpDir != NULL && tmpDir[0] != '\0') {
    string dir(tmpDir);
    if (dir.back() != '/') dir += "/";
    return dir;
  }
  return string(_PATH_TMP);
}

inline string GetHomeDirectory() {
  const char *home = ::getenv("HOME");
  if (home != NULL && home[0] != '\0') {
    return string(home);
  }
  passwd *pwd = getpwuid(getuid());
  if (pwd == NULL || pwd->pw_dir == NULL) {
    return "";
  }
  return string(pwd->pw_dir);
}

inline string GetOsUserName() {
  const char *user = ::getenv("USER");
  if (user != NULL && user[0] != '\0') {
    return string(user);
  }
  passwd *pwd = getpwuid(getuid());
  if (pwd == NULL || pwd->pw_name == NULL) {
    return to_string(getuid());
  }
  return string(pwd->pw_name);
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace sta

#endif
