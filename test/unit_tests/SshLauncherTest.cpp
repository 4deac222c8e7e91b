#include "SshLauncher.hpp"
#include "TestHeaders.hpp"

using namespace sta;

namespace {
class PathLookupSubprocessUtils : public SubprocessUtils {
 public:
  virtual optional<string> FindOnPath(const string& binary) {
    lookups++;
    if (!found) {
      return nullopt;
    }
    return "/opt/openssh/bin/" + binary;
  }

  bool found = true;
  int lookups = 0;
};
}  // namespace

TEST_CASE("Launch command starts with the resolved ssh path",
          "[SshLauncher]") {
  auto subprocess = make_shared<PathLookupSubprocessUtils>();
  SshLauncher launcher(subprocess);

  REQUIRE(launcher.isAvailable());
  REQUIRE(launcher.launchCommand({"-N", "host"}) ==
          vector<string>{"/opt/openssh/bin/ssh", "-N", "host"});
  // Resolved once and cached
  REQUIRE(subprocess->lookups == 1);
}

TEST_CASE("Missing ssh falls back to the bare name", "[SshLauncher]") {
  auto subprocess = make_shared<PathLookupSubprocessUtils>();
  subprocess->found = false;
  SshLauncher launcher(subprocess);

  REQUIRE_FALSE(launcher.isAvailable());
  REQUIRE(launcher.launchCommand({"host"}) ==
          vector<string>{"ssh", "host"});
}

TEST_CASE("Liveness checks the process table", "[SshLauncher]") {
  SshLauncher launcher(make_shared<PathLookupSubprocessUtils>());

  REQUIRE(launcher.isAlive(::getpid()));
  REQUIRE_FALSE(launcher.isAlive(0));
  REQUIRE_FALSE(launcher.isAlive(-1));

  pid_t child = ::fork();
  if (child == 0) {
    ::_exit(0);
  }
  REQUIRE(child > 0);
  int status = 0;
  REQUIRE(::waitpid(child, &status, 0) == child);
  REQUIRE_FALSE(launcher.isAlive(child));
}
