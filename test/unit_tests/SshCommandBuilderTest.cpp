#include "SshCommandBuilder.hpp"
#include "TestHeaders.hpp"

using namespace sta;
using Catch::Matchers::ContainsSubstring;

namespace {
ConnectionSettings testSettings() {
  ConnectionSettings settings;
  settings.host = "bastion.example.com";
  settings.port = 2222;
  settings.user = "alice";
  settings.terminalType = "screen-256color";
  return settings;
}

const vector<string> FIXED_FLAGS = {
    "-N",
    "-T",
    "-o",
    "BatchMode=yes",
    "-o",
    "ExitOnForwardFailure=yes",
    "-o",
    "ServerAliveInterval=30",
    "-o",
    "ServerAliveCountMax=3",
    "-o",
    "SetEnv=TERM=screen-256color",
    "-p",
    "2222",
};
}  // namespace

TEST_CASE("Builds the full ssh argument vector", "[SshCommandBuilder]") {
  auto command = buildSshArguments(testSettings(), "web",
                                   "L:8080:web:80 D:1080 R:9000:localhost:3000");

  REQUIRE(command.ok());
  REQUIRE(command.errors.empty());
  vector<string> expected = FIXED_FLAGS;
  expected.insert(expected.end(),
                  {"-L", "localhost:8080:web:80", "-D", "1080", "-R",
                   "9000:localhost:3000", "alice@bastion.example.com"});
  REQUIRE(command.args == expected);
  REQUIRE(command.specs.size() == 3);
}

TEST_CASE("Forward flags follow token order", "[SshCommandBuilder]") {
  auto command = buildSshArguments(testSettings(), "web",
                                   "L:9001:b:91 L:9000:a:90 L:9002:c:92");

  vector<string> forwards;
  for (size_t i = 0; i < command.args.size(); i++) {
    if (command.args[i] == "-L") {
      forwards.push_back(command.args[i + 1]);
    }
  }
  REQUIRE(forwards == vector<string>{"localhost:9001:b:91",
                                     "localhost:9000:a:90",
                                     "localhost:9002:c:92"});
}

TEST_CASE("Invalid tokens are dropped but reported", "[SshCommandBuilder]") {
  auto command =
      buildSshArguments(testSettings(), "web", "L:8080:web:80 D:bogus");

  REQUIRE(command.ok());
  REQUIRE(command.specs.size() == 1);
  REQUIRE(command.errors.size() == 1);
  REQUIRE(std::count(command.args.begin(), command.args.end(), "-D") == 0);
  REQUIRE(std::count(command.args.begin(), command.args.end(),
                     "localhost:8080:web:80") == 1);
}

TEST_CASE("Destination omits an empty user", "[SshCommandBuilder]") {
  ConnectionSettings settings = testSettings();
  settings.user = "";
  auto command = buildSshArguments(settings, "socks", "D:1080");

  REQUIRE(command.args.back() == "bastion.example.com");
}

TEST_CASE("Group without usable specs fails to build", "[SshCommandBuilder]") {
  SECTION("All tokens invalid") {
    auto command = buildSshArguments(testSettings(), "broken", "X:1 D:nope");
    REQUIRE_FALSE(command.ok());
    REQUIRE(command.args.empty());
    REQUIRE(command.errors.size() == 2);

    REQUIRE_THROWS_WITH(
        buildSshArgumentsOrThrow(testSettings(), "broken", "X:1 D:nope"),
        ContainsSubstring("Tunnel group 'broken' (\"X:1 D:nope\")") &&
            ContainsSubstring("unknown forward type 'X'") &&
            ContainsSubstring("local port 'nope' is not numeric"));
  }

  SECTION("Empty text") {
    auto command = buildSshArguments(testSettings(), "empty", "");
    REQUIRE_FALSE(command.ok());
    REQUIRE_THAT(command.errors[0],
                 ContainsSubstring("no forward specs configured"));
    REQUIRE_THROWS_AS(buildSshArgumentsOrThrow(testSettings(), "empty", ""),
                      TunnelBuildException);
  }
}

TEST_CASE("Maps each forward type to its ssh flag", "[SshCommandBuilder]") {
  REQUIRE(forwardFlag(ForwardSpec::local(5432, "db", 5432)) ==
          vector<string>{"-L", "localhost:5432:db:5432"});
  REQUIRE(forwardFlag(ForwardSpec::dynamic(1080)) ==
          vector<string>{"-D", "1080"});
  REQUIRE(forwardFlag(ForwardSpec::remote(9000, "127.0.0.1", 3000)) ==
          vector<string>{"-R", "9000:127.0.0.1:3000"});
}
