#include "AgentCli.hpp"
#include "TestHeaders.hpp"

using namespace sta;
using Catch::Matchers::ContainsSubstring;

namespace {
AgentCommandLine parse(const vector<string>& args) {
  vector<const char*> argv = {"ssh-tunnel-agent"};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  cxxopts::Options options = buildAgentOptions();
  return parseAgentCommandLine(options, static_cast<int>(argv.size()),
                               argv.data());
}
}  // namespace

TEST_CASE("Accepts every command", "[AgentCli]") {
  for (const auto& command : AGENT_COMMANDS) {
    INFO("Command " << command);
    REQUIRE(parse({command}).command == command);
  }
}

TEST_CASE("Parses options around the command", "[AgentCli]") {
  auto commandLine = parse({"-c", "/tmp/agent.cfg", "start", "--attach",
                            "--verbose", "3", "-l", "/tmp/agent-logs",
                            "--logtostdout"});

  REQUIRE(commandLine.command == "start");
  REQUIRE(commandLine.attach);
  REQUIRE(commandLine.configFile == optional<string>("/tmp/agent.cfg"));
  REQUIRE(commandLine.verbose == optional<int>(3));
  REQUIRE(commandLine.logDirectory == "/tmp/agent-logs");
  REQUIRE(commandLine.logToStdout);
}

TEST_CASE("Defaults when no option is given", "[AgentCli]") {
  auto commandLine = parse({"status"});

  REQUIRE_FALSE(commandLine.attach);
  REQUIRE_FALSE(commandLine.configFile.has_value());
  REQUIRE_FALSE(commandLine.verbose.has_value());
  REQUIRE(commandLine.logDirectory == GetTempDirectory() + AGENT_NAME);
  REQUIRE_FALSE(commandLine.logToStdout);
}

TEST_CASE("Help and version flags become commands", "[AgentCli]") {
  REQUIRE(parse({"--help"}).command == "help");
  REQUIRE(parse({"-h", "start"}).command == "help");
  REQUIRE(parse({"--version"}).command == "version");
}

TEST_CASE("Attach is allowed after start and restart", "[AgentCli]") {
  REQUIRE(parse({"restart", "-a"}).attach);

  for (const string command : {"stop", "status", "list", "attach"}) {
    INFO("Command " << command);
    REQUIRE_THROWS_WITH(
        parse({command, "--attach"}),
        ContainsSubstring("--attach only applies to start and restart"));
  }
}

TEST_CASE("Rejects malformed command lines", "[AgentCli]") {
  SECTION("Missing command") {
    REQUIRE_THROWS_WITH(parse({}), ContainsSubstring("Missing command"));
  }

  SECTION("Unknown command") {
    REQUIRE_THROWS_WITH(parse({"launch"}),
                        ContainsSubstring("Unknown command 'launch'"));
  }

  SECTION("More than one command") {
    REQUIRE_THROWS_WITH(
        parse({"start", "stop"}),
        ContainsSubstring("Expected exactly one command, got: start stop"));
  }

  SECTION("Unknown flag") {
    REQUIRE_THROWS_AS(parse({"start", "--daemon"}), CommandLineException);
  }

  SECTION("Non-numeric verbosity") {
    REQUIRE_THROWS_AS(parse({"start", "--verbose", "loud"}),
                      CommandLineException);
  }
}

TEST_CASE("Verbosity must be between 0 and 9", "[AgentCli]") {
  REQUIRE(parse({"status", "--verbose=0"}).verbose == optional<int>(0));
  REQUIRE(parse({"status", "--verbose=9"}).verbose == optional<int>(9));

  REQUIRE_THROWS_WITH(
      parse({"status", "--verbose=-1"}),
      ContainsSubstring("--verbose must be between 0 and 9, got -1"));
  REQUIRE_THROWS_WITH(parse({"status", "--verbose=10"}),
                      ContainsSubstring("got 10"));
}

TEST_CASE("Usage errors go to stderr with exit code 1", "[AgentCli]") {
  cxxopts::Options options = buildAgentOptions();
  std::ostringstream err;

  int exitCode = reportUsageError("Unknown command 'launch'", options, err);

  REQUIRE(exitCode == 1);
  REQUIRE_THAT(err.str(), ContainsSubstring("Error: Unknown command 'launch'"));
  REQUIRE_THAT(err.str(), ContainsSubstring("restart [--attach]"));
  REQUIRE_THAT(err.str(), ContainsSubstring("--cfgfile"));
}
