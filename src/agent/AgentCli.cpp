#include "AgentCli.hpp"

#include "LogHandler.hpp"

namespace sta {
const set<string> AGENT_COMMANDS = {"start",  "stop",   "restart", "status",
                                    "list",   "attach", "help",    "version"};

cxxopts::Options buildAgentOptions() {
  cxxopts::Options options(AGENT_NAME,
                           "Keeps groups of ssh tunnels running, one tmux "
                           "pane per group");
  options.positional_help("<command>");
  options.custom_help(
      "[OPTION...] <command>\n\n"
      "  Commands:\n"
      "    start [--attach]    start every tunnel group in a tmux session\n"
      "    stop                kill the session and all its tunnels\n"
      "    restart [--attach]  stop, wait for ports to free up, start\n"
      "    status              show the session and each group's forwards\n"
      "    list                show the configured tunnel groups\n"
      "    attach              open the tmux session in this terminal\n"
      "    help                show this help\n"
      "    version             print the version");

  options.add_options()             //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("a,attach", "Attach to the session after start/restart")  //
      ("c,cfgfile", "Location of the config file",
       cxxopts::value<std::string>())  //
      ("v,verbose", "Enable verbose logging (0-9)", cxxopts::value<int>(),
       "LEVEL")  //
      ("l,logdir", "Directory holding the log file",
       cxxopts::value<std::string>()->default_value(
           LogHandler::defaultLogDirectory()))  //
      ("logtostdout", "Write log to stdout")    //
      ("command", "Command to run",
       cxxopts::value<std::vector<std::string>>());

  options.parse_positional({"command"});
  return options;
}

AgentCommandLine parseAgentCommandLine(cxxopts::Options& options, int argc,
                                       const char* const* argv) {
  AgentCommandLine commandLine;
  try {
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      commandLine.command = "help";
      return commandLine;
    }
    if (result.count("version")) {
      commandLine.command = "version";
      return commandLine;
    }

    if (!result.count("command")) {
      throw CommandLineException("Missing command");
    }
    auto commands = result["command"].as<std::vector<std::string>>();
    if (commands.size() != 1) {
      throw CommandLineException("Expected exactly one command, got: " +
                                 joinArgs(commands));
    }
    commandLine.command = commands[0];
    if (AGENT_COMMANDS.find(commandLine.command) == AGENT_COMMANDS.end()) {
      throw CommandLineException("Unknown command '" + commandLine.command +
                                 "'");
    }

    commandLine.attach = result.count("attach") > 0;
    if (commandLine.attach && commandLine.command != "start" &&
        commandLine.command != "restart") {
      throw CommandLineException(
          "--attach only applies to start and restart");
    }

    if (result.count("cfgfile")) {
      commandLine.configFile = result["cfgfile"].as<string>();
    }
    if (result.count("verbose")) {
      int level = result["verbose"].as<int>();
      if (level < 0 || level > MAX_VERBOSE_LEVEL) {
        throw CommandLineException("--verbose must be between 0 and " +
                                   to_string(MAX_VERBOSE_LEVEL) + ", got " +
                                   to_string(level));
      }
      commandLine.verbose = level;
    }
    commandLine.logDirectory = result["logdir"].as<string>();
    commandLine.logToStdout = result.count("logtostdout") > 0;
  } catch (const cxxopts::exceptions::exception& oe) {
    throw CommandLineException(oe.what());
  }
  return commandLine;
}

int reportUsageError(const string& message, const cxxopts::Options& options,
                     std::ostream& err) {
  LOG(ERROR) << message;
  err << "Error: " << message << "\n\n" << options.help({}) << endl;
  return 1;
}
}  // namespace sta
