#include "AgentCli.hpp"
#include "AgentConfig.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "SessionOrchestrator.hpp"
#include "SshLauncher.hpp"
#include "SubprocessUtils.hpp"
#include "TmuxController.hpp"

using namespace sta;

namespace {
void printStartOutcome(const StartOutcome& outcome, const string& logFile) {
  if (outcome.alreadyRunning) {
    CLOG(INFO, "stdout") << "Session '" << SessionOrchestrator::SESSION_NAME
                         << "' is already running" << endl;
    return;
  }
  CLOG(INFO, "stdout") << "Started " << outcome.startedGroups.size()
                       << " tunnel group(s): "
                       << joinArgs(outcome.startedGroups) << endl;
  if (!outcome.skippedGroups.empty()) {
    cerr << "Skipped invalid tunnel group(s): "
         << joinArgs(outcome.skippedGroups) << " (details in " << logFile
         << ")" << endl;
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  // Nothing is written until the log file is known
  el::Loggers::reconfigureLogger("default", defaultConf);

  sta::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, sta::InterruptSignalHandler);

  cxxopts::Options options = buildAgentOptions();
  AgentCommandLine commandLine;
  try {
    commandLine = parseAgentCommandLine(options, argc, argv);
  } catch (const CommandLineException& cle) {
    return reportUsageError(cle.what(), options, cerr);
  }

  const string& command = commandLine.command;
  if (command == "help") {
    CLOG(INFO, "stdout") << options.help({}) << endl;
    return 0;
  }
  if (command == "version") {
    CLOG(INFO, "stdout") << AGENT_NAME << " version " << STA_VERSION << endl;
    return 0;
  }

  try {
    string logFile =
        LogHandler::setupLogFile(&defaultConf, commandLine.logDirectory,
                                 AGENT_NAME + ".log", commandLine.logToStdout);
    if (commandLine.verbose) {
      LogHandler::setVerbosity(&defaultConf, *commandLine.verbose);
    }
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("agent-main");

    AgentConfig config;
    if (commandLine.configFile) {
      config = loadAgentConfigFile(*commandLine.configFile);
    } else {
      config = loadAgentConfig(defaultConfigCandidates());
    }

    // command line verbosity wins over the config file
    if (!commandLine.verbose) {
      LogHandler::setVerbosity(&defaultConf, config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    el::Loggers::reconfigureLogger("default", defaultConf);

    LOG(INFO) << "Running '" << command << "'";

    auto subprocessUtils = make_shared<SubprocessUtils>();
    auto multiplexer = make_shared<TmuxController>(subprocessUtils);
    auto launcher = make_shared<SshLauncher>(subprocessUtils);
    SessionOrchestrator orchestrator(config, multiplexer, launcher);

    if (command == "start" || command == "restart") {
      orchestrator.checkDependencies(true);
      StartOutcome outcome = command == "start" ? orchestrator.start()
                                                : orchestrator.restart();
      printStartOutcome(outcome, logFile);
      if (commandLine.attach) {
        orchestrator.attach();
      }
    } else if (command == "stop") {
      orchestrator.checkDependencies(false);
      if (orchestrator.stop()) {
        CLOG(INFO, "stdout") << "Session '" << SessionOrchestrator::SESSION_NAME
                             << "' stopped" << endl;
      } else {
        CLOG(INFO, "stdout") << "Session '" << SessionOrchestrator::SESSION_NAME
                             << "' is not running" << endl;
      }
    } else if (command == "status") {
      orchestrator.checkDependencies(false);
      CLOG(INFO, "stdout") << formatStatus(orchestrator.status()) << endl;
    } else if (command == "list") {
      CLOG(INFO, "stdout") << orchestrator.list() << endl;
    } else if (command == "attach") {
      orchestrator.checkDependencies(false);
      orchestrator.attach();
    }
  } catch (const ConfigException& ce) {
    LOG(ERROR) << ce.what();
    cerr << "Error: " << ce.what() << endl;
    return 1;
  } catch (const SessionException& se) {
    LOG(ERROR) << se.what();
    cerr << "Error: " << se.what() << endl;
    return 1;
  } catch (const MultiplexerException& me) {
    LOG(ERROR) << me.what();
    cerr << "Error: " << me.what() << endl;
    return 1;
  }

  LOG(INFO) << "Done";
  return 0;
}
