#include "SessionOrchestrator.hpp"

namespace sta {
const string SessionOrchestrator::SESSION_NAME = AGENT_NAME;
const string SessionOrchestrator::EVEN_LAYOUT = "tiled";
const std::chrono::milliseconds SessionOrchestrator::RESTART_DELAY(1000);

SessionOrchestrator::SessionOrchestrator(
    const AgentConfig& config, shared_ptr<MultiplexerController> multiplexer,
    shared_ptr<SecureTransportLauncher> launcher)
    : config_(config), multiplexer_(multiplexer), launcher_(launcher) {}

void SessionOrchestrator::checkDependencies(bool needsTransport) {
  if (!multiplexer_->isAvailable()) {
    throw SessionException(
        "Terminal multiplexer (tmux) not found on PATH, please install it");
  }
  if (needsTransport && !launcher_->isAvailable()) {
    throw SessionException("ssh client not found on PATH, please install it");
  }
}

bool SessionOrchestrator::isRunning() {
  return multiplexer_->hasSession(SESSION_NAME);
}

StartOutcome SessionOrchestrator::start() {
  StartOutcome outcome;
  if (isRunning()) {
    LOG(INFO) << "Session '" << SESSION_NAME
              << "' already running, nothing to start";
    outcome.alreadyRunning = true;
    return outcome;
  }

  vector<pair<string, SshCommand>> commands;
  for (const auto& it : config_.tunnels) {
    const string& name = it.first;
    const string& rawSpecText = it.second;
    try {
      SshCommand command =
          buildSshArgumentsOrThrow(config_.connection, name, rawSpecText);
      // The group survives, but still report the tokens that were dropped.
      for (const auto& error : command.errors) {
        LOG(ERROR) << error;
      }
      commands.emplace_back(name, command);
    } catch (const TunnelBuildException& tbe) {
      LOG(ERROR) << tbe.what();
      LOG(ERROR) << "Skipping tunnel group '" << name << "'";
      outcome.skippedGroups.push_back(name);
    }
  }

  if (commands.empty()) {
    string reason = config_.tunnels.empty()
                        ? "no tunnel groups are configured"
                        : "none of the configured tunnel groups is valid";
    LOG(ERROR) << "Not starting session '" << SESSION_NAME << "': " << reason;
    throw SessionException("Cannot start session '" + SESSION_NAME +
                           "': " + reason);
  }

  bool created = false;
  try {
    for (const auto& it : commands) {
      const string& name = it.first;
      vector<string> argv = launcher_->launchCommand(it.second.args);
      LOG(INFO) << "Starting tunnel group '" << name
                << "': " << joinArgs(argv);
      if (!created) {
        multiplexer_->createSession(SESSION_NAME, name, argv);
        created = true;
      } else {
        multiplexer_->splitPane(SESSION_NAME, name, argv);
      }
      outcome.startedGroups.push_back(name);
    }
    if (commands.size() > 1) {
      multiplexer_->selectLayout(SESSION_NAME, EVEN_LAYOUT);
    }
  } catch (const MultiplexerException& me) {
    LOG(ERROR) << "Failed to start session '" << SESSION_NAME
               << "': " << me.what();
    if (created) {
      try {
        multiplexer_->killSession(SESSION_NAME);
        LOG(INFO) << "Removed partially created session '" << SESSION_NAME
                  << "'";
      } catch (const MultiplexerException& cleanupError) {
        LOG(ERROR) << "Could not remove partially created session: "
                   << cleanupError.what();
      }
    }
    throw SessionException("Failed to start session '" + SESSION_NAME +
                           "': " + me.what());
  }

  LOG(INFO) << "Session '" << SESSION_NAME << "' started with "
            << outcome.startedGroups.size() << " pane(s), "
            << outcome.skippedGroups.size() << " group(s) skipped";
  return outcome;
}

bool SessionOrchestrator::stop() {
  if (!isRunning()) {
    LOG(INFO) << "Session '" << SESSION_NAME << "' not running, nothing to stop";
    return false;
  }
  multiplexer_->killSession(SESSION_NAME);
  LOG(INFO) << "Session '" << SESSION_NAME << "' stopped";
  return true;
}

StartOutcome SessionOrchestrator::restart() {
  LOG(INFO) << "Restarting session '" << SESSION_NAME << "'";
  stop();
  waitBeforeRestart();
  return start();
}

void SessionOrchestrator::waitBeforeRestart() {
  VLOG(1) << "Waiting " << RESTART_DELAY.count()
          << "ms for tunnel ports to be released";
  std::this_thread::sleep_for(RESTART_DELAY);
}

SessionStatus SessionOrchestrator::status() {
  SessionStatus status;
  if (!isRunning()) {
    return status;
  }
  status.running = true;
  vector<PaneInfo> panes = multiplexer_->listPanes(SESSION_NAME);

  set<string> matchedTitles;
  for (const auto& it : config_.tunnels) {
    GroupStatus group;
    group.name = it.first;
    group.forwards = parseGroupSpecs(it.first, it.second).specs;
    if (group.forwards.empty()) {
      VLOG(1) << "Group '" << group.name << "' has no valid forward spec";
      status.invalidGroups.push_back(group.name);
      continue;
    }
    for (const auto& pane : panes) {
      if (pane.title != group.name) {
        continue;
      }
      group.paneFound = true;
      group.alive = !pane.dead && launcher_->isAlive(pane.pid);
      group.exitStatus = pane.exitStatus;
      matchedTitles.insert(pane.title);
      break;
    }
    VLOG(1) << "Group '" << group.name << "' pane="
            << (group.paneFound ? "yes" : "no")
            << " alive=" << (group.alive ? "yes" : "no");
    status.groups.push_back(group);
  }
  for (const auto& pane : panes) {
    if (matchedTitles.find(pane.title) == matchedTitles.end()) {
      status.unknownPanes.push_back(pane);
    }
  }
  return status;
}

void SessionOrchestrator::attach() {
  if (!isRunning()) {
    throw SessionException("Session '" + SESSION_NAME +
                           "' is not running, run '" + AGENT_NAME +
                           " start' first");
  }
  LOG(INFO) << "Attaching to session '" << SESSION_NAME << "'";
  multiplexer_->attach(SESSION_NAME);
}

string formatStatus(const SessionStatus& status) {
  std::ostringstream out;
  if (!status.running) {
    out << "Session '" << SessionOrchestrator::SESSION_NAME
        << "' is not running";
    return out.str();
  }
  out << "Session '" << SessionOrchestrator::SESSION_NAME << "' is running";
  for (const auto& group : status.groups) {
    out << "\n  " << group.name << " [";
    if (!group.paneFound) {
      out << "not started";
    } else if (group.alive) {
      out << "alive";
    } else {
      out << "exited with status " << group.exitStatus;
    }
    out << "]";
    for (const auto& spec : group.forwards) {
      out << "\n    " << describeForwardSpec(spec);
    }
  }
  for (const auto& name : status.invalidGroups) {
    out << "\n  " << name << " [invalid, skipped]";
  }
  for (const auto& pane : status.unknownPanes) {
    out << "\n  pane " << pane.index << " '" << pane.title
        << "' [unknown group]";
  }
  return out.str();
}

string formatTunnelList(const AgentConfig& config) {
  std::ostringstream out;
  out << "Config: "
      << (config.source.empty() ? string("built-in defaults") : config.source)
      << "\n";
  out << "Destination: ";
  if (!config.connection.user.empty()) {
    out << config.connection.user << "@";
  }
  out << config.connection.host << ":" << config.connection.port << "\n";
  if (config.tunnels.empty()) {
    out << "No tunnel groups configured";
    return out.str();
  }
  out << "Tunnel groups:";
  size_t width = 0;
  for (const auto& it : config.tunnels) {
    width = std::max(width, it.first.length());
  }
  for (const auto& it : config.tunnels) {
    out << "\n  " << it.first << string(width - it.first.length() + 2, ' ')
        << it.second;
  }
  return out.str();
}
}  // namespace sta
