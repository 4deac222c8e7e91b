#include "TmuxController.hpp"

namespace sta {
const string TmuxController::TMUX_BIN = "tmux";
// tmux prints control characters in formats as '_', so the separator must be
// printable. The title goes last because it is the only free-form field.
const char TmuxController::FIELD_SEPARATOR = '|';
const string TmuxController::PANE_FORMAT =
    "#{pane_index}|#{pane_pid}|#{pane_dead}|#{pane_dead_status}|#{pane_title}";
const string TmuxController::WINDOW_NAME = "tunnels";

namespace {
string exactSession(const string& session) { return "=" + session; }

int parseNumberField(const string& field, const string& line) {
  if (field.empty()) {
    return 0;
  }
  try {
    size_t consumed = 0;
    int value = stoi(field, &consumed);
    if (consumed == field.length()) {
      return value;
    }
  } catch (const std::logic_error&) {
  }
  throw MultiplexerException("Unexpected tmux list-panes line: " + line);
}
}  // namespace

bool TmuxController::isAvailable() {
  return subprocessUtils_->FindOnPath(TMUX_BIN).has_value();
}

string TmuxController::runChecked(const vector<string>& args) {
  LOG(DEBUG) << "tmux " << joinArgs(args);
  SubprocessResult result = subprocessUtils_->Run(TMUX_BIN, args);
  if (!result.ok()) {
    string message = "tmux " + args[0] + " failed (exit " +
                     to_string(result.exitCode) + ")";
    string error = trim(result.error);
    if (!error.empty()) {
      message += ": " + error;
    }
    throw MultiplexerException(message);
  }
  return result.output;
}

void TmuxController::labelPane(const string& paneId, const string& title) {
  runChecked({"select-pane", "-t", paneId, "-T", title});
}

bool TmuxController::hasSession(const string& session) {
  LOG(DEBUG) << "tmux has-session -t " << exactSession(session);
  SubprocessResult result = subprocessUtils_->Run(
      TMUX_BIN, {"has-session", "-t", exactSession(session)});
  return result.ok();
}

void TmuxController::createSession(const string& session, const string& title,
                                   const vector<string>& argv) {
  vector<string> args = {"new-session", "-d",  "-s", session, "-n",
                         WINDOW_NAME,   "-P",  "-F", "#{pane_id}"};
  args.insert(args.end(), argv.begin(), argv.end());
  // Chained in the same invocation so the option is in place before the
  // first ssh can exit.
  args.insert(args.end(), {";", "set-window-option", "-t", session,
                           "remain-on-exit", "on"});
  string paneId = trim(runChecked(args));
  labelPane(paneId, title);
}

void TmuxController::splitPane(const string& session, const string& title,
                               const vector<string>& argv) {
  vector<string> args = {"split-window", "-d", "-t", session,
                         "-P",           "-F", "#{pane_id}"};
  args.insert(args.end(), argv.begin(), argv.end());
  string paneId = trim(runChecked(args));
  // Re-tile so the next split still has room.
  selectLayout(session, "tiled");
  labelPane(paneId, title);
}

void TmuxController::selectLayout(const string& session,
                                  const string& layout) {
  runChecked({"select-layout", "-t", session, layout});
}

vector<PaneInfo> TmuxController::listPanes(const string& session) {
  return parsePaneList(
      runChecked({"list-panes", "-s", "-t", session, "-F", PANE_FORMAT}));
}

void TmuxController::killSession(const string& session) {
  runChecked({"kill-session", "-t", exactSession(session)});
}

void TmuxController::attach(const string& session) {
  vector<string> args;
  if (::getenv("TMUX") != NULL) {
    // Already inside tmux: nesting is refused, so switch instead.
    args = {"switch-client", "-t", exactSession(session)};
  } else {
    args = {"attach-session", "-t", exactSession(session)};
  }
  LOG(DEBUG) << "tmux " << joinArgs(args);
  int exitCode = subprocessUtils_->RunInteractive(TMUX_BIN, args);
  if (exitCode != 0) {
    throw MultiplexerException("tmux " + args[0] + " failed (exit " +
                               to_string(exitCode) + ")");
  }
}

vector<PaneInfo> TmuxController::parsePaneList(const string& output) {
  vector<PaneInfo> panes;
  for (const auto& rawLine : split(output, '\n')) {
    string line = rawLine;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (trim(line).empty()) {
      continue;
    }
    vector<string> fields;
    size_t start = 0;
    for (int i = 0; i < 4; i++) {
      size_t separator = line.find(FIELD_SEPARATOR, start);
      if (separator == string::npos) {
        throw MultiplexerException("Unexpected tmux list-panes line: " + line);
      }
      fields.push_back(line.substr(start, separator - start));
      start = separator + 1;
    }
    PaneInfo pane;
    pane.index = parseNumberField(fields[0], line);
    pane.pid = static_cast<pid_t>(parseNumberField(fields[1], line));
    pane.dead = parseNumberField(fields[2], line) != 0;
    pane.exitStatus = parseNumberField(fields[3], line);
    pane.title = line.substr(start);
    panes.push_back(pane);
  }
  return panes;
}
}  // namespace sta
