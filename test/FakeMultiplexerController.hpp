#ifndef __STA_FAKE_MULTIPLEXER_CONTROLLER__
#define __STA_FAKE_MULTIPLEXER_CONTROLLER__

#include "MultiplexerController.hpp"
#include "SecureTransportLauncher.hpp"
#include "TestHeaders.hpp"

namespace sta {
/**
 * @brief In-memory multiplexer that records every mutating call.
 *
 * `calls` holds entries like "create:web", "split:db", "layout:tiled",
 * "kill" and "attach". Setting `failOn` to one of "create", "split",
 * "layout" or "kill" makes that operation throw.
 */
class FakeMultiplexerController : public MultiplexerController {
 public:
  struct LaunchedPane {
    string title;
    vector<string> argv;
  };

  virtual ~FakeMultiplexerController() {}

  virtual bool isAvailable() { return available; }

  virtual bool hasSession(const string& session) {
    hasSessionQueries++;
    return sessionExists && session == sessionName;
  }

  virtual void createSession(const string& session, const string& title,
                             const vector<string>& argv) {
    REQUIRE_FALSE(sessionExists);
    maybeFail("create");
    sessionExists = true;
    sessionName = session;
    addPane(title, argv);
    calls.push_back("create:" + title);
  }

  virtual void splitPane(const string& session, const string& title,
                         const vector<string>& argv) {
    REQUIRE(sessionExists);
    REQUIRE(session == sessionName);
    maybeFail("split");
    addPane(title, argv);
    calls.push_back("split:" + title);
  }

  virtual void selectLayout(const string& session, const string& layout) {
    REQUIRE(sessionExists);
    maybeFail("layout");
    calls.push_back("layout:" + layout);
  }

  virtual vector<PaneInfo> listPanes(const string& session) {
    if (!sessionExists || session != sessionName) {
      throw MultiplexerException("can't find session: " + session);
    }
    return panes;
  }

  virtual void killSession(const string& session) {
    if (!sessionExists || session != sessionName) {
      throw MultiplexerException("can't find session: " + session);
    }
    maybeFail("kill");
    sessionExists = false;
    panes.clear();
    calls.push_back("kill");
  }

  virtual void attach(const string& session) {
    REQUIRE(session == sessionName);
    calls.push_back("attach");
  }

  /** @brief Simulates an existing session, e.g. from an earlier run. */
  void seedSession(const string& session, const vector<string>& titles) {
    sessionExists = true;
    sessionName = session;
    for (const auto& title : titles) {
      addPane(title, {"ssh"});
    }
  }

  /** @brief Marks the pane with this title as exited. */
  void markDead(const string& title, int exitStatus) {
    for (auto& pane : panes) {
      if (pane.title == title) {
        pane.dead = true;
        pane.exitStatus = exitStatus;
      }
    }
  }

  size_t paneCreations() const { return launched.size(); }

  bool available = true;
  bool sessionExists = false;
  string sessionName;
  string failOn;
  int hasSessionQueries = 0;
  vector<PaneInfo> panes;
  vector<LaunchedPane> launched;
  vector<string> calls;

 private:
  void maybeFail(const string& operation) {
    if (failOn == operation) {
      throw MultiplexerException("tmux " + operation + " failed (exit 1)");
    }
  }

  void addPane(const string& title, const vector<string>& argv) {
    PaneInfo pane;
    pane.index = static_cast<int>(panes.size());
    pane.title = title;
    pane.pid = nextPid++;
    panes.push_back(pane);
    launched.push_back({title, argv});
  }

  pid_t nextPid = 1000;
};

/**
 * @brief Launcher that pretends ssh lives at /usr/bin/ssh. Pids listed in
 * `deadPids` are reported as gone.
 */
class FakeTransportLauncher : public SecureTransportLauncher {
 public:
  virtual ~FakeTransportLauncher() {}

  virtual bool isAvailable() { return available; }

  virtual vector<string> launchCommand(const vector<string>& args) {
    vector<string> argv = {"/usr/bin/ssh"};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
  }

  virtual bool isAlive(pid_t pid) {
    return deadPids.find(pid) == deadPids.end();
  }

  bool available = true;
  set<pid_t> deadPids;
};
}  // namespace sta

#endif  // __STA_FAKE_MULTIPLEXER_CONTROLLER__
