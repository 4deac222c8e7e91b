#ifndef __STA_SESSION_ORCHESTRATOR__
#define __STA_SESSION_ORCHESTRATOR__

#include "AgentConfig.hpp"
#include "Headers.hpp"
#include "MultiplexerController.hpp"
#include "SecureTransportLauncher.hpp"
#include "SshCommandBuilder.hpp"
#include "TunnelUtils.hpp"

namespace sta {
/**
 * @brief What `start` did.
 */
struct StartOutcome {
  /** The session existed already, nothing was created. */
  bool alreadyRunning = false;
  /** Groups that got a pane, in pane order. */
  vector<string> startedGroups;
  /** Groups dropped because none of their specs parsed. */
  vector<string> skippedGroups;
};

/**
 * @brief One configured tunnel group as seen by `status`.
 */
struct GroupStatus {
  string name;
  vector<ForwardSpec> forwards;
  /** A pane labelled with this group exists in the session. */
  bool paneFound = false;
  /** The pane is not dead and its ssh process still exists. */
  bool alive = false;
  /** Exit status of the pane's process when it is dead. */
  int exitStatus = 0;
};

struct SessionStatus {
  bool running = false;
  /** Configured groups with at least one valid forward spec. */
  vector<GroupStatus> groups;
  /** Configured groups that start skips because no spec parses. */
  vector<string> invalidGroups;
  /** Panes whose title matches no configured group. */
  vector<PaneInfo> unknownPanes;
};

/** @brief Text printed by `list`. */
string formatTunnelList(const AgentConfig& config);

/**
 * @brief Reconciles the configured tunnel groups with the one multiplexer
 * session that runs them.
 *
 * The session is either absent or running. Each group that builds becomes
 * one pane running one ssh process; panes are created in group name order.
 * The pane set is fixed when the session is created, so configuration
 * changes need a restart.
 */
class SessionOrchestrator {
 public:
  SessionOrchestrator(const AgentConfig& config,
                      shared_ptr<MultiplexerController> multiplexer,
                      shared_ptr<SecureTransportLauncher> launcher);
  virtual ~SessionOrchestrator() {}

  /**
   * @brief Throws SessionException if a required external program is
   * missing. The ssh client is only needed when panes will be created.
   */
  void checkDependencies(bool needsTransport);

  /**
   * @brief Creates the session unless it already exists.
   *
   * Groups without a usable spec are logged and skipped. Starting an already
   * running session is a successful no-op. Does not attach; call attach()
   * afterwards for that.
   * @throws SessionException if no group survives or the multiplexer fails;
   * a partially created session is removed first.
   */
  StartOutcome start();

  /**
   * @brief Kills the whole session.
   * @return false if there was no session to stop.
   */
  bool stop();

  /** @brief stop, RESTART_DELAY, start. Always runs all three. */
  StartOutcome restart();

  /** @brief Read-only view of the session and the configured groups. */
  SessionStatus status();

  /**
   * @brief Configured groups with their raw spec text, the config source and
   * the destination. Does not touch the session.
   */
  string list() const { return formatTunnelList(config_); }

  /**
   * @brief Takes over the terminal until the user detaches.
   * @throws SessionException if the session is not running.
   */
  void attach();

  bool isRunning();

  static const string SESSION_NAME;
  static const string EVEN_LAYOUT;
  /** Time for old ssh processes to release their listening ports. */
  static const std::chrono::milliseconds RESTART_DELAY;

 protected:
  virtual void waitBeforeRestart();

 private:
  const AgentConfig& config_;
  shared_ptr<MultiplexerController> multiplexer_;
  shared_ptr<SecureTransportLauncher> launcher_;
};

/** @brief Text printed by `status`. */
string formatStatus(const SessionStatus& status);

/**
 * @brief Thrown when a session operation cannot complete.
 */
class SessionException : public std::exception {
 public:
  explicit SessionException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};
}  // namespace sta

#endif  // __STA_SESSION_ORCHESTRATOR__
