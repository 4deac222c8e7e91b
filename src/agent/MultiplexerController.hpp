#ifndef __STA_MULTIPLEXER_CONTROLLER__
#define __STA_MULTIPLEXER_CONTROLLER__

#include "Headers.hpp"

namespace sta {
/**
 * @brief One pane of a multiplexer session as the multiplexer reports it.
 */
struct PaneInfo {
  int index = 0;
  string title;
  pid_t pid = 0;
  /** The pane's process exited and the pane was kept around. */
  bool dead = false;
  int exitStatus = 0;
};

/**
 * @brief Session and pane operations of a terminal multiplexer.
 *
 * Every mutating call either succeeds or throws MultiplexerException.
 */
class MultiplexerController {
 public:
  virtual ~MultiplexerController() {}

  /** @brief True if the multiplexer binary can be found. */
  virtual bool isAvailable() = 0;

  virtual bool hasSession(const string& session) = 0;

  /**
   * @brief Creates a detached session whose first pane runs `argv`.
   * @param title Label stored on the pane, used to match it back later.
   */
  virtual void createSession(const string& session, const string& title,
                             const vector<string>& argv) = 0;

  /** @brief Adds a pane running `argv` to an existing session. */
  virtual void splitPane(const string& session, const string& title,
                         const vector<string>& argv) = 0;

  virtual void selectLayout(const string& session, const string& layout) = 0;

  virtual vector<PaneInfo> listPanes(const string& session) = 0;

  /** @brief Destroys the session and every process inside it. */
  virtual void killSession(const string& session) = 0;

  /**
   * @brief Hands the caller's terminal to the session. Blocks until the user
   * detaches.
   */
  virtual void attach(const string& session) = 0;
};

/**
 * @brief Thrown when a multiplexer command fails.
 */
class MultiplexerException : public std::exception {
 public:
  explicit MultiplexerException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};
}  // namespace sta

#endif  // __STA_MULTIPLEXER_CONTROLLER__
