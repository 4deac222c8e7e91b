#ifndef __STA_TMUX_CONTROLLER__
#define __STA_TMUX_CONTROLLER__

#include "Headers.hpp"
#include "MultiplexerController.hpp"
#include "SubprocessUtils.hpp"

namespace sta {
/**
 * @brief MultiplexerController backed by the `tmux` binary.
 *
 * Each operation is one or more separate `tmux` invocations. Panes are
 * labelled with their pane title and the session keeps `remain-on-exit` on,
 * so a tunnel whose ssh died stays visible as a dead pane.
 */
class TmuxController : public MultiplexerController {
 public:
  explicit TmuxController(shared_ptr<SubprocessUtils> subprocessUtils)
      : subprocessUtils_(subprocessUtils) {}
  virtual ~TmuxController() {}

  virtual bool isAvailable();
  virtual bool hasSession(const string& session);
  virtual void createSession(const string& session, const string& title,
                             const vector<string>& argv);
  virtual void splitPane(const string& session, const string& title,
                         const vector<string>& argv);
  virtual void selectLayout(const string& session, const string& layout);
  virtual vector<PaneInfo> listPanes(const string& session);
  virtual void killSession(const string& session);
  virtual void attach(const string& session);

  /**
   * @brief Parses `list-panes` output produced with PANE_FORMAT.
   * @throws MultiplexerException on a malformed line.
   */
  static vector<PaneInfo> parsePaneList(const string& output);

  static const string TMUX_BIN;
  static const char FIELD_SEPARATOR;
  static const string PANE_FORMAT;
  static const string WINDOW_NAME;

 private:
  /**
   * @brief Runs tmux and throws MultiplexerException on a non-zero exit.
   * @return tmux's stdout.
   */
  string runChecked(const vector<string>& args);

  /** @brief Sets the pane title used to find the group again. */
  void labelPane(const string& paneId, const string& title);

  shared_ptr<SubprocessUtils> subprocessUtils_;
};
}  // namespace sta

#endif  // __STA_TMUX_CONTROLLER__
