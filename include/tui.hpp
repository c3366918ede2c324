#ifndef FASTGH_TUI_HPP
#define FASTGH_TUI_HPP

#include <curses.h>

#include "git_runner.hpp"
#include "log.hpp"
#include "models.hpp"
#include "preferences.hpp"
#include "refresh_driver.hpp"
#include "repo_browser.hpp"
#include "session_registry.hpp"
#include "task_runner.hpp"
#include "ui_dispatcher.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fastgh {

/// Tabs of the main window, in display order.
enum class Tab { Feed, Repositories, Starred, Watched, Following, Notifications };

/// Printable title of @p tab.
const char *tab_title(Tab tab);

/**
 * Curses based terminal user interface showing the lists of the current
 * account.
 *
 * All methods run on the UI thread. Results of background work arrive
 * through the RefreshListener callbacks and UiDispatcher tasks drained by
 * run().
 */
class Tui : public RefreshListener {
public:
  /// Runs interactive account creation while curses is suspended.
  using AddAccountHandler = std::function<AddAccountResult()>;

  /**
   * Construct a TUI.
   *
   * @param sessions Signed-in accounts.
   * @param driver Refresh driver delivering list updates.
   * @param runner Runner for star, notification and clone requests.
   * @param ui Dispatcher drained by the main loop.
   * @param prefs Preferences read for templates and git settings.
   * @param logs Optional log buffer shown in the log pane.
   */
  Tui(SessionRegistry &sessions, RefreshDriver &driver, TaskRunner &runner,
      UiDispatcher &ui, PreferenceStore &prefs,
      std::shared_ptr<LogBufferSink> logs = nullptr);
  ~Tui() override;

  /// Initialize the curses library and windows.
  void init();

  /// Main interactive loop.
  void run();

  /// Clean up curses state.
  void cleanup();

  /// Draw the interface once.
  void draw();

  /**
   * Handle a single key press.
   *
   * @param ch Character code received from curses.
   */
  void handle_key(int ch);

  /**
   * Check whether the TUI has been successfully initialized.
   *
   * @return `true` if curses has been initialized and windows created.
   */
  bool initialized() const { return initialized_; }

  /// Whether run() is looping.
  bool running() const { return running_; }

  /// Currently shown tab.
  Tab tab() const { return tab_; }

  /// Index of the selected row in the current tab or repository pane.
  int selected() const { return browser_ ? browser_->selected() : selected_; }

  /// Whether a repository is open in the drill-down view.
  bool browsing() const { return browser_ != nullptr; }

  /// Open repository view, `nullptr` when none.
  const RepoBrowser *repo_browser() const { return browser_.get(); }

  /// Number of rows in the current tab or repository pane.
  std::size_t row_count() const;

  /// Text of the row at @p index in the current tab.
  std::string row_text(std::size_t index) const;

  /// One line description of the selected row.
  std::string detail_text() const;

  /// Browser URL of the selected row, empty when none.
  std::string selected_url() const;

  /// Account, unread count and last error.
  std::string status_text() const;

  /// Last message shown in the status line.
  const std::string &message() const { return message_; }

  /// Number of unread notifications currently listed.
  std::size_t unread_count() const;

  /**
   * Override the command used to open URLs. Intended for tests.
   *
   * @param cmd Function returning `true` when the URL was opened.
   */
  void set_open_cmd(std::function<bool(const std::string &)> cmd) {
    open_cmd_ = std::move(cmd);
  }

  /// Set the handler used by the add account hotkey.
  void set_add_account_handler(AddAccountHandler handler) {
    add_account_ = std::move(handler);
  }

  /// Show @p notice in the status line, e.g. an available update.
  void set_notice(const std::string &notice);

  /// Enable or disable interactive hotkeys at runtime.
  void set_hotkeys_enabled(bool enabled) { hotkeys_enabled_ = enabled; }

  /**
   * Override the configured hotkey bindings.
   *
   * @param bindings Mapping from action name to binding specification string.
   *        Each string may contain comma-separated key descriptors such as
   *        `ctrl+c`.
   */
  void configure_hotkeys(
      const std::unordered_map<std::string, std::string> &bindings);

  /// Labels of the keys bound to @p action.
  std::vector<std::string> bindings_for(const std::string &action) const;

  void feed_loaded(const std::vector<Event> &events) override;
  void repositories_loaded(const std::vector<Repository> &repos) override;
  void starred_loaded(const std::vector<Repository> &repos) override;
  void watched_loaded(const std::vector<Repository> &repos) override;
  void following_loaded(const std::vector<UserProfile> &users) override;
  void
  notifications_loaded(const std::vector<Notification> &notifications) override;
  void change_detected(const ChangeAlert &alert) override;
  void refresh_failed(RefreshStream stream, const std::string &error) override;

private:
  struct HotkeyBinding {
    int key;
    std::string label;
  };
  void initialize_default_hotkeys();
  void clear_action_bindings(const std::string &action);
  void set_bindings_for_action(const std::string &action,
                               const std::vector<HotkeyBinding> &bindings);

  void show_message(const std::string &msg);
  void clamp_selection();
  std::size_t tab_row_count() const;
  bool action_available(const std::string &action) const;
  void clear_lists();
  const std::vector<Repository> *repo_list() const;
  const Repository *selected_repo() const;
  const Notification *selected_notification() const;

  void switch_tab(int delta);
  void open_selected();
  void open_repository();
  void close_repository();
  void toggle_follow();
  void mute_selected();
  void toggle_star();
  void mark_read(bool done);
  void start_clone();
  void cancel_clone();
  void switch_account();
  void add_account();
  void suspend();
  void resume();

  SessionRegistry &sessions_;
  RefreshDriver &driver_;
  TaskRunner &runner_;
  UiDispatcher &ui_;
  PreferenceStore &prefs_;
  std::shared_ptr<LogBufferSink> logs_;

  std::vector<Event> feed_;
  std::vector<Repository> repos_;
  std::vector<Repository> starred_;
  std::vector<Repository> watched_;
  std::vector<UserProfile> following_;
  std::vector<Notification> notifications_;

  Tab tab_{Tab::Feed};
  int selected_{0};
  std::string message_;
  std::string last_error_;
  std::string notice_;
  std::shared_ptr<GitOperation> clone_;
  std::shared_ptr<RepoBrowser> browser_;

  WINDOW *tab_win_{nullptr};
  WINDOW *list_win_{nullptr};
  WINDOW *status_win_{nullptr};
  WINDOW *log_win_{nullptr};
  std::function<bool(const std::string &)> open_cmd_;
  AddAccountHandler add_account_;
  bool running_{false};
  bool initialized_{false};
  int last_h_{0}; ///< Cached terminal height for resize detection.
  int last_w_{0}; ///< Cached terminal width for resize detection.
  std::atomic<bool> redraw_requested_{true};
  std::chrono::milliseconds refresh_interval_{500};
  bool hotkeys_enabled_{true};
  std::vector<std::string> hotkey_help_order_;
  std::unordered_map<std::string, std::vector<HotkeyBinding>> action_bindings_;
  std::unordered_map<int, std::string> key_to_action_;
};

} // namespace fastgh

#endif // FASTGH_TUI_HPP
