/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for fastgh.
 *
 * Declares the App class, which parses the command line, loads the
 * configuration, initializes logging and wires the account registry,
 * refresh driver and user interface together.
 */

#ifndef FASTGH_APP_HPP
#define FASTGH_APP_HPP

#include "account.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "credential_store.hpp"
#include "device_flow.hpp"
#include "github_client.hpp"
#include "log.hpp"
#include "notification.hpp"
#include "preferences.hpp"
#include "refresh_driver.hpp"
#include "session_registry.hpp"
#include "task_runner.hpp"
#include "ui_dispatcher.hpp"
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace fastgh {

/**
 * Listener printing refreshed lists to a stream. Used when running without
 * the terminal UI.
 */
class HeadlessPrinter : public RefreshListener {
public:
  HeadlessPrinter(std::ostream &out, PreferenceStore &prefs);

  void feed_loaded(const std::vector<Event> &events) override;
  void repositories_loaded(const std::vector<Repository> &repos) override;
  void starred_loaded(const std::vector<Repository> &repos) override;
  void watched_loaded(const std::vector<Repository> &repos) override;
  void following_loaded(const std::vector<UserProfile> &users) override;
  void
  notifications_loaded(const std::vector<Notification> &notifications) override;
  void change_detected(const ChangeAlert &alert) override;
  void refresh_failed(RefreshStream stream, const std::string &error) override;

  /// Number of stream results (including failures) printed so far.
  std::size_t delivered() const { return delivered_; }

private:
  void header(const char *title, std::size_t count);

  std::ostream &out_;
  PreferenceStore &prefs_;
  std::size_t delivered_ = 0;
};

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  App();
  ~App();

  App(const App &) = delete;
  App &operator=(const App &) = delete;

  /**
   * Parse the command line, load the configuration and initialize logging.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Execute the mode selected on the command line.
   *
   * @return Process exit code.
   */
  int execute();

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded configuration with command line overrides applied.
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   */
  bool should_exit() const { return should_exit_; }

private:
  void init_logging();
  void build_components();
  std::unique_ptr<HttpClient> make_http() const;
  std::unique_ptr<GitHubClient> make_client(const std::string &token) const;
  AuthOutcome authorize();

  int list_accounts();
  int add_account();
  int remove_account(int slot);
  int import_tokens(const std::string &path);
  int refresh_once();
  int run_headless();
  int run_tui();
  void check_updates(const std::function<void(const std::string &)> &sink);
  void pump_until_idle();

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
  bool interactive_{true};
  std::shared_ptr<LogBufferSink> log_buffer_;

  std::unique_ptr<PreferenceStore> prefs_;
  std::unique_ptr<CredentialStore> credentials_;
  UiDispatcher ui_;
  TaskRunner runner_;
  NotifierPtr notifier_;
  std::unique_ptr<AccountSetup> setup_;
  std::unique_ptr<SessionRegistry> sessions_;
  std::unique_ptr<RefreshDriver> driver_;
};

} // namespace fastgh

#endif // FASTGH_APP_HPP
