/**
 * @file refresh_driver.hpp
 * @brief Background refresh of the main lists of the current account.
 */

#ifndef FASTGH_REFRESH_DRIVER_HPP
#define FASTGH_REFRESH_DRIVER_HPP

#include "account.hpp"
#include "change_tracker.hpp"
#include "notification.hpp"
#include "preferences.hpp"
#include "task_runner.hpp"
#include "ui_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fastgh {

/// Lists refreshed by RefreshDriver::refresh_all().
enum class RefreshStream {
  Feed,
  Repositories,
  Starred,
  Watched,
  Following,
  Notifications
};

/// Printable name of @p stream.
const char *to_string(RefreshStream stream);

/**
 * Receives refresh results. Every callback runs on the UI thread and only
 * for the account that is current when the result arrives.
 */
class RefreshListener {
public:
  virtual ~RefreshListener() = default;
  virtual void feed_loaded(const std::vector<Event> &) {}
  virtual void repositories_loaded(const std::vector<Repository> &) {}
  virtual void starred_loaded(const std::vector<Repository> &) {}
  virtual void watched_loaded(const std::vector<Repository> &) {}
  virtual void following_loaded(const std::vector<UserProfile> &) {}
  virtual void notifications_loaded(const std::vector<Notification> &) {}
  /// A change notification was raised for the current account.
  virtual void change_detected(const ChangeAlert &) {}
  virtual void refresh_failed(RefreshStream, const std::string &) {}
};

/**
 * Launches the six list fetches on worker threads, diffs the notification
 * eligible streams and hands results to the listener on the UI thread.
 *
 * Each account has its own ChangeTracker, created on its first refresh and
 * kept for the life of the process, so switching accounts never resets a
 * snapshot.
 */
class RefreshDriver {
public:
  using AccountProvider = std::function<std::shared_ptr<Account>()>;
  using PreferencesProvider = std::function<Preferences()>;

  /**
   * @param accounts Returns the current account; called on the UI thread.
   * @param preferences Returns the notification toggles and intervals.
   */
  RefreshDriver(TaskRunner &runner, UiDispatcher &ui, NotifierPtr notifier,
                AccountProvider accounts, PreferencesProvider preferences);
  ~RefreshDriver();

  RefreshDriver(const RefreshDriver &) = delete;
  RefreshDriver &operator=(const RefreshDriver &) = delete;

  /// Listener owned by the UI; may be null.
  void set_listener(RefreshListener *listener) { listener_ = listener; }

  /// Refresh every stream of the current account. Call on the UI thread.
  void refresh_all();

  /// Refresh one stream of the current account. Call on the UI thread.
  void refresh(RefreshStream stream);

  /**
   * Post refresh_all() to the UI thread every @p interval.
   *
   * A zero interval stops auto refresh.
   */
  void start_auto_refresh(std::chrono::milliseconds interval);
  void stop_auto_refresh();
  bool auto_refresh_running() const { return auto_running_.load(); }

  /// Change tracker of @p account, created on first use.
  ChangeTracker &tracker_for(const Account &account);

private:
  template <typename T, typename Fetch, typename Deliver>
  void launch(RefreshStream stream, const std::shared_ptr<Account> &account,
              Fetch fetch, Deliver deliver);
  bool is_current(const std::shared_ptr<Account> &account) const;

  TaskRunner &runner_;
  UiDispatcher &ui_;
  NotifierPtr notifier_;
  AccountProvider accounts_;
  PreferencesProvider preferences_;
  RefreshListener *listener_ = nullptr;

  std::mutex trackers_mutex_;
  std::map<std::string, std::unique_ptr<ChangeTracker>> trackers_;

  std::mutex auto_mutex_;
  std::condition_variable auto_cv_;
  std::thread auto_thread_;
  std::atomic<bool> auto_running_{false};
};

} // namespace fastgh

#endif // FASTGH_REFRESH_DRIVER_HPP
