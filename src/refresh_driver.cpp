#include "refresh_driver.hpp"
#include "log.hpp"

#include <utility>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> refresh_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("refresh");
  }();
  return logger;
}

} // namespace

const char *to_string(RefreshStream stream) {
  switch (stream) {
  case RefreshStream::Feed:
    return "feed";
  case RefreshStream::Repositories:
    return "repositories";
  case RefreshStream::Starred:
    return "starred";
  case RefreshStream::Watched:
    return "watched";
  case RefreshStream::Following:
    return "following";
  case RefreshStream::Notifications:
    return "notifications";
  }
  return "unknown";
}

RefreshDriver::RefreshDriver(TaskRunner &runner, UiDispatcher &ui,
                             NotifierPtr notifier, AccountProvider accounts,
                             PreferencesProvider preferences)
    : runner_(runner), ui_(ui), notifier_(std::move(notifier)),
      accounts_(std::move(accounts)), preferences_(std::move(preferences)) {}

RefreshDriver::~RefreshDriver() { stop_auto_refresh(); }

ChangeTracker &RefreshDriver::tracker_for(const Account &account) {
  std::lock_guard<std::mutex> lock(trackers_mutex_);
  auto &tracker = trackers_[account.username()];
  if (!tracker) {
    tracker = std::make_unique<ChangeTracker>(notifier_);
  }
  return *tracker;
}

bool RefreshDriver::is_current(const std::shared_ptr<Account> &account) const {
  return accounts_() == account;
}

template <typename T, typename Fetch, typename Deliver>
void RefreshDriver::launch(RefreshStream stream,
                           const std::shared_ptr<Account> &account,
                           Fetch fetch, Deliver deliver) {
  const std::string name =
      std::string("refresh ") + to_string(stream) + " for " +
      account->username();
  runner_.run_then_post(
      ui_, name, [account, fetch]() -> T { return fetch(*account); },
      [this, account, stream, deliver](T items) {
        refresh_log()->debug("{} refreshed with {} items", to_string(stream),
                             items.size());
        deliver(account, items);
      },
      [this, stream](const std::string &message) {
        if (listener_ != nullptr) {
          listener_->refresh_failed(stream, message);
        }
      });
}

void RefreshDriver::refresh(RefreshStream stream) {
  std::shared_ptr<Account> account = accounts_();
  if (!account) {
    refresh_log()->debug("No current account; skipping {}", to_string(stream));
    return;
  }
  switch (stream) {
  case RefreshStream::Feed:
    launch<std::vector<Event>>(
        stream, account,
        [](Account &a) { return a.api().get_received_events(a.username()); },
        [this](const std::shared_ptr<Account> &a,
               const std::vector<Event> &events) {
          auto alert = tracker_for(*a).observe_feed(
              events, preferences_().notify_activity);
          if (listener_ != nullptr && is_current(a)) {
            listener_->feed_loaded(events);
            if (alert) {
              listener_->change_detected(*alert);
            }
          }
        });
    break;
  case RefreshStream::Repositories:
    launch<std::vector<Repository>>(
        stream, account, [](Account &a) { return a.api().get_repos(); },
        [this](const std::shared_ptr<Account> &a,
               const std::vector<Repository> &repos) {
          if (listener_ != nullptr && is_current(a)) {
            listener_->repositories_loaded(repos);
          }
        });
    break;
  case RefreshStream::Starred:
    launch<std::vector<Repository>>(
        stream, account, [](Account &a) { return a.api().get_starred(); },
        [this](const std::shared_ptr<Account> &a,
               const std::vector<Repository> &repos) {
          auto alert = tracker_for(*a).observe_starred(
              repos, preferences_().notify_starred);
          if (listener_ != nullptr && is_current(a)) {
            listener_->starred_loaded(repos);
            if (alert) {
              listener_->change_detected(*alert);
            }
          }
        });
    break;
  case RefreshStream::Watched:
    launch<std::vector<Repository>>(
        stream, account, [](Account &a) { return a.api().get_watched(); },
        [this](const std::shared_ptr<Account> &a,
               const std::vector<Repository> &repos) {
          auto alert = tracker_for(*a).observe_watched(
              repos, preferences_().notify_watched);
          if (listener_ != nullptr && is_current(a)) {
            listener_->watched_loaded(repos);
            if (alert) {
              listener_->change_detected(*alert);
            }
          }
        });
    break;
  case RefreshStream::Following:
    launch<std::vector<UserProfile>>(
        stream, account, [](Account &a) { return a.api().get_following(); },
        [this](const std::shared_ptr<Account> &a,
               const std::vector<UserProfile> &users) {
          if (listener_ != nullptr && is_current(a)) {
            listener_->following_loaded(users);
          }
        });
    break;
  case RefreshStream::Notifications:
    launch<std::vector<Notification>>(
        stream, account,
        [](Account &a) { return a.api().get_notifications(); },
        [this](const std::shared_ptr<Account> &a,
               const std::vector<Notification> &notifications) {
          auto alert = tracker_for(*a).observe_notifications(
              notifications, preferences_().notify_notifications);
          if (listener_ != nullptr && is_current(a)) {
            listener_->notifications_loaded(notifications);
            if (alert) {
              listener_->change_detected(*alert);
            }
          }
        });
    break;
  }
}

void RefreshDriver::refresh_all() {
  for (RefreshStream stream :
       {RefreshStream::Feed, RefreshStream::Repositories,
        RefreshStream::Starred, RefreshStream::Watched,
        RefreshStream::Following, RefreshStream::Notifications}) {
    refresh(stream);
  }
}

void RefreshDriver::start_auto_refresh(std::chrono::milliseconds interval) {
  stop_auto_refresh();
  if (interval.count() <= 0) {
    return;
  }
  auto_running_ = true;
  auto_thread_ = std::thread([this, interval] {
    std::unique_lock<std::mutex> lock(auto_mutex_);
    while (auto_running_) {
      if (auto_cv_.wait_for(lock, interval,
                            [this] { return !auto_running_.load(); })) {
        break;
      }
      refresh_log()->debug("Auto refresh");
      ui_.post([this] { refresh_all(); });
    }
  });
  refresh_log()->info("Auto refresh every {} ms", interval.count());
}

void RefreshDriver::stop_auto_refresh() {
  {
    std::lock_guard<std::mutex> lock(auto_mutex_);
    auto_running_ = false;
  }
  auto_cv_.notify_all();
  if (auto_thread_.joinable()) {
    auto_thread_.join();
  }
}

} // namespace fastgh
