#include "change_tracker.hpp"
#include "log.hpp"

#include <ctime>
#include <set>
#include <utility>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> changes_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("changes");
  }();
  return logger;
}

constexpr std::size_t kBodyLimit = 100;

std::string plural(std::size_t count, const std::string &noun) {
  return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

} // namespace

const char *to_string(ChangeStream stream) {
  switch (stream) {
  case ChangeStream::Feed:
    return "feed";
  case ChangeStream::Notifications:
    return "notifications";
  case ChangeStream::Starred:
    return "starred";
  case ChangeStream::Watched:
    return "watched";
  }
  return "unknown";
}

ChangeTracker::ChangeTracker(NotifierPtr notifier)
    : notifier_(std::move(notifier)) {}

ChangeTracker::Slot &ChangeTracker::slot(ChangeStream stream) {
  return slots_[static_cast<std::size_t>(stream)];
}

const ChangeTracker::Slot &ChangeTracker::slot(ChangeStream stream) const {
  return slots_[static_cast<std::size_t>(stream)];
}

bool ChangeTracker::initialized(ChangeStream stream) const {
  const Slot &s = slot(stream);
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.keys.has_value();
}

std::optional<std::map<std::string, std::string>>
ChangeTracker::snapshot(ChangeStream stream) const {
  const Slot &s = slot(stream);
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.keys;
}

void ChangeTracker::raise(const ChangeAlert &alert) {
  changes_log()->info("{}: {} ({})", to_string(alert.stream), alert.title,
                      alert.body);
  if (notifier_) {
    notifier_->notify(alert.title, alert.body);
  }
}

std::optional<ChangeAlert>
ChangeTracker::observe_feed(const std::vector<Event> &events, bool enabled) {
  Keys current;
  for (const auto &e : events) {
    current.emplace(e.id, std::string());
  }
  Slot &s = slot(ChangeStream::Feed);
  std::lock_guard<std::mutex> lock(s.mutex);
  std::optional<ChangeAlert> alert;
  if (s.keys) {
    ChangeAlert found;
    found.stream = ChangeStream::Feed;
    std::set<std::string> seen;
    for (const auto &e : events) {
      if (s.keys->count(e.id) == 0 && seen.insert(e.id).second) {
        if (found.ids.empty()) {
          found.body = e.display(std::time(nullptr)).substr(0, kBodyLimit);
        }
        found.ids.push_back(e.id);
      }
    }
    found.count = found.ids.size();
    if (found.count > 0 && enabled) {
      found.title = plural(found.count, "new activity item");
      raise(found);
      alert = std::move(found);
    }
  }
  s.keys = std::move(current);
  return alert;
}

std::optional<ChangeAlert> ChangeTracker::observe_notifications(
    const std::vector<Notification> &notifications, bool enabled) {
  Keys current;
  for (const auto &n : notifications) {
    if (n.unread) {
      current.emplace(n.id, std::string());
    }
  }
  Slot &s = slot(ChangeStream::Notifications);
  std::lock_guard<std::mutex> lock(s.mutex);
  std::optional<ChangeAlert> alert;
  if (s.keys) {
    ChangeAlert found;
    found.stream = ChangeStream::Notifications;
    std::set<std::string> seen;
    for (const auto &n : notifications) {
      if (n.unread && s.keys->count(n.id) == 0 && seen.insert(n.id).second) {
        if (found.ids.empty()) {
          found.body =
              n.subject.title + " (" + n.repository_full_name + ")";
        }
        found.ids.push_back(n.id);
      }
    }
    found.count = found.ids.size();
    if (found.count > 0 && enabled) {
      found.title = plural(found.count, "new GitHub notification");
      raise(found);
      alert = std::move(found);
    }
  }
  s.keys = std::move(current);
  return alert;
}

std::optional<ChangeAlert>
ChangeTracker::observe_starred(const std::vector<Repository> &repos,
                               bool enabled) {
  return observe_repos(ChangeStream::Starred, repos, enabled);
}

std::optional<ChangeAlert>
ChangeTracker::observe_watched(const std::vector<Repository> &repos,
                               bool enabled) {
  return observe_repos(ChangeStream::Watched, repos, enabled);
}

std::optional<ChangeAlert>
ChangeTracker::observe_repos(ChangeStream stream,
                             const std::vector<Repository> &repos,
                             bool enabled) {
  Keys current;
  for (const auto &r : repos) {
    current[std::to_string(r.id)] = r.pushed_at;
  }
  Slot &s = slot(stream);
  std::lock_guard<std::mutex> lock(s.mutex);
  std::optional<ChangeAlert> alert;
  if (s.keys) {
    ChangeAlert found;
    found.stream = stream;
    std::string first_name;
    std::set<std::string> seen;
    for (const auto &r : repos) {
      const std::string id = std::to_string(r.id);
      auto previous = s.keys->find(id);
      // Only repositories already known with a different push time count.
      if (previous == s.keys->end() || previous->second == r.pushed_at ||
          !seen.insert(id).second) {
        continue;
      }
      if (found.ids.empty()) {
        first_name = r.full_name;
      }
      found.ids.push_back(id);
    }
    found.count = found.ids.size();
    if (found.count > 0 && enabled) {
      const char *kind =
          stream == ChangeStream::Starred ? "starred repo" : "watched repo";
      found.title = plural(found.count, kind) + " updated";
      found.body = first_name;
      if (found.count > 1) {
        found.body += " and " + std::to_string(found.count - 1) + " more";
      }
      raise(found);
      alert = std::move(found);
    }
  }
  s.keys = std::move(current);
  return alert;
}

} // namespace fastgh
