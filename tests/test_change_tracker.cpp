#include "change_tracker.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace fastgh;

namespace {

class RecordingNotifier : public Notifier {
public:
  void notify(const std::string &title, const std::string &body) override {
    sent.emplace_back(title, body);
  }
  std::vector<std::pair<std::string, std::string>> sent;
};

Notification thread(const std::string &id, bool unread,
                    const std::string &title = "Fix it") {
  Notification n;
  n.id = id;
  n.unread = unread;
  n.subject.title = title;
  n.subject.type = "PullRequest";
  n.repository_full_name = "octo/tool";
  return n;
}

Repository repo(std::int64_t id, const std::string &name,
                const std::string &pushed_at) {
  Repository r;
  r.id = id;
  r.full_name = name;
  r.name = name.substr(name.find('/') + 1);
  r.pushed_at = pushed_at;
  return r;
}

Event event(const std::string &id) {
  Event e;
  e.id = id;
  e.type = "WatchEvent";
  e.actor.login = "mona";
  e.repo.name = "octo/tool";
  return e;
}

} // namespace

TEST_CASE("first refresh only records the snapshot", "[changes]") {
  auto notifier = std::make_shared<RecordingNotifier>();
  ChangeTracker tracker(notifier);
  CHECK_FALSE(tracker.initialized(ChangeStream::Notifications));
  CHECK_FALSE(tracker.observe_notifications(
      {thread("1", true), thread("2", true)}, true));
  CHECK(tracker.initialized(ChangeStream::Notifications));
  CHECK(notifier->sent.empty());
  CHECK(tracker.snapshot(ChangeStream::Notifications)->size() == 2);
}

TEST_CASE("new unread notifications raise one alert", "[changes]") {
  auto notifier = std::make_shared<RecordingNotifier>();
  ChangeTracker tracker(notifier);
  tracker.observe_notifications({thread("1", true), thread("2", false)}, true);

  auto alert = tracker.observe_notifications(
      {thread("3", true, "Add docs"), thread("4", true), thread("1", true),
       thread("2", false), thread("5", false)},
      true);
  REQUIRE(alert);
  CHECK(alert->stream == ChangeStream::Notifications);
  CHECK(alert->count == 2);
  CHECK(alert->ids == std::vector<std::string>{"3", "4"});
  CHECK(alert->title == "2 new GitHub notifications");
  CHECK(alert->body == "Add docs (octo/tool)");
  REQUIRE(notifier->sent.size() == 1);
  CHECK(notifier->sent[0].first == "2 new GitHub notifications");

  auto keys = *tracker.snapshot(ChangeStream::Notifications);
  CHECK(keys.size() == 3);
  CHECK(keys.count("5") == 0);
}

TEST_CASE("a single new notification uses the singular title", "[changes]") {
  ChangeTracker tracker;
  tracker.observe_notifications({}, true);
  auto alert = tracker.observe_notifications({thread("9", true)}, true);
  REQUIRE(alert);
  CHECK(alert->title == "1 new GitHub notification");
}

TEST_CASE("unchanged refreshes stay silent", "[changes]") {
  auto notifier = std::make_shared<RecordingNotifier>();
  ChangeTracker tracker(notifier);
  std::vector<Notification> same{thread("1", true)};
  tracker.observe_notifications(same, true);
  CHECK_FALSE(tracker.observe_notifications(same, true));
  CHECK_FALSE(tracker.observe_notifications({}, true));
  CHECK(notifier->sent.empty());
}

TEST_CASE("disabled streams replace the snapshot without alerting",
          "[changes]") {
  auto notifier = std::make_shared<RecordingNotifier>();
  ChangeTracker tracker(notifier);
  tracker.observe_notifications({thread("1", true)}, true);
  CHECK_FALSE(tracker.observe_notifications(
      {thread("1", true), thread("2", true)}, false));
  CHECK(notifier->sent.empty());
  CHECK(tracker.snapshot(ChangeStream::Notifications)->count("2") == 1);

  // Re-enabling does not replay the change seen while disabled.
  CHECK_FALSE(tracker.observe_notifications(
      {thread("1", true), thread("2", true)}, true));
}

TEST_CASE("starred repos alert only when a known repo is pushed",
          "[changes]") {
  auto notifier = std::make_shared<RecordingNotifier>();
  ChangeTracker tracker(notifier);
  tracker.observe_starred({repo(1, "octo/a", "2024-01-01T00:00:00Z"),
                           repo(2, "octo/b", "2024-01-01T00:00:00Z")},
                          true);

  CHECK_FALSE(tracker.observe_starred(
      {repo(1, "octo/a", "2024-01-01T00:00:00Z"),
       repo(2, "octo/b", "2024-01-01T00:00:00Z"),
       repo(3, "octo/c", "2024-02-01T00:00:00Z")},
      true));

  auto alert = tracker.observe_starred(
      {repo(1, "octo/a", "2024-03-01T00:00:00Z"),
       repo(2, "octo/b", "2024-03-02T00:00:00Z"),
       repo(3, "octo/c", "2024-02-01T00:00:00Z")},
      true);
  REQUIRE(alert);
  CHECK(alert->stream == ChangeStream::Starred);
  CHECK(alert->count == 2);
  CHECK(alert->title == "2 starred repos updated");
  CHECK(alert->body == "octo/a and 1 more");
  CHECK(notifier->sent.size() == 1);
  CHECK(tracker.snapshot(ChangeStream::Starred)->at("1") ==
        "2024-03-01T00:00:00Z");
}

TEST_CASE("watched and starred streams are tracked separately", "[changes]") {
  ChangeTracker tracker;
  tracker.observe_starred({repo(1, "octo/a", "t1")}, true);
  CHECK_FALSE(tracker.initialized(ChangeStream::Watched));
  CHECK_FALSE(tracker.observe_watched({repo(1, "octo/a", "t2")}, true));
  auto alert = tracker.observe_watched({repo(1, "octo/a", "t3")}, true);
  REQUIRE(alert);
  CHECK(alert->title == "1 watched repo updated");
  CHECK(alert->body == "octo/a");
  CHECK(tracker.snapshot(ChangeStream::Starred)->at("1") == "t1");
}

TEST_CASE("new feed events are reported by id", "[changes]") {
  auto notifier = std::make_shared<RecordingNotifier>();
  ChangeTracker tracker(notifier);
  tracker.observe_feed({event("10"), event("11")}, true);
  auto alert =
      tracker.observe_feed({event("12"), event("10"), event("11")}, true);
  REQUIRE(alert);
  CHECK(alert->ids == std::vector<std::string>{"12"});
  CHECK(alert->title == "1 new activity item");
  CHECK(alert->body.find("mona") == 0);
  CHECK(alert->body.size() <= 100);
  CHECK(notifier->sent.size() == 1);
}

TEST_CASE("stream names are printable", "[changes]") {
  CHECK(std::string(to_string(ChangeStream::Feed)) == "feed");
  CHECK(std::string(to_string(ChangeStream::Watched)) == "watched");
}

TEST_CASE("overlapping observations of one stream stay consistent",
          "[changes]") {
  ChangeTracker tracker;
  tracker.observe_notifications({}, true);
  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&tracker, w] {
      for (int i = 0; i < 50; ++i) {
        tracker.observe_notifications(
            {thread(std::to_string(w) + "-" + std::to_string(i), true)}, true);
        tracker.observe_starred({repo(w, "octo/r", std::to_string(i))}, true);
      }
    });
  }
  for (auto &t : workers) {
    t.join();
  }
  auto keys = tracker.snapshot(ChangeStream::Notifications);
  REQUIRE(keys);
  CHECK(keys->size() == 1);
  CHECK(tracker.snapshot(ChangeStream::Starred)->size() == 1);
}
