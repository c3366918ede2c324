#include "fake_http_client.hpp"
#include "tui.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace fastgh;
using namespace fastgh_test;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

HttpResponse github_handler(const Request &req) {
  if (req.url.find("/user/starred/octo/tool") != std::string::npos) {
    return respond(req.method == "GET" ? 404 : 204);
  }
  if (req.url.find("/subscription") != std::string::npos) {
    return respond_json({{"subscribed", false}, {"ignored", true}});
  }
  if (req.url.find("/notifications/threads/") != std::string::npos) {
    return respond(req.method == "PATCH" ? 205 : 204);
  }
  if (req.url.find("/user/following/mona") != std::string::npos) {
    return respond(req.method == "GET" ? 404 : 204);
  }
  return respond_json(nlohmann::json::array());
}

Repository repo(std::int64_t id, const std::string &owner,
                const std::string &name) {
  Repository r;
  r.id = id;
  r.owner = owner;
  r.name = name;
  r.full_name = owner + "/" + name;
  r.html_url = "https://github.com/" + r.full_name;
  r.stars = 5;
  return r;
}

Notification thread(const std::string &id, bool unread) {
  Notification n;
  n.id = id;
  n.unread = unread;
  n.reason = "review_requested";
  n.subject.title = "Fix it";
  n.subject.type = "PullRequest";
  n.subject.url = "https://api.github.com/repos/octo/tool/pulls/" + id;
  n.repository_full_name = "octo/tool";
  return n;
}

/// A TUI wired to in-memory accounts without curses.
struct Fixture {
  explicit Fixture(const std::string &name, int accounts = 1)
      : root(fresh_dir(name)),
        server(std::make_shared<FakeServer>(github_handler)), store(root),
        sessions(store, prefs,
                 [this](std::size_t slot) -> SetupResult {
                   UserProfile profile;
                   profile.login = slot == 0 ? "ann" : "bob";
                   return std::make_shared<Account>(
                       slot,
                       std::make_unique<GitHubClient>("tok", fake_http(server)),
                       profile);
                 }),
        driver(runner, ui, nullptr, [this] { return sessions.current(); },
               [this] { return Preferences::from(prefs); }),
        tui(sessions, driver, runner, ui, prefs) {
    prefs.set(pref::kAccounts, accounts);
    sessions.load_all();
    driver.set_listener(&tui);
  }

  ~Fixture() {
    runner.wait_idle(std::chrono::seconds(5));
    fs::remove_all(root);
  }

  fs::path root;
  std::shared_ptr<FakeServer> server;
  CredentialStore store;
  PreferenceStore prefs;
  SessionRegistry sessions;
  UiDispatcher ui;
  TaskRunner runner;
  RefreshDriver driver;
  Tui tui;
};

} // namespace

TEST_CASE("default hotkeys", "[tui]") {
  Fixture f("fastgh_tui_defaults");
  CHECK_FALSE(f.tui.initialized());
  CHECK(f.tui.bindings_for("next_tab") ==
        std::vector<std::string>{"Tab", "Right"});
  CHECK(f.tui.bindings_for("open") == std::vector<std::string>{"o", "Enter"});
  CHECK(f.tui.bindings_for("quit") == std::vector<std::string>{"q"});
  CHECK(f.tui.bindings_for("unknown").empty());
}

TEST_CASE("tabs and selection follow navigation keys", "[tui]") {
  Fixture f("fastgh_tui_navigation");
  f.tui.repositories_loaded(
      {repo(1, "octo", "a"), repo(2, "octo", "b"), repo(3, "octo", "c")});
  CHECK(f.tui.tab() == Tab::Feed);
  f.tui.handle_key('\t');
  CHECK(f.tui.tab() == Tab::Repositories);
  CHECK(f.tui.row_count() == 3);
  f.tui.handle_key(KEY_DOWN);
  f.tui.handle_key('j');
  f.tui.handle_key('j');
  CHECK(f.tui.selected() == 2);
  f.tui.handle_key('k');
  CHECK(f.tui.selected() == 1);
  CHECK(f.tui.row_text(1) == "octo/b | 5 stars | Unknown | Pushed Unknown");
  CHECK(f.tui.selected_url() == "https://github.com/octo/b");

  f.tui.repositories_loaded({repo(1, "octo", "a")});
  CHECK(f.tui.selected() == 0);

  f.tui.handle_key(KEY_LEFT);
  CHECK(f.tui.tab() == Tab::Feed);
  f.tui.handle_key(KEY_BTAB);
  CHECK(f.tui.tab() == Tab::Notifications);
  CHECK(std::string(tab_title(f.tui.tab())) == "Notifications");
}

TEST_CASE("hotkey configuration overrides defaults", "[tui]") {
  Fixture f("fastgh_tui_hotkeys");
  f.tui.configure_hotkeys({{"up", "w"},
                           {"next", "ctrl+n, down"},
                           {"toggle_star", "default"},
                           {"quit", "none"},
                           {"bogus", "z"},
                           {"refresh", "???"}});
  CHECK(f.tui.bindings_for("navigate_up") == std::vector<std::string>{"w"});
  CHECK(f.tui.bindings_for("navigate_down") ==
        std::vector<std::string>{"Ctrl+N", "Down"});
  CHECK(f.tui.bindings_for("star") == std::vector<std::string>{"s"});
  CHECK(f.tui.bindings_for("quit").empty());
  CHECK(f.tui.bindings_for("refresh") == std::vector<std::string>{"r"});
}

TEST_CASE("disabled hotkeys leave only navigation and quit", "[tui]") {
  Fixture f("fastgh_tui_disabled");
  f.tui.set_hotkeys_enabled(false);
  auto before = f.server->requests().size();
  f.tui.handle_key('r');
  CHECK(f.runner.in_flight() == 0);
  CHECK(f.server->requests().size() == before);
  f.tui.handle_key('\t');
  CHECK(f.tui.tab() == Tab::Repositories);
}

TEST_CASE("refresh key loads every list", "[tui]") {
  Fixture f("fastgh_tui_refresh");
  f.tui.handle_key('r');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.server->count("/notifications?") == 1);
  CHECK(f.server->count("/user/repos?") == 1);
}

TEST_CASE("status line shows account, unread count and errors", "[tui]") {
  Fixture f("fastgh_tui_status");
  f.tui.notifications_loaded({thread("1", true), thread("2", false)});
  CHECK(f.tui.unread_count() == 1);
  CHECK(f.tui.status_text() == "@ann | Unread: 1");
  f.tui.refresh_failed(RefreshStream::Notifications, "boom");
  CHECK(f.tui.status_text() == "@ann | Unread: 1 | Error: notifications: boom");

  ChangeAlert alert;
  alert.title = "2 new GitHub notifications";
  alert.body = "Fix it (octo/tool)";
  f.tui.change_detected(alert);
  CHECK(f.tui.message() == "2 new GitHub notifications: Fix it (octo/tool)");
}

TEST_CASE("notification rows and details", "[tui]") {
  Fixture f("fastgh_tui_notifications");
  f.tui.notifications_loaded({thread("7", true)});
  f.tui.handle_key(KEY_BTAB);
  REQUIRE(f.tui.tab() == Tab::Notifications);
  CHECK(f.tui.row_text(0).rfind("* [PR] Fix it - octo/tool", 0) == 0);
  CHECK(f.tui.detail_text() == "PR in octo/tool (Review requested)");
  CHECK(f.tui.selected_url() == "https://github.com/octo/tool/pull/7");
}

TEST_CASE("open uses the configured command", "[tui]") {
  Fixture f("fastgh_tui_open");
  std::vector<std::string> opened;
  bool succeed = true;
  f.tui.set_open_cmd([&](const std::string &url) {
    opened.push_back(url);
    return succeed;
  });
  f.tui.starred_loaded({repo(1, "octo", "tool")});
  f.tui.handle_key('\t');
  f.tui.handle_key('\t');
  REQUIRE(f.tui.tab() == Tab::Starred);
  f.tui.handle_key('\n');
  REQUIRE(opened.size() == 1);
  CHECK(opened[0] == "https://github.com/octo/tool");

  succeed = false;
  f.tui.handle_key('o');
  CHECK(f.tui.message() == "Could not open https://github.com/octo/tool");
}

TEST_CASE("star toggles on the selected repository", "[tui]") {
  Fixture f("fastgh_tui_star");
  f.tui.starred_loaded({repo(1, "octo", "tool")});
  f.tui.handle_key('\t');
  f.tui.handle_key('\t');
  f.tui.handle_key('s');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.tui.message() == "Starred octo/tool");
  CHECK(f.server->count("/user/starred/octo/tool") == 2);
}

TEST_CASE("mark read and done update the notification list", "[tui]") {
  Fixture f("fastgh_tui_mark");
  f.tui.notifications_loaded({thread("1", true), thread("2", true)});
  f.tui.handle_key(KEY_BTAB);
  f.tui.handle_key('m');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.tui.message() == "Notification marked read");
  CHECK(f.tui.unread_count() == 1);

  f.tui.handle_key('d');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.tui.message() == "Notification done");
  CHECK(f.tui.row_count() == 1);
}

TEST_CASE("cancel without a running git operation", "[tui]") {
  Fixture f("fastgh_tui_cancel");
  f.tui.handle_key('x');
  CHECK(f.tui.message() == "No git operation running");
}

TEST_CASE("account switching cycles through signed-in accounts", "[tui]") {
  {
    Fixture f("fastgh_tui_switch_single");
    f.tui.handle_key('a');
    CHECK(f.tui.message() == "Only one account signed in");
  }
  Fixture f("fastgh_tui_switch", 2);
  REQUIRE(f.sessions.size() == 2);
  f.tui.notifications_loaded({thread("1", true)});
  CHECK(f.tui.status_text() == "@ann (2 accounts) | Unread: 1");
  f.tui.handle_key('a');
  CHECK(f.tui.message() == "Switched to @bob");
  CHECK(f.tui.unread_count() == 0);
  CHECK(f.sessions.current()->username() == "bob");
  REQUIRE(pump(f.runner, f.ui));
  f.tui.handle_key('a');
  CHECK(f.sessions.current()->username() == "ann");
}

TEST_CASE("add account hotkey runs the handler", "[tui]") {
  Fixture f("fastgh_tui_add");
  f.tui.set_add_account_handler([&f] { return f.sessions.add_account(); });
  f.tui.handle_key('n');
  CHECK(f.tui.message() == "Added @bob");
  CHECK(f.sessions.current()->username() == "bob");
  REQUIRE(pump(f.runner, f.ui));

  f.tui.set_add_account_handler([] {
    AddAccountResult result;
    result.status = AddAccountStatus::Failed;
    result.message = "network down";
    return result;
  });
  f.tui.handle_key('n');
  CHECK(f.tui.message() == "Adding account failed: network down");
}

TEST_CASE("quit stops the loop flag", "[tui]") {
  Fixture f("fastgh_tui_quit");
  f.tui.handle_key('q');
  CHECK_FALSE(f.tui.running());
  f.tui.handle_key(-5);
  CHECK_FALSE(f.tui.running());
}

TEST_CASE("details key opens the repository view and escape leaves it",
          "[tui]") {
  Fixture f("fastgh_tui_repo_view");
  f.tui.repositories_loaded({repo(1, "octo", "a"), repo(2, "octo", "tool")});
  f.tui.handle_key('\t');
  f.tui.handle_key('j');
  f.tui.handle_key('v');
  REQUIRE(f.tui.browsing());
  CHECK(f.tui.repo_browser()->repository().full_name == "octo/tool");
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.server->count("/repos/octo/tool/issues?state=open") == 1);
  CHECK(f.tui.selected() == 0);
  CHECK(f.tui.row_count() == 0);

  f.tui.handle_key('\t');
  CHECK(f.tui.repo_browser()->pane() == RepoPane::PullRequests);
  CHECK(f.tui.tab() == Tab::Repositories);
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.server->count("/repos/octo/tool/pulls?") == 1);

  f.tui.handle_key('s');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.tui.message() == "Starred octo/tool");

  f.tui.handle_key(27);
  CHECK_FALSE(f.tui.browsing());
  CHECK(f.tui.selected() == 1);
  CHECK(f.tui.row_count() == 2);
}

TEST_CASE("repository view closes when the account changes", "[tui]") {
  Fixture f("fastgh_tui_repo_switch", 2);
  f.tui.repositories_loaded({repo(1, "octo", "tool")});
  f.tui.handle_key('\t');
  f.tui.handle_key('v');
  REQUIRE(f.tui.browsing());
  f.tui.handle_key('a');
  CHECK_FALSE(f.tui.browsing());
  REQUIRE(pump(f.runner, f.ui));
}

TEST_CASE("follow key toggles the selected user", "[tui]") {
  Fixture f("fastgh_tui_follow");
  UserProfile mona;
  mona.login = "mona";
  f.tui.following_loaded({mona});
  f.tui.handle_key('F');
  CHECK(f.server->count("/user/following/mona") == 0);
  f.tui.handle_key(KEY_BTAB);
  f.tui.handle_key(KEY_BTAB);
  REQUIRE(f.tui.tab() == Tab::Following);
  f.tui.handle_key('F');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.tui.message() == "Following mona");
  auto reqs = f.server->requests();
  REQUIRE(reqs.size() >= 2);
  CHECK(reqs.back().method == "PUT");
}

TEST_CASE("mute key ignores the selected thread", "[tui]") {
  Fixture f("fastgh_tui_mute");
  f.tui.notifications_loaded({thread("9", true)});
  f.tui.handle_key(KEY_BTAB);
  REQUIRE(f.tui.tab() == Tab::Notifications);
  f.tui.handle_key('u');
  REQUIRE(pump(f.runner, f.ui));
  CHECK(f.tui.message() == "Muted notification 9");
  CHECK(f.server->count("/notifications/threads/9/subscription") == 1);
}
