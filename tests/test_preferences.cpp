#include "preferences.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace fastgh;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

} // namespace

TEST_CASE("in-memory store returns fallbacks for missing or mistyped keys",
          "[preferences]") {
  PreferenceStore store;
  CHECK(store.file().empty());
  CHECK(store.get(pref::kAccounts, 1) == 1);
  CHECK(store.get(pref::kDarkMode, "off") == "off");
  store.set(pref::kDarkMode, "on");
  store.set(pref::kCommitLimit, std::string("many"));
  CHECK(store.get(pref::kDarkMode, "off") == "on");
  CHECK(store.get(pref::kCommitLimit, 10) == 10);
  CHECK(store.contains(pref::kDarkMode));
  store.erase(pref::kDarkMode);
  CHECK_FALSE(store.contains(pref::kDarkMode));
  CHECK(store.save());
}

TEST_CASE("autosave writes every change to disk", "[preferences]") {
  fs::path dir = fresh_dir("fastgh_prefs_autosave");
  fs::path file = dir / "nested" / "preferences.json";
  {
    PreferenceStore store(file);
    CHECK(store.load());
    store.set(pref::kAccounts, 2);
    store.set(pref::kNotifyStarred, true);
  }
  REQUIRE(fs::exists(file));
  PreferenceStore reloaded(file);
  REQUIRE(reloaded.load());
  CHECK(reloaded.get(pref::kAccounts, 1) == 2);
  CHECK(reloaded.get(pref::kNotifyStarred, false));
  fs::remove_all(dir);
}

TEST_CASE("stores without autosave write only on save", "[preferences]") {
  fs::path dir = fresh_dir("fastgh_prefs_manual");
  fs::path file = dir / "preferences.json";
  PreferenceStore store(file, false);
  store.set(pref::kGitPath, "/src");
  CHECK_FALSE(fs::exists(file));
  std::string error;
  REQUIRE(store.save(&error));
  CHECK(fs::exists(file));
  fs::remove_all(dir);
}

TEST_CASE("malformed preference files fail to load", "[preferences]") {
  fs::path dir = fresh_dir("fastgh_prefs_malformed");
  fs::create_directories(dir);
  fs::path file = dir / "preferences.json";
  {
    std::ofstream out(file);
    out << "[1, 2";
  }
  PreferenceStore store(file);
  std::string error;
  CHECK_FALSE(store.load(&error));
  CHECK(error.find("Malformed") != std::string::npos);
  {
    std::ofstream out(file, std::ios::trunc);
    out << "[1, 2]";
  }
  CHECK_FALSE(store.load());
  fs::remove_all(dir);
}

TEST_CASE("merge copies overrides and ignores non-objects", "[preferences]") {
  PreferenceStore store;
  store.set(pref::kDarkMode, "off");
  store.merge({{pref::kDarkMode, "system"}, {pref::kAutoRefreshInterval, 5}});
  store.merge(nlohmann::json::array({1}));
  auto doc = store.document();
  CHECK(doc.size() == 2);
  CHECK(doc[pref::kDarkMode] == "system");
  CHECK(doc[pref::kAutoRefreshInterval] == 5);
}

TEST_CASE("typed preferences apply defaults and clamp values",
          "[preferences]") {
  PreferenceStore store;
  Preferences defaults = Preferences::from(store);
  CHECK(defaults.accounts == 1);
  CHECK(defaults.dark_mode == "off");
  CHECK(defaults.repo_template == kDefaultRepoTemplate);
  CHECK(defaults.global_hotkey == "control+alt+g");
  CHECK_FALSE(defaults.notify_notifications);
  CHECK(defaults.check_for_updates);
  CHECK(defaults.git_path.find('~') == std::string::npos);

  store.set(pref::kAccounts, 0);
  store.set(pref::kCommitLimit, -4);
  store.set(pref::kAutoRefreshInterval, -1);
  store.set(pref::kNotifyWatched, true);
  store.set(pref::kGitCloneRecursive, 1);
  Preferences p = Preferences::from(store);
  CHECK(p.accounts == 1);
  CHECK(p.commit_limit == 0);
  CHECK(p.auto_refresh_interval == 0);
  CHECK(p.notify_watched);
  CHECK_FALSE(p.git_clone_recursive);
}

TEST_CASE("expand_home only rewrites a leading tilde", "[preferences]") {
  const char *home = std::getenv("HOME");
  if (home != nullptr) {
    CHECK(expand_home("~/git") == std::string(home) + "/git");
    CHECK(expand_home("~") == std::string(home));
  }
  CHECK(expand_home("~other/git") == "~other/git");
  CHECK(expand_home("/abs/~/x") == "/abs/~/x");
  CHECK(expand_home("") == "");
}
