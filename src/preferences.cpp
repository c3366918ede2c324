#include "preferences.hpp"
#include "log.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

namespace fastgh {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> prefs_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("preferences");
  }();
  return logger;
}

std::string home_directory() {
#ifdef _WIN32
  if (const char *profile = std::getenv("USERPROFILE")) {
    return profile;
  }
#endif
  if (const char *home = std::getenv("HOME")) {
    return home;
  }
  return ".";
}

} // namespace

const char *const kDefaultRepoTemplate =
    "$full_name$ - $description$ | Stars: $stars$ | Forks: $forks$ | "
    "Issues: $open_issues$ | $language$ | Updated $updated_at$";

std::string expand_home(const std::string &path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/' && path[1] != '\\') {
    return path;
  }
  return home_directory() + path.substr(1);
}

PreferenceStore::PreferenceStore(fs::path file, bool autosave)
    : file_(std::move(file)), autosave_(autosave) {}

bool PreferenceStore::load(std::string *error) {
  if (file_.empty()) {
    return true;
  }
  std::error_code ec;
  if (!fs::exists(file_, ec)) {
    std::lock_guard<std::mutex> lock(mutex_);
    doc_ = nlohmann::json::object();
    return true;
  }
  std::ifstream in(file_);
  if (!in) {
    std::string message = "Cannot open " + file_.string();
    prefs_log()->error("{}", message);
    if (error != nullptr) {
      *error = message;
    }
    return false;
  }
  nlohmann::json parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    std::string message = "Malformed preferences in " + file_.string();
    prefs_log()->error("{}", message);
    if (error != nullptr) {
      *error = message;
    }
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  doc_ = std::move(parsed);
  prefs_log()->debug("Loaded {} preferences from {}", doc_.size(),
                     file_.string());
  return true;
}

bool PreferenceStore::save(std::string *error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_locked(error);
}

bool PreferenceStore::save_locked(std::string *error) const {
  if (file_.empty()) {
    return true;
  }
  std::string message;
  std::error_code ec;
  if (file_.has_parent_path()) {
    fs::create_directories(file_.parent_path(), ec);
  }
  if (ec) {
    message = "Cannot create " + file_.parent_path().string() + ": " +
              ec.message();
  } else {
    fs::path tmp = file_;
    tmp += ".tmp";
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    out << doc_.dump(2) << '\n';
    out.close();
    if (!out) {
      message = "Cannot write " + tmp.string();
    } else {
      fs::rename(tmp, file_, ec);
      if (ec) {
        message = "Cannot replace " + file_.string() + ": " + ec.message();
      }
    }
  }
  if (message.empty()) {
    return true;
  }
  prefs_log()->error("{}", message);
  if (error != nullptr) {
    *error = message;
  }
  return false;
}

void PreferenceStore::set_json(const std::string &key, nlohmann::json value) {
  std::lock_guard<std::mutex> lock(mutex_);
  doc_[key] = std::move(value);
  if (autosave_) {
    save_locked(nullptr);
  }
}

bool PreferenceStore::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_.contains(key);
}

void PreferenceStore::erase(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  doc_.erase(key);
  if (autosave_) {
    save_locked(nullptr);
  }
}

void PreferenceStore::merge(const nlohmann::json &overrides) {
  if (!overrides.is_object()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[key, value] : overrides.items()) {
    doc_[key] = value;
  }
  if (autosave_) {
    save_locked(nullptr);
  }
}

nlohmann::json PreferenceStore::document() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return doc_;
}

Preferences Preferences::defaults() {
  Preferences p;
  p.repo_template = kDefaultRepoTemplate;
  p.download_location = expand_home("~/Downloads");
  p.git_path = expand_home("~/git");
  return p;
}

Preferences Preferences::from(const PreferenceStore &store) {
  Preferences p = defaults();
  p.accounts = store.get(pref::kAccounts, p.accounts);
  p.dark_mode = store.get(pref::kDarkMode, p.dark_mode);
  p.repo_template = store.get(pref::kRepoTemplate, p.repo_template);
  p.commit_limit = store.get(pref::kCommitLimit, p.commit_limit);
  p.download_location =
      expand_home(store.get(pref::kDownloadLocation, p.download_location));
  p.global_hotkey = store.get(pref::kGlobalHotkey, p.global_hotkey);
  p.git_path = expand_home(store.get(pref::kGitPath, p.git_path));
  p.git_use_org_structure =
      store.get(pref::kGitUseOrgStructure, p.git_use_org_structure);
  p.git_clone_recursive =
      store.get(pref::kGitCloneRecursive, p.git_clone_recursive);
  p.notify_activity = store.get(pref::kNotifyActivity, p.notify_activity);
  p.notify_notifications =
      store.get(pref::kNotifyNotifications, p.notify_notifications);
  p.notify_starred = store.get(pref::kNotifyStarred, p.notify_starred);
  p.notify_watched = store.get(pref::kNotifyWatched, p.notify_watched);
  p.auto_refresh_interval =
      store.get(pref::kAutoRefreshInterval, p.auto_refresh_interval);
  p.check_for_updates = store.get(pref::kCheckForUpdates, p.check_for_updates);
  if (p.accounts < 1) {
    p.accounts = 1;
  }
  if (p.commit_limit < 0) {
    p.commit_limit = 0;
  }
  if (p.auto_refresh_interval < 0) {
    p.auto_refresh_interval = 0;
  }
  return p;
}

} // namespace fastgh
