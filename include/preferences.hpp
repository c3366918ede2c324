/**
 * @file preferences.hpp
 * @brief Persistent user preferences.
 *
 * PreferenceStore is a thread-safe key/value document persisted as JSON.
 * Preferences is a typed snapshot of the known keys with their defaults.
 */

#ifndef FASTGH_PREFERENCES_HPP
#define FASTGH_PREFERENCES_HPP

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace fastgh {

/// Preference keys.
namespace pref {
inline constexpr const char *kAccounts = "accounts";
inline constexpr const char *kDarkMode = "dark_mode";
inline constexpr const char *kRepoTemplate = "repo_template";
inline constexpr const char *kCommitLimit = "commit_limit";
inline constexpr const char *kDownloadLocation = "download_location";
inline constexpr const char *kGlobalHotkey = "global_hotkey";
inline constexpr const char *kGitPath = "git_path";
inline constexpr const char *kGitUseOrgStructure = "git_use_org_structure";
inline constexpr const char *kGitCloneRecursive = "git_clone_recursive";
inline constexpr const char *kNotifyActivity = "notify_activity";
inline constexpr const char *kNotifyNotifications = "notify_notifications";
inline constexpr const char *kNotifyStarred = "notify_starred";
inline constexpr const char *kNotifyWatched = "notify_watched";
inline constexpr const char *kAutoRefreshInterval = "auto_refresh_interval";
inline constexpr const char *kCheckForUpdates = "check_for_updates";
} // namespace pref

/**
 * JSON backed preference document.
 *
 * With autosave enabled every set() writes the file immediately. A store
 * constructed with an empty path lives in memory only.
 */
class PreferenceStore {
public:
  explicit PreferenceStore(std::filesystem::path file = {},
                           bool autosave = true);

  PreferenceStore(const PreferenceStore &) = delete;
  PreferenceStore &operator=(const PreferenceStore &) = delete;

  /// Backing file; empty for in-memory stores.
  const std::filesystem::path &file() const { return file_; }

  /**
   * Replace the document with the file contents.
   *
   * A missing file yields an empty document and succeeds.
   */
  bool load(std::string *error = nullptr);

  /// Write the document to the backing file.
  bool save(std::string *error = nullptr) const;

  /// Value of @p key converted to `T`, or @p fallback when absent or of the
  /// wrong type.
  template <typename T> T get(const std::string &key, const T &fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = doc_.find(key);
    if (it == doc_.end() || it->is_null()) {
      return fallback;
    }
    try {
      return it->get<T>();
    } catch (const nlohmann::json::exception &) {
      return fallback;
    }
  }

  /// Convenience overload so string literals select `std::string`.
  std::string get(const std::string &key, const char *fallback) const {
    return get<std::string>(key, std::string(fallback));
  }

  /// Store @p value under @p key, saving when autosave is enabled.
  template <typename T> void set(const std::string &key, const T &value) {
    set_json(key, nlohmann::json(value));
  }

  bool contains(const std::string &key) const;
  void erase(const std::string &key);

  /// Copy every member of @p overrides into the document.
  void merge(const nlohmann::json &overrides);

  /// Copy of the whole document.
  nlohmann::json document() const;

private:
  void set_json(const std::string &key, nlohmann::json value);
  bool save_locked(std::string *error) const;

  std::filesystem::path file_;
  bool autosave_;
  mutable std::mutex mutex_;
  nlohmann::json doc_ = nlohmann::json::object();
};

/** Typed view of the known preferences. */
struct Preferences {
  int accounts = 1;
  std::string dark_mode = "off"; ///< "on", "off" or "system"
  std::string repo_template;
  int commit_limit = 0; ///< 0 = unlimited
  std::string download_location;
  std::string global_hotkey = "control+alt+g";
  std::string git_path;
  bool git_use_org_structure = false;
  bool git_clone_recursive = false;
  bool notify_activity = false;
  bool notify_notifications = false;
  bool notify_starred = false;
  bool notify_watched = false;
  int auto_refresh_interval = 0; ///< Minutes; 0 disables
  bool check_for_updates = true;

  /// Defaults with home-relative paths resolved.
  static Preferences defaults();

  /// Read every known key from @p store, falling back to defaults().
  static Preferences from(const PreferenceStore &store);
};

/// Default repository display template.
extern const char *const kDefaultRepoTemplate;

/// Expand a leading `~` to the user's home directory.
std::string expand_home(const std::string &path);

} // namespace fastgh

#endif // FASTGH_PREFERENCES_HPP
