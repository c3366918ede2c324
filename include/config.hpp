#ifndef FASTGH_CONFIG_HPP
#define FASTGH_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace fastgh {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t < 1 ? 1 : t; }

  /// Number of HTTP retry attempts.
  int http_retries() const { return http_retries_; }

  /// Set number of HTTP retry attempts.
  void set_http_retries(int r) { http_retries_ = r < 1 ? 1 : r; }

  /// Minimum delay between two API requests in milliseconds.
  int request_delay_ms() const { return request_delay_ms_; }

  /// Set minimum delay between API requests.
  void set_request_delay_ms(int ms) { request_delay_ms_ = ms < 0 ? 0 : ms; }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// Base URL of the GitHub login endpoints used by the device flow.
  const std::string &login_base() const { return login_base_; }

  /// Set base URL of the login endpoints.
  void set_login_base(const std::string &base) { login_base_ = base; }

  /// OAuth application client id.
  const std::string &client_id() const { return client_id_; }

  /// Set OAuth application client id.
  void set_client_id(const std::string &id) { client_id_ = id; }

  /// Directory holding preferences and account slots. Empty selects the
  /// platform default.
  const std::string &config_dir() const { return config_dir_; }

  /// Set configuration directory.
  void set_config_dir(const std::string &dir) { config_dir_ = dir; }

  /// Repository ("owner/name") whose releases announce new versions.
  const std::string &update_repository() const { return update_repository_; }

  /// Set update repository.
  void set_update_repository(const std::string &repo) {
    update_repository_ = repo;
  }

  /// HTTP proxy URL.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set HTTP proxy URL.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// HTTPS proxy URL.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set HTTPS proxy URL.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &lvl) { log_level_ = lvl; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Log file path.
  const std::string &log_file() const { return log_file_; }

  /// Set log file path.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int files) { log_rotate_ = files < 0 ? 0 : files; }

  /// Whether rotated log files are gzip compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool compress) { log_compress_ = compress; }

  /// Lines kept by the in-memory log buffer shown in the UI.
  int log_buffer_lines() const { return log_buffer_lines_; }

  /// Set the size of the in-memory log buffer.
  void set_log_buffer_lines(int lines) {
    log_buffer_lines_ = lines < 1 ? 1 : lines;
  }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace category overrides.
  void
  set_log_categories(std::unordered_map<std::string, std::string> categories) {
    log_categories_ = std::move(categories);
  }

  /// Assign a single category level.
  void set_log_category(const std::string &name, const std::string &level) {
    log_categories_[name] = level;
  }

  /// Determine whether TUI hotkeys are enabled.
  bool hotkeys_enabled() const { return hotkeys_enabled_; }

  /// Set hotkey enablement.
  void set_hotkeys_enabled(bool enabled) { hotkeys_enabled_ = enabled; }

  /// Retrieve custom hotkey bindings (action -> comma separated key specs).
  const std::unordered_map<std::string, std::string> &hotkey_bindings() const {
    return hotkey_bindings_;
  }

  /// Assign or update a single hotkey binding.
  void set_hotkey_binding(const std::string &action, const std::string &key) {
    hotkey_bindings_[action] = key;
  }

  /// Preference overrides applied to the preference store at startup.
  const nlohmann::json &preference_overrides() const {
    return preference_overrides_;
  }

  /// Replace preference overrides. Non-object values are ignored.
  void set_preference_overrides(nlohmann::json overrides);

  /**
   * Load configuration values from a JSON object.
   *
   * Grouped sections (`core`, `logging`, `network`, `auth`, `ui`) are
   * flattened into the root before keys are read.
   */
  void load_json(const nlohmann::json &j);

  /// Load configuration from a file. Supports YAML, TOML, and JSON.
  static Config from_file(const std::string &path);

  /// Construct configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  int http_timeout_ = 30;
  int http_retries_ = 3;
  int request_delay_ms_ = 0;
  std::string api_base_ = "https://api.github.com";
  std::string login_base_ = "https://github.com";
  std::string client_id_;
  std::string config_dir_;
  std::string update_repository_ = "fastgh/fastgh";
  std::string http_proxy_;
  std::string https_proxy_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  int log_buffer_lines_ = 200;
  std::unordered_map<std::string, std::string> log_categories_;
  bool hotkeys_enabled_ = true;
  std::unordered_map<std::string, std::string> hotkey_bindings_;
  nlohmann::json preference_overrides_ = nlohmann::json::object();
};

/**
 * Parse a YAML, JSON or TOML file into a JSON value.
 *
 * The format is chosen from the file extension.
 *
 * @throws std::runtime_error When the file cannot be opened, parsed, or the
 *         extension is unsupported.
 */
nlohmann::json load_config_document(const std::string &path);

/// Platform default configuration directory
/// (`$XDG_CONFIG_HOME/fastgh`, `~/.config/fastgh` or `%APPDATA%\fastgh`).
std::string default_config_dir();

} // namespace fastgh

#endif // FASTGH_CONFIG_HPP
