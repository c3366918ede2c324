/**
 * @file notification.cpp
 * @brief Desktop notification dispatch through platform utilities
 * (notify-send, terminal-notifier, osascript, PowerShell/BurntToast).
 */
#include "notification.hpp"
#include "log.hpp"

#include <cstdlib>
#include <utility>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> notify_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("notify");
  }();
  return logger;
}

/**
 * Quote a string for safe use in POSIX shells.
 *
 * @param s String to escape.
 * @return Safely quoted representation suitable for `sh`/`bash`.
 */
[[maybe_unused]] std::string shell_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

/// Escape characters for use inside AppleScript quoted strings.
[[maybe_unused]] std::string escape_apple_script(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\\' || c == '"') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  return out;
}

/// Escape characters for use inside PowerShell single-quoted strings.
[[maybe_unused]] std::string escape_powershell(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '\'') {
      out += "''";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

} // namespace

NotifySendNotifier::NotifySendNotifier(CommandRunner runner,
                                       std::string app_name)
    : run_(std::move(runner)), app_name_(std::move(app_name)) {}

void NotifySendNotifier::notify(const std::string &title,
                                const std::string &body) {
  notify_log()->debug("Notification: {} / {}", title, body);
#ifdef _WIN32
  std::string cmd =
      "powershell -NoProfile -Command \"Try {Import-Module BurntToast "
      "-ErrorAction Stop; New-BurntToastNotification -Text '" +
      escape_powershell(title) + "','" + escape_powershell(body) +
      "'} Catch {}\"";
  run_(cmd);
#elif defined(__APPLE__)
  if (run_("command -v terminal-notifier >/dev/null 2>&1") == 0) {
    std::string cmd = "terminal-notifier -title " + shell_escape(title) +
                      " -message " + shell_escape(body) + " -group " +
                      shell_escape(app_name_);
    run_(cmd);
  } else {
    std::string cmd = "osascript -e 'display notification \"" +
                      escape_apple_script(body) + "\" with title \"" +
                      escape_apple_script(title) + "\"'";
    run_(cmd);
  }
#elif defined(__linux__)
  if (run_("command -v notify-send >/dev/null 2>&1") == 0) {
    std::string cmd = "notify-send -a " + shell_escape(app_name_) + " " +
                      shell_escape(title) + " " + shell_escape(body);
    if (run_(cmd) != 0) {
      notify_log()->warn("notify-send failed for '{}'", title);
    }
  } else {
    notify_log()->debug("notify-send not available; dropped '{}'", title);
  }
#else
  (void)title;
  (void)body;
#endif
}

void LogNotifier::notify(const std::string &title, const std::string &body) {
  notify_log()->info("{}: {}", title, body);
}

} // namespace fastgh
