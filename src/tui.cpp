/**
 * @file tui.cpp
 * @brief Implementation of the terminal UI for fastgh.
 *
 * Contains the curses based UI showing the feed, repositories, starred and
 * watched repositories, followed users and notifications of the current
 * account.
 */

#include "tui.hpp"
#include "browser.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#if defined(_WIN32)
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace {

std::shared_ptr<spdlog::logger> tui_log() {
  static auto logger = [] {
    fastgh::ensure_default_logger();
    return fastgh::category_logger("tui");
  }();
  return logger;
}

struct ParsedBinding {
  int key;
  std::string label;
};

/**
 * Return a trimmed copy of the input string.
 *
 * @param s String potentially containing leading or trailing whitespace.
 * @return New string without surrounding whitespace.
 */
std::string trim_copy(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) {
    return static_cast<bool>(std::isspace(ch));
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) {
               return static_cast<bool>(std::isspace(ch));
             }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower_copy(const std::string &s) {
  std::string result;
  result.reserve(s.size());
  std::transform(s.begin(), s.end(), std::back_inserter(result),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  return result;
}

/**
 * Split a binding list specification into individual tokens.
 *
 * @param spec Comma- or pipe-separated list of bindings.
 * @return Vector of trimmed binding strings.
 */
std::vector<std::string> split_binding_list(const std::string &spec) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : spec) {
    if (ch == ',' || ch == '|') {
      std::string trimmed = trim_copy(current);
      if (!trimmed.empty()) {
        parts.push_back(trimmed);
      }
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  std::string trimmed = trim_copy(current);
  if (!trimmed.empty()) {
    parts.push_back(trimmed);
  }
  return parts;
}

/**
 * Parse a textual binding specification into key codes and labels.
 *
 * @param spec Binding description string such as `"ctrl+c"`.
 * @return Parsed key codes paired with human-friendly labels.
 */
std::vector<ParsedBinding> parse_binding_spec(const std::string &spec) {
  std::vector<ParsedBinding> result;
  if (spec.empty()) {
    return result;
  }
  std::string lower = to_lower_copy(spec);
  if (lower == "\\n" || lower == "enter" || lower == "return" ||
      lower == "newline" || lower == "key_enter") {
    result.push_back({KEY_ENTER, "Enter"});
    result.push_back({static_cast<int>('\n'), "Enter"});
    return result;
  }
  if (lower == "space" || lower == "spacebar") {
    result.push_back({static_cast<int>(' '), "Space"});
    return result;
  }
  if (lower == "\\t" || lower == "tab") {
    result.push_back({static_cast<int>('\t'), "Tab"});
    return result;
  }
  if (lower == "shift+tab" || lower == "btab") {
    result.push_back({KEY_BTAB, "Shift+Tab"});
    return result;
  }
  if (lower == "escape" || lower == "esc") {
    result.push_back({27, "Escape"});
    return result;
  }
  if (lower == "backspace" || lower == "key_backspace") {
    result.push_back({KEY_BACKSPACE, "Backspace"});
    result.push_back({127, "Backspace"});
    return result;
  }
  if (lower == "up" || lower == "arrow_up" || lower == "key_up") {
    result.push_back({KEY_UP, "Up"});
    return result;
  }
  if (lower == "down" || lower == "arrow_down" || lower == "key_down") {
    result.push_back({KEY_DOWN, "Down"});
    return result;
  }
  if (lower == "left" || lower == "arrow_left" || lower == "key_left") {
    result.push_back({KEY_LEFT, "Left"});
    return result;
  }
  if (lower == "right" || lower == "arrow_right" || lower == "key_right") {
    result.push_back({KEY_RIGHT, "Right"});
    return result;
  }
  if (lower.rfind("ctrl+", 0) == 0) {
    std::string suffix = trim_copy(spec.substr(5));
    if (suffix.size() == 1) {
      unsigned char ch = static_cast<unsigned char>(suffix[0]);
      unsigned char upper = static_cast<unsigned char>(std::toupper(ch));
      int key = static_cast<int>(upper & 0x1F);
      std::string label = "Ctrl+";
      label.push_back(static_cast<char>(upper));
      result.push_back({key, label});
    }
    return result;
  }
  if (lower.size() == 1) {
    unsigned char ch = static_cast<unsigned char>(spec[0]);
    std::string label(1, static_cast<char>(spec[0]));
    result.push_back({static_cast<int>(ch), label});
    return result;
  }
  return result;
}

const std::unordered_map<std::string, std::string> &action_descriptions() {
  static const std::unordered_map<std::string, std::string> descriptions{
      {"refresh", "Refresh"},
      {"next_tab", "Next tab"},
      {"prev_tab", "Previous tab"},
      {"navigate_up", "Up"},
      {"navigate_down", "Down"},
      {"open", "Open"},
      {"star", "Star/unstar"},
      {"mark_read", "Mark read"},
      {"mark_done", "Done"},
      {"clone", "Clone/pull"},
      {"cancel_clone", "Cancel clone"},
      {"switch_account", "Switch account"},
      {"add_account", "Add account"},
      {"details", "Details"},
      {"back", "Back"},
      {"toggle_state", "Close/reopen"},
      {"merge", "Merge"},
      {"rerun_failed", "Re-run failed"},
      {"job_logs", "Job log"},
      {"download", "Download"},
      {"branch", "Branch"},
      {"filter", "Open/closed"},
      {"follow", "Follow/unfollow"},
      {"mute", "Mute"},
      {"quit", "Quit"}};
  return descriptions;
}

const std::unordered_set<std::string> &valid_actions() {
  static const std::unordered_set<std::string> actions = [] {
    std::unordered_set<std::string> names;
    for (const auto &entry : action_descriptions()) {
      names.insert(entry.first);
    }
    return names;
  }();
  return actions;
}

/**
 * Normalize action names to canonical identifiers.
 *
 * @param action Input action string provided by configuration.
 * @return Canonical action identifier recognized by the TUI.
 */
std::string canonicalize_action(const std::string &action) {
  std::string lower = to_lower_copy(action);
  std::replace(lower.begin(), lower.end(), '-', '_');
  if (lower == "up" || lower == "previous" || lower == "prev") {
    return "navigate_up";
  }
  if (lower == "down" || lower == "next") {
    return "navigate_down";
  }
  if (lower == "tab_next" || lower == "next_page") {
    return "next_tab";
  }
  if (lower == "tab_prev" || lower == "previous_tab" || lower == "prev_page") {
    return "prev_tab";
  }
  if (lower == "open_browser" || lower == "browse") {
    return "open";
  }
  if (lower == "toggle_star" || lower == "unstar") {
    return "star";
  }
  if (lower == "read") {
    return "mark_read";
  }
  if (lower == "done") {
    return "mark_done";
  }
  if (lower == "pull") {
    return "clone";
  }
  if (lower == "account" || lower == "next_account") {
    return "switch_account";
  }
  if (lower == "drill" || lower == "enter_repo" || lower == "detail") {
    return "details";
  }
  if (lower == "close" || lower == "reopen" || lower == "cancel_run") {
    return "toggle_state";
  }
  if (lower == "unfollow") {
    return "follow";
  }
  return lower;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string fit(std::string text, int width) {
  if (width <= 0) {
    return {};
  }
  if (static_cast<int>(text.size()) > width) {
    if (width > 3) {
      text = text.substr(0, static_cast<std::size_t>(width - 3)) + "...";
    } else {
      text = text.substr(0, static_cast<std::size_t>(width));
    }
  }
  return text;
}

} // namespace

namespace fastgh {

const char *tab_title(Tab tab) {
  switch (tab) {
  case Tab::Feed:
    return "Feed";
  case Tab::Repositories:
    return "Repositories";
  case Tab::Starred:
    return "Starred";
  case Tab::Watched:
    return "Watched";
  case Tab::Following:
    return "Following";
  case Tab::Notifications:
    return "Notifications";
  }
  return "";
}

Tui::Tui(SessionRegistry &sessions, RefreshDriver &driver, TaskRunner &runner,
         UiDispatcher &ui, PreferenceStore &prefs,
         std::shared_ptr<LogBufferSink> logs)
    : sessions_(sessions), driver_(driver), runner_(runner), ui_(ui),
      prefs_(prefs), logs_(std::move(logs)) {
  ensure_default_logger();
  initialize_default_hotkeys();
  open_cmd_ = [](const std::string &url) { return open_url(url); };
}

/**
 * Populate the default set of hotkey bindings.
 */
void Tui::initialize_default_hotkeys() {
  hotkey_help_order_ = {"refresh",      "next_tab",       "open",
                        "star",         "mark_read",      "mark_done",
                        "clone",        "cancel_clone",   "switch_account",
                        "add_account",  "details",        "back",
                        "toggle_state", "merge",          "rerun_failed",
                        "job_logs",     "download",       "branch",
                        "filter",       "follow",         "mute",
                        "quit",         "prev_tab",       "navigate_up",
                        "navigate_down"};
  action_bindings_.clear();
  key_to_action_.clear();
  set_bindings_for_action("refresh", {HotkeyBinding{'r', "r"}});
  set_bindings_for_action(
      "next_tab", {HotkeyBinding{'\t', "Tab"}, HotkeyBinding{KEY_RIGHT, "Right"}});
  set_bindings_for_action("prev_tab", {HotkeyBinding{KEY_BTAB, "Shift+Tab"},
                                       HotkeyBinding{KEY_LEFT, "Left"}});
  set_bindings_for_action("navigate_up",
                          {HotkeyBinding{KEY_UP, "Up"}, HotkeyBinding{'k', "k"}});
  set_bindings_for_action("navigate_down", {HotkeyBinding{KEY_DOWN, "Down"},
                                            HotkeyBinding{'j', "j"}});
  set_bindings_for_action("open", {HotkeyBinding{'o', "o"},
                                   HotkeyBinding{'\n', "Enter"},
                                   HotkeyBinding{KEY_ENTER, "Enter"}});
  set_bindings_for_action("star", {HotkeyBinding{'s', "s"}});
  set_bindings_for_action("mark_read", {HotkeyBinding{'m', "m"}});
  set_bindings_for_action("mark_done", {HotkeyBinding{'d', "d"}});
  set_bindings_for_action("clone", {HotkeyBinding{'c', "c"}});
  set_bindings_for_action("cancel_clone", {HotkeyBinding{'x', "x"}});
  set_bindings_for_action("switch_account", {HotkeyBinding{'a', "a"}});
  set_bindings_for_action("add_account", {HotkeyBinding{'n', "n"}});
  set_bindings_for_action("details", {HotkeyBinding{'v', "v"}});
  set_bindings_for_action("back", {HotkeyBinding{27, "Escape"},
                                   HotkeyBinding{KEY_BACKSPACE, "Backspace"},
                                   HotkeyBinding{127, "Backspace"}});
  set_bindings_for_action("toggle_state", {HotkeyBinding{'e', "e"}});
  set_bindings_for_action("merge", {HotkeyBinding{'g', "g"}});
  set_bindings_for_action("rerun_failed", {HotkeyBinding{'R', "R"}});
  set_bindings_for_action("job_logs", {HotkeyBinding{'l', "l"}});
  set_bindings_for_action("download", {HotkeyBinding{'D', "D"}});
  set_bindings_for_action("branch", {HotkeyBinding{'b', "b"}});
  set_bindings_for_action("filter", {HotkeyBinding{'f', "f"}});
  set_bindings_for_action("follow", {HotkeyBinding{'F', "F"}});
  set_bindings_for_action("mute", {HotkeyBinding{'u', "u"}});
  set_bindings_for_action("quit", {HotkeyBinding{'q', "q"}});
}

/**
 * Remove all bindings currently assigned to an action.
 *
 * @param action Canonical action identifier whose bindings should be cleared.
 */
void Tui::clear_action_bindings(const std::string &action) {
  auto it = action_bindings_.find(action);
  if (it == action_bindings_.end()) {
    action_bindings_.emplace(action, std::vector<HotkeyBinding>{});
    return;
  }
  for (const auto &binding : it->second) {
    auto key_it = key_to_action_.find(binding.key);
    if (key_it != key_to_action_.end() && key_it->second == action) {
      key_to_action_.erase(key_it);
    }
  }
  it->second.clear();
}

/**
 * Replace the bindings associated with an action.
 *
 * @param action Canonical action identifier receiving new bindings.
 * @param bindings Hotkey bindings to assign to the action.
 */
void Tui::set_bindings_for_action(
    const std::string &action, const std::vector<HotkeyBinding> &bindings) {
  clear_action_bindings(action);
  auto &vec = action_bindings_[action];
  vec.reserve(bindings.size());
  std::unordered_set<int> seen;
  for (const auto &binding : bindings) {
    if (!seen.insert(binding.key).second) {
      continue;
    }
    auto existing = key_to_action_.find(binding.key);
    if (existing != key_to_action_.end() && existing->second != action) {
      tui_log()->warn(
          "Hotkey '{}' already assigned to '{}'; '{}' will take precedence",
          binding.label, existing->second, action);
      auto &other = action_bindings_[existing->second];
      other.erase(std::remove_if(other.begin(), other.end(),
                                 [&](const HotkeyBinding &b) {
                                   return b.key == binding.key;
                                 }),
                  other.end());
    }
    key_to_action_[binding.key] = action;
    vec.push_back(binding);
  }
}

/**
 * Apply user-provided hotkey configuration overrides.
 *
 * @param bindings Mapping from action identifiers to configuration strings.
 */
void Tui::configure_hotkeys(
    const std::unordered_map<std::string, std::string> &bindings) {
  for (const auto &entry : bindings) {
    std::string canonical = canonicalize_action(entry.first);
    if (valid_actions().count(canonical) == 0) {
      tui_log()->warn("Unknown hotkey action '{}' in configuration", entry.first);
      continue;
    }
    std::string value = trim_copy(entry.second);
    std::string lower_value = to_lower_copy(value);
    if (lower_value == "default") {
      continue;
    }
    if (value.empty() || lower_value == "none" || lower_value == "disabled" ||
        lower_value == "off") {
      tui_log()->info("Disabling hotkey bindings for action '{}'", canonical);
      set_bindings_for_action(canonical, {});
      continue;
    }
    std::vector<HotkeyBinding> parsed;
    for (const auto &spec : split_binding_list(value)) {
      std::vector<ParsedBinding> parsed_list = parse_binding_spec(spec);
      if (parsed_list.empty()) {
        tui_log()->warn(
            "Ignoring unrecognized hotkey binding '{}' for action '{}'", spec,
            canonical);
        continue;
      }
      for (const auto &p : parsed_list) {
        parsed.push_back(HotkeyBinding{p.key, p.label});
      }
    }
    if (parsed.empty()) {
      tui_log()->warn(
          "No valid hotkey bindings provided for action '{}'; keeping existing "
          "bindings",
          canonical);
      continue;
    }
    set_bindings_for_action(canonical, parsed);
  }
}

std::vector<std::string> Tui::bindings_for(const std::string &action) const {
  std::vector<std::string> labels;
  auto it = action_bindings_.find(action);
  if (it == action_bindings_.end()) {
    return labels;
  }
  for (const auto &binding : it->second) {
    if (std::find(labels.begin(), labels.end(), binding.label) == labels.end()) {
      labels.push_back(binding.label);
    }
  }
  return labels;
}

Tui::~Tui() { cleanup(); }

/**
 * Initialize the curses environment.
 *
 * Without a terminal on every standard stream the UI stays uninitialized.
 *
 * @throws std::runtime_error When the curses subsystem cannot be initialized.
 */
void Tui::init() {
  bool tty_out = isatty(fileno(stdout));
  bool tty_in = isatty(fileno(stdin));
  bool tty_err = isatty(fileno(stderr));
  if (!tty_out || !tty_in || !tty_err) {
    tui_log()->warn("Standard streams are not a terminal; UI disabled");
    return;
  }
  if (initscr() == nullptr) {
    throw std::runtime_error("Failed to initialize curses");
  }
  set_console_logging(false);
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  if (has_colors()) {
    start_color();
    use_default_colors();
    init_pair(1, COLOR_CYAN, -1);   // highlight
    init_pair(2, COLOR_YELLOW, -1); // logs
    init_pair(3, COLOR_GREEN, -1);  // help text
    init_pair(4, COLOR_RED, -1);    // errors
  }
  refresh();
  initialized_ = true;
  driver_.set_listener(this);
}

void Tui::show_message(const std::string &msg) {
  message_ = msg;
  tui_log()->info("{}", msg);
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::set_notice(const std::string &notice) {
  notice_ = notice;
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::clamp_selection() {
  std::size_t rows = tab_row_count();
  if (rows == 0) {
    selected_ = 0;
  } else if (selected_ >= static_cast<int>(rows)) {
    selected_ = static_cast<int>(rows) - 1;
  }
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::clear_lists() {
  feed_.clear();
  repos_.clear();
  starred_.clear();
  watched_.clear();
  following_.clear();
  notifications_.clear();
  browser_.reset();
  selected_ = 0;
  last_error_.clear();
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::feed_loaded(const std::vector<Event> &events) {
  feed_ = events;
  clamp_selection();
}

void Tui::repositories_loaded(const std::vector<Repository> &repos) {
  repos_ = repos;
  clamp_selection();
}

void Tui::starred_loaded(const std::vector<Repository> &repos) {
  starred_ = repos;
  clamp_selection();
}

void Tui::watched_loaded(const std::vector<Repository> &repos) {
  watched_ = repos;
  clamp_selection();
}

void Tui::following_loaded(const std::vector<UserProfile> &users) {
  following_ = users;
  clamp_selection();
}

void Tui::notifications_loaded(
    const std::vector<Notification> &notifications) {
  notifications_ = notifications;
  clamp_selection();
}

void Tui::change_detected(const ChangeAlert &alert) {
  show_message(alert.title + ": " + alert.body);
}

void Tui::refresh_failed(RefreshStream stream, const std::string &error) {
  last_error_ = std::string(to_string(stream)) + ": " + error;
  redraw_requested_.store(true, std::memory_order_relaxed);
}

const std::vector<Repository> *Tui::repo_list() const {
  switch (tab_) {
  case Tab::Repositories:
    return &repos_;
  case Tab::Starred:
    return &starred_;
  case Tab::Watched:
    return &watched_;
  default:
    return nullptr;
  }
}

const Repository *Tui::selected_repo() const {
  if (browser_) {
    return &browser_->repository();
  }
  const auto *list = repo_list();
  if (list == nullptr || selected_ < 0 ||
      selected_ >= static_cast<int>(list->size())) {
    return nullptr;
  }
  return &(*list)[static_cast<std::size_t>(selected_)];
}

const Notification *Tui::selected_notification() const {
  if (tab_ != Tab::Notifications || selected_ < 0 ||
      selected_ >= static_cast<int>(notifications_.size())) {
    return nullptr;
  }
  return &notifications_[static_cast<std::size_t>(selected_)];
}

std::size_t Tui::row_count() const {
  return browser_ ? browser_->row_count() : tab_row_count();
}

std::size_t Tui::tab_row_count() const {
  switch (tab_) {
  case Tab::Feed:
    return feed_.size();
  case Tab::Following:
    return following_.size();
  case Tab::Notifications:
    return notifications_.size();
  default:
    return repo_list()->size();
  }
}

std::string Tui::row_text(std::size_t index) const {
  if (browser_) {
    return browser_->row_text(index);
  }
  std::time_t now = std::time(nullptr);
  switch (tab_) {
  case Tab::Feed:
    return index < feed_.size() ? feed_[index].display(now) : std::string{};
  case Tab::Following:
    return index < following_.size() ? following_[index].display()
                                     : std::string{};
  case Tab::Notifications:
    return index < notifications_.size() ? notifications_[index].display(now)
                                         : std::string{};
  default: {
    const auto &list = *repo_list();
    return index < list.size() ? list[index].single_line() : std::string{};
  }
  }
}

std::string Tui::detail_text() const {
  if (browser_) {
    return browser_->detail_text();
  }
  if (selected_ < 0 || static_cast<std::size_t>(selected_) >= row_count()) {
    return {};
  }
  auto index = static_cast<std::size_t>(selected_);
  std::time_t now = std::time(nullptr);
  switch (tab_) {
  case Tab::Feed:
    return feed_[index].web_url();
  case Tab::Following: {
    const auto &user = following_[index];
    std::string text = user.display_name() + " | Repos: " +
                       std::to_string(user.public_repos) +
                       " | Followers: " + std::to_string(user.followers);
    if (user.location) {
      text += " | " + *user.location;
    }
    return text;
  }
  case Tab::Notifications: {
    const auto &n = notifications_[index];
    return n.type_label() + " in " + n.repository_full_name + " (" +
           n.reason_text() + ")";
  }
  default: {
    std::string tmpl = prefs_.get(pref::kRepoTemplate, kDefaultRepoTemplate);
    return (*repo_list())[index].render(tmpl, now);
  }
  }
}

std::string Tui::selected_url() const {
  if (browser_) {
    return browser_->selected_url();
  }
  if (selected_ < 0 || static_cast<std::size_t>(selected_) >= row_count()) {
    return {};
  }
  auto index = static_cast<std::size_t>(selected_);
  switch (tab_) {
  case Tab::Feed:
    return feed_[index].web_url();
  case Tab::Following:
    return following_[index].html_url;
  case Tab::Notifications:
    return notifications_[index].web_url();
  default:
    return (*repo_list())[index].html_url;
  }
}

std::size_t Tui::unread_count() const {
  return static_cast<std::size_t>(
      std::count_if(notifications_.begin(), notifications_.end(),
                    [](const Notification &n) { return n.unread; }));
}

std::string Tui::status_text() const {
  auto account = sessions_.current();
  std::string text =
      account ? "@" + account->username() : std::string("No account");
  if (sessions_.size() > 1) {
    text += " (" + std::to_string(sessions_.size()) + " accounts)";
  }
  text += " | Unread: " + std::to_string(unread_count());
  if (clone_) {
    text += " | Git running";
  }
  if (!notice_.empty()) {
    text += " | " + notice_;
  }
  if (!last_error_.empty()) {
    text += " | Error: " + last_error_;
  }
  return text;
}

/**
 * Redraw the entire user interface based on current state.
 */
void Tui::draw() {
  if (!initialized_)
    return;
  const bool color_capable = has_colors();
  int h = 0;
  int w = 0;
  getmaxyx(stdscr, h, w);

  const int tab_height = 1;
  const int status_height = 3;
  int log_height = (logs_ || browser_) ? std::max(3, h / 4) : 0;
  int list_height = h - tab_height - status_height - log_height;
  if (list_height < 3) {
    log_height = 0;
    list_height = std::max(3, h - tab_height - status_height);
  }

  if (h != last_h_ || w != last_w_ || tab_win_ == nullptr ||
      list_win_ == nullptr || status_win_ == nullptr ||
      (log_win_ != nullptr) != (log_height > 0)) {
    last_h_ = h;
    last_w_ = w;
    for (WINDOW **win : {&tab_win_, &list_win_, &status_win_, &log_win_}) {
      if (*win != nullptr) {
        delwin(*win);
        *win = nullptr;
      }
    }
    tab_win_ = newwin(tab_height, w, 0, 0);
    list_win_ = newwin(list_height, w, tab_height, 0);
    status_win_ = newwin(status_height, w, tab_height + list_height, 0);
    if (log_height > 0) {
      log_win_ = newwin(log_height, w, tab_height + list_height + status_height,
                        0);
    }
  }

  auto begin_highlight = [&](WINDOW *win) {
    wattron(win, color_capable ? COLOR_PAIR(1) : A_REVERSE);
  };
  auto end_highlight = [&](WINDOW *win) {
    wattroff(win, color_capable ? COLOR_PAIR(1) : A_REVERSE);
  };

  // Tab bar, or the panes of the open repository
  werase(tab_win_);
  int x = 0;
  if (browser_) {
    for (RepoPane p : {RepoPane::Issues, RepoPane::PullRequests,
                       RepoPane::Commits, RepoPane::Actions,
                       RepoPane::Releases, RepoPane::Files}) {
      std::string label = std::string(" ") + pane_title(p) + " ";
      if (x + static_cast<int>(label.size()) > w)
        break;
      if (p == browser_->pane())
        begin_highlight(tab_win_);
      mvwprintw(tab_win_, 0, x, "%s", label.c_str());
      if (p == browser_->pane())
        end_highlight(tab_win_);
      x += static_cast<int>(label.size()) + 1;
    }
  }
  for (Tab t : {Tab::Feed, Tab::Repositories, Tab::Starred, Tab::Watched,
                Tab::Following, Tab::Notifications}) {
    if (browser_)
      break;
    std::string label = std::string(" ") + tab_title(t);
    if (t == Tab::Notifications && unread_count() > 0) {
      label += " (" + std::to_string(unread_count()) + ")";
    }
    label += " ";
    if (x + static_cast<int>(label.size()) > w)
      break;
    if (t == tab_)
      begin_highlight(tab_win_);
    mvwprintw(tab_win_, 0, x, "%s", label.c_str());
    if (t == tab_)
      end_highlight(tab_win_);
    x += static_cast<int>(label.size()) + 1;
  }
  wnoutrefresh(tab_win_);

  // List window
  werase(list_win_);
  box(list_win_, 0, 0);
  std::string title = browser_ ? browser_->header_text() : tab_title(tab_);
  mvwprintw(list_win_, 0, 2, "%s", fit(title, w - 4).c_str());
  int list_h = 0;
  int list_w = 0;
  getmaxyx(list_win_, list_h, list_w);
  int visible = std::max(0, list_h - 2);
  int rows = static_cast<int>(row_count());
  int current = selected();
  int first = current >= visible ? current - visible + 1 : 0;
  if (rows == 0) {
    mvwprintw(list_win_, 1, 1, "Nothing to show yet");
  }
  for (int i = 0; i < visible && first + i < rows; ++i) {
    int index = first + i;
    std::string line =
        fit(row_text(static_cast<std::size_t>(index)), list_w - 2);
    if (index == current)
      begin_highlight(list_win_);
    mvwprintw(list_win_, 1 + i, 1, "%s", line.c_str());
    if (index == current)
      end_highlight(list_win_);
  }
  wnoutrefresh(list_win_);

  // Details, status and hotkey help
  werase(status_win_);
  mvwprintw(status_win_, 0, 0, "%s", fit(detail_text(), w).c_str());
  if (!last_error_.empty() && color_capable)
    wattron(status_win_, COLOR_PAIR(4));
  std::string status = status_text();
  if (!message_.empty()) {
    status += " | " + message_;
  }
  mvwprintw(status_win_, 1, 0, "%s", fit(status, w).c_str());
  if (!last_error_.empty() && color_capable)
    wattroff(status_win_, COLOR_PAIR(4));
  std::string help;
  const auto &descriptions = action_descriptions();
  for (const auto &action : hotkey_help_order_) {
    auto labels = bindings_for(action);
    if (labels.empty() || !action_available(action))
      continue;
    if (!help.empty())
      help += "  ";
    help += labels.front() + " " + descriptions.at(action);
  }
  if (!hotkeys_enabled_) {
    help = "Hotkeys disabled (navigation and quit only)";
  }
  if (color_capable)
    wattron(status_win_, COLOR_PAIR(3));
  mvwprintw(status_win_, 2, 0, "%s", fit(help, w).c_str());
  if (color_capable)
    wattroff(status_win_, COLOR_PAIR(3));
  wnoutrefresh(status_win_);

  // Log window, replaced by the drill-down of the open repository
  const bool show_drill = browser_ && !browser_->drill_down().empty();
  if (log_win_ != nullptr && (logs_ || show_drill)) {
    werase(log_win_);
    box(log_win_, 0, 0);
    mvwprintw(log_win_, 0, 2, "%s", show_drill ? "Details" : "Logs");
    int log_h = 0;
    int log_w = 0;
    getmaxyx(log_win_, log_h, log_w);
    std::vector<std::string> lines =
        show_drill ? split_lines(browser_->drill_down()) : logs_->lines();
    int max_lines = std::max(0, log_h - 2);
    int start = !show_drill && static_cast<int>(lines.size()) > max_lines
                    ? static_cast<int>(lines.size()) - max_lines
                    : 0;
    if (color_capable)
      wattron(log_win_, COLOR_PAIR(2));
    for (int i = 0; start + i < static_cast<int>(lines.size()) && i < max_lines;
         ++i) {
      mvwprintw(log_win_, 1 + i, 1, "%s",
                fit(lines[static_cast<std::size_t>(start + i)], log_w - 2)
                    .c_str());
    }
    if (color_capable)
      wattroff(log_win_, COLOR_PAIR(2));
    wnoutrefresh(log_win_);
  } else if (log_win_ != nullptr) {
    werase(log_win_);
    wnoutrefresh(log_win_);
  }

  doupdate();
  redraw_requested_.store(false, std::memory_order_relaxed);
}

void Tui::switch_tab(int delta) {
  constexpr int kTabs = 6;
  int next = (static_cast<int>(tab_) + delta + kTabs) % kTabs;
  tab_ = static_cast<Tab>(next);
  selected_ = 0;
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::open_selected() {
  std::string url = selected_url();
  if (url.empty()) {
    return;
  }
  if (!open_cmd_(url)) {
    show_message("Could not open " + url);
  }
}

void Tui::open_repository() {
  const Repository *repo = selected_repo();
  auto account = sessions_.current();
  if (repo == nullptr || !account) {
    return;
  }
  tui_log()->info("Opening {}", repo->full_name);
  browser_ = std::make_shared<RepoBrowser>(
      account, *repo, runner_, ui_, Preferences::from(prefs_),
      [this](const std::string &msg) { show_message(msg); });
  browser_->open();
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::close_repository() {
  browser_.reset();
  clamp_selection();
}

void Tui::toggle_follow() {
  auto account = sessions_.current();
  if (tab_ != Tab::Following || !account || selected_ < 0 ||
      selected_ >= static_cast<int>(following_.size())) {
    return;
  }
  std::string login = following_[static_cast<std::size_t>(selected_)].login;
  runner_.run_then_post(
      ui_, "toggle follow " + login,
      [account, login]() {
        bool following = account->api().is_following(login);
        bool ok = following ? account->api().unfollow_user(login)
                            : account->api().follow_user(login);
        return std::make_pair(ok, !following);
      },
      [this, login](std::pair<bool, bool> result) {
        if (!result.first) {
          show_message("Could not update follow state of " + login);
        } else {
          show_message((result.second ? "Following " : "Unfollowed ") + login);
        }
      },
      [this](const std::string &error) { show_message(error); });
}

void Tui::mute_selected() {
  const Notification *n = selected_notification();
  auto account = sessions_.current();
  if (n == nullptr || !account) {
    return;
  }
  std::string id = n->id;
  runner_.run_then_post(
      ui_, "mute " + id,
      [account, id]() { return account->api().mute_thread(id); },
      [this, id](bool ok) {
        show_message(ok ? "Muted notification " + id
                        : "Could not mute notification " + id);
      },
      [this](const std::string &error) { show_message(error); });
}

void Tui::toggle_star() {
  const Repository *repo = selected_repo();
  auto account = sessions_.current();
  if (repo == nullptr || !account) {
    return;
  }
  std::string owner = repo->owner;
  std::string name = repo->name;
  std::string full_name = repo->full_name;
  runner_.run_then_post(
      ui_, "toggle star " + full_name,
      [account, owner, name]() {
        bool starred = account->api().is_starred(owner, name);
        bool ok = starred ? account->api().unstar_repo(owner, name)
                          : account->api().star_repo(owner, name);
        return std::make_pair(ok, !starred);
      },
      [this, full_name](std::pair<bool, bool> result) {
        if (!result.first) {
          show_message("Could not update star on " + full_name);
        } else {
          show_message((result.second ? "Starred " : "Unstarred ") + full_name);
        }
      },
      [this](const std::string &error) { show_message(error); });
}

void Tui::mark_read(bool done) {
  const Notification *n = selected_notification();
  auto account = sessions_.current();
  if (n == nullptr || !account) {
    return;
  }
  std::string id = n->id;
  runner_.run_then_post(
      ui_, (done ? "mark done " : "mark read ") + id,
      [account, id, done]() {
        return done ? account->api().mark_thread_done(id)
                    : account->api().mark_thread_read(id);
      },
      [this, id, done](bool ok) {
        if (!ok) {
          show_message("Could not update notification " + id);
          return;
        }
        auto it = std::find_if(
            notifications_.begin(), notifications_.end(),
            [&id](const Notification &item) { return item.id == id; });
        if (it != notifications_.end()) {
          if (done) {
            notifications_.erase(it);
          } else {
            it->unread = false;
          }
        }
        clamp_selection();
        show_message(done ? "Notification done" : "Notification marked read");
      },
      [this](const std::string &error) { show_message(error); });
}

void Tui::start_clone() {
  const Repository *repo = selected_repo();
  if (repo == nullptr) {
    return;
  }
  if (clone_) {
    show_message("A git operation is already running");
    return;
  }
  Preferences prefs = Preferences::from(prefs_);
  std::string dest =
      clone_destination(*repo, prefs.git_path, prefs.git_use_org_structure);
  std::error_code ec;
  bool exists = std::filesystem::exists(std::filesystem::path(dest) / ".git", ec);
  auto op = std::make_shared<GitOperation>(
      exists ? pull_command(dest)
             : clone_command(*repo, dest, prefs.git_clone_recursive));
  clone_ = op;
  std::string full_name = repo->full_name;
  show_message((exists ? "Pulling " : "Cloning ") + full_name + " into " + dest);
  runner_.run_then_post(
      ui_, "git " + full_name,
      [this, op]() {
        return op->run([this](const std::string &line) {
          ui_.post([this, line] { show_message(line); });
        });
      },
      [this, full_name](GitResult result) {
        clone_.reset();
        std::string text = std::string("git ") + to_string(result.outcome) +
                           " for " + full_name;
        if (!result.error.empty()) {
          text += ": " + result.error;
        }
        show_message(text);
      },
      [this](const std::string &error) {
        clone_.reset();
        show_message(error);
      });
}

void Tui::cancel_clone() {
  if (!clone_) {
    show_message("No git operation running");
    return;
  }
  clone_->cancel();
  show_message("Cancelling git operation");
}

void Tui::switch_account() {
  if (sessions_.size() < 2) {
    show_message("Only one account signed in");
    return;
  }
  std::size_t next = (sessions_.current_slot().value_or(0) + 1) % sessions_.size();
  if (!sessions_.switch_account(next)) {
    return;
  }
  clear_lists();
  show_message("Switched to @" + sessions_.current()->username());
  driver_.refresh_all();
}

void Tui::suspend() {
  if (!initialized_) {
    return;
  }
  def_prog_mode();
  endwin();
  set_console_logging(true);
}

void Tui::resume() {
  if (!initialized_) {
    return;
  }
  set_console_logging(false);
  reset_prog_mode();
  refresh();
  last_h_ = 0;
  last_w_ = 0;
  redraw_requested_.store(true, std::memory_order_relaxed);
}

void Tui::add_account() {
  if (!add_account_) {
    return;
  }
  suspend();
  AddAccountResult result = add_account_();
  resume();
  switch (result.status) {
  case AddAccountStatus::Added:
    sessions_.switch_account(result.account->slot());
    clear_lists();
    show_message("Added @" + result.account->username());
    driver_.refresh_all();
    break;
  case AddAccountStatus::Cancelled:
  case AddAccountStatus::ExitRequested:
    show_message("Adding account cancelled");
    break;
  case AddAccountStatus::Failed:
    show_message("Adding account failed: " + result.message);
    break;
  }
}

void Tui::handle_key(int ch) {
  auto it = key_to_action_.find(ch);
  if (it == key_to_action_.end()) {
    tui_log()->debug("Unhandled key: {}", ch);
    return;
  }
  const std::string action = it->second;
  const bool is_navigation =
      action == "navigate_up" || action == "navigate_down" ||
      action == "next_tab" || action == "prev_tab" || action == "back";
  if (!hotkeys_enabled_ && !is_navigation && action != "quit") {
    tui_log()->debug("Hotkeys disabled; ignoring action {}", action);
    return;
  }
  redraw_requested_.store(true, std::memory_order_relaxed);
  if (action == "quit") {
    tui_log()->info("Quit requested");
    running_ = false;
    return;
  }
  if (browser_) {
    if (action == "refresh") {
      browser_->reload();
    } else if (action == "next_tab") {
      browser_->switch_pane(1);
    } else if (action == "prev_tab") {
      browser_->switch_pane(-1);
    } else if (action == "navigate_up") {
      browser_->move(-1);
    } else if (action == "navigate_down") {
      browser_->move(1);
    } else if (action == "back") {
      if (!browser_->back()) {
        close_repository();
      }
    } else if (action == "details") {
      browser_->enter();
    } else if (action == "open") {
      open_selected();
    } else if (action == "star") {
      toggle_star();
    } else if (action == "mark_read") {
      browser_->mark_notifications_read();
    } else if (action == "clone") {
      start_clone();
    } else if (action == "cancel_clone") {
      cancel_clone();
    } else if (action == "toggle_state") {
      browser_->toggle_state();
    } else if (action == "merge") {
      browser_->merge();
    } else if (action == "rerun_failed") {
      browser_->rerun_failed();
    } else if (action == "job_logs") {
      browser_->fetch_job_logs();
    } else if (action == "download") {
      browser_->download_asset();
    } else if (action == "branch") {
      browser_->cycle_branch();
    } else if (action == "filter") {
      browser_->toggle_filter();
    } else if (action == "switch_account") {
      switch_account();
    } else if (action == "add_account") {
      add_account();
    }
    return;
  }
  if (action == "refresh") {
    tui_log()->info("Manual refresh requested");
    driver_.refresh_all();
  } else if (action == "next_tab") {
    switch_tab(1);
  } else if (action == "prev_tab") {
    switch_tab(-1);
  } else if (action == "navigate_up") {
    if (selected_ > 0) {
      --selected_;
    }
  } else if (action == "navigate_down") {
    if (selected_ + 1 < static_cast<int>(tab_row_count())) {
      ++selected_;
    }
  } else if (action == "open") {
    open_selected();
  } else if (action == "details") {
    open_repository();
  } else if (action == "star") {
    toggle_star();
  } else if (action == "mark_read") {
    mark_read(false);
  } else if (action == "mark_done") {
    mark_read(true);
  } else if (action == "mute") {
    mute_selected();
  } else if (action == "follow") {
    toggle_follow();
  } else if (action == "clone") {
    start_clone();
  } else if (action == "cancel_clone") {
    cancel_clone();
  } else if (action == "switch_account") {
    switch_account();
  } else if (action == "add_account") {
    add_account();
  }
}

/// Whether @p action does anything in the current view; drives the help line.
bool Tui::action_available(const std::string &action) const {
  static const std::unordered_set<std::string> repo_actions{
      "back",     "toggle_state", "merge",  "rerun_failed",
      "job_logs", "download",     "branch", "filter"};
  if (browser_) {
    return action != "mark_done" && action != "follow" && action != "mute";
  }
  if (repo_actions.count(action) > 0) {
    return false;
  }
  if (action == "details" || action == "star" || action == "clone") {
    return repo_list() != nullptr;
  }
  if (action == "mark_read" || action == "mark_done" || action == "mute") {
    return tab_ == Tab::Notifications;
  }
  if (action == "follow") {
    return tab_ == Tab::Following;
  }
  return true;
}

/**
 * Enter the main UI loop, processing input until exit.
 */
void Tui::run() {
  if (!initialized_)
    return;
  running_ = true;
  redraw_requested_.store(true, std::memory_order_relaxed);
  auto next_refresh = std::chrono::steady_clock::now() + refresh_interval_;
  while (running_) {
    if (ui_.drain() > 0) {
      redraw_requested_.store(true, std::memory_order_relaxed);
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= next_refresh ||
        redraw_requested_.load(std::memory_order_relaxed)) {
      draw();
      next_refresh = std::chrono::steady_clock::now() + refresh_interval_;
    }
    timeout(100);
    int ch = getch();
    if (ch == ERR) {
      continue;
    }
    if (ch == KEY_RESIZE) {
      redraw_requested_.store(true, std::memory_order_relaxed);
      continue;
    }
    handle_key(ch);
  }
}

/**
 * Restore terminal state after the UI terminates.
 */
void Tui::cleanup() {
  if (!initialized_)
    return;
  driver_.set_listener(nullptr);
  if (clone_) {
    clone_->cancel();
  }
  for (WINDOW **win : {&tab_win_, &list_win_, &status_win_, &log_win_}) {
    if (*win != nullptr) {
      delwin(*win);
      *win = nullptr;
    }
  }
  endwin();
  set_console_logging(true);
  initialized_ = false;
}

} // namespace fastgh
