#include "app.hpp"
#include "device_flow.hpp"
#include "github_client.hpp"
#include "http_client.hpp"
#include "token_loader.hpp"
#include "tui.hpp"
#include "update_check.hpp"
#include "version.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#if defined(_WIN32)
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace fastgh {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) { g_interrupted = true; }

constexpr std::chrono::milliseconds kPumpInterval{100};
} // namespace

HeadlessPrinter::HeadlessPrinter(std::ostream &out, PreferenceStore &prefs)
    : out_(out), prefs_(prefs) {}

void HeadlessPrinter::header(const char *title, std::size_t count) {
  ++delivered_;
  out_ << "== " << title << " (" << count << ") ==\n";
}

void HeadlessPrinter::feed_loaded(const std::vector<Event> &events) {
  header("Feed", events.size());
  std::time_t now = std::time(nullptr);
  for (const auto &event : events) {
    out_ << event.display(now) << '\n';
  }
  out_.flush();
}

void HeadlessPrinter::repositories_loaded(const std::vector<Repository> &repos) {
  header("Repositories", repos.size());
  std::string tmpl = prefs_.get(pref::kRepoTemplate, kDefaultRepoTemplate);
  std::time_t now = std::time(nullptr);
  for (const auto &repo : repos) {
    out_ << repo.render(tmpl, now) << '\n';
  }
  out_.flush();
}

void HeadlessPrinter::starred_loaded(const std::vector<Repository> &repos) {
  header("Starred", repos.size());
  for (const auto &repo : repos) {
    out_ << repo.single_line() << '\n';
  }
  out_.flush();
}

void HeadlessPrinter::watched_loaded(const std::vector<Repository> &repos) {
  header("Watched", repos.size());
  for (const auto &repo : repos) {
    out_ << repo.single_line() << '\n';
  }
  out_.flush();
}

void HeadlessPrinter::following_loaded(const std::vector<UserProfile> &users) {
  header("Following", users.size());
  for (const auto &user : users) {
    out_ << user.display() << '\n';
  }
  out_.flush();
}

void HeadlessPrinter::notifications_loaded(
    const std::vector<Notification> &notifications) {
  header("Notifications", notifications.size());
  std::time_t now = std::time(nullptr);
  for (const auto &n : notifications) {
    out_ << n.display(now) << '\n';
  }
  out_.flush();
}

void HeadlessPrinter::change_detected(const ChangeAlert &alert) {
  out_ << "!! " << alert.title << ": " << alert.body << '\n';
  out_.flush();
}

void HeadlessPrinter::refresh_failed(RefreshStream stream,
                                     const std::string &error) {
  ++delivered_;
  out_ << "!! " << to_string(stream) << " failed: " << error << '\n';
  out_.flush();
}

App::App() = default;

App::~App() {
  if (driver_) {
    driver_->stop_auto_refresh();
    driver_->set_listener(nullptr);
  }
  runner_.shutdown();
}

/**
 * Parse the command line, load the configuration and initialize logging.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Cannot load configuration {}: {}",
                       options_.config_file, e.what());
      should_exit_ = true;
      return 1;
    }
  }
  apply_cli_overrides(options_, config_);
  init_logging();
  try {
    build_components();
  } catch (const std::exception &e) {
    app_log()->error("Startup failed: {}", e.what());
    should_exit_ = true;
    return 1;
  }
  app_log()->info("fastgh {} starting", kVersionString);
  return 0;
}

void App::init_logging() {
  const std::string &level_str = config_.log_level();
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Unknown log level '{}'; using info", level_str);
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : config_.log_categories()) {
    auto parsed = spdlog::level::from_str(category_level);
    if (parsed == spdlog::level::off && category_level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
  if (config_.verbose()) {
    app_log()->debug("Verbose mode enabled");
  }
}

void App::build_components() {
  std::filesystem::path dir = config_.config_dir().empty()
                                  ? default_config_dir()
                                  : expand_home(config_.config_dir());
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Cannot create " + dir.string() + ": " +
                             ec.message());
  }
  app_log()->debug("Configuration directory {}", dir.string());

  prefs_ = std::make_unique<PreferenceStore>(dir / "preferences.json");
  std::string error;
  if (!prefs_->load(&error)) {
    app_log()->warn("Using default preferences: {}", error);
  }
  if (!config_.preference_overrides().empty()) {
    prefs_->merge(config_.preference_overrides());
  }
  credentials_ = std::make_unique<CredentialStore>(dir);
  notifier_ = std::make_shared<NotifySendNotifier>();
  setup_ = std::make_unique<AccountSetup>(
      *credentials_,
      [this](const std::string &token) { return make_client(token); },
      [this]() { return authorize(); });
  sessions_ = std::make_unique<SessionRegistry>(
      *credentials_, *prefs_,
      [this](std::size_t slot) { return setup_->open(slot); });
  driver_ = std::make_unique<RefreshDriver>(
      runner_, ui_, notifier_, [this]() { return sessions_->current(); },
      [this]() { return Preferences::from(*prefs_); });
}

std::unique_ptr<HttpClient> App::make_http() const {
  auto curl = std::make_unique<CurlHttpClient>(
      static_cast<long>(config_.http_timeout()) * 1000, kUserAgent,
      config_.http_proxy(), config_.https_proxy());
  return std::make_unique<RetryHttpClient>(std::move(curl),
                                           config_.http_retries(), 200);
}

std::unique_ptr<GitHubClient>
App::make_client(const std::string &token) const {
  return std::make_unique<GitHubClient>(token, make_http(), config_.api_base(),
                                        config_.request_delay_ms());
}

AuthOutcome App::authorize() {
  if (!interactive_) {
    return AuthCancelled{"Interactive sign-in is disabled for this command"};
  }
  std::string client_id =
      config_.client_id().empty() ? std::string(kDefaultClientId)
                                  : config_.client_id();
  DeviceFlowAuthenticator authenticator(make_http(), client_id,
                                        config_.login_base());
  ConsoleDevicePrompt prompt(std::cout);
  return authenticator.authenticate(prompt);
}

/**
 * Execute the mode selected on the command line.
 */
int App::execute() {
  if (options_.list_accounts) {
    return list_accounts();
  }
  if (options_.remove_account) {
    return remove_account(*options_.remove_account);
  }
  if (!options_.import_tokens.empty()) {
    return import_tokens(options_.import_tokens);
  }
  if (options_.add_account) {
    return add_account();
  }
  if (options_.refresh_once) {
    return refresh_once();
  }
  if (options_.no_tui) {
    return run_headless();
  }
  return run_tui();
}

int App::list_accounts() {
  interactive_ = false;
  sessions_->load_all();
  if (sessions_->empty()) {
    std::cout << "No accounts signed in" << std::endl;
    return 0;
  }
  auto current = sessions_->current();
  for (const auto &account : sessions_->accounts()) {
    std::cout << (account == current ? "* " : "  ") << '[' << account->slot()
              << "] @" << account->username();
    if (account->display_name() != account->username()) {
      std::cout << " (" << account->display_name() << ')';
    }
    std::cout << '\n';
  }
  std::cout.flush();
  return 0;
}

int App::add_account() {
  interactive_ = false;
  sessions_->load_all();
  interactive_ = true;
  AddAccountResult result = sessions_->add_account();
  switch (result.status) {
  case AddAccountStatus::Added:
    std::cout << "Signed in @" << result.account->username() << " in slot "
              << result.account->slot() << std::endl;
    return 0;
  case AddAccountStatus::Cancelled:
  case AddAccountStatus::ExitRequested:
    std::cout << "Sign-in cancelled: " << result.message << std::endl;
    return 1;
  case AddAccountStatus::Failed:
    break;
  }
  std::cerr << "Sign-in failed: " << result.message << std::endl;
  return 1;
}

int App::remove_account(int slot) {
  interactive_ = false;
  sessions_->load_all();
  std::string error;
  if (!sessions_->remove_account(static_cast<std::size_t>(slot), &error)) {
    std::cerr << "Cannot remove account " << slot << ": "
              << (error.empty() ? "no such account" : error) << std::endl;
    return 1;
  }
  std::cout << "Removed account in slot " << slot << std::endl;
  return 0;
}

int App::import_tokens(const std::string &path) {
  std::vector<std::string> tokens;
  try {
    tokens = load_tokens_from_file(path);
  } catch (const std::exception &e) {
    std::cerr << "Cannot read tokens from " << path << ": " << e.what()
              << std::endl;
    return 1;
  }
  interactive_ = false;
  sessions_->load_all();
  std::size_t imported = 0;
  for (const auto &token : tokens) {
    std::size_t slot = sessions_->size();
    std::string error;
    if (!credentials_->save_token(slot, token, &error)) {
      std::cerr << "Cannot store token: " << error << std::endl;
      return 1;
    }
    AddAccountResult result = sessions_->add_account(slot);
    if (result.status == AddAccountStatus::Added) {
      std::cout << "Imported @" << result.account->username() << " into slot "
                << slot << std::endl;
      ++imported;
      continue;
    }
    app_log()->warn("Token {} of {} rejected: {}", imported + 1, tokens.size(),
                    result.message);
    if (!credentials_->remove_slot(slot, &error)) {
      app_log()->warn("Cannot clean up slot {}: {}", slot, error);
    }
  }
  std::cout << "Imported " << imported << " of " << tokens.size()
            << " token(s)" << std::endl;
  return imported == tokens.size() ? 0 : 1;
}

void App::pump_until_idle() {
  while (!g_interrupted) {
    ui_.drain();
    if (runner_.in_flight() == 0 && ui_.pending() == 0) {
      break;
    }
    ui_.wait_for_work(kPumpInterval);
  }
  ui_.drain();
}

void App::check_updates(
    const std::function<void(const std::string &)> &sink) {
  Preferences prefs = Preferences::from(*prefs_);
  auto account = sessions_->current();
  if (!prefs.check_for_updates || !account ||
      config_.update_repository().empty()) {
    return;
  }
  std::string repository = config_.update_repository();
  runner_.run_then_post(
      ui_, "update check",
      [account, repository]() {
        return check_for_update(account->api(), repository, kVersionString);
      },
      [sink](std::optional<UpdateInfo> info) {
        if (info && info->available) {
          sink("Update available: " + info->latest_version + " " +
               info->html_url);
        }
      });
}

int App::refresh_once() {
  sessions_->load_all();
  if (sessions_->empty()) {
    std::cerr << "No account signed in" << std::endl;
    return 1;
  }
  HeadlessPrinter printer(std::cout, *prefs_);
  driver_->set_listener(&printer);
  driver_->refresh_all();
  pump_until_idle();
  driver_->set_listener(nullptr);
  return 0;
}

int App::run_headless() {
  sessions_->load_all();
  if (sessions_->empty()) {
    std::cerr << "No account signed in" << std::endl;
    return 1;
  }
  std::signal(SIGINT, on_interrupt);
  std::signal(SIGTERM, on_interrupt);
  HeadlessPrinter printer(std::cout, *prefs_);
  driver_->set_listener(&printer);
  check_updates([](const std::string &notice) {
    std::cout << notice << std::endl;
  });
  driver_->refresh_all();
  pump_until_idle();
  int minutes = Preferences::from(*prefs_).auto_refresh_interval;
  if (minutes > 0) {
    driver_->start_auto_refresh(std::chrono::minutes(minutes));
    while (!g_interrupted) {
      ui_.wait_for_work(kPumpInterval);
      ui_.drain();
    }
    driver_->stop_auto_refresh();
  }
  runner_.shutdown();
  driver_->set_listener(nullptr);
  return 0;
}

int App::run_tui() {
  if (!isatty(fileno(stdout)) || !isatty(fileno(stdin)) ||
      !isatty(fileno(stderr))) {
    app_log()->warn("No terminal attached; running headless");
    return run_headless();
  }
  log_buffer_ = attach_log_buffer(
      static_cast<std::size_t>(config_.log_buffer_lines()));
  if (sessions_->load_all() == AddAccountStatus::ExitRequested) {
    app_log()->info("No account signed in; exiting");
    return 0;
  }
  Tui ui(*sessions_, *driver_, runner_, ui_, *prefs_, log_buffer_);
  ui.set_hotkeys_enabled(config_.hotkeys_enabled());
  if (!config_.hotkey_bindings().empty()) {
    ui.configure_hotkeys(config_.hotkey_bindings());
  }
  ui.set_add_account_handler([this]() { return sessions_->add_account(); });
  ui.init();
  check_updates([&ui](const std::string &notice) { ui.set_notice(notice); });
  driver_->refresh_all();
  int minutes = Preferences::from(*prefs_).auto_refresh_interval;
  if (minutes > 0) {
    driver_->start_auto_refresh(std::chrono::minutes(minutes));
  }
  ui.run();
  driver_->stop_auto_refresh();
  ui.cleanup();
  runner_.shutdown();
  return 0;
}

} // namespace fastgh
