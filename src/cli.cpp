#include "cli.hpp"
#include "config.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <sstream>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace fastgh {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 18> categories = {
      "accounts", "app",   "auth",   "browser",     "changes", "cli",
      "config",   "credentials", "git", "github", "http",    "notify",
      "preferences", "refresh", "tasks", "tui",     "ui",      "update"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., refresh=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"fastgh - a fast terminal GitHub client"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, JSON or TOML)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_option("--config-dir", options.config_dir,
                 "Directory holding preferences and account credentials")
      ->type_name("DIR")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "fastgh " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  CLI::Option *log_level_option =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, "
             "off)")
          ->type_name("LEVEL")
          ->default_val("info")
          ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning",
                                 "error", "critical", "off"}))
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_function(
         "--log-compress",
         [&options](std::size_t) {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_flag("--no-tui", options.no_tui,
               "Run without the terminal UI and print refreshed lists")
      ->group("Modes");
  app.add_flag("--list-accounts", options.list_accounts,
               "List signed-in accounts and exit")
      ->group("Accounts");
  app.add_flag("--add-account", options.add_account,
               "Sign in an additional account with the device flow and exit")
      ->group("Accounts");
  app.add_option_function<int>(
         "--remove-account",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--remove-account",
                                        "slot must be non-negative");
           }
           options.remove_account = value;
         },
         "Sign out the account in slot N and exit")
      ->type_name("N")
      ->group("Accounts");
  app.add_option("--import-tokens", options.import_tokens,
                 "Seed new account slots from a token file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("Accounts");
  app.add_flag("--refresh-once", options.refresh_once,
               "Refresh every list once for the current account, print the "
               "results and exit")
      ->group("Modes");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  options.log_level_explicit = log_level_option->count() > 0U;
  if (options.verbose && !options.log_level_explicit) {
    options.log_level = "debug";
    options.log_level_explicit = true;
  }
  cli_log()->debug("Parsed command line: {} argument(s)", argc - 1);
  return options;
}

void apply_cli_overrides(const CliOptions &options, Config &cfg) {
  if (options.verbose) {
    cfg.set_verbose(true);
  }
  if (options.log_level_explicit) {
    cfg.set_log_level(options.log_level);
  }
  if (!options.log_file.empty()) {
    cfg.set_log_file(options.log_file);
  }
  if (options.log_rotate_explicit) {
    cfg.set_log_rotate(options.log_rotate);
  }
  if (options.log_compress_explicit) {
    cfg.set_log_compress(options.log_compress);
  }
  for (const auto &[name, level] : options.log_categories) {
    cfg.set_log_category(name, level);
  }
  if (!options.config_dir.empty()) {
    cfg.set_config_dir(options.config_dir);
  }
}

} // namespace fastgh
