/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for fastgh.
 *
 * Declares CLI parsing helpers, the option structure, and the exception used
 * to request an early exit.
 */

#ifndef FASTGH_CLI_HPP
#define FASTGH_CLI_HPP

#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace fastgh {

class Config;

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * `*_explicit` members record whether the user supplied the value so it can
 * override the configuration file.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string config_dir;         ///< Overrides the configuration directory
  std::string log_level = "info"; ///< Logging verbosity level
  bool log_level_explicit{false}; ///< True if CLI set the log level
  std::string log_file;           ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress{false};          ///< Compress rotated log files
  bool log_compress_explicit{false}; ///< True if CLI toggled log compression
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI

  bool no_tui{false};          ///< Run headless instead of the curses UI
  bool list_accounts{false};   ///< Print signed-in accounts and exit
  bool add_account{false};     ///< Sign in one more account and exit
  std::optional<int> remove_account; ///< Slot to sign out, then exit
  std::string import_tokens;   ///< File with tokens seeding new slots
  bool refresh_once{false};    ///< Refresh every stream once, print, exit
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing encounters non-error conditions such as
 *         `--help` or `--version`, or a parse error, that require the
 *         application to exit early.
 */
CliOptions parse_cli(int argc, char **argv);

/**
 * Apply explicitly supplied command line values on top of @p cfg.
 */
void apply_cli_overrides(const CliOptions &options, Config &cfg);

} // namespace fastgh

#endif // FASTGH_CLI_HPP
