#include "cli.hpp"
#include "config.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace fastgh;

namespace {

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "fastgh");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}

} // namespace

TEST_CASE("test cli defaults", "[cli]") {
  CliOptions opts = parse({});
  CHECK_FALSE(opts.verbose);
  CHECK(opts.log_level == "info");
  CHECK_FALSE(opts.log_level_explicit);
  CHECK(opts.log_rotate == 3);
  CHECK_FALSE(opts.no_tui);
  CHECK_FALSE(opts.remove_account);
  CHECK(opts.import_tokens.empty());
}

TEST_CASE("verbose implies debug logging unless a level is given", "[cli]") {
  CliOptions verbose = parse({"--verbose"});
  CHECK(verbose.verbose);
  CHECK(verbose.log_level == "debug");
  CHECK(verbose.log_level_explicit);

  CliOptions explicit_level = parse({"-v", "--log-level", "warn"});
  CHECK(explicit_level.log_level == "warn");
}

TEST_CASE("logging options", "[cli]") {
  CliOptions opts =
      parse({"-F", "/tmp/fastgh.log", "--log-rotate", "0", "--log-compress",
             "--log-category", "http=trace", "--log-category", "refresh"});
  CHECK(opts.log_file == "/tmp/fastgh.log");
  CHECK(opts.log_rotate == 0);
  CHECK(opts.log_rotate_explicit);
  CHECK(opts.log_compress);
  CHECK(opts.log_categories.at("http") == "trace");
  CHECK(opts.log_categories.at("refresh") == "debug");
}

TEST_CASE("mode and account options", "[cli]") {
  CliOptions opts = parse({"--no-tui", "--refresh-once", "--list-accounts",
                           "--add-account", "--remove-account", "2",
                           "--config-dir", "/tmp/fastgh-cfg"});
  CHECK(opts.no_tui);
  CHECK(opts.refresh_once);
  CHECK(opts.list_accounts);
  CHECK(opts.add_account);
  CHECK(opts.remove_account == std::optional<int>(2));
  CHECK(opts.config_dir == "/tmp/fastgh-cfg");
}

TEST_CASE("file options require existing files", "[cli]") {
  auto path = std::filesystem::temp_directory_path() / "fastgh_cli_cfg.yaml";
  {
    std::ofstream out(path);
    out << "verbose: true\n";
  }
  CliOptions opts = parse({"--config", path.string(), "--import-tokens",
                           path.string()});
  CHECK(opts.config_file == path.string());
  CHECK(opts.import_tokens == path.string());
  std::filesystem::remove(path);
  CHECK(exit_code_of({"--config", path.string()}) != 0);
}

TEST_CASE("invalid values and early exits", "[cli]") {
  CHECK(exit_code_of({"--version"}) == 0);
  CHECK(exit_code_of({"--help"}) == 0);
  CHECK(exit_code_of({"--log-level", "loud"}) != 0);
  CHECK(exit_code_of({"--log-rotate", "-1"}) != 0);
  CHECK(exit_code_of({"--remove-account", "-3"}) != 0);
  CHECK(exit_code_of({"--log-category", "=debug"}) != 0);
  CHECK(exit_code_of({"--bogus"}) != 0);
}

TEST_CASE("explicit CLI values override the configuration", "[cli]") {
  Config cfg;
  cfg.set_log_level("error");
  cfg.set_log_rotate(7);
  cfg.set_log_file("/var/log/cfg.log");

  CliOptions untouched = parse({});
  apply_cli_overrides(untouched, cfg);
  CHECK(cfg.log_level() == "error");
  CHECK(cfg.log_rotate() == 7);

  CliOptions opts = parse({"-v", "--log-rotate", "1", "--log-category",
                           "git=warn", "--config-dir", "/tmp/x"});
  apply_cli_overrides(opts, cfg);
  CHECK(cfg.verbose());
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_rotate() == 1);
  CHECK(cfg.log_file() == "/var/log/cfg.log");
  CHECK(cfg.log_categories().at("git") == "warn");
  CHECK(cfg.config_dir() == "/tmp/x");
}
