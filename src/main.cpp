#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    fastgh::ensure_default_logger();
    return fastgh::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point orchestrating configuration loading and UI startup.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  fastgh::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  try {
    ret = app.execute();
  } catch (const std::exception &e) {
    main_log()->critical("Unhandled error: {}", e.what());
    return 1;
  }
  main_log()->debug("Exiting with code {}", ret);
  return ret;
}
