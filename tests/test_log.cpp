#include "log.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

using namespace fastgh;

TEST_CASE("log buffer keeps the most recent lines") {
  auto sink = std::make_shared<LogBufferSink>(3);
  sink->set_pattern("%v");
  spdlog::logger logger("buffer-test", sink);
  for (int i = 1; i <= 5; ++i) {
    logger.info("line {}", i);
  }
  auto lines = sink->lines();
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "line 3");
  CHECK(lines[2] == "line 5");
  CHECK(sink->limit() == 3);
  CHECK(LogBufferSink(0).limit() == 1);
}

TEST_CASE("category loggers are shared and namespaced") {
  ensure_default_logger();
  auto a = category_logger("log-test");
  auto b = category_logger("log-test");
  CHECK(a == b);
  CHECK(a->name() == "fastgh.log-test");
  configure_log_categories({{"log-test", spdlog::level::trace}});
  CHECK(a->level() == spdlog::level::trace);
  configure_log_categories({{"log-test", spdlog::level::warn}});
  CHECK(b->level() == spdlog::level::warn);
}

TEST_CASE("attached log buffer receives category output") {
  auto sink = attach_log_buffer(50);
  auto logger = category_logger("log-buffer");
  logger->set_level(spdlog::level::info);
  logger->info("buffered message");
  bool found = false;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!found && std::chrono::steady_clock::now() < deadline) {
    for (const auto &line : sink->lines()) {
      if (line.find("buffered message") != std::string::npos) {
        found = true;
      }
    }
    if (!found) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  CHECK(found);
}
