#include "fake_http_client.hpp"
#include "task_runner.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace fastgh;
using namespace fastgh_test;

TEST_CASE("run returns results through a future", "[tasks]") {
  TaskRunner runner;
  auto answer = runner.run("answer", [] { return 42; });
  CHECK(answer.get() == 42);
  auto nothing = runner.run("nothing", [] {});
  nothing.get();
  REQUIRE(runner.wait_idle(std::chrono::seconds(5)));
  auto snap = runner.snapshot();
  CHECK(snap.running.empty());
  CHECK(snap.total_completed == 2);
  CHECK(snap.total_failed == 0);
  REQUIRE(snap.completed.size() == 2);
  CHECK(snap.completed[0].state == TaskRunner::RequestState::Completed);
}

TEST_CASE("failures are recorded and rethrown from the future", "[tasks]") {
  TaskRunner runner;
  auto failing = runner.run("failing", []() -> int {
    throw std::runtime_error("no network");
  });
  CHECK_THROWS_AS(failing.get(), std::runtime_error);
  REQUIRE(runner.wait_idle(std::chrono::seconds(5)));
  auto snap = runner.snapshot();
  CHECK(snap.total_failed == 1);
  REQUIRE(snap.completed.size() == 1);
  CHECK(snap.completed[0].name == "failing");
  CHECK(snap.completed[0].error == "no network");
}

TEST_CASE("jobs run concurrently on their own threads", "[tasks]") {
  TaskRunner runner;
  std::atomic<int> arrived{0};
  auto job = [&arrived] {
    ++arrived;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (arrived.load() < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return arrived.load();
  };
  auto a = runner.run("a", job);
  auto b = runner.run("b", job);
  CHECK(a.get() == 2);
  CHECK(b.get() == 2);
}

TEST_CASE("run_then_post delivers results on the UI thread", "[tasks]") {
  TaskRunner runner;
  UiDispatcher ui;
  auto ui_thread = std::this_thread::get_id();
  std::string delivered;
  std::thread::id delivered_on;
  std::string error;
  runner.run_then_post(
      ui, "fetch", [] { return std::string("payload"); },
      [&](std::string value) {
        delivered = value;
        delivered_on = std::this_thread::get_id();
      });
  runner.run_then_post(
      ui, "broken", []() -> int { throw std::runtime_error("bad gateway"); },
      [](int) {}, [&](const std::string &message) { error = message; });
  REQUIRE(pump(runner, ui));
  CHECK(delivered == "payload");
  CHECK(delivered_on == ui_thread);
  CHECK(error == "bad gateway");
  CHECK(runner.snapshot().total_failed == 1);
}

TEST_CASE("history is bounded and later jobs run inline after shutdown",
          "[tasks]") {
  TaskRunner runner(2);
  for (int i = 0; i < 4; ++i) {
    runner.run("job-" + std::to_string(i), [] {}).get();
  }
  REQUIRE(runner.wait_idle(std::chrono::seconds(5)));
  auto snap = runner.snapshot();
  CHECK(snap.total_completed == 4);
  CHECK(snap.completed.size() == 2);

  runner.shutdown();
  auto caller = std::this_thread::get_id();
  auto inline_job =
      runner.run("inline", [] { return std::this_thread::get_id(); });
  CHECK(inline_job.get() == caller);
}
