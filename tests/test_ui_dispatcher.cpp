#include "ui_dispatcher.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fastgh;

TEST_CASE("posted tasks run in order on drain", "[ui]") {
  UiDispatcher ui;
  CHECK(ui.is_ui_thread());
  std::vector<int> order;
  ui.post([&] { order.push_back(1); });
  ui.post([&] { order.push_back(2); });
  ui.post({});
  CHECK(ui.pending() == 2);
  CHECK(ui.drain() == 2);
  CHECK(order == std::vector<int>{1, 2});
  CHECK(ui.pending() == 0);
}

TEST_CASE("tasks posted during drain wait for the next drain", "[ui]") {
  UiDispatcher ui;
  int runs = 0;
  ui.post([&] {
    ++runs;
    ui.post([&] { ++runs; });
  });
  CHECK(ui.drain() == 1);
  CHECK(runs == 1);
  CHECK(ui.drain() == 1);
  CHECK(runs == 2);
}

TEST_CASE("a failing callback does not stop the batch", "[ui]") {
  UiDispatcher ui;
  bool second = false;
  ui.post([] { throw std::runtime_error("boom"); });
  ui.post([&] { second = true; });
  CHECK(ui.drain() == 2);
  CHECK(second);
}

TEST_CASE("drain is restricted to the bound thread", "[ui]") {
  UiDispatcher ui;
  bool threw = false;
  bool ui_thread = true;
  std::thread worker([&] {
    ui_thread = ui.is_ui_thread();
    ui.post([] {});
    try {
      ui.drain();
    } catch (const std::logic_error &) {
      threw = true;
    }
  });
  worker.join();
  CHECK(threw);
  CHECK_FALSE(ui_thread);
  CHECK(ui.pending() == 1);
  CHECK(ui.drain() == 1);
}

TEST_CASE("wait_for_work wakes on post from a worker", "[ui]") {
  UiDispatcher ui;
  CHECK_FALSE(ui.wait_for_work(std::chrono::milliseconds(1)));
  std::thread worker([&] { ui.post([] {}); });
  CHECK(ui.wait_for_work(std::chrono::seconds(5)));
  worker.join();
  CHECK(ui.drain() == 1);
}
