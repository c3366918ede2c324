#include "ui_dispatcher.hpp"
#include "log.hpp"

#include <stdexcept>
#include <utility>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> ui_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("ui");
  }();
  return logger;
}

} // namespace

UiDispatcher::UiDispatcher() : owner_(std::this_thread::get_id()) {}

void UiDispatcher::bind_to_current_thread() {
  std::lock_guard<std::mutex> lock(mutex_);
  owner_ = std::this_thread::get_id();
}

bool UiDispatcher::is_ui_thread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return owner_ == std::this_thread::get_id();
}

void UiDispatcher::post(Task task) {
  if (!task) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

std::size_t UiDispatcher::drain() {
  std::deque<Task> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owner_ != std::this_thread::get_id()) {
      throw std::logic_error("UiDispatcher::drain called off the UI thread");
    }
    batch.swap(queue_);
  }
  std::size_t ran = 0;
  for (auto &task : batch) {
    try {
      task();
    } catch (const std::exception &e) {
      ui_log()->error("UI callback failed: {}", e.what());
    }
    ++ran;
  }
  return ran;
}

bool UiDispatcher::wait_for_work(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
}

std::size_t UiDispatcher::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace fastgh
