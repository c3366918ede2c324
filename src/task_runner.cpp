#include "task_runner.hpp"
#include "log.hpp"

#include <algorithm>

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> tasks_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tasks");
  }();
  return logger;
}

} // namespace

TaskRunner::TaskRunner(std::size_t history_limit)
    : history_limit_(std::max<std::size_t>(1, history_limit)) {}

TaskRunner::~TaskRunner() { shutdown(); }

std::shared_ptr<TaskRunner::RequestInfo>
TaskRunner::create_request_info(std::string name) {
  auto info = std::make_shared<RequestInfo>();
  info->id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
  info->name = name.empty() ? "request-" + std::to_string(info->id)
                            : std::move(name);
  info->enqueued_at = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  active_.push_back(info);
  ++in_flight_;
  return info;
}

void TaskRunner::launch(std::function<void()> body) {
  std::unique_lock<std::mutex> lock(mutex_);
  reap_finished_locked();
  if (stopping_) {
    lock.unlock();
    body();
    return;
  }
  auto done = std::make_shared<std::atomic<bool>>(false);
  Worker worker;
  worker.done = done;
  worker.thread = std::thread([body = std::move(body), done] {
    body();
    done->store(true);
  });
  workers_.push_back(std::move(worker));
}

void TaskRunner::reap_finished_locked() {
  auto it = std::partition(workers_.begin(), workers_.end(),
                           [](const Worker &w) { return !w.done->load(); });
  for (auto j = it; j != workers_.end(); ++j) {
    if (j->thread.joinable()) {
      j->thread.join();
    }
  }
  workers_.erase(it, workers_.end());
}

void TaskRunner::mark_started(const std::shared_ptr<RequestInfo> &info) {
  std::lock_guard<std::mutex> lock(mutex_);
  info->state = RequestState::Running;
  info->started_at = std::chrono::steady_clock::now();
  tasks_log()->debug("Started {}", info->name);
}

void TaskRunner::mark_finished(const std::shared_ptr<RequestInfo> &info,
                               RequestState state, std::string error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    info->state = state;
    info->finished_at = std::chrono::steady_clock::now();
    info->error = std::move(error);
    active_.erase(std::remove(active_.begin(), active_.end(), info),
                  active_.end());
    completed_.push_back(*info);
    while (completed_.size() > history_limit_) {
      completed_.pop_front();
    }
    if (state == RequestState::Failed) {
      ++total_failed_;
      tasks_log()->warn("{} failed: {}", info->name, info->error);
    } else {
      ++total_completed_;
      tasks_log()->debug("Finished {}", info->name);
    }
    --in_flight_;
  }
  idle_cv_.notify_all();
}

std::size_t TaskRunner::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

bool TaskRunner::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

TaskRunner::Snapshot TaskRunner::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  for (const auto &info : active_) {
    snap.running.push_back(*info);
  }
  snap.completed.assign(completed_.begin(), completed_.end());
  snap.total_completed = total_completed_;
  snap.total_failed = total_failed_;
  return snap;
}

void TaskRunner::shutdown() {
  std::vector<Worker> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    workers.swap(workers_);
  }
  for (auto &w : workers) {
    if (w.thread.joinable()) {
      w.thread.join();
    }
  }
}

} // namespace fastgh
