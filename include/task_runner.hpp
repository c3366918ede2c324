/**
 * @file task_runner.hpp
 * @brief Thread-per-request execution of background work.
 *
 * Every submitted job runs on its own short-lived thread; the number of
 * concurrent jobs is not limited. Results are delivered through futures or
 * marshalled back to the UI thread via UiDispatcher.
 */
#ifndef FASTGH_TASK_RUNNER_HPP
#define FASTGH_TASK_RUNNER_HPP

#include "ui_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace fastgh {

/**
 * Launches background jobs on dedicated threads and tracks their progress.
 *
 * The destructor joins every outstanding thread.
 */
class TaskRunner {
public:
  /// Lifecycle state of a submitted request.
  enum class RequestState { Pending, Running, Completed, Failed };

  /** Metadata describing a submitted request. */
  struct RequestInfo {
    std::size_t id{0};
    std::string name;
    RequestState state{RequestState::Pending};
    std::chrono::steady_clock::time_point enqueued_at{};
    std::optional<std::chrono::steady_clock::time_point> started_at;
    std::optional<std::chrono::steady_clock::time_point> finished_at;
    std::string error;
  };

  /** Snapshot of running and recently finished requests. */
  struct Snapshot {
    std::vector<RequestInfo> running;
    std::vector<RequestInfo> completed; ///< Most recent last
    std::size_t total_completed{0};
    std::size_t total_failed{0};
  };

  /**
   * @param history_limit Number of finished requests kept for snapshot().
   */
  explicit TaskRunner(std::size_t history_limit = 64);
  ~TaskRunner();

  TaskRunner(const TaskRunner &) = delete;
  TaskRunner &operator=(const TaskRunner &) = delete;

  /**
   * Run @p work on a new thread.
   *
   * Exceptions thrown by @p work mark the request Failed and are stored in
   * the returned future.
   */
  template <typename F>
  auto run(std::string name, F work) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();
    auto info = create_request_info(std::move(name));
    launch([this, promise, info, work = std::move(work)]() mutable {
      mark_started(info);
      try {
        if constexpr (std::is_void_v<R>) {
          work();
          promise->set_value();
        } else {
          promise->set_value(work());
        }
        mark_finished(info, RequestState::Completed, {});
      } catch (const std::exception &e) {
        mark_finished(info, RequestState::Failed, e.what());
        promise->set_exception(std::current_exception());
      } catch (...) {
        mark_finished(info, RequestState::Failed, "unknown error");
        promise->set_exception(std::current_exception());
      }
    });
    return future;
  }

  /**
   * Run @p work in the background and hand its result to @p on_done on the
   * UI thread.
   *
   * @param ui Dispatcher bound to the UI thread; must outlive the job.
   * @param on_error Receives the failure message on the UI thread.
   */
  template <typename F, typename OnDone>
  void run_then_post(UiDispatcher &ui, std::string name, F work,
                     OnDone on_done,
                     std::function<void(const std::string &)> on_error = {}) {
    using R = std::invoke_result_t<F>;
    static_assert(!std::is_void_v<R>, "run_then_post needs a result value");
    run(std::move(name), [&ui, work = std::move(work),
                          on_done = std::move(on_done),
                          on_error = std::move(on_error)]() mutable {
      try {
        R result = work();
        ui.post([on_done, result = std::move(result)]() mutable {
          on_done(std::move(result));
        });
      } catch (const std::exception &e) {
        if (on_error) {
          std::string message = e.what();
          ui.post([on_error, message] { on_error(message); });
        }
        throw;
      }
    });
  }

  /// Number of jobs started but not yet finished.
  std::size_t in_flight() const;

  /// Block until no job is running or @p timeout expires.
  bool wait_idle(std::chrono::milliseconds timeout);

  /// Capture running and recently finished requests.
  Snapshot snapshot() const;

  /// Join every thread. Jobs submitted afterwards run on the caller.
  void shutdown();

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::shared_ptr<RequestInfo> create_request_info(std::string name);
  void launch(std::function<void()> body);
  void reap_finished_locked();
  void mark_started(const std::shared_ptr<RequestInfo> &info);
  void mark_finished(const std::shared_ptr<RequestInfo> &info,
                     RequestState state, std::string error);

  std::size_t history_limit_;
  bool stopping_{false};
  std::vector<Worker> workers_;
  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::vector<std::shared_ptr<RequestInfo>> active_;
  std::deque<RequestInfo> completed_;
  std::size_t in_flight_{0};
  std::size_t total_completed_{0};
  std::size_t total_failed_{0};
  std::atomic<std::size_t> next_request_id_{1};
};

} // namespace fastgh

#endif // FASTGH_TASK_RUNNER_HPP
