/**
 * @file ui_dispatcher.hpp
 * @brief Hand-off queue that runs callbacks on the UI thread.
 */
#ifndef FASTGH_UI_DISPATCHER_HPP
#define FASTGH_UI_DISPATCHER_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace fastgh {

/**
 * Single-consumer queue bound to one thread.
 *
 * Worker threads call post(); only the bound thread may call drain(), so
 * every posted callback runs on the UI thread and UI state is never touched
 * from a worker.
 */
class UiDispatcher {
public:
  using Task = std::function<void()>;

  /// Bind the dispatcher to the constructing thread.
  UiDispatcher();

  UiDispatcher(const UiDispatcher &) = delete;
  UiDispatcher &operator=(const UiDispatcher &) = delete;

  /// Rebind to the calling thread (for example the thread running the UI).
  void bind_to_current_thread();

  /// Whether the calling thread is the bound UI thread.
  bool is_ui_thread() const;

  /// Queue @p task for execution on the UI thread. Safe from any thread.
  void post(Task task);

  /**
   * Run every queued task in posting order.
   *
   * Tasks posted while draining run on the next drain().
   *
   * @return Number of tasks executed.
   * @throws std::logic_error when called off the UI thread.
   */
  std::size_t drain();

  /**
   * Block until work is queued or @p timeout expires.
   *
   * @return `true` when at least one task is pending.
   */
  bool wait_for_work(std::chrono::milliseconds timeout);

  /// Number of queued tasks.
  std::size_t pending() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> queue_;
  std::thread::id owner_;
};

} // namespace fastgh

#endif // FASTGH_UI_DISPATCHER_HPP
