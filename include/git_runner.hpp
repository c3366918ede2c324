/**
 * @file git_runner.hpp
 * @brief Cancellable git clone and pull child processes.
 */

#ifndef FASTGH_GIT_RUNNER_HPP
#define FASTGH_GIT_RUNNER_HPP

#include "models.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace fastgh {

/// Terminal state of a git process.
enum class GitOutcome { Success, Failed, Cancelled };

/** Result of GitOperation::run(). */
struct GitResult {
  GitOutcome outcome = GitOutcome::Failed;
  int exit_code = -1;
  std::string output; ///< Combined stdout and stderr
  std::string error;  ///< Launch failure description
};

/**
 * One git invocation run as a child process with captured output.
 *
 * run() blocks and is meant for a worker thread; cancel() may be called from
 * any thread. On POSIX it terminates the process group (SIGTERM, then SIGKILL
 * after a grace period); on Windows it terminates the job object holding git
 * and its helpers.
 */
class GitOperation {
public:
  using OutputCallback = std::function<void(const std::string &line)>;

  explicit GitOperation(std::vector<std::string> argv);

  GitOperation(const GitOperation &) = delete;
  GitOperation &operator=(const GitOperation &) = delete;

  const std::vector<std::string> &argv() const { return argv_; }

  /// Run to completion. @p on_line receives each output line.
  GitResult run(const OutputCallback &on_line = {});

  /// Request termination. Safe before, during and after run().
  void cancel();

  bool cancel_requested() const { return cancelled_.load(); }

private:
  std::vector<std::string> argv_;
  std::atomic<bool> cancelled_{false};
  std::mutex pid_mutex_;
  long pid_ = 0;
  void *job_ = nullptr; ///< Job object handle on Windows
};

/// Destination directory of a clone below @p git_path.
std::string clone_destination(const Repository &repo,
                              const std::string &git_path,
                              bool use_org_structure);

/// `git clone [--recursive] https://github.com/<full_name>.git <dest>`.
std::vector<std::string> clone_command(const Repository &repo,
                                       const std::string &destination,
                                       bool recursive,
                                       const std::string &git = "git");

/// `git -C <dir> pull`.
std::vector<std::string> pull_command(const std::string &directory,
                                      const std::string &git = "git");

/// Printable name of @p outcome.
const char *to_string(GitOutcome outcome);

} // namespace fastgh

#endif // FASTGH_GIT_RUNNER_HPP
