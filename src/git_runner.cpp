#include "git_runner.hpp"
#include "log.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <optional>
#include <utility>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace fastgh {

namespace {

std::shared_ptr<spdlog::logger> git_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("git");
  }();
  return logger;
}

#ifndef _WIN32
constexpr std::chrono::seconds kKillGrace{3};
#endif

std::string join(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &a : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += a;
  }
  return out;
}

/// Splits child output into lines on CR or LF.
class LineBuffer {
public:
  explicit LineBuffer(const GitOperation::OutputCallback &on_line)
      : on_line_(on_line) {}

  void append(const char *data, std::size_t size) {
    pending_.append(data, size);
    flush(false);
  }

  void flush(bool final) {
    std::size_t pos;
    while ((pos = pending_.find_first_of("\r\n")) != std::string::npos) {
      std::string line = pending_.substr(0, pos);
      pending_.erase(0, pos + 1);
      if (!line.empty() && on_line_) {
        on_line_(line);
      }
    }
    if (final && !pending_.empty() && on_line_) {
      on_line_(pending_);
      pending_.clear();
    }
  }

private:
  const GitOperation::OutputCallback &on_line_;
  std::string pending_;
};

void finish(GitResult &result, const std::vector<std::string> &argv,
            bool cancelled) {
  if (cancelled) {
    result.outcome = GitOutcome::Cancelled;
  } else if (result.exit_code == 0) {
    result.outcome = GitOutcome::Success;
  } else {
    result.outcome = GitOutcome::Failed;
    if (result.exit_code == 127) {
      result.error = "Could not execute " + argv.front();
    }
  }
  git_log()->info("'{}' finished: {} (exit {})", join(argv),
                  to_string(result.outcome), result.exit_code);
}

#ifdef _WIN32
/// Quote @p arg the way CommandLineToArgvW splits it again.
std::string quote_argument(const std::string &arg) {
  if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
    return arg;
  }
  std::string out = "\"";
  std::size_t backslashes = 0;
  for (char ch : arg) {
    if (ch == '\\') {
      ++backslashes;
      continue;
    }
    out.append(ch == '"' ? backslashes * 2 + 1 : backslashes, '\\');
    backslashes = 0;
    out += ch;
  }
  out.append(backslashes * 2, '\\');
  out += '"';
  return out;
}

std::string last_error_text() {
  return "Windows error " + std::to_string(::GetLastError());
}
#endif

} // namespace

const char *to_string(GitOutcome outcome) {
  switch (outcome) {
  case GitOutcome::Success:
    return "success";
  case GitOutcome::Failed:
    return "failed";
  case GitOutcome::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::string clone_destination(const Repository &repo,
                              const std::string &git_path,
                              bool use_org_structure) {
  std::filesystem::path dest(git_path);
  if (use_org_structure && !repo.owner.empty()) {
    dest /= repo.owner;
  }
  dest /= repo.name;
  return dest.string();
}

std::vector<std::string> clone_command(const Repository &repo,
                                       const std::string &destination,
                                       bool recursive, const std::string &git) {
  std::vector<std::string> argv{git, "clone"};
  if (recursive) {
    argv.emplace_back("--recursive");
  }
  argv.push_back("https://github.com/" + repo.full_name + ".git");
  argv.push_back(destination);
  return argv;
}

std::vector<std::string> pull_command(const std::string &directory,
                                      const std::string &git) {
  return {git, "-C", directory, "pull"};
}

GitOperation::GitOperation(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

void GitOperation::cancel() {
  cancelled_ = true;
  std::lock_guard<std::mutex> lock(pid_mutex_);
#ifdef _WIN32
  if (job_ != nullptr) {
    ::TerminateJobObject(static_cast<HANDLE>(job_), 1);
    git_log()->info("Cancelling '{}'", join(argv_));
  }
#else
  if (pid_ > 0) {
    ::kill(-static_cast<pid_t>(pid_), SIGTERM);
    git_log()->info("Cancelling '{}'", join(argv_));
  }
#endif
}

#ifndef _WIN32
GitResult GitOperation::run(const OutputCallback &on_line) {
  GitResult result;
  if (argv_.empty()) {
    result.error = "Empty git command";
    return result;
  }
  if (cancelled_) {
    result.outcome = GitOutcome::Cancelled;
    return result;
  }
  int pipefd[2];
  if (::pipe(pipefd) == -1) {
    result.error = std::string("Failed to create pipe: ") + std::strerror(errno);
    git_log()->error("{}", result.error);
    return result;
  }
  std::vector<char *> cargv;
  cargv.reserve(argv_.size() + 1);
  for (auto &a : argv_) {
    cargv.push_back(const_cast<char *>(a.c_str()));
  }
  cargv.push_back(nullptr);

  git_log()->info("Running '{}'", join(argv_));
  pid_t pid = ::fork();
  if (pid == -1) {
    ::close(pipefd[0]);
    ::close(pipefd[1]);
    result.error = std::string("Failed to fork: ") + std::strerror(errno);
    git_log()->error("{}", result.error);
    return result;
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    ::close(pipefd[0]);
    ::dup2(pipefd[1], STDOUT_FILENO);
    ::dup2(pipefd[1], STDERR_FILENO);
    ::close(pipefd[1]);
    ::setenv("GIT_TERMINAL_PROMPT", "0", 1);
    ::execvp(cargv[0], cargv.data());
    ::_exit(127);
  }
  ::close(pipefd[1]);
  ::setpgid(pid, pid);
  {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    pid_ = pid;
  }
  if (cancelled_) {
    ::kill(-pid, SIGTERM);
  }

  LineBuffer lines(on_line);

  std::optional<std::chrono::steady_clock::time_point> term_sent;
  bool killed = false;
  char buffer[4096];
  while (true) {
    if (cancelled_ && !term_sent) {
      term_sent = std::chrono::steady_clock::now();
    }
    if (term_sent && !killed &&
        std::chrono::steady_clock::now() - *term_sent > kKillGrace) {
      ::kill(-pid, SIGKILL);
      killed = true;
    }
    struct pollfd pfd {
      pipefd[0], POLLIN, 0
    };
    int ready = ::poll(&pfd, 1, 100);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      continue;
    }
    ssize_t n = ::read(pipefd[0], buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    result.output.append(buffer, static_cast<std::size_t>(n));
    lines.append(buffer, static_cast<std::size_t>(n));
  }
  lines.flush(true);
  ::close(pipefd[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
  {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    pid_ = 0;
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  finish(result, argv_, cancelled_);
  return result;
}
#else
GitResult GitOperation::run(const OutputCallback &on_line) {
  GitResult result;
  if (argv_.empty()) {
    result.error = "Empty git command";
    return result;
  }
  if (cancelled_) {
    result.outcome = GitOutcome::Cancelled;
    return result;
  }

  SECURITY_ATTRIBUTES inherit{};
  inherit.nLength = sizeof(inherit);
  inherit.bInheritHandle = TRUE;
  HANDLE read_end = nullptr;
  HANDLE write_end = nullptr;
  if (!::CreatePipe(&read_end, &write_end, &inherit, 0)) {
    result.error = "Failed to create pipe: " + last_error_text();
    git_log()->error("{}", result.error);
    return result;
  }
  ::SetHandleInformation(read_end, HANDLE_FLAG_INHERIT, 0);

  // The job plays the part of the process group: it holds git and the
  // helpers it starts so cancel() can end all of them.
  HANDLE job = ::CreateJobObjectA(nullptr, nullptr);
  if (job == nullptr) {
    ::CloseHandle(read_end);
    ::CloseHandle(write_end);
    result.error = "Failed to create job object: " + last_error_text();
    git_log()->error("{}", result.error);
    return result;
  }
  JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
  limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
  ::SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits,
                            sizeof(limits));

  std::string command_line;
  for (const auto &a : argv_) {
    if (!command_line.empty()) {
      command_line += ' ';
    }
    command_line += quote_argument(a);
  }

  STARTUPINFOA startup{};
  startup.cb = sizeof(startup);
  startup.dwFlags = STARTF_USESTDHANDLES;
  startup.hStdOutput = write_end;
  startup.hStdError = write_end;
  PROCESS_INFORMATION process{};

  ::SetEnvironmentVariableA("GIT_TERMINAL_PROMPT", "0");
  git_log()->info("Running '{}'", join(argv_));
  BOOL started = ::CreateProcessA(nullptr, &command_line[0], nullptr, nullptr,
                                  TRUE, CREATE_SUSPENDED | CREATE_NO_WINDOW,
                                  nullptr, nullptr, &startup, &process);
  ::CloseHandle(write_end);
  if (!started) {
    ::CloseHandle(read_end);
    ::CloseHandle(job);
    result.error =
        "Could not execute " + argv_.front() + ": " + last_error_text();
    git_log()->error("{}", result.error);
    return result;
  }
  if (!::AssignProcessToJobObject(job, process.hProcess)) {
    git_log()->warn("Could not attach '{}' to a job: {}", join(argv_),
                    last_error_text());
  }
  {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    job_ = job;
    pid_ = static_cast<long>(process.dwProcessId);
  }
  ::ResumeThread(process.hThread);
  ::CloseHandle(process.hThread);
  if (cancelled_) {
    ::TerminateJobObject(job, 1);
  }

  // ReadFile fails with a broken pipe once every writer has exited.
  LineBuffer lines(on_line);
  char buffer[4096];
  DWORD n = 0;
  while (::ReadFile(read_end, buffer, sizeof(buffer), &n, nullptr) && n > 0) {
    result.output.append(buffer, n);
    lines.append(buffer, n);
  }
  lines.flush(true);
  ::CloseHandle(read_end);

  ::WaitForSingleObject(process.hProcess, INFINITE);
  DWORD code = 1;
  if (::GetExitCodeProcess(process.hProcess, &code)) {
    result.exit_code = static_cast<int>(code);
  }
  ::CloseHandle(process.hProcess);
  {
    std::lock_guard<std::mutex> lock(pid_mutex_);
    job_ = nullptr;
    pid_ = 0;
  }
  ::CloseHandle(job);
  finish(result, argv_, cancelled_);
  return result;
}
#endif

} // namespace fastgh
